#pragma once

#include "urbanres/Random.hpp"
#include "urbanres/RoadGraph.hpp"
#include "urbanres/Types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace urbanres {

// Roadside trees: the collapse candidates of a disaster run.
//
// Trees can come from any source (e.g. loaded from JSON); PlantRoadsideTrees is the
// built-in generator that lines every road with randomly offset trees.

enum class VulnerabilityLevel : std::uint8_t {
  I = 0,   // high
  II = 1,  // medium
  III = 2, // low
};

constexpr int kVulnerabilityLevelCount = 3;

const char* ToString(VulnerabilityLevel v);
bool ParseVulnerabilityLevel(const std::string& s, VulnerabilityLevel& out);

struct Tree {
  int id = -1;
  Vec2 pos;
  VulnerabilityLevel level = VulnerabilityLevel::III;
  double height = 10.0;    // meters
  double trunkWidth = 0.5; // meters
};

struct TreePlantingConfig {
  double spacing = 25.0;   // meters between trees along a road side
  double maxOffset = 8.0;  // random extra distance from the road edge
  double roadBuffer = 3.0; // minimum distance from the road edge
  bool bothSides = true;

  // Relative weights of levels I, II, III.
  std::array<double, kVulnerabilityLevelCount> levelWeights{{0.1, 0.3, 0.6}};

  double minHeight = 4.0;
  double maxHeight = 25.0;
  double minTrunkWidth = 0.2;
  double maxTrunkWidth = 1.5;
};

bool ValidateTreePlantingConfig(const TreePlantingConfig& cfg, std::string& outError);

// Sample height and trunk width for a tree of the given level.
void SampleTreeDimensions(const TreePlantingConfig& cfg, VulnerabilityLevel level, RNG& rng, double& outHeight,
                          double& outTrunkWidth);

// Line every active road edge (except access edges) with trees. Tree ids are dense
// (0..n-1) in generation order.
std::vector<Tree> PlantRoadsideTrees(const RoadGraph& g, const TreePlantingConfig& cfg, RNG& rng);

struct TreeStats {
  int total = 0;
  std::array<int, kVulnerabilityLevelCount> byLevel{{0, 0, 0}};
  double minHeight = 0.0;
  double maxHeight = 0.0;
  double avgHeight = 0.0;
  double minTrunkWidth = 0.0;
  double maxTrunkWidth = 0.0;
};

TreeStats ComputeTreeStats(const std::vector<Tree>& trees);

} // namespace urbanres

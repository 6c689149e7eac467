#pragma once

#include "urbanres/Geometry.hpp"
#include "urbanres/RoadGraph.hpp"
#include "urbanres/TreePlanting.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace urbanres {

// Disaster geometry: stochastic tree collapse and the resulting road obstructions.
//
// A collapsed tree becomes a quadrilateral lying on the ground. Every road whose
// rectangular footprint it overlaps receives a RoadObstruction carrying the remaining
// passable width, measured as the narrowest perpendicular cross-section of the road
// through the blocked stretch (a pinch point governs passability, not the blocked area).

struct DisasterConfig {
  double intensity = 5.0; // [1,10]

  // Base collapse rate per vulnerability level (I, II, III).
  std::array<double, kVulnerabilityLevelCount> baseRates{{0.8, 0.5, 0.1}};

  int crossSections = 10;
  double directionThreshold = 2.0; // a direction below this width counts as affected
  double fallbackBlockage = 0.7;   // used when an edge has no usable geometry
};

struct TreeCollapseEvent {
  int id = -1;
  int treeId = -1;
  Vec2 location;
  VulnerabilityLevel level = VulnerabilityLevel::III;
  double angleDeg = 0.0;
  double height = 0.0;
  double trunkWidth = 0.0;
  double severity = 0.0; // [0,1]
  Polygon blockage;
};

struct RoadObstruction {
  int id = -1;
  int edge = -1;
  int eventId = -1;

  Polygon polygon; // tree polygon clipped to the road footprint

  double remainingWidth = 0.0;    // meters, narrowest cross-section
  double blockedPercentage = 0.0; // (1 - remaining/original) * 100
  double blockedLength = 0.0;     // meters along the road axis
  bool approximate = false;       // fallback estimate, no exact geometry

  // Only for bidirectional roads.
  bool hasDirectional = false;
  double forwardRemaining = 0.0;
  double backwardRemaining = 0.0;
  bool forwardAffected = false;
  bool backwardAffected = false;
};

struct DisasterStats {
  int treesEvaluated = 0;
  int treesSkipped = 0; // invalid dimensions
  int collapsed = 0;
  std::array<int, kVulnerabilityLevelCount> collapsedByLevel{{0, 0, 0}};

  int obstructions = 0;
  int roadsAffected = 0;
  int approximateObstructions = 0;
  double totalBlockedLength = 0.0;
  double averageBlockagePct = 0.0;
};

struct DisasterResult {
  std::uint64_t seed = 0;
  std::vector<TreeCollapseEvent> events;
  std::vector<RoadObstruction> obstructions;
  DisasterStats stats;
};

bool ValidateDisasterConfig(const DisasterConfig& cfg, std::string& outError);

// p = base_rate(level) * (0.5 + 0.5 * min(1, intensity / 10))
double CollapseProbability(VulnerabilityLevel level, double intensity, const DisasterConfig& cfg);

double CollapseSeverity(VulnerabilityLevel level, double height, double trunkWidth);

// Trunk rectangle swept from `base` along `angleDeg` for `height` meters.
Polygon BuildBlockagePolygon(Vec2 base, double angleDeg, double height, double trunkWidth);

// Cross-section measurement of one obstacle against one road segment.
// Returns false when the obstacle does not overlap the road footprint.
bool MeasureRoadBlockage(Vec2 a, Vec2 b, double width, const std::vector<LaneInfo>& lanes, bool bidirectional,
                         const Polygon& obstacle, const DisasterConfig& cfg, RoadObstruction& out);

// One obstruction per (event, affected edge). Access edges are ignored.
std::vector<RoadObstruction> ComputeRoadObstructions(const RoadGraph& g, const std::vector<TreeCollapseEvent>& events,
                                                     const DisasterConfig& cfg);

DisasterStats SummarizeDisaster(const std::vector<TreeCollapseEvent>& events,
                                const std::vector<RoadObstruction>& obstructions);

// Decide collapses for every tree using `seed`, then derive obstructions and stats.
bool SimulateTreeCollapse(const RoadGraph& g, const std::vector<Tree>& trees, const DisasterConfig& cfg,
                          std::uint64_t seed, DisasterResult& out, std::string& outError);

} // namespace urbanres

#pragma once

#include "urbanres/ConfigIO.hpp"
#include "urbanres/Facilities.hpp"
#include "urbanres/MapSynth.hpp"
#include "urbanres/TreePlanting.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace urbanres {

// Everything generated from one world seed: road map, roadside trees, facilities.
//
// Each stage draws from its own derived stream, so swapping the tree inventory (e.g. for
// one loaded from JSON) leaves the road map and facility layout unchanged.
struct Scenario {
  std::uint64_t seed = 0;
  SynthesizedMap map;
  std::vector<Tree> trees;
  std::vector<Facility> facilities;
};

constexpr std::uint64_t kTreeSeedSalt = 0x7472656573ULL;     // "trees"
constexpr std::uint64_t kFacilitySeedSalt = 0x66616369ULL;   // "faci"

bool BuildScenario(const CombinedConfig& cfg, std::uint64_t seed, Scenario& out, std::string& outError);

// Same as BuildScenario but keeps an externally supplied tree inventory.
bool BuildScenarioWithTrees(const CombinedConfig& cfg, std::uint64_t seed, std::vector<Tree> trees, Scenario& out,
                            std::string& outError);

} // namespace urbanres

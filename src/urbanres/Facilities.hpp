#pragma once

#include "urbanres/MapSynth.hpp"
#include "urbanres/Random.hpp"
#include "urbanres/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace urbanres {

// Critical facilities placed on road nodes: ambulance stations (route sources for the
// coverage analysis) and shelters.

enum class FacilityType : std::uint8_t {
  AmbulanceStation = 0,
  Shelter = 1,
};

const char* ToString(FacilityType t);

struct Facility {
  int id = -1;
  FacilityType type = FacilityType::AmbulanceStation;
  int node = -1;
  Vec2 pos;
  std::string name;
  int capacity = 0; // shelters only
};

struct FacilityConfig {
  int ambulanceStations = 3;
  int shelters = 8;
  int shelterCapacityMin = 100;
  int shelterCapacityMax = 1000;
};

bool ValidateFacilityConfig(const FacilityConfig& cfg, std::string& outError);

// Rank nodes by suitability: intersections, well-connected nodes and nodes on main roads
// score higher, with a small bonus for nodes away from the map center (spreads facilities
// out). Ties resolve by node id.
std::vector<int> RankFacilityNodes(const SynthesizedMap& map);

// Stations take the best-ranked nodes, shelters the next ones. Fails when the graph has
// fewer nodes than requested facilities.
bool PlaceFacilities(const SynthesizedMap& map, const FacilityConfig& cfg, RNG& rng, std::vector<Facility>& out,
                     std::string& outError);

std::vector<Vec2> FacilityPositions(const std::vector<Facility>& facilities, FacilityType type);

} // namespace urbanres

#include "urbanres/Facilities.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <utility>

namespace urbanres {

const char* ToString(FacilityType t)
{
  return (t == FacilityType::AmbulanceStation) ? "ambulance_station" : "shelter";
}

bool ValidateFacilityConfig(const FacilityConfig& cfg, std::string& outError)
{
  if (cfg.ambulanceStations < 0 || cfg.shelters < 0) {
    outError = "facility counts must be >= 0";
    return false;
  }
  if (cfg.shelterCapacityMin < 0 || cfg.shelterCapacityMax < cfg.shelterCapacityMin) {
    outError = "shelter capacity range is invalid";
    return false;
  }
  outError.clear();
  return true;
}

std::vector<int> RankFacilityNodes(const SynthesizedMap& map)
{
  const RoadGraph& g = map.graph;
  const int n = static_cast<int>(g.nodes.size());

  std::vector<std::uint8_t> onMain(static_cast<std::size_t>(n), 0);
  for (const RoadGraphEdge& e : g.edges) {
    if (!e.active || e.roadClass != RoadClass::Main) continue;
    onMain[static_cast<std::size_t>(e.a)] = 1;
    onMain[static_cast<std::size_t>(e.b)] = 1;
  }

  const double w = map.bounds.width();
  const double h = map.bounds.height();

  std::vector<std::pair<int, int>> scored; // (score, node)
  scored.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    const RoadGraphNode& node = g.nodes[static_cast<std::size_t>(i)];
    if (node.kind != NodeKind::Intersection || node.edges.empty()) continue;

    int score = 10;
    score += 5 * static_cast<int>(node.edges.size());
    if (onMain[static_cast<std::size_t>(i)]) score += 20;

    const double rx = (w > 0.0) ? (node.pos.x - map.bounds.minX) / w : 0.5;
    const double ry = (h > 0.0) ? (node.pos.y - map.bounds.minY) / h : 0.5;
    if (std::sqrt((rx - 0.5) * (rx - 0.5) + (ry - 0.5) * (ry - 0.5)) > 0.2) score += 5;

    scored.emplace_back(score, i);
  }

  std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
    if (a.first != b.first) return a.first > b.first;
    return a.second < b.second;
  });

  std::vector<int> out;
  out.reserve(scored.size());
  for (const auto& s : scored) out.push_back(s.second);
  return out;
}

bool PlaceFacilities(const SynthesizedMap& map, const FacilityConfig& cfg, RNG& rng, std::vector<Facility>& out,
                     std::string& outError)
{
  out.clear();
  if (!ValidateFacilityConfig(cfg, outError)) return false;

  const std::vector<int> ranked = RankFacilityNodes(map);
  const int needed = cfg.ambulanceStations + cfg.shelters;
  if (static_cast<int>(ranked.size()) < needed) {
    std::ostringstream oss;
    oss << "not enough road nodes for facilities: need " << needed << ", have " << ranked.size();
    outError = oss.str();
    return false;
  }

  std::size_t next = 0;
  for (int i = 0; i < cfg.ambulanceStations; ++i) {
    const int node = ranked[next++];
    Facility f;
    f.id = static_cast<int>(out.size());
    f.type = FacilityType::AmbulanceStation;
    f.node = node;
    f.pos = map.graph.nodes[static_cast<std::size_t>(node)].pos;
    f.name = "Ambulance Station " + std::to_string(i + 1);
    out.push_back(std::move(f));
  }

  for (int i = 0; i < cfg.shelters; ++i) {
    const int node = ranked[next++];
    Facility f;
    f.id = static_cast<int>(out.size());
    f.type = FacilityType::Shelter;
    f.node = node;
    f.pos = map.graph.nodes[static_cast<std::size_t>(node)].pos;
    f.name = "Shelter " + std::to_string(i + 1);
    f.capacity = rng.rangeInt(cfg.shelterCapacityMin, cfg.shelterCapacityMax);
    out.push_back(std::move(f));
  }

  outError.clear();
  return true;
}

std::vector<Vec2> FacilityPositions(const std::vector<Facility>& facilities, FacilityType type)
{
  std::vector<Vec2> out;
  for (const Facility& f : facilities) {
    if (f.type == type) out.push_back(f.pos);
  }
  return out;
}

} // namespace urbanres

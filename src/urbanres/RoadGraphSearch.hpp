#pragma once

#include "urbanres/RoadGraph.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <vector>

namespace urbanres {

// Shortest-path searches over the active adjacency of a RoadGraph.
//
// Costs come from a caller-supplied callback so the same search serves plain routing,
// diversity-penalized alternatives and service areas. A callback returning a non-finite
// value marks the edge as impassable in that direction.
//
// Priority queue ties are broken by insertion sequence, so results are deterministic for
// a given graph regardless of the standard library's heap implementation.

using EdgeCostFn = std::function<double(int edgeId, int fromNode)>;

struct NodeRoute {
  std::vector<int> nodes; // inclusive
  std::vector<int> edges; // edges[i] connects nodes[i] -> nodes[i+1]
  double cost = 0.0;
  bool found = false;
};

enum class SearchStatus : std::uint8_t {
  Found = 0,
  NoPath = 1,
  CostLimit = 2,      // every remaining label exceeded the cost ceiling
  ExpansionLimit = 3, // gave up after maxExpansions
};

const char* ToString(SearchStatus s);

struct AStarConfig {
  int maxExpansions = 1000;
  double maxCost = std::numeric_limits<double>::infinity();

  // Fastest speed any edge can be traversed at (m/s). The heuristic is the straight-line
  // distance divided by this, which never overestimates. <= 0 disables the heuristic.
  double heuristicSpeed = 0.0;
};

struct AStarResult {
  NodeRoute route;
  SearchStatus status = SearchStatus::NoPath;
  int expansions = 0;
};

AStarResult FindRouteAStar(const RoadGraph& g, int start, int goal, const EdgeCostFn& cost, const AStarConfig& cfg);

struct ShortestPathTree {
  int source = -1;
  std::vector<double> dist; // +inf when unreached
  std::vector<int> prevNode;
  std::vector<int> prevEdge;
  std::vector<int> settled; // in settle order
  int iterations = 0;
  bool truncated = false; // stopped by maxIterations
};

// Single-source Dijkstra. Labels above maxCost are never settled; the loop stops after
// maxIterations settled nodes (<= 0 means unbounded).
ShortestPathTree RunDijkstra(const RoadGraph& g, int source, const EdgeCostFn& cost,
                             double maxCost = std::numeric_limits<double>::infinity(), int maxIterations = 0);

// Walk prev links back from target. Returns found=false when target was not settled.
NodeRoute ExtractRoute(const ShortestPathTree& tree, int target);

} // namespace urbanres

#include "urbanres/RoadGraphSearch.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <queue>

namespace urbanres {

namespace {

constexpr double kINF = std::numeric_limits<double>::infinity();

struct OpenNode {
  double f = 0.0;
  double g = 0.0;
  std::uint64_t seq = 0;
  int node = -1;
};

struct OpenCmp {
  bool operator()(const OpenNode& a, const OpenNode& b) const
  {
    // min-heap emulation for std::priority_queue
    if (a.f != b.f) return a.f > b.f;
    return a.seq > b.seq;
  }
};

using OpenQueue = std::priority_queue<OpenNode, std::vector<OpenNode>, OpenCmp>;

bool ValidNodeId(const RoadGraph& g, int id)
{
  return id >= 0 && static_cast<std::size_t>(id) < g.nodes.size();
}

NodeRoute WalkBack(int source, int target, const std::vector<int>& prevNode, const std::vector<int>& prevEdge,
                   double cost)
{
  NodeRoute out;

  std::vector<int> nodesRev;
  std::vector<int> edgesRev;
  int cur = target;
  nodesRev.push_back(cur);
  while (cur != source) {
    const std::size_t cu = static_cast<std::size_t>(cur);
    const int pn = prevNode[cu];
    const int pe = prevEdge[cu];
    if (pn < 0 || pe < 0) return out;
    edgesRev.push_back(pe);
    nodesRev.push_back(pn);
    cur = pn;
    if (nodesRev.size() > prevNode.size() + 1) return out; // cycle guard
  }

  out.nodes.assign(nodesRev.rbegin(), nodesRev.rend());
  out.edges.assign(edgesRev.rbegin(), edgesRev.rend());
  out.cost = cost;
  out.found = true;
  return out;
}

} // namespace

const char* ToString(SearchStatus s)
{
  switch (s) {
  case SearchStatus::Found: return "found";
  case SearchStatus::NoPath: return "no_path";
  case SearchStatus::CostLimit: return "cost_limit";
  case SearchStatus::ExpansionLimit: return "expansion_limit";
  }
  return "no_path";
}

AStarResult FindRouteAStar(const RoadGraph& g, int start, int goal, const EdgeCostFn& cost, const AStarConfig& cfg)
{
  AStarResult out;
  if (!ValidNodeId(g, start) || !ValidNodeId(g, goal)) return out;

  if (start == goal) {
    out.route.nodes = {start};
    out.route.found = true;
    out.status = SearchStatus::Found;
    return out;
  }

  const std::size_t n = g.nodes.size();
  const Vec2 goalPos = g.nodes[static_cast<std::size_t>(goal)].pos;
  auto heuristic = [&](int node) -> double {
    if (!(cfg.heuristicSpeed > 0.0)) return 0.0;
    return Distance(g.nodes[static_cast<std::size_t>(node)].pos, goalPos) / cfg.heuristicSpeed;
  };

  std::vector<double> best(n, kINF);
  std::vector<int> prevNode(n, -1);
  std::vector<int> prevEdge(n, -1);
  std::vector<std::uint8_t> closed(n, 0);

  OpenQueue open;
  std::uint64_t seq = 0;

  best[static_cast<std::size_t>(start)] = 0.0;
  open.push(OpenNode{heuristic(start), 0.0, seq++, start});

  bool prunedByCost = false;
  bool hitExpansionLimit = false;
  bool reached = false;

  while (!open.empty()) {
    const OpenNode cur = open.top();
    open.pop();

    const std::size_t cu = static_cast<std::size_t>(cur.node);
    if (closed[cu] || cur.g != best[cu]) continue;

    if (cur.node == goal) {
      reached = true;
      break;
    }

    if (cfg.maxExpansions > 0 && out.expansions >= cfg.maxExpansions) {
      hitExpansionLimit = true;
      break;
    }

    closed[cu] = 1;
    ++out.expansions;

    for (const int edgeId : g.nodes[cu].edges) {
      const RoadGraphEdge& e = g.edges[static_cast<std::size_t>(edgeId)];
      if (!e.active) continue;
      const int neigh = OtherRoadNode(e, cur.node);
      if (!ValidNodeId(g, neigh)) continue;
      const std::size_t nu = static_cast<std::size_t>(neigh);
      if (closed[nu]) continue;

      const double w = cost(edgeId, cur.node);
      if (!std::isfinite(w) || w < 0.0) continue;

      const double ng = cur.g + w;
      if (ng > cfg.maxCost) {
        prunedByCost = true;
        continue;
      }
      if (!(ng < best[nu])) continue;

      best[nu] = ng;
      prevNode[nu] = cur.node;
      prevEdge[nu] = edgeId;
      open.push(OpenNode{ng + heuristic(neigh), ng, seq++, neigh});
    }
  }

  if (!reached) {
    if (hitExpansionLimit) {
      out.status = SearchStatus::ExpansionLimit;
    } else if (prunedByCost) {
      out.status = SearchStatus::CostLimit;
    } else {
      out.status = SearchStatus::NoPath;
    }
    return out;
  }

  out.route = WalkBack(start, goal, prevNode, prevEdge, best[static_cast<std::size_t>(goal)]);
  out.status = out.route.found ? SearchStatus::Found : SearchStatus::NoPath;
  return out;
}

ShortestPathTree RunDijkstra(const RoadGraph& g, int source, const EdgeCostFn& cost, double maxCost,
                             int maxIterations)
{
  ShortestPathTree t;
  t.source = source;

  const std::size_t n = g.nodes.size();
  t.dist.assign(n, kINF);
  t.prevNode.assign(n, -1);
  t.prevEdge.assign(n, -1);
  if (!ValidNodeId(g, source)) return t;

  std::vector<std::uint8_t> done(n, 0);
  OpenQueue open;
  std::uint64_t seq = 0;

  t.dist[static_cast<std::size_t>(source)] = 0.0;
  open.push(OpenNode{0.0, 0.0, seq++, source});

  while (!open.empty()) {
    const OpenNode cur = open.top();
    open.pop();

    const std::size_t cu = static_cast<std::size_t>(cur.node);
    if (done[cu] || cur.g != t.dist[cu]) continue;

    if (maxIterations > 0 && t.iterations >= maxIterations) {
      t.truncated = true;
      break;
    }

    done[cu] = 1;
    ++t.iterations;
    t.settled.push_back(cur.node);

    for (const int edgeId : g.nodes[cu].edges) {
      const RoadGraphEdge& e = g.edges[static_cast<std::size_t>(edgeId)];
      if (!e.active) continue;
      const int neigh = OtherRoadNode(e, cur.node);
      if (!ValidNodeId(g, neigh)) continue;
      const std::size_t nu = static_cast<std::size_t>(neigh);
      if (done[nu]) continue;

      const double w = cost(edgeId, cur.node);
      if (!std::isfinite(w) || w < 0.0) continue;

      const double nd = cur.g + w;
      if (nd > maxCost || !(nd < t.dist[nu])) continue;

      t.dist[nu] = nd;
      t.prevNode[nu] = cur.node;
      t.prevEdge[nu] = edgeId;
      open.push(OpenNode{nd, nd, seq++, neigh});
    }
  }

  // Labels that were queued but never settled are not part of the tree.
  for (std::size_t i = 0; i < n; ++i) {
    if (!done[i]) {
      t.dist[i] = kINF;
      t.prevNode[i] = -1;
      t.prevEdge[i] = -1;
    }
  }

  return t;
}

NodeRoute ExtractRoute(const ShortestPathTree& tree, int target)
{
  if (target < 0 || static_cast<std::size_t>(target) >= tree.dist.size()) return NodeRoute{};
  const double d = tree.dist[static_cast<std::size_t>(target)];
  if (!std::isfinite(d)) return NodeRoute{};
  return WalkBack(tree.source, target, tree.prevNode, tree.prevEdge, d);
}

} // namespace urbanres

#include "urbanres/RoadGraphConnectivity.hpp"

#include <algorithm>
#include <cstddef>

namespace urbanres {

namespace {

bool UsesEdge(const RoadGraph& g, const std::vector<std::uint8_t>& mask, int ei)
{
  if (ei < 0 || static_cast<std::size_t>(ei) >= g.edges.size()) return false;
  if (static_cast<std::size_t>(ei) >= mask.size() || !mask[static_cast<std::size_t>(ei)]) return false;
  return g.edges[static_cast<std::size_t>(ei)].active;
}

} // namespace

RoadGraphConnectivityResult ComputeRoadGraphConnectivity(const RoadGraph& g, const std::vector<std::uint8_t>& edgeMask)
{
  RoadGraphConnectivityResult out;

  const int n = static_cast<int>(g.nodes.size());
  const int m = static_cast<int>(g.edges.size());

  out.nodeComponent.assign(static_cast<std::size_t>(n), -1);
  out.isBridgeEdge.assign(static_cast<std::size_t>(m), 0);
  out.bridgeSubtreeNodes.assign(static_cast<std::size_t>(m), 0);
  if (n == 0) return out;

  std::vector<int> disc(static_cast<std::size_t>(n), -1);
  std::vector<int> low(static_cast<std::size_t>(n), -1);
  std::vector<int> parent(static_cast<std::size_t>(n), -1);
  std::vector<int> parentEdge(static_cast<std::size_t>(n), -1);
  std::vector<int> subtree(static_cast<std::size_t>(n), 0);

  struct Frame {
    int u = -1;
    std::size_t it = 0;
  };

  int time = 0;
  std::vector<Frame> st;

  for (int root = 0; root < n; ++root) {
    if (disc[static_cast<std::size_t>(root)] != -1) continue;

    const int comp = static_cast<int>(out.componentNodes.size());
    out.componentNodes.push_back(0);
    out.componentEdges.push_back(0);

    disc[static_cast<std::size_t>(root)] = low[static_cast<std::size_t>(root)] = time++;
    subtree[static_cast<std::size_t>(root)] = 1;
    out.nodeComponent[static_cast<std::size_t>(root)] = comp;
    out.componentNodes[static_cast<std::size_t>(comp)] += 1;

    st.clear();
    st.push_back(Frame{root, 0});

    while (!st.empty()) {
      Frame& f = st.back();
      const int u = f.u;
      const std::vector<int>& adj = g.nodes[static_cast<std::size_t>(u)].edges;

      if (f.it < adj.size()) {
        const int ei = adj[f.it++];
        if (!UsesEdge(g, edgeMask, ei)) continue;

        const int v = OtherRoadNode(g.edges[static_cast<std::size_t>(ei)], u);
        if (v < 0 || v >= n) continue;

        if (disc[static_cast<std::size_t>(v)] == -1) {
          parent[static_cast<std::size_t>(v)] = u;
          parentEdge[static_cast<std::size_t>(v)] = ei;
          disc[static_cast<std::size_t>(v)] = low[static_cast<std::size_t>(v)] = time++;
          subtree[static_cast<std::size_t>(v)] = 1;
          out.nodeComponent[static_cast<std::size_t>(v)] = comp;
          out.componentNodes[static_cast<std::size_t>(comp)] += 1;
          st.push_back(Frame{v, 0});
        } else if (ei != parentEdge[static_cast<std::size_t>(u)]) {
          // Only the exact parent edge is skipped so parallel roads count as a cycle.
          low[static_cast<std::size_t>(u)] = std::min(low[static_cast<std::size_t>(u)], disc[static_cast<std::size_t>(v)]);
        }
      } else {
        st.pop_back();

        const int p = parent[static_cast<std::size_t>(u)];
        if (p == -1) continue;

        subtree[static_cast<std::size_t>(p)] += subtree[static_cast<std::size_t>(u)];
        low[static_cast<std::size_t>(p)] = std::min(low[static_cast<std::size_t>(p)], low[static_cast<std::size_t>(u)]);

        const int pe = parentEdge[static_cast<std::size_t>(u)];
        if (low[static_cast<std::size_t>(u)] > disc[static_cast<std::size_t>(p)]) {
          out.isBridgeEdge[static_cast<std::size_t>(pe)] = 1;
          out.bridgeSubtreeNodes[static_cast<std::size_t>(pe)] = subtree[static_cast<std::size_t>(u)];
        }
      }
    }
  }

  for (int ei = 0; ei < m; ++ei) {
    if (!UsesEdge(g, edgeMask, ei)) continue;
    const RoadGraphEdge& e = g.edges[static_cast<std::size_t>(ei)];
    if (e.a < 0 || e.a >= n) continue;
    out.componentEdges[static_cast<std::size_t>(out.nodeComponent[static_cast<std::size_t>(e.a)])] += 1;
    if (out.isBridgeEdge[static_cast<std::size_t>(ei)]) out.bridgeEdges.push_back(ei);
  }

  for (int c = 0; c < static_cast<int>(out.componentEdges.size()); ++c) {
    const int edges = out.componentEdges[static_cast<std::size_t>(c)];
    if (edges == 0) continue;
    ++out.componentsWithEdges;

    if (out.largestComponent < 0) {
      out.largestComponent = c;
      continue;
    }
    const int best = out.largestComponent;
    const int bestEdges = out.componentEdges[static_cast<std::size_t>(best)];
    const int bestNodes = out.componentNodes[static_cast<std::size_t>(best)];
    const int nodes = out.componentNodes[static_cast<std::size_t>(c)];
    if (edges > bestEdges || (edges == bestEdges && nodes > bestNodes)) out.largestComponent = c;
  }

  return out;
}

} // namespace urbanres

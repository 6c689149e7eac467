#pragma once

#include "urbanres/RoadGraph.hpp"

#include <cstdint>
#include <vector>

namespace urbanres {

// Component / bridge analysis restricted to a subset of edges.
//
// Only active edges whose entry in `edgeMask` is non-zero take part. This is how the
// analyzer looks at "the network a given vehicle can still use" after a disaster: the mask
// marks edges wide enough for the vehicle.
//
// Bridge edges are roads whose loss would split their component further; in a damaged
// network those are the next roads worth clearing or protecting.

struct RoadGraphConnectivityResult {
  // Component id per node (every node gets one; isolated nodes form singleton components).
  std::vector<int> nodeComponent;

  std::vector<int> componentNodes;
  std::vector<int> componentEdges; // masked edges inside each component

  int componentsWithEdges = 0;
  int largestComponent = -1; // by edge count, ties by node count then id

  // Per-edge flag: 1 => bridge of the masked subgraph.
  std::vector<std::uint8_t> isBridgeEdge;
  std::vector<int> bridgeEdges;

  // For bridge edges: node count on the DFS child side.
  std::vector<int> bridgeSubtreeNodes;
};

RoadGraphConnectivityResult ComputeRoadGraphConnectivity(const RoadGraph& g, const std::vector<std::uint8_t>& edgeMask);

} // namespace urbanres

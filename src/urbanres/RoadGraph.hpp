#pragma once

#include "urbanres/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace urbanres {

// Undirected road graph stored as an arena.
//
// Node and edge ids are indices into RoadGraph::nodes / RoadGraph::edges and stay
// stable for the lifetime of the graph. Edges are never erased in place: an edge that is
// temporarily replaced (e.g. split around a query point) is deactivated, which removes it
// from the adjacency lists while keeping its id and attributes. Transient nodes/edges are
// only ever appended, so a scoped owner can drop them again by truncating back to a
// recorded size (see NetworkAnalyzer).

enum class NodeKind : std::uint8_t {
  Intersection = 0,
  Virtual = 1, // inserted on an edge to attach a query point
  Access = 2,  // exact query point, linked by an access edge
};

enum class RoadClass : std::uint8_t {
  Main = 0,
  Secondary = 1,
  Access = 2,
};

enum class LaneDirection : std::uint8_t {
  Forward = 0,  // a -> b
  Backward = 1, // b -> a
};

enum class LaneSide : std::uint8_t {
  Right = 0,
  Left = 1,
};

enum class CompassDirection : std::uint8_t {
  North = 0,
  South = 1,
  East = 2,
  West = 3,
};

const char* ToString(NodeKind k);
const char* ToString(RoadClass c);
const char* ToString(LaneDirection d);
const char* ToString(LaneSide s);
const char* ToString(CompassDirection d);

struct LaneInfo {
  int index = 0;
  LaneDirection direction = LaneDirection::Forward;
  LaneSide side = LaneSide::Right;
  double width = 0.0;
};

// Construction-time attributes shared by every sub-edge cut from one road.
struct RoadSpec {
  RoadClass roadClass = RoadClass::Secondary;
  double width = 6.0;
  int lanes = 2;
  bool bidirectional = true;
  double speedLimitKmh = 30.0;
};

struct RoadGraphNode {
  Vec2 pos{};
  NodeKind kind = NodeKind::Intersection;
  std::vector<int> edges; // active incident edges
};

struct RoadGraphEdge {
  int a = -1;
  int b = -1;

  RoadClass roadClass = RoadClass::Secondary;
  int laneCount = 2;
  bool bidirectional = true;
  double speedLimitKmh = 30.0;

  double length = 0.0;        // meters
  double originalWidth = 0.0; // meters
  double currentWidth = 0.0;  // meters, 0 <= current <= original

  std::vector<LaneInfo> lanes;
  CompassDirection direction = CompassDirection::East;

  bool active = true;

  // Edge the geometry was cut from when this edge is a transient split half, else -1.
  int sourceEdge = -1;
};

struct RoadGraph {
  std::vector<RoadGraphNode> nodes;
  std::vector<RoadGraphEdge> edges;
};

// Lane layout for right-hand traffic: forward lanes on the right side, backward lanes on
// the left. One-way roads carry only forward lanes.
std::vector<LaneInfo> BuildLaneInfo(int lanes, double width, bool bidirectional);

// East/west when the segment is mostly horizontal, else north/south.
CompassDirection PrimaryDirection(Vec2 a, Vec2 b);

int AddRoadNode(RoadGraph& g, Vec2 pos, NodeKind kind = NodeKind::Intersection);

// Append an edge between two existing, distinct nodes. Length comes from the node
// coordinates unless lengthOverride >= 0. Returns the new edge id or -1.
int AddRoadEdge(RoadGraph& g, int a, int b, const RoadSpec& spec, double lengthOverride = -1.0);

// Hide an edge from the adjacency index without releasing its id.
void DeactivateRoadEdge(RoadGraph& g, int edgeId);

inline int OtherRoadNode(const RoadGraphEdge& e, int node)
{
  return (e.a == node) ? e.b : e.a;
}

// Original id of a (possibly split) edge.
inline int SourceRoadEdge(const RoadGraph& g, int edgeId)
{
  const int src = g.edges[static_cast<std::size_t>(edgeId)].sourceEdge;
  return (src >= 0) ? src : edgeId;
}

RoadSpec RoadSpecOf(const RoadGraphEdge& e);

int CountActiveEdges(const RoadGraph& g);

// Structural consistency check: edge endpoints exist, adjacency lists match the active
// edge set, widths satisfy 0 <= current <= original.
bool ValidateRoadGraph(const RoadGraph& g, std::string& outError);

} // namespace urbanres

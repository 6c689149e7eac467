#pragma once

#include "urbanres/RoadGraph.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace urbanres {

// Attaching arbitrary query points to the road graph.
//
// A query point rarely sits exactly on a node. It is spliced in for the duration of one
// query: either snapped to a nearby node, or the closest edge is split at the projected
// point (virtual node). When the point itself is off the road an access node is placed at
// the exact coordinate and linked with a slow, wide access edge.
//
// All of these mutations are recorded by an AttachGuard and reversed when it goes out of
// scope, so the graph is back to its pre-query state on every exit path.

struct AttachConfig {
  double snapDistance = 12.0;       // snap to an edge endpoint within this distance
  double accessTolerance = 1.0;     // farther than this from the road -> access edge
  double maxAttachDistance = 200.0; // farther than this from every edge -> forced connection
  double accessSpeedKmh = 5.0;
  double accessWidth = 10.0;
};

bool ValidateAttachConfig(const AttachConfig& cfg, std::string& outError);

enum class AttachMode : std::uint8_t {
  SnappedToNode = 0,
  SplitEdge = 1,
  ForcedConnection = 2,
};

const char* ToString(AttachMode m);

struct AttachInfo {
  AttachMode mode = AttachMode::SnappedToNode;
  int node = -1;     // routing node for the query (the access node when one was created)
  int roadNode = -1; // node on the road network the query hangs off
  int edge = -1;     // original edge the point was projected onto (-1 when forced)
  double ratio = 0.0;
  Vec2 roadPoint;          // attachment point on the road network
  double distance = 0.0;   // query point -> roadPoint
  bool accessEdge = false; // an access node/edge was created
};

// Records the transient mutations of one query and undoes them on destruction.
//
// New nodes and edges are only ever appended, so dropping them means truncating back to
// the watermarks recorded at construction. Pre-existing state that gets touched (split
// edges, adjacency lists of existing nodes) is snapshotted before the first edit.
class AttachGuard {
public:
  // driftCounter / lastError (optional) receive diagnostics when rollback finds the graph
  // in an unexpected state.
  explicit AttachGuard(RoadGraph& g, int* driftCounter = nullptr, std::string* lastError = nullptr);
  ~AttachGuard();

  AttachGuard(const AttachGuard&) = delete;
  AttachGuard& operator=(const AttachGuard&) = delete;

  RoadGraph& graph() { return m_graph; }

  // Must be called before modifying the adjacency list of node `id`.
  void noteNodePreEdit(int id);

  // Must be called after deactivating edge `id`.
  void noteEdgeDeactivated(int id);

  bool isTransientNode(int id) const { return id >= m_nodeWatermark; }
  bool isTransientEdge(int id) const { return id >= m_edgeWatermark; }

  int nodeWatermark() const { return m_nodeWatermark; }
  int edgeWatermark() const { return m_edgeWatermark; }

  // Undo everything now. Safe to call more than once; later calls are no-ops.
  // Returns false (with outError) when drift was detected.
  bool rollback(std::string& outError);

private:
  RoadGraph& m_graph;
  int m_nodeWatermark = 0;
  int m_edgeWatermark = 0;

  std::vector<std::pair<int, std::vector<int>>> m_adjacency; // node -> adjacency before edit
  std::vector<int> m_deactivated;

  int* m_driftCounter = nullptr;
  std::string* m_lastError = nullptr;
  bool m_done = false;
};

// Splice `p` into the graph under `guard`. Fails only for malformed input (non-finite
// point, graph without nodes).
bool AttachPoint(AttachGuard& guard, Vec2 p, const AttachConfig& cfg, AttachInfo& out, std::string& outError);

} // namespace urbanres

#include "urbanres/RoadGraphAttach.hpp"

#include "urbanres/Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <sstream>

namespace urbanres {

namespace {

struct EdgeHit {
  int edge = -1;
  SegmentProjection proj;
};

EdgeHit ClosestRoadEdge(const RoadGraph& g, Vec2 p)
{
  EdgeHit best;
  best.proj.distance = std::numeric_limits<double>::infinity();

  const int n = static_cast<int>(g.nodes.size());
  for (int ei = 0; ei < static_cast<int>(g.edges.size()); ++ei) {
    const RoadGraphEdge& e = g.edges[static_cast<std::size_t>(ei)];
    if (!e.active || e.roadClass == RoadClass::Access) continue;
    if (e.a < 0 || e.a >= n || e.b < 0 || e.b >= n) continue;

    const SegmentProjection pr =
        ProjectPointOnSegment(p, g.nodes[static_cast<std::size_t>(e.a)].pos, g.nodes[static_cast<std::size_t>(e.b)].pos);
    if (pr.distance < best.proj.distance) {
      best.edge = ei;
      best.proj = pr;
    }
  }
  return best;
}

// Nearest pre-existing intersection, preferring nodes that still have roads.
int NearestRealNode(const RoadGraph& g, Vec2 p, int nodeLimit)
{
  int best = -1;
  int bestLoose = -1;
  double bestD = std::numeric_limits<double>::infinity();
  double bestLooseD = std::numeric_limits<double>::infinity();

  for (int i = 0; i < nodeLimit; ++i) {
    const RoadGraphNode& node = g.nodes[static_cast<std::size_t>(i)];
    const double d = DistanceSquared(p, node.pos);
    if (node.kind == NodeKind::Intersection && !node.edges.empty() && d < bestD) {
      bestD = d;
      best = i;
    }
    if (d < bestLooseD) {
      bestLooseD = d;
      bestLoose = i;
    }
  }
  return (best >= 0) ? best : bestLoose;
}

RoadSpec AccessSpec(const AttachConfig& cfg)
{
  RoadSpec s;
  s.roadClass = RoadClass::Access;
  s.width = cfg.accessWidth;
  s.lanes = 1;
  s.bidirectional = true;
  s.speedLimitKmh = cfg.accessSpeedKmh;
  return s;
}

// Access node at p linked to roadNode. Returns the access node id or -1.
int AddAccessLink(AttachGuard& guard, Vec2 p, int roadNode, const AttachConfig& cfg)
{
  RoadGraph& g = guard.graph();
  if (!guard.isTransientNode(roadNode)) guard.noteNodePreEdit(roadNode);

  const int access = AddRoadNode(g, p, NodeKind::Access);
  if (AddRoadEdge(g, access, roadNode, AccessSpec(cfg)) < 0) return -1;
  return access;
}

} // namespace

bool ValidateAttachConfig(const AttachConfig& cfg, std::string& outError)
{
  if (!(cfg.snapDistance >= 0.0) || !(cfg.accessTolerance >= 0.0)) {
    outError = "snap distance and access tolerance must be >= 0";
    return false;
  }
  if (!(cfg.maxAttachDistance > 0.0)) {
    outError = "max attach distance must be > 0";
    return false;
  }
  if (!(cfg.accessSpeedKmh > 0.0) || !(cfg.accessWidth > 0.0)) {
    outError = "access edge speed and width must be > 0";
    return false;
  }
  outError.clear();
  return true;
}

const char* ToString(AttachMode m)
{
  switch (m) {
  case AttachMode::SnappedToNode: return "snapped";
  case AttachMode::SplitEdge: return "split";
  case AttachMode::ForcedConnection: return "forced";
  }
  return "snapped";
}

AttachGuard::AttachGuard(RoadGraph& g, int* driftCounter, std::string* lastError)
    : m_graph(g)
    , m_nodeWatermark(static_cast<int>(g.nodes.size()))
    , m_edgeWatermark(static_cast<int>(g.edges.size()))
    , m_driftCounter(driftCounter)
    , m_lastError(lastError)
{
}

AttachGuard::~AttachGuard()
{
  std::string err;
  if (!rollback(err)) {
    if (m_driftCounter) *m_driftCounter += 1;
    if (m_lastError) *m_lastError = err;
  }
}

void AttachGuard::noteNodePreEdit(int id)
{
  if (id < 0 || id >= m_nodeWatermark) return;
  for (const auto& snap : m_adjacency) {
    if (snap.first == id) return;
  }
  m_adjacency.emplace_back(id, m_graph.nodes[static_cast<std::size_t>(id)].edges);
}

void AttachGuard::noteEdgeDeactivated(int id)
{
  if (id < 0 || id >= m_edgeWatermark) return;
  m_deactivated.push_back(id);
}

bool AttachGuard::rollback(std::string& outError)
{
  outError.clear();
  if (m_done) return true;
  m_done = true;

  std::ostringstream drift;
  if (static_cast<int>(m_graph.nodes.size()) < m_nodeWatermark) {
    drift << "node arena shrank below watermark (" << m_graph.nodes.size() << " < " << m_nodeWatermark << "); ";
  }
  if (static_cast<int>(m_graph.edges.size()) < m_edgeWatermark) {
    drift << "edge arena shrank below watermark (" << m_graph.edges.size() << " < " << m_edgeWatermark << "); ";
  }

  if (static_cast<int>(m_graph.nodes.size()) > m_nodeWatermark) {
    m_graph.nodes.resize(static_cast<std::size_t>(m_nodeWatermark));
  }
  if (static_cast<int>(m_graph.edges.size()) > m_edgeWatermark) {
    m_graph.edges.resize(static_cast<std::size_t>(m_edgeWatermark));
  }

  const int n = static_cast<int>(m_graph.nodes.size());
  const int m = static_cast<int>(m_graph.edges.size());

  for (const int ei : m_deactivated) {
    if (ei >= m) continue;
    m_graph.edges[static_cast<std::size_t>(ei)].active = true;
  }

  for (auto& snap : m_adjacency) {
    if (snap.first >= n) continue;
    std::vector<int>& adj = m_graph.nodes[static_cast<std::size_t>(snap.first)].edges;
    adj = std::move(snap.second);
    for (const int ei : adj) {
      if (ei < 0 || ei >= m || !m_graph.edges[static_cast<std::size_t>(ei)].active) {
        drift << "node " << snap.first << " restored with dangling edge " << ei << "; ";
      }
    }
  }

  m_adjacency.clear();
  m_deactivated.clear();

  outError = drift.str();
  return outError.empty();
}

bool AttachPoint(AttachGuard& guard, Vec2 p, const AttachConfig& cfg, AttachInfo& out, std::string& outError)
{
  out = AttachInfo{};
  RoadGraph& g = guard.graph();

  if (!IsFinite(p)) {
    outError = "query point is not finite";
    return false;
  }
  if (g.nodes.empty()) {
    outError = "road graph is empty";
    return false;
  }

  const EdgeHit hit = ClosestRoadEdge(g, p);

  if (hit.edge < 0 || hit.proj.distance > cfg.maxAttachDistance) {
    const int target = NearestRealNode(g, p, guard.nodeWatermark());
    if (target < 0) {
      outError = "no node to connect the query point to";
      return false;
    }

    out.mode = AttachMode::ForcedConnection;
    out.roadNode = target;
    out.roadPoint = g.nodes[static_cast<std::size_t>(target)].pos;
    out.distance = Distance(p, out.roadPoint);
    out.node = target;

    if (out.distance > cfg.accessTolerance) {
      const int access = AddAccessLink(guard, p, target, cfg);
      if (access < 0) {
        outError = "failed to add forced access edge";
        return false;
      }
      out.node = access;
      out.accessEdge = true;
    }
    outError.clear();
    return true;
  }

  const RoadGraphEdge e = g.edges[static_cast<std::size_t>(hit.edge)];
  const Vec2 pa = g.nodes[static_cast<std::size_t>(e.a)].pos;
  const Vec2 pb = g.nodes[static_cast<std::size_t>(e.b)].pos;

  out.edge = SourceRoadEdge(g, hit.edge);
  out.ratio = hit.proj.t;

  const double da = Distance(hit.proj.point, pa);
  const double db = Distance(hit.proj.point, pb);

  if (std::min(da, db) <= cfg.snapDistance) {
    out.mode = AttachMode::SnappedToNode;
    out.roadNode = (da <= db) ? e.a : e.b;
    out.roadPoint = (da <= db) ? pa : pb;
  } else {
    guard.noteNodePreEdit(e.a);
    guard.noteNodePreEdit(e.b);
    DeactivateRoadEdge(g, hit.edge);
    guard.noteEdgeDeactivated(hit.edge);

    const int v = AddRoadNode(g, hit.proj.point, NodeKind::Virtual);
    const RoadSpec spec = RoadSpecOf(e);
    const int e1 = AddRoadEdge(g, e.a, v, spec, e.length * hit.proj.t);
    const int e2 = AddRoadEdge(g, v, e.b, spec, e.length * (1.0 - hit.proj.t));
    if (e1 < 0 || e2 < 0) {
      outError = "failed to split edge " + std::to_string(hit.edge);
      return false;
    }

    // Both halves keep the obstruction state and report the original id.
    for (const int half : {e1, e2}) {
      RoadGraphEdge& he = g.edges[static_cast<std::size_t>(half)];
      he.currentWidth = e.currentWidth;
      he.direction = e.direction;
      he.sourceEdge = out.edge;
    }

    out.mode = AttachMode::SplitEdge;
    out.roadNode = v;
    out.roadPoint = hit.proj.point;
  }

  out.distance = Distance(p, out.roadPoint);
  out.node = out.roadNode;

  if (out.distance > cfg.accessTolerance) {
    const int access = AddAccessLink(guard, p, out.roadNode, cfg);
    if (access < 0) {
      outError = "failed to add access edge";
      return false;
    }
    out.node = access;
    out.accessEdge = true;
  }

  outError.clear();
  return true;
}

} // namespace urbanres

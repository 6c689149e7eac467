#include "urbanres/RoadGraph.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <utility>

namespace urbanres {

const char* ToString(NodeKind k)
{
  switch (k) {
  case NodeKind::Intersection: return "intersection";
  case NodeKind::Virtual: return "virtual";
  case NodeKind::Access: return "access";
  }
  return "intersection";
}

const char* ToString(RoadClass c)
{
  switch (c) {
  case RoadClass::Main: return "main";
  case RoadClass::Secondary: return "secondary";
  case RoadClass::Access: return "access";
  }
  return "secondary";
}

const char* ToString(LaneDirection d)
{
  return (d == LaneDirection::Forward) ? "forward" : "backward";
}

const char* ToString(LaneSide s)
{
  return (s == LaneSide::Right) ? "right" : "left";
}

const char* ToString(CompassDirection d)
{
  switch (d) {
  case CompassDirection::North: return "north";
  case CompassDirection::South: return "south";
  case CompassDirection::East: return "east";
  case CompassDirection::West: return "west";
  }
  return "east";
}

std::vector<LaneInfo> BuildLaneInfo(int lanes, double width, bool bidirectional)
{
  std::vector<LaneInfo> out;
  if (lanes <= 0 || !(width > 0.0)) return out;

  const double laneWidth = width / static_cast<double>(lanes);

  if (!bidirectional || lanes == 1) {
    for (int i = 0; i < lanes; ++i) {
      out.push_back(LaneInfo{i, LaneDirection::Forward, LaneSide::Right, laneWidth});
    }
    return out;
  }

  // Odd lane counts give the extra lane to the forward direction.
  const int forward = lanes - lanes / 2;
  const int backward = lanes / 2;
  int idx = 0;
  for (int i = 0; i < forward; ++i) {
    out.push_back(LaneInfo{idx++, LaneDirection::Forward, LaneSide::Right, laneWidth});
  }
  for (int i = 0; i < backward; ++i) {
    out.push_back(LaneInfo{idx++, LaneDirection::Backward, LaneSide::Left, laneWidth});
  }
  return out;
}

CompassDirection PrimaryDirection(Vec2 a, Vec2 b)
{
  const double dx = b.x - a.x;
  const double dy = b.y - a.y;
  if (std::fabs(dx) > std::fabs(dy)) {
    return (dx > 0.0) ? CompassDirection::East : CompassDirection::West;
  }
  return (dy > 0.0) ? CompassDirection::North : CompassDirection::South;
}

int AddRoadNode(RoadGraph& g, Vec2 pos, NodeKind kind)
{
  RoadGraphNode n;
  n.pos = pos;
  n.kind = kind;
  g.nodes.push_back(std::move(n));
  return static_cast<int>(g.nodes.size()) - 1;
}

int AddRoadEdge(RoadGraph& g, int a, int b, const RoadSpec& spec, double lengthOverride)
{
  const int n = static_cast<int>(g.nodes.size());
  if (a < 0 || a >= n || b < 0 || b >= n) return -1;
  if (a == b) return -1;

  const Vec2 pa = g.nodes[static_cast<std::size_t>(a)].pos;
  const Vec2 pb = g.nodes[static_cast<std::size_t>(b)].pos;

  RoadGraphEdge e;
  e.a = a;
  e.b = b;
  e.roadClass = spec.roadClass;
  e.laneCount = spec.lanes;
  e.bidirectional = spec.bidirectional;
  e.speedLimitKmh = spec.speedLimitKmh;
  e.length = (lengthOverride >= 0.0) ? lengthOverride : Distance(pa, pb);
  e.originalWidth = spec.width;
  e.currentWidth = spec.width;
  e.lanes = BuildLaneInfo(spec.lanes, spec.width, spec.bidirectional);
  e.direction = PrimaryDirection(pa, pb);
  e.active = true;

  const int id = static_cast<int>(g.edges.size());
  g.edges.push_back(std::move(e));
  g.nodes[static_cast<std::size_t>(a)].edges.push_back(id);
  g.nodes[static_cast<std::size_t>(b)].edges.push_back(id);
  return id;
}

void DeactivateRoadEdge(RoadGraph& g, int edgeId)
{
  if (edgeId < 0 || edgeId >= static_cast<int>(g.edges.size())) return;

  RoadGraphEdge& e = g.edges[static_cast<std::size_t>(edgeId)];
  if (!e.active) return;
  e.active = false;

  for (const int nodeId : {e.a, e.b}) {
    if (nodeId < 0 || nodeId >= static_cast<int>(g.nodes.size())) continue;
    std::vector<int>& adj = g.nodes[static_cast<std::size_t>(nodeId)].edges;
    adj.erase(std::remove(adj.begin(), adj.end(), edgeId), adj.end());
  }
}

RoadSpec RoadSpecOf(const RoadGraphEdge& e)
{
  RoadSpec s;
  s.roadClass = e.roadClass;
  s.width = e.originalWidth;
  s.lanes = e.laneCount;
  s.bidirectional = e.bidirectional;
  s.speedLimitKmh = e.speedLimitKmh;
  return s;
}

int CountActiveEdges(const RoadGraph& g)
{
  int n = 0;
  for (const RoadGraphEdge& e : g.edges) {
    if (e.active) ++n;
  }
  return n;
}

bool ValidateRoadGraph(const RoadGraph& g, std::string& outError)
{
  const int n = static_cast<int>(g.nodes.size());
  const int m = static_cast<int>(g.edges.size());

  std::vector<int> expectedDegree(static_cast<std::size_t>(n), 0);

  for (int ei = 0; ei < m; ++ei) {
    const RoadGraphEdge& e = g.edges[static_cast<std::size_t>(ei)];
    if (e.a < 0 || e.a >= n || e.b < 0 || e.b >= n) {
      std::ostringstream oss;
      oss << "edge " << ei << " references a missing node (" << e.a << ", " << e.b << ")";
      outError = oss.str();
      return false;
    }
    if (!(e.currentWidth >= 0.0) || e.currentWidth > e.originalWidth) {
      std::ostringstream oss;
      oss << "edge " << ei << " width out of range: current=" << e.currentWidth
          << " original=" << e.originalWidth;
      outError = oss.str();
      return false;
    }
    if (!e.active) continue;
    expectedDegree[static_cast<std::size_t>(e.a)] += 1;
    expectedDegree[static_cast<std::size_t>(e.b)] += 1;
  }

  for (int ni = 0; ni < n; ++ni) {
    const RoadGraphNode& node = g.nodes[static_cast<std::size_t>(ni)];
    if (static_cast<int>(node.edges.size()) != expectedDegree[static_cast<std::size_t>(ni)]) {
      std::ostringstream oss;
      oss << "node " << ni << " adjacency size " << node.edges.size() << " != active degree "
          << expectedDegree[static_cast<std::size_t>(ni)];
      outError = oss.str();
      return false;
    }
    for (const int ei : node.edges) {
      if (ei < 0 || ei >= m) {
        outError = "node " + std::to_string(ni) + " lists a missing edge " + std::to_string(ei);
        return false;
      }
      const RoadGraphEdge& e = g.edges[static_cast<std::size_t>(ei)];
      if (!e.active || (e.a != ni && e.b != ni)) {
        outError = "node " + std::to_string(ni) + " lists edge " + std::to_string(ei) + " that does not touch it";
        return false;
      }
    }
  }

  outError.clear();
  return true;
}

} // namespace urbanres

#include "urbanres/NetworkAnalyzer.hpp"

#include "urbanres/RoadCost.hpp"
#include "urbanres/RoadGraphConnectivity.hpp"
#include "urbanres/RoadGraphSearch.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <map>
#include <utility>

namespace urbanres {

namespace {

// Fraction of `cur`'s edges that also appear in `prev` (both sorted, unique).
double EdgeOverlap(const std::vector<int>& cur, const std::vector<int>& prev)
{
  if (cur.empty()) return 1.0;
  std::vector<int> common;
  std::set_intersection(cur.begin(), cur.end(), prev.begin(), prev.end(), std::back_inserter(common));
  return static_cast<double>(common.size()) / static_cast<double>(cur.size());
}

// Sorted source road ids along a route; access links and split halves fold away.
std::vector<int> RoadEdgeSet(const RoadGraph& g, const std::vector<int>& routeEdges)
{
  std::vector<int> out;
  out.reserve(routeEdges.size());
  for (const int ei : routeEdges) {
    if (g.edges[static_cast<std::size_t>(ei)].roadClass == RoadClass::Access) continue;
    out.push_back(SourceRoadEdge(g, ei));
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

PathReason ReasonFor(SearchStatus s)
{
  switch (s) {
  case SearchStatus::Found: return PathReason::None;
  case SearchStatus::NoPath: return PathReason::NoPath;
  case SearchStatus::CostLimit: return PathReason::TimeLimitExceeded;
  case SearchStatus::ExpansionLimit: return PathReason::ExpansionLimit;
  }
  return PathReason::NoPath;
}

} // namespace

bool ValidateAnalyzerConfig(const AnalyzerConfig& cfg, std::string& outError)
{
  if (!ValidateAttachConfig(cfg.attach, outError)) return false;
  if (cfg.maxExpansions < 1 || cfg.partialMaxIterations < 1) {
    outError = "search bounds must be >= 1";
    return false;
  }
  if (!std::isfinite(cfg.diversityFactor) || cfg.diversityFactor < 1.0) {
    outError = "diversity factor must be >= 1";
    return false;
  }
  if (!(cfg.maxOverlapFraction > 0.0 && cfg.maxOverlapFraction <= 1.0)) {
    outError = "max overlap fraction must be in (0,1]";
    return false;
  }
  if (cfg.maxAlternativePaths < 1) {
    outError = "max alternative paths must be >= 1";
    return false;
  }
  outError.clear();
  return true;
}

const char* ToString(PathReason r)
{
  switch (r) {
  case PathReason::None: return "none";
  case PathReason::NoPath: return "no_path";
  case PathReason::TimeLimitExceeded: return "time_limit_exceeded";
  case PathReason::ExpansionLimit: return "expansion_limit";
  }
  return "none";
}

RoadNetworkAnalyzer::RoadNetworkAnalyzer(RoadGraph graph, AnalyzerConfig cfg)
    : m_graph(std::move(graph))
    , m_cfg(std::move(cfg))
{
}

ObstructionApplyStats RoadNetworkAnalyzer::applyObstructions(const std::vector<RoadObstruction>& obstructions)
{
  std::lock_guard<std::mutex> lock(m_mutex);

  ObstructionApplyStats stats;
  stats.obstructions = static_cast<int>(obstructions.size());

  for (RoadGraphEdge& e : m_graph.edges) e.currentWidth = e.originalWidth;

  // Several obstructions on one edge: the narrowest pinch point wins, independent of order.
  std::map<int, double> narrowest;
  for (const RoadObstruction& o : obstructions) {
    if (o.edge < 0 || o.edge >= static_cast<int>(m_graph.edges.size())) {
      ++stats.unknownEdges;
      continue;
    }
    if (!std::isfinite(o.remainingWidth)) {
      ++stats.invalidWidths;
      continue;
    }
    auto it = narrowest.find(o.edge);
    if (it == narrowest.end()) {
      narrowest.emplace(o.edge, o.remainingWidth);
    } else {
      it->second = std::min(it->second, o.remainingWidth);
    }
  }

  for (const auto& kv : narrowest) {
    RoadGraphEdge& e = m_graph.edges[static_cast<std::size_t>(kv.first)];
    e.currentWidth = std::clamp(kv.second, 0.0, e.originalWidth);
  }
  stats.edgesObstructed = static_cast<int>(narrowest.size());
  return stats;
}

void RoadNetworkAnalyzer::clearObstructions()
{
  std::lock_guard<std::mutex> lock(m_mutex);
  for (RoadGraphEdge& e : m_graph.edges) e.currentWidth = e.originalWidth;
}

bool RoadNetworkAnalyzer::validateGraph(std::string& outError) const
{
  if (m_graph.nodes.empty() || CountActiveEdges(m_graph) == 0) {
    outError = "road graph is empty";
    return false;
  }
  return ValidateAnalyzerConfig(m_cfg, outError);
}

double RoadNetworkAnalyzer::heuristicSpeed(const VehicleProfile& vehicle) const
{
  double best = 0.0;
  for (const RoadGraphEdge& e : m_graph.edges) {
    if (!e.active) continue;
    best = std::max(best, EdgeSpeedMps(e, vehicle));
  }
  return best;
}

void RoadNetworkAnalyzer::fillRoute(const std::vector<int>& nodes, const std::vector<int>& edges,
                                    const VehicleProfile& vehicle, PathResult& out) const
{
  out.coords.clear();
  out.edges.clear();
  out.blockedRoads.clear();
  out.distance = 0.0;
  out.travelTime = 0.0;

  for (const int ni : nodes) out.coords.push_back(m_graph.nodes[static_cast<std::size_t>(ni)].pos);

  for (const int ei : edges) {
    const RoadGraphEdge& e = m_graph.edges[static_cast<std::size_t>(ei)];
    out.distance += e.length;
    out.travelTime += EdgeTraversalCost(e, vehicle);

    if (e.roadClass == RoadClass::Access) continue;
    const int src = SourceRoadEdge(m_graph, ei);
    if (!out.edges.empty() && out.edges.back() == src) continue;
    out.edges.push_back(src);

    if (e.currentWidth < e.originalWidth) {
      const bool seen = std::any_of(out.blockedRoads.begin(), out.blockedRoads.end(),
                                    [src](const BlockedRoad& b) { return b.edge == src; });
      if (!seen) out.blockedRoads.push_back(BlockedRoad{src, e.currentWidth, e.originalWidth});
    }
  }
}

bool RoadNetworkAnalyzer::findPath(const PathRequest& req, PathResult& out, std::string& outError)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  out = PathResult{};

  if (!validateGraph(outError)) return false;
  if (!ValidateVehicleProfile(req.vehicle, outError)) return false;
  if (!IsFinite(req.start) || !IsFinite(req.end)) {
    outError = "path endpoints must be finite";
    return false;
  }
  if (std::isnan(req.maxTravelTimeSec) || !(req.maxTravelTimeSec > 0.0)) {
    outError = "max travel time must be > 0";
    return false;
  }

  AttachGuard guard(m_graph, &m_cleanupIssues, &m_lastCleanupError);
  if (!AttachPoint(guard, req.start, m_cfg.attach, out.startAttach, outError)) return false;
  if (!AttachPoint(guard, req.end, m_cfg.attach, out.endAttach, outError)) return false;

  const VehicleProfile& vehicle = req.vehicle;
  const EdgeCostFn cost = [this, &vehicle](int ei, int) {
    return EdgeTraversalCost(m_graph.edges[static_cast<std::size_t>(ei)], vehicle);
  };

  AStarConfig acfg;
  acfg.maxExpansions = m_cfg.maxExpansions;
  acfg.maxCost = req.maxTravelTimeSec;
  acfg.heuristicSpeed = heuristicSpeed(vehicle);

  const int startNode = out.startAttach.node;
  const int endNode = out.endAttach.node;
  const AStarResult ar = FindRouteAStar(m_graph, startNode, endNode, cost, acfg);
  out.expansions = ar.expansions;

  if (ar.status == SearchStatus::Found) {
    fillRoute(ar.route.nodes, ar.route.edges, vehicle, out);
    out.success = true;
    out.reason = PathReason::None;
    if (out.coords.empty() || out.coords.front() != req.start) out.coords.insert(out.coords.begin(), req.start);
    if (out.coords.back() != req.end) out.coords.push_back(req.end);
    outError.clear();
    return true;
  }

  // Partial fallback: get as close to the destination as the network allows.
  out.reason = ReasonFor(ar.status);
  out.isPartial = true;

  const ShortestPathTree tree = RunDijkstra(m_graph, startNode, cost, req.maxTravelTimeSec, m_cfg.partialMaxIterations);

  int closest = startNode;
  double closestD = Distance(m_graph.nodes[static_cast<std::size_t>(startNode)].pos, req.end);
  for (const int ni : tree.settled) {
    const double d = Distance(m_graph.nodes[static_cast<std::size_t>(ni)].pos, req.end);
    if (d < closestD) {
      closestD = d;
      closest = ni;
    }
  }

  const NodeRoute partial = ExtractRoute(tree, closest);
  if (partial.found) {
    fillRoute(partial.nodes, partial.edges, vehicle, out);
  } else {
    fillRoute({startNode}, {}, vehicle, out);
  }
  if (out.coords.empty() || out.coords.front() != req.start) out.coords.insert(out.coords.begin(), req.start);

  outError.clear();
  return true;
}

bool RoadNetworkAnalyzer::findAlternativePaths(const PathRequest& req, AlternativePathsResult& out,
                                               std::string& outError)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  out = AlternativePathsResult{};

  if (!validateGraph(outError)) return false;
  if (!ValidateVehicleProfile(req.vehicle, outError)) return false;
  if (!IsFinite(req.start) || !IsFinite(req.end)) {
    outError = "path endpoints must be finite";
    return false;
  }
  if (std::isnan(req.maxTravelTimeSec) || !(req.maxTravelTimeSec > 0.0)) {
    outError = "max travel time must be > 0";
    return false;
  }

  AttachGuard guard(m_graph, &m_cleanupIssues, &m_lastCleanupError);
  AttachInfo startInfo;
  AttachInfo endInfo;
  if (!AttachPoint(guard, req.start, m_cfg.attach, startInfo, outError)) return false;
  if (!AttachPoint(guard, req.end, m_cfg.attach, endInfo, outError)) return false;

  const VehicleProfile& vehicle = req.vehicle;
  std::vector<int> uses(m_graph.edges.size(), 0);
  const double factor = m_cfg.diversityFactor;
  const EdgeCostFn cost = [this, &vehicle, &uses, factor](int ei, int) {
    const double base = EdgeTraversalCost(m_graph.edges[static_cast<std::size_t>(ei)], vehicle);
    const int n = uses[static_cast<std::size_t>(ei)];
    return (n > 0) ? base * std::pow(factor, static_cast<double>(n)) : base;
  };

  AStarConfig acfg;
  acfg.maxExpansions = m_cfg.maxExpansions;
  acfg.maxCost = req.maxTravelTimeSec;
  acfg.heuristicSpeed = heuristicSpeed(vehicle);

  std::vector<std::vector<int>> accepted;
  while (static_cast<int>(out.paths.size()) < m_cfg.maxAlternativePaths) {
    ++out.attempts;
    const AStarResult ar = FindRouteAStar(m_graph, startInfo.node, endInfo.node, cost, acfg);
    if (ar.status != SearchStatus::Found) break;

    std::vector<int> edgeSet = RoadEdgeSet(m_graph, ar.route.edges);

    bool distinct = true;
    for (const std::vector<int>& prev : accepted) {
      if (EdgeOverlap(edgeSet, prev) >= m_cfg.maxOverlapFraction) {
        distinct = false;
        break;
      }
    }
    if (!distinct) break;

    PathResult pr;
    fillRoute(ar.route.nodes, ar.route.edges, vehicle, pr);
    pr.success = true;
    pr.expansions = ar.expansions;
    pr.startAttach = startInfo;
    pr.endAttach = endInfo;
    if (pr.coords.empty() || pr.coords.front() != req.start) pr.coords.insert(pr.coords.begin(), req.start);
    if (pr.coords.back() != req.end) pr.coords.push_back(req.end);
    out.paths.push_back(std::move(pr));

    for (const int ei : ar.route.edges) uses[static_cast<std::size_t>(ei)] += 1;
    accepted.push_back(std::move(edgeSet));
  }

  outError.clear();
  return true;
}

bool RoadNetworkAnalyzer::runIsochrones(Vec2 center, const VehicleProfile& vehicle,
                                        const std::vector<double>& thresholds, ServiceAreaResult& out,
                                        std::string& outError)
{
  out = ServiceAreaResult{};
  out.center = center;

  if (!validateGraph(outError)) return false;
  if (!ValidateVehicleProfile(vehicle, outError)) return false;
  if (!IsFinite(center)) {
    outError = "center point must be finite";
    return false;
  }
  if (thresholds.empty()) {
    outError = "at least one time threshold is required";
    return false;
  }
  for (const double t : thresholds) {
    if (!std::isfinite(t) || t <= 0.0) {
      outError = "time thresholds must be finite and > 0";
      return false;
    }
  }

  AttachGuard guard(m_graph, &m_cleanupIssues, &m_lastCleanupError);
  if (!AttachPoint(guard, center, m_cfg.attach, out.centerAttach, outError)) return false;

  const EdgeCostFn cost = [this, &vehicle](int ei, int) {
    return EdgeTraversalCost(m_graph.edges[static_cast<std::size_t>(ei)], vehicle);
  };
  const double budget = *std::max_element(thresholds.begin(), thresholds.end());
  const ShortestPathTree tree = RunDijkstra(m_graph, out.centerAttach.node, cost, budget);

  out.bands = BuildIsochroneBands(m_graph, tree, thresholds);
  outError.clear();
  return true;
}

bool RoadNetworkAnalyzer::computeServiceArea(Vec2 center, const VehicleProfile& vehicle, double budgetSec,
                                             ServiceAreaResult& out, std::string& outError)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!std::isfinite(budgetSec) || budgetSec <= 0.0) {
    out = ServiceAreaResult{};
    outError = "time budget must be finite and > 0";
    return false;
  }
  return runIsochrones(center, vehicle, {budgetSec}, out, outError);
}

bool RoadNetworkAnalyzer::computeIsochrones(const ServiceAreaRequest& req, ServiceAreaResult& out,
                                            std::string& outError)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return runIsochrones(req.center, req.vehicle, req.thresholdsSec, out, outError);
}

bool RoadNetworkAnalyzer::analyzeConnectivity(const VehicleProfile& vehicle, ConnectivityReport& out,
                                              std::string& outError)
{
  std::lock_guard<std::mutex> lock(m_mutex);
  out = ConnectivityReport{};

  if (!validateGraph(outError)) return false;
  if (!ValidateVehicleProfile(vehicle, outError)) return false;

  std::vector<std::uint8_t> mask(m_graph.edges.size(), 0);
  for (int ei = 0; ei < static_cast<int>(m_graph.edges.size()); ++ei) {
    const RoadGraphEdge& e = m_graph.edges[static_cast<std::size_t>(ei)];
    if (!e.active || e.roadClass == RoadClass::Access) continue;

    ++out.totalEdges;
    out.totalLength += e.length;

    const double ratio = (e.originalWidth > 0.0) ? e.currentWidth / e.originalWidth : 0.0;
    if (ratio < 0.5) ++out.severelyObstructed;

    if (IsEdgePassable(e, vehicle)) {
      mask[static_cast<std::size_t>(ei)] = 1;
      ++out.passableEdges;
      out.passableLength += e.length;
    } else {
      ++out.blockedEdges;
      out.blockedLength += e.length;
      out.blockedEdgeIds.push_back(ei);
    }
  }

  const RoadGraphConnectivityResult cr = ComputeRoadGraphConnectivity(m_graph, mask);
  out.components = cr.componentsWithEdges;
  out.fragmented = cr.componentsWithEdges > 1;
  if (cr.largestComponent >= 0) {
    out.largestComponentNodes = cr.componentNodes[static_cast<std::size_t>(cr.largestComponent)];
    out.largestComponentEdges = cr.componentEdges[static_cast<std::size_t>(cr.largestComponent)];
  }
  out.bridgeEdges = cr.bridgeEdges;

  outError.clear();
  return true;
}

RoadGraph RoadNetworkAnalyzer::snapshotGraph() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_graph;
}

int RoadNetworkAnalyzer::cleanupIssues() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_cleanupIssues;
}

std::string RoadNetworkAnalyzer::lastCleanupError() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_lastCleanupError;
}

} // namespace urbanres

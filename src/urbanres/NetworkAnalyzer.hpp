#pragma once

#include "urbanres/Disaster.hpp"
#include "urbanres/Geometry.hpp"
#include "urbanres/Isochrone.hpp"
#include "urbanres/RoadGraph.hpp"
#include "urbanres/RoadGraphAttach.hpp"
#include "urbanres/Vehicle.hpp"

#include <cstdint>
#include <limits>
#include <mutex>
#include <string>
#include <vector>

namespace urbanres {

// Live routable graph plus the queries emergency planning needs.
//
// The analyzer owns its RoadGraph. Every public operation takes the instance mutex so that
// obstruction updates, query-point attachment, search and cleanup never interleave on one
// graph. Separate analyzers share nothing.

struct AnalyzerConfig {
  AttachConfig attach;

  int maxExpansions = 1000;         // A* node expansions per search
  int partialMaxIterations = 5000;  // Dijkstra bound for the partial-path fallback

  double diversityFactor = 1.5;     // cost multiplier per previous use of an edge
  double maxOverlapFraction = 0.7;  // alternatives must overlap every accepted path less
  int maxAlternativePaths = 3;
};

bool ValidateAnalyzerConfig(const AnalyzerConfig& cfg, std::string& outError);

enum class PathReason : std::uint8_t {
  None = 0,
  NoPath = 1,
  TimeLimitExceeded = 2,
  ExpansionLimit = 3,
};

const char* ToString(PathReason r);

struct PathRequest {
  Vec2 start;
  Vec2 end;
  VehicleProfile vehicle;
  double maxTravelTimeSec = std::numeric_limits<double>::infinity();
};

struct BlockedRoad {
  int edge = -1;
  double currentWidth = 0.0;
  double originalWidth = 0.0;
};

struct PathResult {
  bool success = false;
  bool isPartial = false;
  PathReason reason = PathReason::None;

  std::vector<Vec2> coords;
  std::vector<int> edges; // original edge ids in travel order, access links omitted
  double distance = 0.0;  // meters
  double travelTime = 0.0; // seconds
  int expansions = 0;

  std::vector<BlockedRoad> blockedRoads;

  AttachInfo startAttach;
  AttachInfo endAttach;
};

struct AlternativePathsResult {
  std::vector<PathResult> paths;
  int attempts = 0;
};

struct ServiceAreaRequest {
  Vec2 center;
  VehicleProfile vehicle;
  std::vector<double> thresholdsSec; // one band per threshold
};

struct ServiceAreaResult {
  Vec2 center;
  AttachInfo centerAttach;
  std::vector<IsochroneBand> bands; // ascending thresholds, nested
};

struct ObstructionApplyStats {
  int obstructions = 0;
  int edgesObstructed = 0; // distinct edges after min-reduction
  int unknownEdges = 0;    // obstructions naming edges outside the graph
  int invalidWidths = 0;   // non-finite remaining widths
};

struct ConnectivityReport {
  int totalEdges = 0;
  int passableEdges = 0;
  int blockedEdges = 0;
  double totalLength = 0.0;
  double passableLength = 0.0;
  double blockedLength = 0.0;

  int severelyObstructed = 0; // width ratio < 0.5

  int components = 0; // components of the passable subgraph containing edges
  int largestComponentNodes = 0;
  int largestComponentEdges = 0;
  bool fragmented = false;

  std::vector<int> blockedEdgeIds;
  std::vector<int> bridgeEdges; // passable roads whose loss splits their component
};

class RoadNetworkAnalyzer {
public:
  explicit RoadNetworkAnalyzer(RoadGraph graph, AnalyzerConfig cfg = {});

  RoadNetworkAnalyzer(const RoadNetworkAnalyzer&) = delete;
  RoadNetworkAnalyzer& operator=(const RoadNetworkAnalyzer&) = delete;

  // Reset every edge to its original width, then apply the minimum remaining width per
  // edge. An empty list is a plain reset.
  ObstructionApplyStats applyObstructions(const std::vector<RoadObstruction>& obstructions);
  void clearObstructions();

  // Returns false only for malformed requests. Unreachable targets come back as a
  // partial result with a reason code.
  bool findPath(const PathRequest& req, PathResult& out, std::string& outError);

  bool findAlternativePaths(const PathRequest& req, AlternativePathsResult& out, std::string& outError);

  // Single-band service area within budgetSec.
  bool computeServiceArea(Vec2 center, const VehicleProfile& vehicle, double budgetSec, ServiceAreaResult& out,
                          std::string& outError);

  bool computeIsochrones(const ServiceAreaRequest& req, ServiceAreaResult& out, std::string& outError);

  bool analyzeConnectivity(const VehicleProfile& vehicle, ConnectivityReport& out, std::string& outError);

  // Copy of the graph at rest (no transient query nodes).
  RoadGraph snapshotGraph() const;

  // Rollbacks that detected drift, and the most recent diagnostic.
  int cleanupIssues() const;
  std::string lastCleanupError() const;

  const AnalyzerConfig& config() const { return m_cfg; }

private:
  bool validateGraph(std::string& outError) const;
  double heuristicSpeed(const VehicleProfile& vehicle) const;
  void fillRoute(const std::vector<int>& nodes, const std::vector<int>& edges, const VehicleProfile& vehicle,
                 PathResult& out) const;
  bool runIsochrones(Vec2 center, const VehicleProfile& vehicle, const std::vector<double>& thresholds,
                     ServiceAreaResult& out, std::string& outError);

  mutable std::mutex m_mutex;
  RoadGraph m_graph;
  AnalyzerConfig m_cfg;

  int m_cleanupIssues = 0;
  std::string m_lastCleanupError;
};

} // namespace urbanres

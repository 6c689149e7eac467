#pragma once

#include "urbanres/Geometry.hpp"
#include "urbanres/RoadGraph.hpp"
#include "urbanres/RoadGraphSearch.hpp"

#include <vector>

namespace urbanres {

// Reachability boundary for one travel-time threshold.
struct IsochroneBand {
  double thresholdSec = 0.0;
  int nodeCount = 0;   // nodes with accumulated time <= threshold
  Polygon hull;        // convex hull of those nodes (CCW); fewer than 3 points when degenerate
  double areaM2 = 0.0; // 0 for degenerate hulls
  double maxReachedSec = 0.0;
};

// Derive one band per threshold from a single shortest-path tree. Thresholds are sorted
// ascending; non-finite or negative thresholds are dropped.
std::vector<IsochroneBand> BuildIsochroneBands(const RoadGraph& g, const ShortestPathTree& tree,
                                               std::vector<double> thresholdsSec);

// thresholds = interval, 2*interval, ... <= budget (the budget itself is always the last one).
std::vector<double> IsochroneThresholds(double budgetSec, double intervalSec);

} // namespace urbanres

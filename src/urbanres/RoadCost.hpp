#pragma once

#include "urbanres/RoadGraph.hpp"
#include "urbanres/Vehicle.hpp"

#include <limits>

namespace urbanres {

// Travel-time model for one edge under its current (possibly obstructed) width.

constexpr double kImpassable = std::numeric_limits<double>::infinity();

// current_width >= vehicle.minRoadWidth
bool IsEdgePassable(const RoadGraphEdge& e, const VehicleProfile& v);

// Slow-down factor for a narrowed road:
//   ratio >= 0.9 -> 1.0 (1.3 when current < 1.2 * min width)
//   ratio >= 0.7 -> 1.5
//   ratio >= 0.5 -> 2.0
//   else         -> 3.0
double WidthPenaltyMultiplier(const RoadGraphEdge& e, const VehicleProfile& v);

// Seconds at min(speed limit, vehicle max speed), times the width penalty.
// kImpassable when the vehicle does not fit.
double EdgeTraversalCost(const RoadGraphEdge& e, const VehicleProfile& v);

// Edge speed used by the router in m/s.
double EdgeSpeedMps(const RoadGraphEdge& e, const VehicleProfile& v);

} // namespace urbanres

#include "urbanres/RoadCost.hpp"

#include <algorithm>
#include <cmath>

namespace urbanres {

bool IsEdgePassable(const RoadGraphEdge& e, const VehicleProfile& v)
{
  return e.currentWidth >= v.minRoadWidth;
}

double WidthPenaltyMultiplier(const RoadGraphEdge& e, const VehicleProfile& v)
{
  const double ratio = (e.originalWidth > 0.0) ? e.currentWidth / e.originalWidth : 0.0;

  if (ratio >= 0.9) return (e.currentWidth < 1.2 * v.minRoadWidth) ? 1.3 : 1.0;
  if (ratio >= 0.7) return 1.5;
  if (ratio >= 0.5) return 2.0;
  return 3.0;
}

double EdgeSpeedMps(const RoadGraphEdge& e, const VehicleProfile& v)
{
  return std::min(e.speedLimitKmh, v.maxSpeedKmh) / 3.6;
}

double EdgeTraversalCost(const RoadGraphEdge& e, const VehicleProfile& v)
{
  if (!IsEdgePassable(e, v)) return kImpassable;

  const double speed = EdgeSpeedMps(e, v);
  if (!(speed > 0.0)) return kImpassable;

  return (e.length / speed) * WidthPenaltyMultiplier(e, v);
}

} // namespace urbanres

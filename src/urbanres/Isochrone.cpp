#include "urbanres/Isochrone.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace urbanres {

std::vector<IsochroneBand> BuildIsochroneBands(const RoadGraph& g, const ShortestPathTree& tree,
                                               std::vector<double> thresholdsSec)
{
  thresholdsSec.erase(std::remove_if(thresholdsSec.begin(), thresholdsSec.end(),
                                     [](double t) { return !std::isfinite(t) || t < 0.0; }),
                      thresholdsSec.end());
  std::sort(thresholdsSec.begin(), thresholdsSec.end());
  thresholdsSec.erase(std::unique(thresholdsSec.begin(), thresholdsSec.end()), thresholdsSec.end());

  // Settle order is nondecreasing in time, so each band is a prefix of it.
  std::vector<IsochroneBand> out;
  out.reserve(thresholdsSec.size());

  std::vector<Vec2> pts;
  std::size_t next = 0;
  double maxReached = 0.0;

  for (const double thr : thresholdsSec) {
    while (next < tree.settled.size()) {
      const int node = tree.settled[next];
      const double d = tree.dist[static_cast<std::size_t>(node)];
      if (d > thr) break;
      pts.push_back(g.nodes[static_cast<std::size_t>(node)].pos);
      maxReached = std::max(maxReached, d);
      ++next;
    }

    IsochroneBand band;
    band.thresholdSec = thr;
    band.nodeCount = static_cast<int>(pts.size());
    band.maxReachedSec = maxReached;
    band.hull = ConvexHull(pts);
    band.areaM2 = (band.hull.size() >= 3) ? PolygonArea(band.hull) : 0.0;
    out.push_back(std::move(band));
  }

  return out;
}

std::vector<double> IsochroneThresholds(double budgetSec, double intervalSec)
{
  std::vector<double> out;
  if (!(budgetSec > 0.0) || !std::isfinite(budgetSec)) return out;

  if (intervalSec > 0.0 && std::isfinite(intervalSec)) {
    for (int i = 1;; ++i) {
      const double t = intervalSec * static_cast<double>(i);
      if (t >= budgetSec - 1e-9) break;
      out.push_back(t);
    }
  }
  out.push_back(budgetSec);
  return out;
}

} // namespace urbanres

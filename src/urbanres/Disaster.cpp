#include "urbanres/Disaster.hpp"

#include "urbanres/Random.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <set>
#include <utility>

namespace urbanres {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Overlaps thinner than this (m^2) are numerical noise from touching polygons.
constexpr double kMinOverlapArea = 1e-6;

double IntervalOverlap(double a0, double a1, double b0, double b1)
{
  return std::max(0.0, std::min(a1, b1) - std::max(a0, b0));
}

struct Bounds2 {
  double minX = std::numeric_limits<double>::infinity();
  double minY = std::numeric_limits<double>::infinity();
  double maxX = -std::numeric_limits<double>::infinity();
  double maxY = -std::numeric_limits<double>::infinity();

  void add(Vec2 p)
  {
    minX = std::min(minX, p.x);
    minY = std::min(minY, p.y);
    maxX = std::max(maxX, p.x);
    maxY = std::max(maxY, p.y);
  }

  bool overlaps(const Bounds2& o, double pad) const
  {
    return !(maxX + pad < o.minX || o.maxX + pad < minX || maxY + pad < o.minY || o.maxY + pad < minY);
  }
};

Bounds2 BoundsOf(const Polygon& poly)
{
  Bounds2 b;
  for (const Vec2& p : poly) b.add(p);
  return b;
}

bool ValidNode(const RoadGraph& g, int id)
{
  return id >= 0 && id < static_cast<int>(g.nodes.size());
}

// Conservative estimate for an edge without usable segment geometry.
bool ApproximateBlockage(Vec2 p, const RoadGraphEdge& e, const Polygon& obstacle, const DisasterConfig& cfg,
                         RoadObstruction& out)
{
  if (DistanceToPolygon(p, obstacle) > e.originalWidth * 0.5) return false;

  out.polygon = obstacle;
  out.remainingWidth = e.originalWidth * (1.0 - cfg.fallbackBlockage);
  out.blockedPercentage = cfg.fallbackBlockage * 100.0;
  out.blockedLength = 0.0;
  out.approximate = true;
  out.hasDirectional = false;
  return true;
}

} // namespace

bool ValidateDisasterConfig(const DisasterConfig& cfg, std::string& outError)
{
  if (!std::isfinite(cfg.intensity) || cfg.intensity < 1.0 || cfg.intensity > 10.0) {
    outError = "disaster intensity must be in [1,10]";
    return false;
  }
  for (const double r : cfg.baseRates) {
    if (!std::isfinite(r) || r < 0.0 || r > 1.0) {
      outError = "base collapse rates must be in [0,1]";
      return false;
    }
  }
  if (cfg.crossSections < 1) {
    outError = "cross_sections must be >= 1";
    return false;
  }
  if (!(cfg.directionThreshold >= 0.0)) {
    outError = "direction_threshold must be >= 0";
    return false;
  }
  if (!(cfg.fallbackBlockage >= 0.0 && cfg.fallbackBlockage <= 1.0)) {
    outError = "fallback_blockage must be in [0,1]";
    return false;
  }
  outError.clear();
  return true;
}

double CollapseProbability(VulnerabilityLevel level, double intensity, const DisasterConfig& cfg)
{
  const double base = cfg.baseRates[static_cast<std::size_t>(level)];
  const double factor = 0.5 + 0.5 * std::min(1.0, intensity / 10.0);
  return std::clamp(base * factor, 0.0, 1.0);
}

double CollapseSeverity(VulnerabilityLevel level, double height, double trunkWidth)
{
  static const double kLevelFactor[kVulnerabilityLevelCount] = {1.0, 0.7, 0.4};
  const double size = std::min(1.0, (height * trunkWidth) / 20.0);
  return std::min(1.0, size * kLevelFactor[static_cast<std::size_t>(level)]);
}

Polygon BuildBlockagePolygon(Vec2 base, double angleDeg, double height, double trunkWidth)
{
  const double rad = angleDeg * kPi / 180.0;
  const Vec2 dir{std::cos(rad), std::sin(rad)};
  const Vec2 off = Perp(dir) * (trunkWidth * 0.5);
  const Vec2 end = base + dir * height;

  return Polygon{base + off, base - off, end - off, end + off};
}

bool MeasureRoadBlockage(Vec2 a, Vec2 b, double width, const std::vector<LaneInfo>& lanes, bool bidirectional,
                         const Polygon& obstacle, const DisasterConfig& cfg, RoadObstruction& out)
{
  const Polygon footprint = SegmentFootprint(a, b, width);
  if (footprint.empty()) return false;

  Polygon overlap = ClipConvexPolygon(obstacle, footprint);
  if (overlap.size() < 3 || PolygonArea(overlap) < kMinOverlapArea) return false;

  const double len = Distance(a, b);
  const Vec2 u = (b - a) * (1.0 / len);
  const Vec2 n = Perp(u); // left of travel a->b
  const double half = width * 0.5;

  double sMin = std::numeric_limits<double>::infinity();
  double sMax = -std::numeric_limits<double>::infinity();
  for (const Vec2& v : overlap) {
    const double s = Dot(v - a, u);
    sMin = std::min(sMin, s);
    sMax = std::max(sMax, s);
  }
  sMin = std::clamp(sMin, 0.0, len);
  sMax = std::clamp(sMax, 0.0, len);

  // Forward lanes occupy the right side, t in [-half, center].
  double forwardWidth = 0.0;
  for (const LaneInfo& lane : lanes) {
    if (lane.direction == LaneDirection::Forward) forwardWidth += lane.width;
  }
  const bool directional = bidirectional && forwardWidth > 0.0 && forwardWidth < width;
  const double center = -half + forwardWidth;
  const double backwardWidth = width - forwardWidth;

  double minRemaining = width;
  double minForward = forwardWidth;
  double minBackward = backwardWidth;

  const int samples = (sMax - sMin > kGeomEps) ? std::max(1, cfg.crossSections) : 1;
  for (int i = 0; i < samples; ++i) {
    const double s = (samples == 1) ? 0.5 * (sMin + sMax)
                                    : sMin + (static_cast<double>(i) + 0.5) / static_cast<double>(samples) * (sMax - sMin);
    const Vec2 origin = a + u * s;

    double t0 = 0.0;
    double t1 = 0.0;
    double blocked = 0.0;
    double blockedForward = 0.0;
    double blockedBackward = 0.0;
    if (ClipLineToConvexPolygon(origin, n, obstacle, t0, t1)) {
      // The road polygon's cross-section is [-half, half].
      t0 = std::max(t0, -half);
      t1 = std::min(t1, half);
      if (t1 > t0) {
        blocked = t1 - t0;
        blockedForward = IntervalOverlap(t0, t1, -half, center);
        blockedBackward = IntervalOverlap(t0, t1, center, half);
      }
    }

    minRemaining = std::min(minRemaining, width - blocked);
    minForward = std::min(minForward, forwardWidth - blockedForward);
    minBackward = std::min(minBackward, backwardWidth - blockedBackward);
  }

  out.polygon = std::move(overlap);
  out.approximate = false;
  out.blockedLength = std::max(0.0, sMax - sMin);

  if (directional) {
    out.hasDirectional = true;
    out.forwardRemaining = std::max(0.0, minForward);
    out.backwardRemaining = std::max(0.0, minBackward);
    out.forwardAffected = out.forwardRemaining < cfg.directionThreshold;
    out.backwardAffected = out.backwardRemaining < cfg.directionThreshold;
    out.remainingWidth = std::min(out.forwardRemaining, out.backwardRemaining);
  } else {
    out.hasDirectional = false;
    out.forwardRemaining = 0.0;
    out.backwardRemaining = 0.0;
    out.forwardAffected = false;
    out.backwardAffected = false;
    out.remainingWidth = std::max(0.0, minRemaining);
  }

  out.remainingWidth = std::clamp(out.remainingWidth, 0.0, width);
  out.blockedPercentage = std::clamp((1.0 - out.remainingWidth / width) * 100.0, 0.0, 100.0);
  return true;
}

std::vector<RoadObstruction> ComputeRoadObstructions(const RoadGraph& g, const std::vector<TreeCollapseEvent>& events,
                                                     const DisasterConfig& cfg)
{
  std::vector<RoadObstruction> out;

  for (const TreeCollapseEvent& ev : events) {
    if (ev.blockage.size() < 3) continue;
    const Bounds2 evBounds = BoundsOf(ev.blockage);

    for (int ei = 0; ei < static_cast<int>(g.edges.size()); ++ei) {
      const RoadGraphEdge& e = g.edges[static_cast<std::size_t>(ei)];
      if (!e.active || e.roadClass == RoadClass::Access) continue;

      const bool hasA = ValidNode(g, e.a);
      const bool hasB = ValidNode(g, e.b);
      if (!hasA && !hasB) continue;

      RoadObstruction obs;
      bool hit = false;

      if (hasA && hasB) {
        const Vec2 pa = g.nodes[static_cast<std::size_t>(e.a)].pos;
        const Vec2 pb = g.nodes[static_cast<std::size_t>(e.b)].pos;

        Bounds2 eb;
        eb.add(pa);
        eb.add(pb);
        if (!eb.overlaps(evBounds, e.originalWidth * 0.5)) continue;

        if (Distance(pa, pb) > kGeomEps) {
          hit = MeasureRoadBlockage(pa, pb, e.originalWidth, e.lanes, e.bidirectional, ev.blockage, cfg, obs);
        } else {
          hit = ApproximateBlockage(pa, e, ev.blockage, cfg, obs);
        }
      } else {
        const Vec2 p = g.nodes[static_cast<std::size_t>(hasA ? e.a : e.b)].pos;
        hit = ApproximateBlockage(p, e, ev.blockage, cfg, obs);
      }

      if (!hit) continue;

      obs.id = static_cast<int>(out.size());
      obs.edge = ei;
      obs.eventId = ev.id;
      out.push_back(std::move(obs));
    }
  }

  return out;
}

DisasterStats SummarizeDisaster(const std::vector<TreeCollapseEvent>& events,
                                const std::vector<RoadObstruction>& obstructions)
{
  DisasterStats s;
  s.collapsed = static_cast<int>(events.size());
  for (const TreeCollapseEvent& ev : events) {
    s.collapsedByLevel[static_cast<std::size_t>(ev.level)] += 1;
  }

  std::set<int> edges;
  double pctSum = 0.0;
  for (const RoadObstruction& o : obstructions) {
    edges.insert(o.edge);
    s.totalBlockedLength += o.blockedLength;
    pctSum += o.blockedPercentage;
    if (o.approximate) ++s.approximateObstructions;
  }

  s.obstructions = static_cast<int>(obstructions.size());
  s.roadsAffected = static_cast<int>(edges.size());
  s.averageBlockagePct = obstructions.empty() ? 0.0 : pctSum / static_cast<double>(obstructions.size());
  return s;
}

bool SimulateTreeCollapse(const RoadGraph& g, const std::vector<Tree>& trees, const DisasterConfig& cfg,
                          std::uint64_t seed, DisasterResult& out, std::string& outError)
{
  if (!ValidateDisasterConfig(cfg, outError)) return false;

  DisasterResult result;
  result.seed = seed;

  RNG rng(seed);
  int skipped = 0;

  for (const Tree& tree : trees) {
    if (!IsFinite(tree.pos) || !std::isfinite(tree.height) || !std::isfinite(tree.trunkWidth) ||
        tree.height <= 0.0 || tree.trunkWidth <= 0.0) {
      ++skipped;
      continue;
    }

    const double p = CollapseProbability(tree.level, cfg.intensity, cfg);
    const double roll = rng.nextF01();
    const double angle = rng.rangeDouble(0.0, 360.0);
    if (roll >= p) continue;

    TreeCollapseEvent ev;
    ev.id = static_cast<int>(result.events.size());
    ev.treeId = tree.id;
    ev.location = tree.pos;
    ev.level = tree.level;
    ev.angleDeg = angle;
    ev.height = tree.height;
    ev.trunkWidth = tree.trunkWidth;
    ev.severity = CollapseSeverity(tree.level, tree.height, tree.trunkWidth);
    ev.blockage = BuildBlockagePolygon(tree.pos, angle, tree.height, tree.trunkWidth);
    result.events.push_back(std::move(ev));
  }

  result.obstructions = ComputeRoadObstructions(g, result.events, cfg);
  result.stats = SummarizeDisaster(result.events, result.obstructions);
  result.stats.treesEvaluated = static_cast<int>(trees.size()) - skipped;
  result.stats.treesSkipped = skipped;

  out = std::move(result);
  outError.clear();
  return true;
}

} // namespace urbanres

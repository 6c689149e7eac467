#include "urbanres/MapSynth.hpp"

#include "urbanres/Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace urbanres {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Crossing points closer than this to an existing endpoint reuse that endpoint.
constexpr double kEndpointSnap = 0.5;

// Crossing points are deduplicated on a 1 cm grid.
constexpr double kKeyScale = 100.0;

constexpr double kMinSegmentLength = 1e-6;

double DegToRad(double deg) { return deg * kPi / 180.0; }

bool InUnit(double p) { return std::isfinite(p) && p >= 0.0 && p <= 1.0; }

struct PointKey {
  long long x = 0;
  long long y = 0;

  bool operator<(const PointKey& o) const
  {
    if (x != o.x) return x < o.x;
    return y < o.y;
  }
};

PointKey KeyOf(Vec2 p)
{
  return PointKey{std::llround(p.x * kKeyScale), std::llround(p.y * kKeyScale)};
}

struct WorkSegment {
  int a = -1;
  int b = -1;
  RoadSpec spec;
  std::vector<std::pair<double, int>> splits; // (t along a->b, node)
};

struct NodeTable {
  std::vector<Vec2> pos;
  std::map<PointKey, int> byKey;

  int at(Vec2 p, bool* created = nullptr)
  {
    const PointKey k = KeyOf(p);
    const auto it = byKey.find(k);
    if (it != byKey.end()) {
      if (created) *created = false;
      return it->second;
    }
    const int id = static_cast<int>(pos.size());
    pos.push_back(p);
    byKey.emplace(k, id);
    if (created) *created = true;
    return id;
  }
};

void AddHorizontalAlley(const MapSynthConfig& cfg, double left, double right, double bottom, double top,
                        bool fullLength, RNG& rng, std::vector<RoadSegment>& out)
{
  const double y = bottom + rng.rangeDouble(cfg.alleyPositionMin, cfg.alleyPositionMax) * (top - bottom);
  const bool bidirectional = rng.chance(cfg.alleyBidirectionalChance);

  double sx = left;
  double ex = right;
  double ey = y;

  if (!fullLength) {
    const double frac = rng.rangeDouble(cfg.partialAlleyMinFrac, cfg.partialAlleyMaxFrac);
    if (rng.chance(0.5)) {
      sx = left;
      ex = left + frac * (right - left);
    } else {
      ex = right;
      sx = right - frac * (right - left);
    }

    if (rng.chance(cfg.alleyTiltChance)) {
      const double maxTilt = DegToRad(cfg.alleyMaxTiltDeg);
      const double tilt = rng.rangeDouble(-maxTilt, maxTilt);
      double off = (ex - sx) * std::tan(tilt);
      if (y + off > top - cfg.alleyBlockMargin) {
        off = top - y - cfg.alleyBlockMargin;
      } else if (y + off < bottom + cfg.alleyBlockMargin) {
        off = bottom - y + cfg.alleyBlockMargin;
      }
      ey = y + off;
    }
  }

  const Vec2 a{sx, y};
  const Vec2 b{ex, ey};
  if (Distance(a, b) < cfg.minRoadLength) return;
  out.push_back(RoadSegment{a, b, SecondaryRoadSpec(cfg, bidirectional), RoadSegmentOrigin::Alley});
}

void AddVerticalAlley(const MapSynthConfig& cfg, double left, double right, double bottom, double top,
                      bool fullLength, RNG& rng, std::vector<RoadSegment>& out)
{
  const double x = left + rng.rangeDouble(cfg.alleyPositionMin, cfg.alleyPositionMax) * (right - left);
  const bool bidirectional = rng.chance(cfg.alleyBidirectionalChance);

  double sy = bottom;
  double ey = top;
  double ex = x;

  if (!fullLength) {
    const double frac = rng.rangeDouble(cfg.partialAlleyMinFrac, cfg.partialAlleyMaxFrac);
    if (rng.chance(0.5)) {
      sy = bottom;
      ey = bottom + frac * (top - bottom);
    } else {
      ey = top;
      sy = top - frac * (top - bottom);
    }

    if (rng.chance(cfg.alleyTiltChance)) {
      const double maxTilt = DegToRad(cfg.alleyMaxTiltDeg);
      const double tilt = rng.rangeDouble(-maxTilt, maxTilt);
      double off = (ey - sy) * std::tan(tilt);
      if (x + off > right - cfg.alleyBlockMargin) {
        off = right - x - cfg.alleyBlockMargin;
      } else if (x + off < left + cfg.alleyBlockMargin) {
        off = left - x + cfg.alleyBlockMargin;
      }
      ex = x + off;
    }
  }

  const Vec2 a{x, sy};
  const Vec2 b{ex, ey};
  if (Distance(a, b) < cfg.minRoadLength) return;
  out.push_back(RoadSegment{a, b, SecondaryRoadSpec(cfg, bidirectional), RoadSegmentOrigin::Alley});
}

void SortUnique(std::vector<double>& v)
{
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end(), [](double a, double b) { return std::fabs(a - b) < 1e-6; }), v.end());
}

} // namespace

bool ValidateMapSynthConfig(const MapSynthConfig& cfg, std::string& outError)
{
  auto fail = [&](const std::string& msg) {
    outError = msg;
    return false;
  };

  if (!std::isfinite(cfg.width) || !std::isfinite(cfg.height) || cfg.width <= 0.0 || cfg.height <= 0.0) {
    return fail("map size must be positive");
  }
  if (cfg.mainRoadCount < 0) return fail("main_road_count must be >= 0");
  if (!(cfg.mainRoadInset >= 0.0) || 2.0 * cfg.mainRoadInset >= std::min(cfg.width, cfg.height)) {
    return fail("main_road_inset must be >= 0 and smaller than half the map");
  }
  if (cfg.diagonalMin < 0 || cfg.diagonalMax < cfg.diagonalMin) return fail("diagonal range is invalid");
  if (!(cfg.diagonalOvershoot >= 1.0)) return fail("diagonal_overshoot must be >= 1");
  if (cfg.alleysPerBlockMin < 0 || cfg.alleysPerBlockMax < cfg.alleysPerBlockMin) {
    return fail("alleys per block range is invalid");
  }
  if (!(cfg.mainRoadWidth > 0.0) || !(cfg.secondaryRoadWidth > 0.0)) return fail("road widths must be > 0");
  if (cfg.mainRoadLanes < 1 || cfg.secondaryRoadLanes < 1) return fail("lane counts must be >= 1");
  if (!(cfg.mainRoadSpeedKmh > 0.0) || !(cfg.secondaryRoadSpeedKmh > 0.0)) return fail("speed limits must be > 0");
  if (!InUnit(cfg.fullLengthAlleyChance) || !InUnit(cfg.horizontalAlleyChance) ||
      !InUnit(cfg.alleyBidirectionalChance) || !InUnit(cfg.alleyTiltChance)) {
    return fail("alley probabilities must be in [0,1]");
  }
  if (!InUnit(cfg.alleyPositionMin) || !InUnit(cfg.alleyPositionMax) || cfg.alleyPositionMax < cfg.alleyPositionMin) {
    return fail("alley position range must be within [0,1]");
  }
  if (!InUnit(cfg.partialAlleyMinFrac) || !InUnit(cfg.partialAlleyMaxFrac) ||
      cfg.partialAlleyMaxFrac < cfg.partialAlleyMinFrac) {
    return fail("partial alley fraction range must be within [0,1]");
  }
  if (!(cfg.alleyMaxTiltDeg >= 0.0 && cfg.alleyMaxTiltDeg < 90.0)) return fail("alley_max_tilt_deg must be in [0,90)");
  if (!(cfg.alleyBlockMargin >= 0.0)) return fail("alley_block_margin must be >= 0");
  if (!(cfg.minRoadLength >= 0.0)) return fail("min_road_length must be >= 0");

  outError.clear();
  return true;
}

MapBounds BoundsOf(const MapSynthConfig& cfg)
{
  MapBounds b;
  b.minX = 0.0;
  b.minY = 0.0;
  b.maxX = cfg.width;
  b.maxY = cfg.height;
  return b;
}

RoadSpec MainRoadSpec(const MapSynthConfig& cfg)
{
  RoadSpec s;
  s.roadClass = RoadClass::Main;
  s.width = cfg.mainRoadWidth;
  s.lanes = cfg.mainRoadLanes;
  s.bidirectional = true;
  s.speedLimitKmh = cfg.mainRoadSpeedKmh;
  return s;
}

RoadSpec SecondaryRoadSpec(const MapSynthConfig& cfg, bool bidirectional)
{
  RoadSpec s;
  s.roadClass = RoadClass::Secondary;
  s.width = cfg.secondaryRoadWidth;
  s.lanes = cfg.secondaryRoadLanes;
  s.bidirectional = bidirectional;
  s.speedLimitKmh = cfg.secondaryRoadSpeedKmh;
  return s;
}

std::vector<RoadSegment> GenerateMainRoadSegments(const MapSynthConfig& cfg)
{
  std::vector<RoadSegment> out;
  const MapBounds bounds = BoundsOf(cfg);
  const RoadSpec spec = MainRoadSpec(cfg);

  const int vertical = cfg.mainRoadCount / 2;
  const int horizontal = cfg.mainRoadCount - vertical;

  for (int i = 0; i < vertical; ++i) {
    const double x = bounds.minX + static_cast<double>(i + 1) * bounds.width() / static_cast<double>(vertical + 1);
    const Vec2 a{x, bounds.minY + cfg.mainRoadInset};
    const Vec2 b{x, bounds.maxY - cfg.mainRoadInset};
    out.push_back(RoadSegment{a, b, spec, RoadSegmentOrigin::MainStraight});
  }

  for (int i = 0; i < horizontal; ++i) {
    const double y = bounds.minY + static_cast<double>(i + 1) * bounds.height() / static_cast<double>(horizontal + 1);
    const Vec2 a{bounds.minX + cfg.mainRoadInset, y};
    const Vec2 b{bounds.maxX - cfg.mainRoadInset, y};
    out.push_back(RoadSegment{a, b, spec, RoadSegmentOrigin::MainStraight});
  }

  return out;
}

std::vector<RoadSegment> GenerateAlleySegments(const MapSynthConfig& cfg, const std::vector<RoadSegment>& mains,
                                               RNG& rng)
{
  std::vector<RoadSegment> out;

  std::vector<double> xs;
  std::vector<double> ys;
  for (const RoadSegment& s : mains) {
    if (s.origin != RoadSegmentOrigin::MainStraight) continue;
    if (std::fabs(s.a.x - s.b.x) < 1e-6) xs.push_back(0.5 * (s.a.x + s.b.x));
    if (std::fabs(s.a.y - s.b.y) < 1e-6) ys.push_back(0.5 * (s.a.y + s.b.y));
  }
  SortUnique(xs);
  SortUnique(ys);

  for (std::size_t i = 0; i + 1 < xs.size(); ++i) {
    for (std::size_t j = 0; j + 1 < ys.size(); ++j) {
      const double left = xs[i];
      const double right = xs[i + 1];
      const double bottom = ys[j];
      const double top = ys[j + 1];

      const int count = rng.rangeInt(cfg.alleysPerBlockMin, cfg.alleysPerBlockMax);
      for (int k = 0; k < count; ++k) {
        const bool fullLength = rng.chance(cfg.fullLengthAlleyChance);
        const bool horizontal = rng.chance(cfg.horizontalAlleyChance);
        if (horizontal) {
          AddHorizontalAlley(cfg, left, right, bottom, top, fullLength, rng, out);
        } else {
          AddVerticalAlley(cfg, left, right, bottom, top, fullLength, rng, out);
        }
      }
    }
  }

  return out;
}

std::vector<RoadSegment> GenerateDiagonalRoadSegments(const MapSynthConfig& cfg, RNG& rng)
{
  static const double kBaseAngles[4] = {30.0, 150.0, 210.0, 330.0};

  std::vector<RoadSegment> out;
  const MapBounds bounds = BoundsOf(cfg);
  const RoadSpec spec = MainRoadSpec(cfg);

  const int count = rng.rangeInt(cfg.diagonalMin, cfg.diagonalMax);
  for (int i = 0; i < count; ++i) {
    const double base = kBaseAngles[rng.rangeInt(0, 3)];
    const double deg = base + rng.rangeDouble(-cfg.diagonalJitterDeg, cfg.diagonalJitterDeg);
    const double rad = DegToRad(deg);
    const double dx = std::cos(rad);
    const double dy = std::sin(rad);

    const bool eastbound = (deg < 90.0 || deg > 270.0);
    const Vec2 start{eastbound ? bounds.minX : bounds.maxX,
                     bounds.minY + rng.rangeDouble(0.3, 0.7) * bounds.height()};

    double len = (std::fabs(dx) > std::fabs(dy)) ? bounds.width() / std::fabs(dx) : bounds.height() / std::fabs(dy);
    len *= cfg.diagonalOvershoot;

    Vec2 a = start;
    Vec2 b{start.x + dx * len, start.y + dy * len};
    if (!ClipSegmentToRect(a, b, bounds.minX, bounds.minY, bounds.maxX, bounds.maxY)) continue;
    if (Distance(a, b) < cfg.minRoadLength) continue;

    out.push_back(RoadSegment{a, b, spec, RoadSegmentOrigin::MainDiagonal});
  }

  return out;
}

RoadGraph BuildRoadGraphFromSegments(const std::vector<RoadSegment>& segments, IntersectionStats* outStats)
{
  IntersectionStats stats;
  stats.segmentsIn = static_cast<int>(segments.size());

  NodeTable table;
  std::vector<WorkSegment> work;
  work.reserve(segments.size());

  std::set<std::pair<int, int>> seenPairs;
  for (const RoadSegment& s : segments) {
    if (!IsFinite(s.a) || !IsFinite(s.b) || Distance(s.a, s.b) < kMinSegmentLength) {
      ++stats.segmentsSkipped;
      continue;
    }
    WorkSegment w;
    w.a = table.at(s.a);
    w.b = table.at(s.b);
    w.spec = s.spec;
    if (w.a == w.b) {
      ++stats.segmentsSkipped;
      continue;
    }
    const std::pair<int, int> key = std::minmax(w.a, w.b);
    if (!seenPairs.insert(key).second) {
      ++stats.segmentsSkipped;
      continue;
    }
    work.push_back(std::move(w));
  }

  auto addSplit = [&](WorkSegment& w, int node) {
    if (node == w.a || node == w.b) return;
    const Vec2 pa = table.pos[static_cast<std::size_t>(w.a)];
    const Vec2 pb = table.pos[static_cast<std::size_t>(w.b)];
    const SegmentProjection proj = ProjectPointOnSegment(table.pos[static_cast<std::size_t>(node)], pa, pb);
    w.splits.emplace_back(proj.t, node);
  };

  const std::size_t n = work.size();
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      WorkSegment& si = work[i];
      WorkSegment& sj = work[j];

      if (si.a == sj.a || si.a == sj.b || si.b == sj.a || si.b == sj.b) continue;

      const Vec2 a0 = table.pos[static_cast<std::size_t>(si.a)];
      const Vec2 a1 = table.pos[static_cast<std::size_t>(si.b)];
      const Vec2 b0 = table.pos[static_cast<std::size_t>(sj.a)];
      const Vec2 b1 = table.pos[static_cast<std::size_t>(sj.b)];

      if (std::max(a0.x, a1.x) < std::min(b0.x, b1.x) || std::max(b0.x, b1.x) < std::min(a0.x, a1.x) ||
          std::max(a0.y, a1.y) < std::min(b0.y, b1.y) || std::max(b0.y, b1.y) < std::min(a0.y, a1.y)) {
        continue;
      }

      const SegmentIntersection hit = IntersectSegments(a0, a1, b0, b1);
      if (hit.kind != SegmentIntersectionKind::Point) continue;
      ++stats.crossings;

      // Reuse an endpoint when the crossing is a T-junction (or nearly so).
      int node = -1;
      double bestDist = kEndpointSnap;
      for (const int cand : {si.a, si.b, sj.a, sj.b}) {
        const double d = Distance(hit.point, table.pos[static_cast<std::size_t>(cand)]);
        if (d <= bestDist) {
          bestDist = d;
          node = cand;
        }
      }
      if (node < 0) {
        bool created = false;
        node = table.at(hit.point, &created);
        if (created) ++stats.splitNodes;
      }

      addSplit(si, node);
      addSplit(sj, node);
    }
  }

  // Emit sub-edges, compacting away nodes that ended up without edges.
  RoadGraph g;
  std::vector<int> remap(table.pos.size(), -1);
  auto finalNode = [&](int tmp) {
    int& id = remap[static_cast<std::size_t>(tmp)];
    if (id < 0) id = AddRoadNode(g, table.pos[static_cast<std::size_t>(tmp)], NodeKind::Intersection);
    return id;
  };

  std::set<std::pair<int, int>> emitted;
  for (WorkSegment& w : work) {
    std::sort(w.splits.begin(), w.splits.end());

    std::vector<int> chain;
    chain.reserve(w.splits.size() + 2);
    chain.push_back(w.a);
    for (const auto& sp : w.splits) {
      if (sp.second != chain.back()) chain.push_back(sp.second);
    }
    if (w.b != chain.back()) chain.push_back(w.b);

    for (std::size_t k = 0; k + 1 < chain.size(); ++k) {
      const int u = chain[k];
      const int v = chain[k + 1];
      if (u == v) continue;
      if (Distance(table.pos[static_cast<std::size_t>(u)], table.pos[static_cast<std::size_t>(v)]) < kMinSegmentLength) {
        continue;
      }
      if (!emitted.insert(std::minmax(u, v)).second) continue;
      AddRoadEdge(g, finalNode(u), finalNode(v), w.spec);
    }
  }

  if (outStats) *outStats = stats;
  return g;
}

bool SynthesizeRoadMap(const MapSynthConfig& cfg, std::uint64_t seed, SynthesizedMap& out, std::string& outError)
{
  if (!ValidateMapSynthConfig(cfg, outError)) return false;

  RNG rng(seed);

  const std::vector<RoadSegment> mains = GenerateMainRoadSegments(cfg);
  const std::vector<RoadSegment> alleys = GenerateAlleySegments(cfg, mains, rng);
  const std::vector<RoadSegment> diagonals = GenerateDiagonalRoadSegments(cfg, rng);

  std::vector<RoadSegment> all;
  all.reserve(mains.size() + alleys.size() + diagonals.size());
  all.insert(all.end(), mains.begin(), mains.end());
  all.insert(all.end(), alleys.begin(), alleys.end());
  all.insert(all.end(), diagonals.begin(), diagonals.end());

  SynthesizedMap result;
  result.bounds = BoundsOf(cfg);
  result.mainRoads = static_cast<int>(mains.size());
  result.alleys = static_cast<int>(alleys.size());
  result.diagonalRoads = static_cast<int>(diagonals.size());
  result.graph = BuildRoadGraphFromSegments(all, &result.intersections);

  if (result.graph.edges.empty()) {
    std::ostringstream oss;
    oss << "road synthesis produced no edges (main_road_count=" << cfg.mainRoadCount << ")";
    outError = oss.str();
    return false;
  }

  out = std::move(result);
  outError.clear();
  return true;
}

} // namespace urbanres

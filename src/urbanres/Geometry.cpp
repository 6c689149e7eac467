#include "urbanres/Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace urbanres {

namespace {

// Intersection of the infinite lines through (p0,p1) and (q0,q1). Callers guarantee the
// lines are not parallel.
Vec2 LineLineIntersection(Vec2 p0, Vec2 p1, Vec2 q0, Vec2 q1)
{
  const Vec2 r = p1 - p0;
  const Vec2 s = q1 - q0;
  const double denom = Cross(r, s);
  if (std::fabs(denom) < kGeomEps) return p1;
  const double t = Cross(q0 - p0, s) / denom;
  return p0 + r * t;
}

double OrientationSign(const Polygon& poly)
{
  return (SignedPolygonArea(poly) >= 0.0) ? 1.0 : -1.0;
}

} // namespace

SegmentProjection ProjectPointOnSegment(Vec2 p, Vec2 a, Vec2 b)
{
  SegmentProjection out;
  const Vec2 ab = b - a;
  const double len2 = Dot(ab, ab);
  if (len2 < kGeomEps) {
    out.point = a;
    out.t = 0.0;
    out.distance = Distance(p, a);
    return out;
  }

  const double t = std::clamp(Dot(p - a, ab) / len2, 0.0, 1.0);
  out.point = a + ab * t;
  out.t = t;
  out.distance = Distance(p, out.point);
  return out;
}

SegmentIntersection IntersectSegments(Vec2 a0, Vec2 a1, Vec2 b0, Vec2 b1)
{
  SegmentIntersection out;

  const Vec2 r = a1 - a0;
  const Vec2 s = b1 - b0;
  const Vec2 qp = b0 - a0;
  const double rr = Dot(r, r);
  const double ss = Dot(s, s);
  if (rr < kGeomEps || ss < kGeomEps) return out;

  const double denom = Cross(r, s);
  const double scale = std::sqrt(rr * ss);

  if (std::fabs(denom) <= 1e-12 * scale) {
    // Parallel. Only collinear segments can still meet.
    if (std::fabs(Cross(qp, r)) > 1e-9 * std::sqrt(rr)) return out;

    const double t0 = Dot(qp, r) / rr;
    const double t1 = t0 + Dot(s, r) / rr;
    const double lo = std::max(0.0, std::min(t0, t1));
    const double hi = std::min(1.0, std::max(t0, t1));
    if (hi < lo - 1e-12) return out;

    if ((hi - lo) * std::sqrt(rr) <= 1e-9) {
      out.kind = SegmentIntersectionKind::Point;
      out.t = lo;
      out.point = a0 + r * lo;
      out.u = std::clamp(Dot(out.point - b0, s) / ss, 0.0, 1.0);
      return out;
    }

    out.kind = SegmentIntersectionKind::Overlap;
    out.t = lo;
    out.point = a0 + r * lo;
    out.u = std::clamp(Dot(out.point - b0, s) / ss, 0.0, 1.0);
    return out;
  }

  const double t = Cross(qp, s) / denom;
  const double u = Cross(qp, r) / denom;
  const double tol = 1e-9;
  if (t < -tol || t > 1.0 + tol || u < -tol || u > 1.0 + tol) return out;

  out.kind = SegmentIntersectionKind::Point;
  out.t = std::clamp(t, 0.0, 1.0);
  out.u = std::clamp(u, 0.0, 1.0);
  out.point = a0 + r * out.t;
  return out;
}

double SignedPolygonArea(const Polygon& poly)
{
  const std::size_t n = poly.size();
  if (n < 3) return 0.0;

  double area = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& p = poly[i];
    const Vec2& q = poly[(i + 1) % n];
    area += p.x * q.y - q.x * p.y;
  }
  return area * 0.5;
}

double PolygonArea(const Polygon& poly)
{
  return std::fabs(SignedPolygonArea(poly));
}

bool PointInPolygon(Vec2 p, const Polygon& poly)
{
  const std::size_t n = poly.size();
  if (n < 3) return false;

  bool inside = false;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const Vec2& a = poly[i];
    const Vec2& b = poly[j];
    if (((a.y > p.y) != (b.y > p.y)) && (p.x < (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x)) {
      inside = !inside;
    }
  }
  return inside;
}

double DistanceToPolygon(Vec2 p, const Polygon& poly)
{
  if (poly.empty()) return std::numeric_limits<double>::infinity();
  if (poly.size() == 1) return Distance(p, poly.front());
  if (PointInPolygon(p, poly)) return 0.0;

  double best = std::numeric_limits<double>::infinity();
  const std::size_t n = poly.size();
  for (std::size_t i = 0; i < n; ++i) {
    const SegmentProjection proj = ProjectPointOnSegment(p, poly[i], poly[(i + 1) % n]);
    best = std::min(best, proj.distance);
  }
  return best;
}

Polygon ClipConvexPolygon(const Polygon& subject, const Polygon& clip)
{
  if (subject.size() < 3 || clip.size() < 3) return {};

  const double sign = OrientationSign(clip);
  auto inside = [sign](Vec2 p, Vec2 e0, Vec2 e1) {
    return sign * Cross(e1 - e0, p - e0) >= -kGeomEps;
  };

  Polygon output = subject;
  const std::size_t clipN = clip.size();
  for (std::size_t i = 0; i < clipN && !output.empty(); ++i) {
    const Vec2 e0 = clip[i];
    const Vec2 e1 = clip[(i + 1) % clipN];

    const Polygon input = output;
    output.clear();

    const std::size_t n = input.size();
    for (std::size_t k = 0; k < n; ++k) {
      const Vec2 cur = input[k];
      const Vec2 prev = input[(k + n - 1) % n];
      const bool curIn = inside(cur, e0, e1);
      const bool prevIn = inside(prev, e0, e1);

      if (curIn) {
        if (!prevIn) output.push_back(LineLineIntersection(prev, cur, e0, e1));
        output.push_back(cur);
      } else if (prevIn) {
        output.push_back(LineLineIntersection(prev, cur, e0, e1));
      }
    }
  }

  if (output.size() < 3) return {};
  return output;
}

Polygon ConvexHull(std::vector<Vec2> points)
{
  std::sort(points.begin(), points.end(), [](const Vec2& a, const Vec2& b) {
    if (a.x != b.x) return a.x < b.x;
    return a.y < b.y;
  });
  points.erase(std::unique(points.begin(), points.end()), points.end());

  const std::size_t n = points.size();
  if (n < 3) return points;

  Polygon hull(2 * n);
  std::size_t k = 0;

  for (std::size_t i = 0; i < n; ++i) {
    while (k >= 2 && Cross(hull[k - 1] - hull[k - 2], points[i] - hull[k - 2]) <= 0.0) --k;
    hull[k++] = points[i];
  }
  for (std::size_t i = n - 1, lower = k + 1; i > 0; --i) {
    while (k >= lower && Cross(hull[k - 1] - hull[k - 2], points[i - 1] - hull[k - 2]) <= 0.0) --k;
    hull[k++] = points[i - 1];
  }

  hull.resize(k - 1);
  return hull;
}

bool ClipLineToConvexPolygon(Vec2 origin, Vec2 dir, const Polygon& poly, double& outMin, double& outMax)
{
  const std::size_t n = poly.size();
  if (n < 3) return false;
  if (PolygonArea(poly) < kGeomEps) return false;

  const double sign = OrientationSign(poly);
  double lo = -std::numeric_limits<double>::infinity();
  double hi = std::numeric_limits<double>::infinity();

  for (std::size_t i = 0; i < n; ++i) {
    const Vec2 p0 = poly[i];
    const Vec2 p1 = poly[(i + 1) % n];
    const Vec2 inward = Perp(p1 - p0) * sign;

    const double num = Dot(inward, origin - p0);
    const double den = Dot(inward, dir);

    if (std::fabs(den) < kGeomEps) {
      if (num < 0.0) return false;
      continue;
    }

    const double s = -num / den;
    if (den > 0.0) {
      lo = std::max(lo, s);
    } else {
      hi = std::min(hi, s);
    }
    if (lo > hi) return false;
  }

  outMin = lo;
  outMax = hi;
  return true;
}

bool ClipSegmentToRect(Vec2& a, Vec2& b, double minX, double minY, double maxX, double maxY)
{
  const Vec2 d = b - a;
  double t0 = 0.0;
  double t1 = 1.0;

  const double p[4] = {-d.x, d.x, -d.y, d.y};
  const double q[4] = {a.x - minX, maxX - a.x, a.y - minY, maxY - a.y};

  for (int i = 0; i < 4; ++i) {
    if (std::fabs(p[i]) < kGeomEps) {
      if (q[i] < 0.0) return false;
      continue;
    }
    const double r = q[i] / p[i];
    if (p[i] < 0.0) {
      if (r > t1) return false;
      t0 = std::max(t0, r);
    } else {
      if (r < t0) return false;
      t1 = std::min(t1, r);
    }
  }

  const Vec2 start = a;
  a = start + d * t0;
  b = start + d * t1;
  return true;
}

Polygon SegmentFootprint(Vec2 a, Vec2 b, double width)
{
  const Vec2 d = b - a;
  const double len = Length(d);
  if (len < kGeomEps || !(width > 0.0)) return {};

  const Vec2 n = Perp(d * (1.0 / len)) * (width * 0.5);
  return Polygon{a - n, b - n, b + n, a + n};
}

} // namespace urbanres

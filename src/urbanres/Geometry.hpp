#pragma once

#include "urbanres/Types.hpp"

#include <cstdint>
#include <vector>

namespace urbanres {

// 2D geometry primitives shared by the map synthesizer, the disaster engine and the
// network analyzer.
//
// Polygons are plain vertex loops (the closing edge is implicit). Unless a function
// says otherwise the winding may be either CW or CCW.

using Polygon = std::vector<Vec2>;

constexpr double kGeomEps = 1e-9;

struct SegmentProjection {
  Vec2 point;          // closest point on the segment
  double t = 0.0;      // offset ratio along a->b, clamped to [0,1]
  double distance = 0.0;
};

// Closest point on segment [a,b] to p. Zero-length segments project onto a.
SegmentProjection ProjectPointOnSegment(Vec2 p, Vec2 a, Vec2 b);

enum class SegmentIntersectionKind : std::uint8_t {
  None = 0,
  Point = 1,
  Overlap = 2, // collinear segments sharing more than one point
};

struct SegmentIntersection {
  SegmentIntersectionKind kind = SegmentIntersectionKind::None;
  Vec2 point;
  double t = 0.0; // along the first segment
  double u = 0.0; // along the second segment
};

// Intersect [a0,a1] with [b0,b1]. Touching endpoints count as a point intersection.
SegmentIntersection IntersectSegments(Vec2 a0, Vec2 a1, Vec2 b0, Vec2 b1);

// Positive for CCW loops.
double SignedPolygonArea(const Polygon& poly);
double PolygonArea(const Polygon& poly);

// Ray casting; points exactly on the boundary may land on either side.
bool PointInPolygon(Vec2 p, const Polygon& poly);

// Distance from p to the polygon boundary, or 0 when p is inside.
double DistanceToPolygon(Vec2 p, const Polygon& poly);

// Sutherland-Hodgman clip of `subject` against a convex `clip` polygon.
// Returns an empty polygon when there is no overlap.
Polygon ClipConvexPolygon(const Polygon& subject, const Polygon& clip);

// Andrew's monotone chain. Returns a CCW hull without collinear points.
// Fewer than 3 distinct input points are returned as-is (deduplicated).
Polygon ConvexHull(std::vector<Vec2> points);

// Clip the infinite line origin + s*dir against a convex polygon (Cyrus-Beck).
// On success [outMin,outMax] is the parameter interval inside the polygon.
bool ClipLineToConvexPolygon(Vec2 origin, Vec2 dir, const Polygon& poly, double& outMin, double& outMax);

// Liang-Barsky clip of segment a->b to an axis-aligned rectangle. Returns false when
// the segment lies fully outside.
bool ClipSegmentToRect(Vec2& a, Vec2& b, double minX, double minY, double maxX, double maxY);

// Rectangle covering segment a->b with the given total width (CCW). Empty for
// zero-length segments.
Polygon SegmentFootprint(Vec2 a, Vec2 b, double width);

} // namespace urbanres

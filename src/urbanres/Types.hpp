#pragma once

#include <cmath>

namespace urbanres {

// Plane coordinate in meters.
//
// Everything in the road model (nodes, tree bases, query points) lives in the same
// flat frame spanning the synthesized map rectangle.
struct Vec2 {
  double x = 0.0;
  double y = 0.0;
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return Vec2{a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return Vec2{a.x - b.x, a.y - b.y}; }
inline Vec2 operator*(Vec2 a, double s) { return Vec2{a.x * s, a.y * s}; }
inline Vec2 operator*(double s, Vec2 a) { return Vec2{a.x * s, a.y * s}; }

inline bool operator==(Vec2 a, Vec2 b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Vec2 a, Vec2 b) { return !(a == b); }

inline double Dot(Vec2 a, Vec2 b) { return a.x * b.x + a.y * b.y; }

// z component of the 3D cross product.
inline double Cross(Vec2 a, Vec2 b) { return a.x * b.y - a.y * b.x; }

inline double Length(Vec2 a) { return std::sqrt(a.x * a.x + a.y * a.y); }

inline double Distance(Vec2 a, Vec2 b) { return Length(b - a); }

inline double DistanceSquared(Vec2 a, Vec2 b)
{
  const Vec2 d = b - a;
  return d.x * d.x + d.y * d.y;
}

// Left-hand normal (rotated +90 degrees).
inline Vec2 Perp(Vec2 a) { return Vec2{-a.y, a.x}; }

inline bool IsFinite(Vec2 a) { return std::isfinite(a.x) && std::isfinite(a.y); }

} // namespace urbanres

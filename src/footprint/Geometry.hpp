#pragma once

#include "footprint/Types.hpp"

#include <vector>

namespace footprint {

// Small, dependency-free planar geometry helpers.
//
// Polygons are passed as open rings: the first vertex is NOT repeated at the end.

inline double DistSq(const Vec2& a, const Vec2& b)
{
  const double dx = a.x - b.x;
  const double dy = a.y - b.y;
  return dx * dx + dy * dy;
}

inline double Distance(const Vec2& a, const Vec2& b)
{
  return std::hypot(a.x - b.x, a.y - b.y);
}

// Squared distance from p to the closed segment [a,b].
double DistPointSegSq(const Vec2& p, const Vec2& a, const Vec2& b);

// Distance from p to the infinite line through a and b (distance to a if a == b).
double PerpendicularDistance(const Vec2& p, const Vec2& a, const Vec2& b);

// Shoelace area. Positive for counter-clockwise rings in a +Y-up frame.
double SignedPolygonArea(const std::vector<Vec2>& ring);

inline double PolygonArea(const std::vector<Vec2>& ring)
{
  return std::fabs(SignedPolygonArea(ring));
}

// Sum of edge lengths including the closing edge.
double PolygonPerimeter(const std::vector<Vec2>& ring);

struct Bounds2D {
  double minX = 0.0;
  double minY = 0.0;
  double maxX = 0.0;
  double maxY = 0.0;
  bool empty = true;

  double width() const { return empty ? 0.0 : maxX - minX; }
  double height() const { return empty ? 0.0 : maxY - minY; }
  double maxExtent() const { return width() > height() ? width() : height(); }

  void include(const Vec2& p);
};

Bounds2D ComputeBounds(const std::vector<Vec2>& pts);
Bounds2D ComputeSegmentBounds(const std::vector<Segment>& segs);

// Axis-aligned rectangle of the bounds: (minX,minY), (maxX,minY), (maxX,maxY), (minX,maxY).
std::vector<Vec2> BoundsRectangle(const Bounds2D& b);

// Graham scan convex hull.
//
// Returns indices into `pts`, counter-clockwise (+Y up) starting at the lowest point.
// Collinear boundary points are dropped. Fewer than 3 input points are returned as-is.
std::vector<int> ConvexHullIndices(const std::vector<Vec2>& pts);

// Douglas-Peucker simplification of an open polyline using perpendicular distance to
// the chord. The endpoints are always kept.
//
// Implemented with an explicit range stack (no recursion), so deep inputs such as long
// runs of nearly collinear pixels cannot overflow the call stack. Each split keeps one
// more vertex, which bounds the number of iterations by the input size.
std::vector<Vec2> SimplifyDouglasPeucker(const std::vector<Vec2>& pts, double epsilon);

} // namespace footprint

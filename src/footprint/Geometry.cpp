#include "footprint/Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace footprint {

double DistPointSegSq(const Vec2& p, const Vec2& a, const Vec2& b)
{
  const double vx = b.x - a.x;
  const double vy = b.y - a.y;
  const double wx = p.x - a.x;
  const double wy = p.y - a.y;

  const double vv = vx * vx + vy * vy;
  if (vv <= 1e-18) return DistSq(p, a);

  double t = (wx * vx + wy * vy) / vv;
  if (t < 0.0) t = 0.0;
  if (t > 1.0) t = 1.0;

  const Vec2 proj{a.x + vx * t, a.y + vy * t};
  return DistSq(p, proj);
}

double PerpendicularDistance(const Vec2& p, const Vec2& a, const Vec2& b)
{
  const double dx = b.x - a.x;
  const double dy = b.y - a.y;
  const double lenSq = dx * dx + dy * dy;
  if (lenSq == 0.0) return Distance(p, a);
  return std::fabs(dy * p.x - dx * p.y + b.x * a.y - b.y * a.x) / std::sqrt(lenSq);
}

double SignedPolygonArea(const std::vector<Vec2>& ring)
{
  const std::size_t n = ring.size();
  if (n < 3) return 0.0;

  double acc = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& p = ring[i];
    const Vec2& q = ring[(i + 1) % n];
    acc += p.x * q.y - q.x * p.y;
  }
  return acc * 0.5;
}

double PolygonPerimeter(const std::vector<Vec2>& ring)
{
  const std::size_t n = ring.size();
  if (n < 2) return 0.0;

  double acc = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    acc += Distance(ring[i], ring[(i + 1) % n]);
  }
  return acc;
}

void Bounds2D::include(const Vec2& p)
{
  if (empty) {
    minX = maxX = p.x;
    minY = maxY = p.y;
    empty = false;
    return;
  }
  minX = std::min(minX, p.x);
  minY = std::min(minY, p.y);
  maxX = std::max(maxX, p.x);
  maxY = std::max(maxY, p.y);
}

Bounds2D ComputeBounds(const std::vector<Vec2>& pts)
{
  Bounds2D b;
  for (const Vec2& p : pts) b.include(p);
  return b;
}

Bounds2D ComputeSegmentBounds(const std::vector<Segment>& segs)
{
  Bounds2D b;
  for (const Segment& s : segs) {
    b.include(s.start);
    b.include(s.end);
  }
  return b;
}

std::vector<Vec2> BoundsRectangle(const Bounds2D& b)
{
  return {
      Vec2{b.minX, b.minY},
      Vec2{b.maxX, b.minY},
      Vec2{b.maxX, b.maxY},
      Vec2{b.minX, b.maxY},
  };
}

std::vector<int> ConvexHullIndices(const std::vector<Vec2>& pts)
{
  const int n = static_cast<int>(pts.size());
  std::vector<int> order(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) order[static_cast<std::size_t>(i)] = i;
  if (n < 3) return order;

  // Pivot: lowest y, then lowest x.
  int pivot = 0;
  for (int i = 1; i < n; ++i) {
    const Vec2& p = pts[static_cast<std::size_t>(i)];
    const Vec2& q = pts[static_cast<std::size_t>(pivot)];
    if (p.y < q.y || (p.y == q.y && p.x < q.x)) pivot = i;
  }
  const Vec2 o = pts[static_cast<std::size_t>(pivot)];

  std::swap(order[0], order[static_cast<std::size_t>(pivot)]);
  std::sort(order.begin() + 1, order.end(), [&](int ia, int ib) {
    const Vec2& a = pts[static_cast<std::size_t>(ia)];
    const Vec2& b = pts[static_cast<std::size_t>(ib)];
    const double angA = std::atan2(a.y - o.y, a.x - o.x);
    const double angB = std::atan2(b.y - o.y, b.x - o.x);
    if (angA != angB) return angA < angB;
    const double da = DistSq(a, o);
    const double db = DistSq(b, o);
    if (da != db) return da < db;
    return ia < ib;
  });

  std::vector<int> hull;
  hull.reserve(order.size());
  for (int idx : order) {
    const Vec2& p = pts[static_cast<std::size_t>(idx)];
    while (hull.size() >= 2) {
      const Vec2& a = pts[static_cast<std::size_t>(hull[hull.size() - 2])];
      const Vec2& b = pts[static_cast<std::size_t>(hull.back())];
      const double cross = (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
      if (cross <= 0.0) {
        hull.pop_back();
      } else {
        break;
      }
    }
    hull.push_back(idx);
  }
  return hull;
}

std::vector<Vec2> SimplifyDouglasPeucker(const std::vector<Vec2>& pts, double epsilon)
{
  if (pts.size() <= 2) return pts;

  const int n = static_cast<int>(pts.size());
  std::vector<std::uint8_t> keep(static_cast<std::size_t>(n), std::uint8_t{0});
  keep[0] = 1;
  keep[static_cast<std::size_t>(n - 1)] = 1;

  struct Range {
    int a;
    int b;
  };

  std::vector<Range> stack;
  stack.push_back({0, n - 1});

  while (!stack.empty()) {
    const Range r = stack.back();
    stack.pop_back();

    if (r.b <= r.a + 1) continue;

    const Vec2& a = pts[static_cast<std::size_t>(r.a)];
    const Vec2& b = pts[static_cast<std::size_t>(r.b)];

    double best = 0.0;
    int bestIdx = -1;
    for (int i = r.a + 1; i < r.b; ++i) {
      const double d = PerpendicularDistance(pts[static_cast<std::size_t>(i)], a, b);
      if (d > best) {
        best = d;
        bestIdx = i;
      }
    }

    if (bestIdx >= 0 && best > epsilon) {
      keep[static_cast<std::size_t>(bestIdx)] = 1;
      stack.push_back({bestIdx, r.b});
      stack.push_back({r.a, bestIdx});
    }
  }

  std::vector<Vec2> out;
  for (int i = 0; i < n; ++i) {
    if (keep[static_cast<std::size_t>(i)] != 0) out.push_back(pts[static_cast<std::size_t>(i)]);
  }
  return out;
}

} // namespace footprint

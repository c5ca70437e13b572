#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace footprint {

// Core value types shared by the vector and raster paths.
//
// Coordinate system (vector path):
//  - Drawing units, +X to the right, +Y up (CAD convention).
//
// Coordinate system (raster path):
//  - Pixel units, +X to the right, +Y down; outputs are normalized to [0,1].

struct Vec2 {
  double x = 0.0;
  double y = 0.0;

  bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
  bool operator!=(const Vec2& o) const { return !(*this == o); }
};

// A straight line segment with its cached Euclidean length.
struct Segment {
  Vec2 start;
  Vec2 end;
  double length = 0.0;
};

inline Segment MakeSegment(const Vec2& a, const Vec2& b)
{
  Segment s;
  s.start = a;
  s.end = b;
  s.length = std::hypot(b.x - a.x, b.y - a.y);
  return s;
}

enum class DrawingUnit : std::uint8_t {
  Millimeter = 0,
  Centimeter = 1,
  Meter = 2,
};

// "mm", "cm" or "m".
const char* DrawingUnitName(DrawingUnit u);

// Accepts mm/millimeter(s), cm/centimeter(s), m/meter(s)/metre(s) (case-insensitive).
bool ParseDrawingUnit(const std::string& s, DrawingUnit* out);

// Maps a DXF $INSUNITS code (4=mm, 5=cm, 6=m). Anything else falls back to millimetres.
DrawingUnit DrawingUnitFromInsUnits(int code);

// Multiplier from drawing units to millimetres.
double UnitToMm(DrawingUnit u);

} // namespace footprint

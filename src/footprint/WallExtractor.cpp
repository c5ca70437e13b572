#include "footprint/WallExtractor.hpp"

#include "footprint/Geometry.hpp"
#include "footprint/Log.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>

namespace footprint {

namespace {

constexpr double kRadToDeg = 180.0 / 3.14159265358979323846;

// Labels that mark a dimension as a height annotation.
const char* const kHeightKeywords[] = {
    "GL", "\xE9\xAB\x98\xE3\x81\x95",                 // 高さ
    "height", "H=", "FL", "\xE9\x9A\x8E\xE9\xAB\x98", // 階高
    "\xE5\xBB\xBA\xE7\x89\xA9\xE9\xAB\x98",           // 建物高
    "\xE8\xBB\x92\xE9\xAB\x98",                       // 軒高
    "\xE6\x9C\x80\xE9\xAB\x98\xE9\xAB\x98\xE3\x81\x95", // 最高高さ
    "\xE6\xA3\x9F\xE9\xAB\x98",                       // 棟高
    "eave", "ridge",
};

std::string UpperAscii(std::string s)
{
  for (char& c : s) {
    const unsigned char u = static_cast<unsigned char>(c);
    if (u < 0x80u) c = static_cast<char>(std::toupper(u));
  }
  return s;
}

std::string FormatValue(double v)
{
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.15g", v);
  return buf;
}

} // namespace

const char* WallSideName(WallSide s)
{
  switch (s) {
  case WallSide::East: return "east";
  case WallSide::North: return "north";
  case WallSide::West: return "west";
  case WallSide::South: return "south";
  case WallSide::Diagonal: return "diagonal";
  default: return "diagonal";
  }
}

WallSide ClassifyWallSide(double angleDeg)
{
  double a = std::fmod(angleDeg, 360.0);
  if (a < 0.0) a += 360.0;

  constexpr double kTol = 15.0;
  if (a <= kTol || a >= 360.0 - kTol) return WallSide::East;
  if (std::fabs(a - 90.0) <= kTol) return WallSide::North;
  if (std::fabs(a - 180.0) <= kTol) return WallSide::West;
  if (std::fabs(a - 270.0) <= kTol) return WallSide::South;
  return WallSide::Diagonal;
}

bool HasHeightKeyword(const std::string& text)
{
  const std::string upper = UpperAscii(text);
  for (const char* kw : kHeightKeywords) {
    if (upper.find(UpperAscii(kw)) != std::string::npos) return true;
  }
  return false;
}

HeightEstimate ResolveBuildingHeight(const std::vector<DimensionHint>& dims, const ZRange& z, DrawingUnit unit,
                                     const HeightConfig& cfg)
{
  HeightEstimate est;
  const double toMm = UnitToMm(unit);
  const std::string u = DrawingUnitName(unit);

  if (z.hasZ && z.maxZ > z.minZ) {
    const double zh = z.maxZ - z.minZ;
    est.heightMm = std::round(zh * toMm);
    est.note = "Height extracted from 3D Z-coordinates: " + FormatValue(zh) + u + " (Z range: " + FormatValue(z.minZ) +
               " to " + FormatValue(z.maxZ) + ")";
    Logf(LogLevel::Info, "walls", "building height from Z range: %g %s", zh, u.c_str());
    return est;
  }

  for (const DimensionHint& d : dims) {
    if (!d.isVertical || !d.value || *d.value <= 0.0) continue;
    if (!HasHeightKeyword(d.text)) continue;
    est.heightMm = std::round(*d.value * toMm);
    est.note = "Height extracted from dimension entity: " + FormatValue(*d.value) + u + " (label: \"" + d.text + "\")";
    Logf(LogLevel::Info, "walls", "building height from labelled dimension '%s'", d.text.c_str());
    return est;
  }

  for (const DimensionHint& d : dims) {
    if (!d.isVertical || !d.value || *d.value <= 0.0) continue;
    const double mm = *d.value * toMm;
    if (mm < cfg.minPlausibleMm || mm > cfg.maxPlausibleMm) continue;
    est.heightMm = std::round(mm);
    est.note = "Height possibly from vertical dimension: " + FormatValue(*d.value) + u + ". Please verify.";
    Logf(LogLevel::Info, "walls", "building height guessed from vertical dimension %g %s", *d.value, u.c_str());
    return est;
  }

  est.note = "Height data not found in CAD file. Please enter building height manually.";
  Logf(LogLevel::Warn, "walls", "building height not found");
  return est;
}

ExtractionResult ExtractWallSegments(const BoundaryLoop& boundary, const std::vector<DimensionHint>& dims,
                                     const ZRange& z, DrawingUnit unit, const HeightConfig& cfg)
{
  ExtractionResult r;
  const double toMm = UnitToMm(unit);
  const std::vector<Vec2>& pts = boundary.points;
  const std::size_t n = pts.size();

  double perimeter = 0.0;
  r.wallSegments.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& a = pts[i];
    const Vec2& b = pts[(i + 1) % n];
    const double len = Distance(a, b);

    double deg = std::atan2(b.y - a.y, b.x - a.x) * kRadToDeg;
    if (deg < 0.0) deg += 360.0;
    deg = std::round(deg * 100.0) / 100.0;
    if (deg >= 360.0) deg -= 360.0;

    WallSegment w;
    w.id = static_cast<int>(i) + 1;
    w.start = Vec2{a.x * toMm, a.y * toMm};
    w.end = Vec2{b.x * toMm, b.y * toMm};
    w.length = std::round(len * toMm);
    w.angleDeg = deg;
    w.side = ClassifyWallSide(deg);
    r.wallSegments.push_back(w);

    perimeter += len;
  }
  r.perimeterTotal = std::round(perimeter * toMm);

  HeightEstimate h = ResolveBuildingHeight(dims, z, unit, cfg);
  r.buildingHeight = h.heightMm;
  r.heightNote = std::move(h.note);

  Logf(LogLevel::Info, "walls", "%zu wall segments, perimeter=%.0fmm", r.wallSegments.size(), r.perimeterTotal);
  return r;
}

BoundaryLoop OutlineToBoundary(const std::vector<OutlinePoint>& outline, double widthMm, double heightMm)
{
  BoundaryLoop loop;
  loop.points.reserve(outline.size());
  for (std::size_t i = 0; i < outline.size(); ++i) {
    const OutlinePoint& p = outline[i];
    loop.points.push_back(Vec2{p.xFrac * widthMm, (1.0 - p.yFrac) * heightMm});
    loop.nodeIds.push_back(static_cast<int>(i));
  }
  loop.signedArea = SignedPolygonArea(loop.points);
  loop.area = std::fabs(loop.signedArea);
  loop.perimeter = PolygonPerimeter(loop.points);
  return loop;
}

} // namespace footprint

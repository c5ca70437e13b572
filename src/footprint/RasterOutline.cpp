#include "footprint/RasterOutline.hpp"

#include "footprint/Geometry.hpp"
#include "footprint/Log.hpp"
#include "footprint/Mask.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace footprint {

namespace {

std::optional<std::vector<OutlinePoint>> Reject(OutlineStats& st, PipelineError kind, std::string msg)
{
  Logf(LogLevel::Warn, "raster", "%s", msg.c_str());
  st.error = kind;
  st.message = std::move(msg);
  return std::nullopt;
}

void DrawLine(RgbImage& img, int x0, int y0, int x1, int y1)
{
  const int dx = std::abs(x1 - x0);
  const int dy = -std::abs(y1 - y0);
  const int sx = x0 < x1 ? 1 : -1;
  const int sy = y0 < y1 ? 1 : -1;
  int err = dx + dy;

  while (true) {
    if (x0 >= 0 && y0 >= 0 && x0 < img.width && y0 < img.height) {
      const std::size_t o =
          (static_cast<std::size_t>(y0) * static_cast<std::size_t>(img.width) + static_cast<std::size_t>(x0)) * 3u;
      img.rgb[o + 0] = 255;
      img.rgb[o + 1] = 0;
      img.rgb[o + 2] = 0;
    }
    if (x0 == x1 && y0 == y1) break;
    const int e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x0 += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y0 += sy;
    }
  }
}

} // namespace

void ComputeWorkingSize(int srcW, int srcH, const RasterConfig& cfg, int& outW, int& outH)
{
  const int w = std::max(1, srcW);
  const int h = std::max(1, srcH);
  const double scale = std::min(1.0, static_cast<double>(cfg.workingMaxSide) / static_cast<double>(std::max(w, h)));
  outW = std::max(cfg.workingMinSide, static_cast<int>(std::lround(static_cast<double>(w) * scale)));
  outH = std::max(cfg.workingMinSide, static_cast<int>(std::lround(static_cast<double>(h) * scale)));
}

GrayImage MakeWorkingImage(const RgbImage& img, const RasterConfig& cfg)
{
  int w = 0;
  int h = 0;
  ComputeWorkingSize(img.width, img.height, cfg, w, h);

  GrayImage gray = ToGray(img);
  if (w != gray.width || h != gray.height) gray = ResizeGrayArea(gray, w, h);
  return gray;
}

std::vector<Vec2> SnapToAxes(const std::vector<Vec2>& pts, double threshold, double ratio)
{
  std::vector<Vec2> out = pts;
  const std::size_t n = out.size();
  for (std::size_t i = 0; i < n; ++i) {
    Vec2& a = out[i];
    Vec2& b = out[(i + 1) % n];
    const double dx = std::fabs(b.x - a.x);
    const double dy = std::fabs(b.y - a.y);
    const double len = std::sqrt(dx * dx + dy * dy);
    if (len < 2.0) continue;

    if (dy / len < ratio && dy < threshold) {
      const double avg = std::round((a.y + b.y) / 2.0);
      a.y = avg;
      b.y = avg;
    } else if (dx / len < ratio && dx < threshold) {
      const double avg = std::round((a.x + b.x) / 2.0);
      a.x = avg;
      b.x = avg;
    }
  }
  return out;
}

std::vector<Vec2> RemoveDuplicatePoints(const std::vector<Vec2>& pts)
{
  if (pts.size() <= 1) return pts;
  std::vector<Vec2> out{pts[0]};
  for (std::size_t i = 1; i < pts.size(); ++i) {
    if (pts[i] != pts[i - 1]) out.push_back(pts[i]);
  }
  if (out.size() > 1 && out.front() == out.back()) out.pop_back();
  return out;
}

std::vector<Vec2> MergeCollinearPoints(const std::vector<Vec2>& pts)
{
  const std::size_t n = pts.size();
  if (n <= 3) return pts;

  // A vertex survives if either the normalized or the absolute cross product is large.
  constexpr double kMinSine = 0.1;
  constexpr double kMinCross = 2.0;

  std::vector<Vec2> out{pts[0]};
  for (std::size_t i = 1; i < n; ++i) {
    const Vec2 prev = out.back();
    const Vec2& cur = pts[i];
    const Vec2& next = pts[(i + 1) % n];

    const double dx1 = cur.x - prev.x;
    const double dy1 = cur.y - prev.y;
    const double dx2 = next.x - cur.x;
    const double dy2 = next.y - cur.y;
    const double cross = dx1 * dy2 - dy1 * dx2;
    const double len1 = std::sqrt(dx1 * dx1 + dy1 * dy1);
    const double len2 = std::sqrt(dx2 * dx2 + dy2 * dy2);
    const double sine = (len1 > 0.0 && len2 > 0.0) ? std::fabs(cross) / (len1 * len2) : std::fabs(cross);

    if (sine > kMinSine || std::fabs(cross) > kMinCross) out.push_back(cur);
  }

  if (out.size() < 3) return {pts[0], pts[n / 2], pts[n - 1]};
  return out;
}

std::vector<Vec2> RefineOutlinePolygon(const std::vector<Vec2>& simplified, int w, int h, const RasterConfig& cfg,
                                       bool* outUsedBoundingBox)
{
  if (outUsedBoundingBox) *outUsedBoundingBox = false;
  const double minSide = static_cast<double>(std::min(w, h));

  const double snapThresh = std::max(cfg.axisSnapFloor, minSide * cfg.axisSnapFactor);
  std::vector<Vec2> poly = SnapToAxes(simplified, snapThresh, cfg.axisSnapRatio);
  poly = RemoveDuplicatePoints(poly);
  poly = MergeCollinearPoints(poly);

  // Keep the start vertex of every edge long enough to be exterior wall.
  const double minEdge = minSide * cfg.minEdgeFactor;
  std::vector<Vec2> filtered;
  for (std::size_t i = 0; i < poly.size(); ++i) {
    const Vec2& cur = poly[i];
    const Vec2& next = poly[(i + 1) % poly.size()];
    if (Distance(cur, next) < minEdge) continue;
    if (filtered.empty() || filtered.back() != cur) filtered.push_back(cur);
  }

  if (filtered.size() < 3) {
    Logf(LogLevel::Debug, "raster", "short-edge filter left %zu points, keeping unfiltered polygon", filtered.size());
    poly = RemoveDuplicatePoints(poly);
  } else {
    poly = std::move(filtered);
  }

  poly = MergeCollinearPoints(poly);

  bool useBox = false;
  if (static_cast<int>(poly.size()) > cfg.maxVertices) {
    Logf(LogLevel::Info, "raster", "%zu vertices after refinement, using bounding box", poly.size());
    useBox = true;
  } else if (poly.size() >= 3) {
    const double minArea = static_cast<double>(w) * static_cast<double>(h) * cfg.minAreaFraction;
    const double area = PolygonArea(poly);
    if (area < minArea) {
      Logf(LogLevel::Info, "raster", "polygon area %.0f below %.0f, using bounding box", area, minArea);
      useBox = true;
    }
  }

  if (useBox) {
    poly = BoundsRectangle(ComputeBounds(poly));
    if (outUsedBoundingBox) *outUsedBoundingBox = true;
  }
  return poly;
}

std::optional<std::vector<OutlinePoint>> DetectOutlineFromGray(const GrayImage& work, const RasterConfig& cfg,
                                                               OutlineStats* outStats)
{
  OutlineStats local;
  OutlineStats& st = outStats ? *outStats : local;
  st.workWidth = work.width;
  st.workHeight = work.height;

  const int w = work.width;
  const int h = work.height;
  if (w <= 0 || h <= 0 || work.pixels.size() != static_cast<std::size_t>(w) * static_cast<std::size_t>(h)) {
    return Reject(st, PipelineError::InvalidInput, "invalid working image");
  }
  const double total = static_cast<double>(w) * static_cast<double>(h);

  const BinaryMask walls = DilateBox(ThresholdBelow(work, cfg.threshold), cfg.dilateRadius);
  const BinaryMask exterior = FloodFromBorder(walls);
  BinaryMask building = Invert(exterior);

  st.buildingFraction = static_cast<double>(building.count()) / total;
  Logf(LogLevel::Info, "raster", "building fraction %.1f%%", st.buildingFraction * 100.0);

  if (st.buildingFraction < cfg.minBuildingFraction || st.buildingFraction > cfg.maxBuildingFraction) {
    return Reject(st, PipelineError::ImplausibleSegmentation, "building fraction out of plausible range");
  }

  building = FillHoles(KeepLargestComponent(building));

  const std::vector<Vec2> contour = TraceMooreContour(building);
  st.contourPoints = static_cast<int>(contour.size());
  if (st.contourPoints < cfg.minContourPoints) {
    return Reject(st, PipelineError::ImplausibleSegmentation,
                  "contour too short (" + std::to_string(st.contourPoints) + " points)");
  }

  const double minSide = static_cast<double>(std::min(w, h));
  double eps = std::max(cfg.simplifyFloor, minSide * cfg.simplifyFactor);
  std::vector<Vec2> simplified = SimplifyDouglasPeucker(contour, eps);
  Logf(LogLevel::Debug, "raster", "simplified %zu -> %zu points (eps=%.1f)", contour.size(), simplified.size(), eps);

  if (static_cast<int>(simplified.size()) > cfg.secondPassAbove) {
    eps = std::max(cfg.simplifyFloor2, minSide * cfg.simplifyFactor2);
    simplified = SimplifyDouglasPeucker(contour, eps);
    Logf(LogLevel::Debug, "raster", "second pass -> %zu points (eps=%.1f)", simplified.size(), eps);
  }
  st.simplifiedPoints = static_cast<int>(simplified.size());

  if (simplified.size() < 3) {
    return Reject(st, PipelineError::ImplausibleSegmentation, "simplified outline has fewer than 3 points");
  }

  const std::vector<Vec2> poly = RefineOutlinePolygon(simplified, w, h, cfg, &st.usedBoundingBox);
  if (poly.size() < 3) {
    return Reject(st, PipelineError::ImplausibleSegmentation, "refined outline has fewer than 3 points");
  }

  // The bounding box of a small component can still be far below a building's extent.
  const double polyFraction = PolygonArea(poly) / total;
  if (polyFraction < cfg.minBuildingFraction) {
    Logf(LogLevel::Info, "raster", "final polygon covers %.2f%% of the image", polyFraction * 100.0);
    return Reject(st, PipelineError::ImplausibleSegmentation, "final outline area below plausible range");
  }

  std::vector<OutlinePoint> out;
  out.reserve(poly.size());
  for (const Vec2& p : poly) {
    out.push_back(OutlinePoint{p.x / static_cast<double>(w), p.y / static_cast<double>(h)});
  }
  st.finalPoints = static_cast<int>(out.size());
  st.error = PipelineError::None;
  st.message.clear();

  Logf(LogLevel::Info, "raster", "final polygon: %zu vertices%s", out.size(),
       st.usedBoundingBox ? " (bounding box)" : "");
  return out;
}

std::optional<std::vector<OutlinePoint>> DetectOutlineFromImage(const RgbImage& img, const RasterConfig& cfg,
                                                                OutlineStats* outStats)
{
  OutlineStats local;
  OutlineStats& st = outStats ? *outStats : local;
  st.sourceWidth = img.width;
  st.sourceHeight = img.height;

  if (img.width <= 0 || img.height <= 0) {
    return Reject(st, PipelineError::DecodeFailed, "empty image");
  }

  const GrayImage work = MakeWorkingImage(img, cfg);
  Logf(LogLevel::Info, "raster", "outline detection: source %dx%d, work %dx%d", img.width, img.height, work.width,
       work.height);
  return DetectOutlineFromGray(work, cfg, &st);
}

std::optional<std::vector<OutlinePoint>> DetectOutline(const std::string& imagePath, const RasterConfig& cfg,
                                                       OutlineStats* outStats)
{
  OutlineStats local;
  OutlineStats& st = outStats ? *outStats : local;

  RgbImage img;
  std::string err;
  if (!ReadImageAuto(imagePath, img, err)) {
    return Reject(st, PipelineError::DecodeFailed, "failed to read " + imagePath + ": " + err);
  }
  return DetectOutlineFromImage(img, cfg, &st);
}

RgbImage RenderOutlineOverlay(const GrayImage& work, const std::vector<OutlinePoint>& outline)
{
  RgbImage img = GrayToRgb(work);
  const std::size_t n = outline.size();
  for (std::size_t i = 0; i < n; ++i) {
    const OutlinePoint& a = outline[i];
    const OutlinePoint& b = outline[(i + 1) % n];
    DrawLine(img, static_cast<int>(std::lround(a.xFrac * work.width)), static_cast<int>(std::lround(a.yFrac * work.height)),
             static_cast<int>(std::lround(b.xFrac * work.width)), static_cast<int>(std::lround(b.yFrac * work.height)));
  }
  return img;
}

} // namespace footprint

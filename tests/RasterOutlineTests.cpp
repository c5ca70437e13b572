#include "footprint/Geometry.hpp"
#include "footprint/Image.hpp"
#include "footprint/Log.hpp"
#include "footprint/Mask.hpp"
#include "footprint/Pipeline.hpp"
#include "footprint/RasterOutline.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace footprint;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp =
      static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static RgbImage MakeImage(int w, int h, std::uint8_t v)
{
  RgbImage img;
  img.width = w;
  img.height = h;
  img.rgb.assign(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * 3u, v);
  return img;
}

static void SetPixel(RgbImage& img, int x, int y, std::uint8_t v)
{
  const std::size_t o =
      (static_cast<std::size_t>(y) * static_cast<std::size_t>(img.width) + static_cast<std::size_t>(x)) * 3u;
  img.rgb[o + 0] = v;
  img.rgb[o + 1] = v;
  img.rgb[o + 2] = v;
}

// White sheet with a 1px black rectangle outline.
static RgbImage OutlinedRectangle(int w, int h, int x0, int y0, int x1, int y1)
{
  RgbImage img = MakeImage(w, h, 255);
  for (int x = x0; x <= x1; ++x) {
    SetPixel(img, x, y0, 0);
    SetPixel(img, x, y1, 0);
  }
  for (int y = y0; y <= y1; ++y) {
    SetPixel(img, x0, y, 0);
    SetPixel(img, x1, y, 0);
  }
  return img;
}

static bool NearEither(double v, double a, double b, double eps)
{
  return std::fabs(v - a) <= eps || std::fabs(v - b) <= eps;
}

static void TestWorkingSize()
{
  const RasterConfig cfg;
  int w = 0;
  int h = 0;
  ComputeWorkingSize(1000, 600, cfg, w, h);
  EXPECT_EQ(w, 500);
  EXPECT_EQ(h, 300);

  // Never enlarged.
  ComputeWorkingSize(100, 50, cfg, w, h);
  EXPECT_EQ(w, 100);
  EXPECT_EQ(h, 50);

  // Thin strips keep a minimum side.
  ComputeWorkingSize(5000, 20, cfg, w, h);
  EXPECT_EQ(w, 500);
  EXPECT_EQ(h, 10);

  const GrayImage work = MakeWorkingImage(MakeImage(1000, 600, 200), cfg);
  EXPECT_EQ(work.width, 500);
  EXPECT_EQ(work.height, 300);
  EXPECT_EQ(static_cast<int>(work.at(10, 10)), 200);
}

static void TestMaskOps()
{
  GrayImage g;
  g.width = 4;
  g.height = 1;
  g.pixels = {0, 159, 160, 255};
  const BinaryMask t = ThresholdBelow(g, 160);
  EXPECT_EQ(t.count(), static_cast<std::size_t>(2));

  BinaryMask dot(11, 11);
  dot.set(5, 5, true);
  EXPECT_EQ(DilateBox(dot, 2).count(), static_cast<std::size_t>(25));

  BinaryMask corner(11, 11);
  corner.set(0, 0, true);
  EXPECT_EQ(DilateBox(corner, 2).count(), static_cast<std::size_t>(9));

  // 5x5 ring with a 3x3 hole.
  BinaryMask ring(9, 9);
  for (int i = 2; i <= 6; ++i) {
    ring.set(i, 2, true);
    ring.set(i, 6, true);
    ring.set(2, i, true);
    ring.set(6, i, true);
  }
  EXPECT_EQ(ring.count(), static_cast<std::size_t>(16));
  EXPECT_EQ(FloodFromBorder(ring).count(), static_cast<std::size_t>(81 - 25));
  EXPECT_EQ(FillHoles(ring).count(), static_cast<std::size_t>(25));
  EXPECT_EQ(Invert(ring).count(), static_cast<std::size_t>(81 - 16));

  BinaryMask blobs(10, 10);
  for (int y = 0; y < 2; ++y)
    for (int x = 0; x < 2; ++x) blobs.set(x, y, true);
  for (int y = 5; y < 8; ++y)
    for (int x = 5; x < 8; ++x) blobs.set(x, y, true);
  const BinaryMask largest = KeepLargestComponent(blobs);
  EXPECT_EQ(largest.count(), static_cast<std::size_t>(9));
  EXPECT_FALSE(largest.get(0, 0));
  EXPECT_TRUE(largest.get(6, 6));
}

static void TestMooreTrace()
{
  BinaryMask m(7, 7);
  for (int y = 2; y <= 4; ++y)
    for (int x = 2; x <= 4; ++x) m.set(x, y, true);

  const std::vector<Vec2> c = TraceMooreContour(m);
  ASSERT_TRUE(c.size() == 8);
  EXPECT_TRUE(c[0] == (Vec2{2, 2}));
  EXPECT_TRUE(c[1] == (Vec2{3, 2}));
  EXPECT_TRUE(c[4] == (Vec2{4, 4}));
  EXPECT_TRUE(c[7] == (Vec2{2, 3}));

  EXPECT_TRUE(TraceMooreContour(BinaryMask(5, 5)).empty());
}

static void TestPolygonCleanup()
{
  const std::vector<Vec2> skew = {Vec2{0, 0}, Vec2{100, 3}, Vec2{100, 100}, Vec2{0, 100}};
  const std::vector<Vec2> snapped = SnapToAxes(skew, 10.0);
  ASSERT_TRUE(snapped.size() == 4);
  EXPECT_NEAR(snapped[0].y, 2.0, 1e-12);
  EXPECT_NEAR(snapped[1].y, 2.0, 1e-12);
  EXPECT_NEAR(snapped[1].x, 100.0, 1e-12);

  const std::vector<Vec2> dups = {Vec2{0, 0}, Vec2{0, 0}, Vec2{5, 0}, Vec2{5, 5}, Vec2{0, 0}};
  EXPECT_EQ(RemoveDuplicatePoints(dups).size(), static_cast<std::size_t>(3));

  const std::vector<Vec2> mid = {Vec2{0, 0}, Vec2{5, 0}, Vec2{10, 0}, Vec2{10, 10}, Vec2{0, 10}};
  const std::vector<Vec2> merged = MergeCollinearPoints(mid);
  ASSERT_TRUE(merged.size() == 4);
  EXPECT_TRUE(merged[1] == (Vec2{10, 0}));
}

static void TestBoundingBoxFallback()
{
  // Twelve vertices on a circle: too many for a footprint, so the box replaces them.
  std::vector<Vec2> circle;
  const double kPi = 3.14159265358979323846;
  for (int i = 0; i < 12; ++i) {
    const double a = static_cast<double>(i) * kPi / 6.0;
    circle.push_back(Vec2{200.0 + 150.0 * std::cos(a), 200.0 + 150.0 * std::sin(a)});
  }

  bool usedBox = false;
  const std::vector<Vec2> poly = RefineOutlinePolygon(circle, 400, 400, RasterConfig{}, &usedBox);
  EXPECT_TRUE(usedBox);
  ASSERT_TRUE(poly.size() == 4);
  for (std::size_t i = 0; i < 4; ++i) {
    const Vec2& a = poly[i];
    const Vec2& b = poly[(i + 1) % 4];
    EXPECT_TRUE(a.x == b.x || a.y == b.y);
  }
  const Bounds2D bb = ComputeBounds(poly);
  EXPECT_NEAR(bb.minX, 50.0, 1e-6);
  EXPECT_NEAR(bb.maxX, 350.0, 1e-6);
  EXPECT_NEAR(bb.minY, 50.0, 1e-6);
  EXPECT_NEAR(bb.maxY, 350.0, 1e-6);
}

static void TestDetectRectangleOutline()
{
  const RgbImage img = OutlinedRectangle(400, 300, 50, 50, 350, 250);

  OutlineStats st;
  const std::optional<std::vector<OutlinePoint>> outline = DetectOutlineFromImage(img, RasterConfig{}, &st);
  ASSERT_TRUE(outline.has_value());
  EXPECT_EQ(outline->size(), static_cast<std::size_t>(4));
  EXPECT_FALSE(st.usedBoundingBox);
  EXPECT_EQ(st.workWidth, 400);
  EXPECT_EQ(st.workHeight, 300);
  EXPECT_TRUE(st.buildingFraction > 0.4 && st.buildingFraction < 0.7);
  EXPECT_TRUE(st.error == PipelineError::None);

  int corners = 0;
  for (const OutlinePoint& p : *outline) {
    const bool ok = NearEither(p.xFrac, 0.125, 0.875, 0.03) && NearEither(p.yFrac, 50.0 / 300.0, 250.0 / 300.0, 0.03);
    EXPECT_TRUE(ok);
    if (ok) ++corners;
  }
  EXPECT_EQ(corners, 4);

  // All four quadrants are represented.
  bool quadrants[4] = {false, false, false, false};
  for (const OutlinePoint& p : *outline) quadrants[(p.xFrac > 0.5 ? 1 : 0) + (p.yFrac > 0.5 ? 2 : 0)] = true;
  EXPECT_TRUE(quadrants[0] && quadrants[1] && quadrants[2] && quadrants[3]);
}

static void TestImplausibleSegmentation()
{
  OutlineStats st;
  EXPECT_FALSE(DetectOutlineFromImage(MakeImage(100, 80, 255), RasterConfig{}, &st).has_value());
  EXPECT_TRUE(st.error == PipelineError::ImplausibleSegmentation);
  EXPECT_NEAR(st.buildingFraction, 0.0, 1e-12);

  st = OutlineStats{};
  EXPECT_FALSE(DetectOutlineFromImage(MakeImage(100, 80, 0), RasterConfig{}, &st).has_value());
  EXPECT_TRUE(st.error == PipelineError::ImplausibleSegmentation);
  EXPECT_NEAR(st.buildingFraction, 1.0, 1e-12);

  st = OutlineStats{};
  EXPECT_FALSE(DetectOutlineFromImage(RgbImage{}, RasterConfig{}, &st).has_value());
  EXPECT_TRUE(st.error == PipelineError::DecodeFailed);

  // Sixteen separate small rooms: plenty of building pixels overall, but the
  // largest one is far too small to be the footprint.
  RgbImage grid = MakeImage(400, 400, 255);
  for (int gy = 0; gy < 4; ++gy) {
    for (int gx = 0; gx < 4; ++gx) {
      const int x0 = 40 + gx * 90;
      const int y0 = 40 + gy * 90;
      for (int i = 0; i <= 40; ++i) {
        SetPixel(grid, x0 + i, y0, 0);
        SetPixel(grid, x0 + i, y0 + 40, 0);
        SetPixel(grid, x0, y0 + i, 0);
        SetPixel(grid, x0 + 40, y0 + i, 0);
      }
    }
  }
  st = OutlineStats{};
  EXPECT_FALSE(DetectOutlineFromImage(grid, RasterConfig{}, &st).has_value());
  EXPECT_TRUE(st.error == PipelineError::ImplausibleSegmentation);
  EXPECT_TRUE(st.buildingFraction > 0.2);
  EXPECT_TRUE(st.message.find("area") != std::string::npos);

  st = OutlineStats{};
  EXPECT_FALSE(DetectOutline(MakeTempPath("footprint_no_image").string() + ".png", RasterConfig{}, &st).has_value());
  EXPECT_TRUE(st.error == PipelineError::DecodeFailed);
}

static void TestOverlay()
{
  GrayImage work;
  work.width = 40;
  work.height = 40;
  work.pixels.assign(1600, 255);

  const std::vector<OutlinePoint> square = {{0.25, 0.25}, {0.75, 0.25}, {0.75, 0.75}, {0.25, 0.75}};
  const RgbImage ov = RenderOutlineOverlay(work, square);
  EXPECT_EQ(ov.width, 40);
  EXPECT_EQ(ov.height, 40);

  const std::size_t o = (static_cast<std::size_t>(10) * 40u + 20u) * 3u;
  EXPECT_EQ(static_cast<int>(ov.rgb[o + 0]), 255);
  EXPECT_EQ(static_cast<int>(ov.rgb[o + 1]), 0);

  const std::size_t centre = (static_cast<std::size_t>(20) * 40u + 20u) * 3u;
  EXPECT_EQ(static_cast<int>(ov.rgb[centre + 1]), 255);
}

static void TestRasterPipeline()
{
  const RgbImage img = OutlinedRectangle(400, 300, 50, 50, 350, 250);

  const fs::path path = MakeTempPath("footprint_raster") += ".png";
  std::string err;
  ASSERT_TRUE(WritePng(path.string(), img, err));

  const RasterResult plain = ProcessRasterDrawing(path.string());
  EXPECT_TRUE(plain.success);
  EXPECT_EQ(plain.outline.size(), static_cast<std::size_t>(4));
  EXPECT_FALSE(plain.extraction.has_value());

  const RasterResult sized = ProcessRasterDrawing(path.string(), FootprintConfig{}, RasterExtent{12000.0, 9000.0});
  ASSERT_TRUE(sized.success);
  ASSERT_TRUE(sized.extraction.has_value());
  const ExtractionResult& e = *sized.extraction;
  EXPECT_EQ(e.wallSegments.size(), static_cast<std::size_t>(4));
  EXPECT_TRUE(e.perimeterTotal > 28000.0 && e.perimeterTotal < 34000.0);
  EXPECT_FALSE(e.buildingHeight.has_value());
  for (const WallSegment& w : e.wallSegments) EXPECT_TRUE(w.side != WallSide::Diagonal);

  const RasterResult bad = ProcessRasterImage(img, FootprintConfig{}, RasterExtent{0.0, 9000.0});
  EXPECT_FALSE(bad.success);
  EXPECT_TRUE(bad.error == PipelineError::InvalidInput);

  std::error_code ec;
  fs::remove(path, ec);
}

static void TestOutlineToBoundary()
{
  const std::vector<OutlinePoint> outline = {{0.0, 0.0}, {1.0, 0.0}, {1.0, 0.5}, {0.0, 0.5}};
  const BoundaryLoop loop = OutlineToBoundary(outline, 10000.0, 8000.0);
  ASSERT_TRUE(loop.points.size() == 4);

  // Image rows grow downward; the boundary has +Y up.
  EXPECT_NEAR(loop.points[0].y, 8000.0, 1e-9);
  EXPECT_NEAR(loop.points[2].y, 4000.0, 1e-9);
  EXPECT_NEAR(loop.points[1].x, 10000.0, 1e-9);
  EXPECT_NEAR(loop.area, 40000000.0, 1e-3);
  EXPECT_NEAR(loop.perimeter, 28000.0, 1e-9);
}

int main()
{
  SetLogLevel(LogLevel::Error);

  TestWorkingSize();
  TestMaskOps();
  TestMooreTrace();
  TestPolygonCleanup();
  TestBoundingBoxFallback();
  TestDetectRectangleOutline();
  TestImplausibleSegmentation();
  TestOverlay();
  TestRasterPipeline();
  TestOutlineToBoundary();

  if (g_failures == 0) {
    std::cout << "footprint_raster_tests: OK\n";
    return 0;
  }

  std::cerr << "footprint_raster_tests: FAILED (" << g_failures << ")\n";
  return 1;
}

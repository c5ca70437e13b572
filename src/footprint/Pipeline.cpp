#include "footprint/Pipeline.hpp"

#include "footprint/DrawingJson.hpp"
#include "footprint/Log.hpp"

#include <cmath>

namespace footprint {

namespace {

VectorResult Fail(VectorResult r, PipelineError e, std::string msg)
{
  r.success = false;
  r.error = e;
  r.message = std::move(msg);
  Logf(LogLevel::Warn, "pipeline", "%s: %s", PipelineErrorName(e), r.message.c_str());
  return r;
}

RasterResult FinishRaster(std::optional<std::vector<OutlinePoint>> outline, const OutlineStats& stats,
                          const std::optional<RasterExtent>& extent, const FootprintConfig& cfg)
{
  RasterResult r;
  r.stats = stats;
  if (!outline) {
    r.error = stats.error == PipelineError::None ? PipelineError::ImplausibleSegmentation : stats.error;
    r.message = stats.message.empty() ? std::string("no outline detected") : stats.message;
    Logf(LogLevel::Warn, "pipeline", "raster: %s", r.message.c_str());
    return r;
  }

  r.outline = std::move(*outline);
  r.success = true;

  if (extent) {
    if (!(extent->widthMm > 0.0) || !(extent->heightMm > 0.0) || !std::isfinite(extent->widthMm) ||
        !std::isfinite(extent->heightMm)) {
      r.success = false;
      r.error = PipelineError::InvalidInput;
      r.message = "raster extent must be positive";
      return r;
    }
    const BoundaryLoop loop = OutlineToBoundary(r.outline, extent->widthMm, extent->heightMm);
    // Raster images carry no elevation or dimension entities: height stays unknown.
    r.extraction = ExtractWallSegments(loop, {}, ZRange{}, DrawingUnit::Millimeter, cfg.height);
  }
  return r;
}

} // namespace

VectorResult ProcessVectorDrawing(const VectorDrawing& drawing, const FootprintConfig& cfg)
{
  VectorResult r;
  r.info.unit = drawing.unit;

  const FlattenedDrawing flat = FlattenDrawing(drawing);
  r.info.rawSegments = static_cast<int>(flat.segments.size());
  r.info.layers = flat.layers;

  if (flat.segments.empty()) {
    return Fail(std::move(r), PipelineError::NoGeometry,
                "No structural geometry found in CAD file. The file may contain only text/annotations.");
  }

  const CleaningTolerances tol = ComputeAdaptiveTolerances(flat.bounds, drawing.unit, cfg.cleaner);
  r.info.tolerances = tol;
  Logf(LogLevel::Debug, "pipeline", "extent %.3f x %.3f %s, snap=%.4f minLength=%.4f", flat.bounds.width(),
       flat.bounds.height(), DrawingUnitName(drawing.unit), tol.snap, tol.minLength);

  CleaningResult cleaned = CleanSegments(flat.segments, tol.minLength, tol.snap, cfg.cleaner);
  r.info.cleanedSegments = static_cast<int>(cleaned.segments.size());
  r.info.cleaning = cleaned.stats;

  if (cleaned.segments.size() < 3) {
    return Fail(std::move(r), PipelineError::InsufficientGeometry,
                "Insufficient geometry after cleaning (" + std::to_string(cleaned.segments.size()) +
                    " segments remain). Need at least 3 segments to form a building outline.");
  }

  BoundaryResult br;
  std::string err;
  if (!DetectOuterBoundary(cleaned.segments, tol.snap, br, err, cfg.detector)) {
    return Fail(std::move(r), PipelineError::InsufficientGeometry, "Boundary detection failed: " + err);
  }

  r.info.graphNodes = static_cast<int>(br.graph.nodes.size());
  r.info.graphEdges = static_cast<int>(br.graph.edges.size());
  r.info.loopsFound = static_cast<int>(br.innerLoops.size()) + 1;
  r.info.boundaryPoints = static_cast<int>(br.outerBoundary.points.size());
  r.info.usedHullFallback = br.usedHullFallback;

  r.extraction = ExtractWallSegments(br.outerBoundary, flat.dimensions, flat.zRange, drawing.unit, cfg.height);
  r.info.wallCount = static_cast<int>(r.extraction.wallSegments.size());

  const double toMm = UnitToMm(drawing.unit);
  r.extraction.allGeometry.reserve(cleaned.segments.size());
  for (const Segment& s : cleaned.segments) {
    r.extraction.allGeometry.push_back(
        MakeSegment(Vec2{s.start.x * toMm, s.start.y * toMm}, Vec2{s.end.x * toMm, s.end.y * toMm}));
  }

  r.boundary = std::move(br.outerBoundary);
  r.success = true;

  Logf(LogLevel::Info, "pipeline", "vector: %d raw -> %d cleaned segments, %d nodes, %d loops, %d walls",
       r.info.rawSegments, r.info.cleanedSegments, r.info.graphNodes, r.info.loopsFound, r.info.wallCount);
  return r;
}

VectorResult ProcessVectorFile(const std::string& path, const FootprintConfig& cfg)
{
  VectorDrawing drawing;
  std::string err;
  if (!LoadDrawingJsonFile(path, drawing, err)) {
    return Fail(VectorResult{}, PipelineError::InvalidInput, err);
  }
  return ProcessVectorDrawing(drawing, cfg);
}

RasterResult ProcessRasterDrawing(const std::string& imagePath, const FootprintConfig& cfg,
                                  const std::optional<RasterExtent>& extent)
{
  OutlineStats stats;
  std::optional<std::vector<OutlinePoint>> outline = DetectOutline(imagePath, cfg.raster, &stats);
  return FinishRaster(std::move(outline), stats, extent, cfg);
}

RasterResult ProcessRasterImage(const RgbImage& img, const FootprintConfig& cfg,
                                const std::optional<RasterExtent>& extent)
{
  OutlineStats stats;
  std::optional<std::vector<OutlinePoint>> outline = DetectOutlineFromImage(img, cfg.raster, &stats);
  return FinishRaster(std::move(outline), stats, extent, cfg);
}

} // namespace footprint

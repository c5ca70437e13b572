#pragma once

#include "footprint/BoundaryGraph.hpp"
#include "footprint/CadEntity.hpp"
#include "footprint/Config.hpp"
#include "footprint/Errors.hpp"
#include "footprint/RasterOutline.hpp"
#include "footprint/SegmentCleaner.hpp"
#include "footprint/WallExtractor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace footprint {

// Per-file orchestration of the two reconstruction paths.
//
// Vector: flatten -> adaptive tolerances -> clean -> detect boundary -> extract walls.
// Raster: detect outline -> (optional real-world extent) -> extract walls.
//
// Each call is self-contained; nothing is shared between calls, so several files may be
// processed concurrently (see Batch.hpp).

// Diagnostics for a vector run.
struct ExtractionInfo {
  int rawSegments = 0;
  int cleanedSegments = 0;
  int graphNodes = 0;
  int graphEdges = 0;

  // Inner loops + the outer boundary.
  int loopsFound = 0;

  int boundaryPoints = 0;
  int wallCount = 0;

  DrawingUnit unit = DrawingUnit::Millimeter;
  CleaningTolerances tolerances{};
  CleaningStats cleaning{};
  bool usedHullFallback = false;

  std::vector<std::string> layers;
};

struct VectorResult {
  bool success = false;
  PipelineError error = PipelineError::None;
  std::string message;

  ExtractionInfo info{};

  // Outer boundary in drawing units.
  BoundaryLoop boundary;

  ExtractionResult extraction;
};

// Real-world size of the whole raster image, in millimetres.
struct RasterExtent {
  double widthMm = 0.0;
  double heightMm = 0.0;
};

struct RasterResult {
  bool success = false;
  PipelineError error = PipelineError::None;
  std::string message;

  std::vector<OutlinePoint> outline;
  OutlineStats stats{};

  // Present only when an extent was supplied.
  std::optional<ExtractionResult> extraction;
};

VectorResult ProcessVectorDrawing(const VectorDrawing& drawing, const FootprintConfig& cfg = {});

// Load a drawing JSON document and process it. Malformed documents fail with InvalidInput.
VectorResult ProcessVectorFile(const std::string& path, const FootprintConfig& cfg = {});

RasterResult ProcessRasterDrawing(const std::string& imagePath, const FootprintConfig& cfg = {},
                                  const std::optional<RasterExtent>& extent = std::nullopt);

RasterResult ProcessRasterImage(const RgbImage& img, const FootprintConfig& cfg = {},
                                const std::optional<RasterExtent>& extent = std::nullopt);

} // namespace footprint

#pragma once

#include "footprint/Config.hpp"
#include "footprint/Errors.hpp"
#include "footprint/Image.hpp"
#include "footprint/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace footprint {

// Raster Outline Detector.
//
// Recovers a building footprint polygon from a scanned or rendered drawing:
//
//   downscale -> gray -> threshold -> dilate -> exterior flood -> plausibility check
//   -> largest component -> fill holes -> Moore trace -> Douglas-Peucker (x2)
//   -> axis snap -> dedupe + collinear merge -> short-edge filter -> bbox fallback
//
// Detection is best effort: every failure yields std::nullopt, never an exception.
// Output vertices are fractions of the working image width/height.

struct OutlinePoint {
  double xFrac = 0.0;
  double yFrac = 0.0;
};

struct OutlineStats {
  int sourceWidth = 0;
  int sourceHeight = 0;
  int workWidth = 0;
  int workHeight = 0;

  double buildingFraction = 0.0;
  int contourPoints = 0;
  int simplifiedPoints = 0;
  int finalPoints = 0;

  // The final polygon was replaced by the axis-aligned bounding box.
  bool usedBoundingBox = false;

  // Why no outline was produced (None on success).
  PipelineError error = PipelineError::None;
  std::string message;
};

// Working resolution: longest side scaled to cfg.workingMaxSide (never enlarged), each
// axis at least cfg.workingMinSide.
void ComputeWorkingSize(int srcW, int srcH, const RasterConfig& cfg, int& outW, int& outH);

// Grayscale image at working resolution.
GrayImage MakeWorkingImage(const RgbImage& img, const RasterConfig& cfg);

std::optional<std::vector<OutlinePoint>> DetectOutline(const std::string& imagePath, const RasterConfig& cfg = {},
                                                       OutlineStats* outStats = nullptr);

std::optional<std::vector<OutlinePoint>> DetectOutlineFromImage(const RgbImage& img, const RasterConfig& cfg = {},
                                                                OutlineStats* outStats = nullptr);

// `work` is already at working resolution.
std::optional<std::vector<OutlinePoint>> DetectOutlineFromGray(const GrayImage& work, const RasterConfig& cfg = {},
                                                               OutlineStats* outStats = nullptr);

// Polygon clean-up stages (pixel coordinates, implicit closure).

// Edges (length >= 2) that are within the slope ratio and absolute tolerance of an axis
// get both endpoints set to the rounded average coordinate.
std::vector<Vec2> SnapToAxes(const std::vector<Vec2>& pts, double threshold, double ratio = 0.15);

// Consecutive duplicates and a closing duplicate are removed.
std::vector<Vec2> RemoveDuplicatePoints(const std::vector<Vec2>& pts);

// Drops vertices with no significant turn. Polygons of 3 or fewer vertices pass through;
// if fewer than 3 would remain, the first, middle and last input vertices are returned.
std::vector<Vec2> MergeCollinearPoints(const std::vector<Vec2>& pts);

// Steps after simplification: axis snap, dedupe, collinear merge, short-edge filter,
// collinear merge again and the bounding-box fallback. Returns fewer than 3 points only
// when the input is degenerate.
std::vector<Vec2> RefineOutlinePolygon(const std::vector<Vec2>& simplified, int w, int h, const RasterConfig& cfg,
                                       bool* outUsedBoundingBox = nullptr);

// Draw the outline (red, 1px) over the working image for visual inspection.
RgbImage RenderOutlineOverlay(const GrayImage& work, const std::vector<OutlinePoint>& outline);

} // namespace footprint

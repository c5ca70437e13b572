#pragma once

#include "footprint/BoundaryGraph.hpp"
#include "footprint/CadEntity.hpp"
#include "footprint/Config.hpp"
#include "footprint/RasterOutline.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace footprint {

// Wall Segment Extractor: turns an ordered boundary loop into dimensioned walls (mm)
// and resolves the building height from the available hints.

enum class WallSide : std::uint8_t {
  East = 0,
  North,
  West,
  South,
  Diagonal,
};

// "east", "north", "west", "south", "diagonal".
const char* WallSideName(WallSide s);

// Within +-15 degrees of an axis direction (0 = east, 90 = north, ...), otherwise diagonal.
WallSide ClassifyWallSide(double angleDeg);

struct WallSegment {
  int id = 0;

  // Millimetres, not rounded.
  Vec2 start;
  Vec2 end;

  // Millimetres, rounded to the nearest integer.
  double length = 0.0;

  // Direction in degrees, [0,360), 0 = +X, counter-clockwise, rounded to 0.01.
  double angleDeg = 0.0;

  WallSide side = WallSide::East;
};

struct HeightEstimate {
  std::optional<double> heightMm;
  std::string note;
};

struct ExtractionResult {
  std::vector<WallSegment> wallSegments;

  // Millimetres, rounded.
  double perimeterTotal = 0.0;

  // Unset means unknown: the caller must ask for it, never substitute a default.
  std::optional<double> buildingHeight;
  std::string heightNote;

  // Always "mm".
  std::string unit = "mm";

  // All cleaned geometry in mm (reference rendering only).
  std::vector<Segment> allGeometry;
};

// Height resolution, first match wins:
//   1) Z range with maxZ > minZ
//   2) vertical dimension whose label contains a height keyword, value > 0
//   3) vertical dimension whose value lies within the plausible range (mm)
//   4) unknown
HeightEstimate ResolveBuildingHeight(const std::vector<DimensionHint>& dims, const ZRange& z, DrawingUnit unit,
                                     const HeightConfig& cfg = {});

// True if `text` contains one of the height keywords (ASCII case-insensitive).
bool HasHeightKeyword(const std::string& text);

ExtractionResult ExtractWallSegments(const BoundaryLoop& boundary, const std::vector<DimensionHint>& dims,
                                     const ZRange& z, DrawingUnit unit, const HeightConfig& cfg = {});

// Map a fractional raster outline onto a real-world extent. Image rows grow downward,
// so y is flipped to keep +Y up.
BoundaryLoop OutlineToBoundary(const std::vector<OutlinePoint>& outline, double widthMm, double heightMm);

} // namespace footprint

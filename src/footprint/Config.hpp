#pragma once

namespace footprint {

// Tunables for the reconstruction pipeline. Defaults reproduce the calibrated behaviour
// for architectural drawings; every field can be overridden from JSON (see ConfigIO.hpp).

struct CleanerConfig {
  // Adaptive tolerances: snap = max(floor, factor * extent), floors given in mm and
  // scaled into the drawing unit.
  double snapFactor = 0.001;
  double snapFloorMm = 5.0;
  double minLengthFactor = 0.005;
  double minLengthFloorMm = 10.0;

  // Two segments are collinear when their directions agree within this angle
  // (forward or reversed).
  double collinearAngleDeg = 1.0;

  // Segments at or below this length after snapping are dropped.
  double zeroLength = 0.001;
};

struct DetectorConfig {
  // Loops with |area| at or below this are discarded as degenerate.
  double minLoopArea = 0.1;

  // A face walk may take at most nodes + walkStepSlack steps.
  int walkStepSlack = 10;

  // Report a cycle only once even if traversed in both directions.
  bool dedupeLoops = true;
};

struct RasterConfig {
  // Working resolution: longest side scaled down to this (never up), each axis >= minSide.
  int workingMaxSide = 500;
  int workingMinSide = 10;

  // Gray < threshold is a wall pixel.
  int threshold = 160;
  int dilateRadius = 4;

  // Plausible building-pixel fraction after the exterior flood.
  double minBuildingFraction = 0.02;
  double maxBuildingFraction = 0.92;

  int minContourPoints = 8;

  // Douglas-Peucker: eps = max(floor, factor * min(w,h)); the second pass runs when the
  // first leaves more than secondPassAbove points.
  double simplifyFactor = 0.10;
  double simplifyFloor = 15.0;
  double simplifyFactor2 = 0.15;
  double simplifyFloor2 = 20.0;
  int secondPassAbove = 12;

  // Axis snapping.
  double axisSnapRatio = 0.15;
  double axisSnapFactor = 0.08;
  double axisSnapFloor = 10.0;

  // Edges shorter than minEdgeFactor * min(w,h) are dropped.
  double minEdgeFactor = 0.05;

  // Bounding-box fallback triggers.
  int maxVertices = 8;
  double minAreaFraction = 0.05;
};

struct HeightConfig {
  // Plausible building height for unlabelled vertical dimensions.
  double minPlausibleMm = 2500.0;
  double maxPlausibleMm = 100000.0;
};

struct FootprintConfig {
  CleanerConfig cleaner{};
  DetectorConfig detector{};
  RasterConfig raster{};
  HeightConfig height{};
};

} // namespace footprint

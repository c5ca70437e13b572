#pragma once

#include "footprint/Config.hpp"
#include "footprint/Geometry.hpp"
#include "footprint/Types.hpp"

#include <vector>

namespace footprint {

// Segment Cleaner: normalizes raw vector segments before boundary detection.
//
// Stages, in order:
//   1) length filter        (drop segments shorter than minLength)
//   2) endpoint snapping    (cluster around seed endpoints, fold clusters whose centroids
//                            still lie within tolerance, move members to the centroid)
//   3) collinear merge      (fixed point, capped)
//   4) duplicate removal
//   5) disconnected removal (keep the largest component)
//
// Never fails. An empty or tiny result is reported by the next stage.

struct CleaningStats {
  int tooShort = 0;
  int duplicates = 0;
  int disconnected = 0;
  int merged = 0;
};

struct CleaningResult {
  std::vector<Segment> segments;
  CleaningStats stats;
};

struct CleaningTolerances {
  double snap = 5.0;
  double minLength = 10.0;
};

// Tolerances adapted to the drawing extent and unit.
CleaningTolerances ComputeAdaptiveTolerances(const Bounds2D& bounds, DrawingUnit unit, const CleanerConfig& cfg = {});

CleaningResult CleanSegments(const std::vector<Segment>& raw, double minLength, double snapTolerance,
                             const CleanerConfig& cfg = {});

// Individual stages (exposed for diagnostics and tests).
std::vector<Segment> SnapEndpoints(const std::vector<Segment>& segs, double tolerance, double zeroLength = 0.001);
std::vector<Segment> MergeCollinearSegments(const std::vector<Segment>& segs, double tolerance, double angleTolDeg = 1.0);
std::vector<Segment> RemoveDuplicateSegments(const std::vector<Segment>& segs, double tolerance);
std::vector<Segment> RemoveDisconnectedSegments(const std::vector<Segment>& segs, double tolerance);

} // namespace footprint

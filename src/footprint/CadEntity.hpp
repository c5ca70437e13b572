#pragma once

#include "footprint/Geometry.hpp"
#include "footprint/Types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace footprint {

// Structural CAD entities as handed over by the vector-extraction collaborator.
//
// The set is closed: anything that is not one of these (text, hatches, leaders...) is
// dropped before it gets here. Block references are kept next to the entity list
// (VectorDrawing::inserts) rather than as a sixth alternative, so a block cannot
// contain itself.

struct CadLine {
  Vec2 start;
  Vec2 end;

  // Elevation of the endpoints, when the source carried Z.
  bool hasZ = false;
  double startZ = 0.0;
  double endZ = 0.0;

  std::string layer;
};

struct CadPolyline {
  std::vector<Vec2> points;
  bool closed = false;
  std::string layer;
};

// Counter-clockwise arc, angles in degrees.
struct CadArc {
  Vec2 center;
  double radius = 0.0;
  double startAngleDeg = 0.0;
  double endAngleDeg = 360.0;
  std::string layer;
};

// Approximated by its control/fit points taken as a polyline.
struct CadSpline {
  std::vector<Vec2> points;
  std::string layer;
};

struct CadDimension {
  std::string text;
  Vec2 start;
  Vec2 end;
  std::string layer;
};

using CadEntity = std::variant<CadLine, CadPolyline, CadArc, CadSpline, CadDimension>;

// Lower-case entity kind: "line", "polyline", "arc", "spline", "dimension".
const char* CadEntityKindName(const CadEntity& e);

struct CadBlock {
  std::string name;
  std::vector<CadEntity> entities;
};

// Placement of a named block: scale, then rotate (degrees, CCW), then translate.
struct CadInsert {
  std::string blockName;
  Vec2 position;
  double scaleX = 1.0;
  double scaleY = 1.0;
  double rotationDeg = 0.0;
  std::string layer;
};

struct VectorDrawing {
  DrawingUnit unit = DrawingUnit::Millimeter;
  std::vector<CadEntity> entities;
  std::vector<CadBlock> blocks;
  std::vector<CadInsert> inserts;
};

struct DimensionHint {
  // First decimal number found in `text`, if any.
  std::optional<double> value;
  std::string text;
  Vec2 start;
  Vec2 end;
  std::string layer;

  // |dy| > 3*|dx| between the definition points.
  bool isVertical = false;
};

struct ZRange {
  bool hasZ = false;
  double minZ = 0.0;
  double maxZ = 0.0;
};

struct FlattenedDrawing {
  std::vector<Segment> segments;
  std::vector<DimensionHint> dimensions;
  ZRange zRange;

  // Distinct layer names in first-seen order ("default" for unnamed).
  std::vector<std::string> layers;

  // Bounds of `segments`; 0..1000 on both axes when there are none.
  Bounds2D bounds;
};

// Segments per full turn when linearizing arcs.
constexpr int kArcSegmentsPerTurn = 16;

// Append the chords of an arc. Non-positive radii produce nothing.
// Uses max(4, ceil(sweep / 2pi * 16)) chords; an end angle <= start angle wraps once.
void LinearizeArc(const CadArc& arc, std::vector<Segment>& out);

// First run of digits (with an optional fractional part) in `text`, e.g. "H=6500" -> 6500.
std::optional<double> ParseDimensionValue(const std::string& text);

DimensionHint MakeDimensionHint(const CadDimension& d);

// Convert entities (and expanded block inserts) into a uniform segment list plus
// dimension and elevation hints. Dimensions inside blocks are ignored.
FlattenedDrawing FlattenDrawing(const VectorDrawing& drawing);

} // namespace footprint

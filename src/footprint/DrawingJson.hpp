#pragma once

#include "footprint/CadEntity.hpp"
#include "footprint/Json.hpp"

#include <string>

namespace footprint {

// JSON form of a VectorDrawing.
//
// {
//   "unit": "mm",                      // or "cm"/"m"; alternatively "insunits": 4|5|6
//   "entities": [
//     {"type":"line", "start":[x,y], "end":[x,y], "z":[z1,z2], "layer":"A-WALL"},
//     {"type":"polyline", "points":[[x,y],...], "closed":true},
//     {"type":"arc", "center":[x,y], "radius":r, "start_angle":deg, "end_angle":deg},
//     {"type":"spline", "points":[[x,y],...]},
//     {"type":"dimension", "text":"H=6500", "start":[x,y], "end":[x,y]}
//   ],
//   "blocks":  [{"name":"COL", "entities":[...]}],
//   "inserts": [{"block":"COL", "position":[x,y], "scale":[sx,sy], "rotation":deg}]
// }
//
// Line endpoints may also be given as [x,y,z]. Unknown entity types are skipped with a
// warning; malformed known entities are errors.

bool ParseDrawingJson(const JsonValue& root, VectorDrawing& outDrawing, std::string& outError);

bool LoadDrawingJsonFile(const std::string& path, VectorDrawing& outDrawing, std::string& outError);

// Serialize a drawing back to the same format (used by tests and tooling).
std::string DrawingToJson(const VectorDrawing& drawing, bool pretty = true);

} // namespace footprint

#include "footprint/DrawingJson.hpp"

#include "footprint/Log.hpp"

#include <cmath>
#include <sstream>
#include <type_traits>

namespace footprint {

namespace {

bool ReadPoint(const JsonValue& v, Vec2& out, double* outZ, bool* outHasZ)
{
  if (!v.isArray() || v.arrayValue.size() < 2 || v.arrayValue.size() > 3) return false;
  for (const JsonValue& c : v.arrayValue) {
    if (!c.isNumber() || !std::isfinite(c.numberValue)) return false;
  }
  out.x = v.arrayValue[0].numberValue;
  out.y = v.arrayValue[1].numberValue;
  if (v.arrayValue.size() == 3) {
    if (outZ) *outZ = v.arrayValue[2].numberValue;
    if (outHasZ) *outHasZ = true;
  }
  return true;
}

bool RequirePoint(const JsonValue& obj, const char* key, Vec2& out, std::string& err, double* outZ = nullptr,
                  bool* outHasZ = nullptr)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) {
    err = std::string("missing '") + key + "'";
    return false;
  }
  if (!ReadPoint(*v, out, outZ, outHasZ)) {
    err = std::string("expected [x,y] for '") + key + "'";
    return false;
  }
  return true;
}

bool RequirePoints(const JsonValue& obj, std::vector<Vec2>& out, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, "points");
  if (!v || !v->isArray()) {
    err = "expected array for 'points'";
    return false;
  }
  out.clear();
  out.reserve(v->arrayValue.size());
  for (const JsonValue& p : v->arrayValue) {
    Vec2 q;
    if (!ReadPoint(p, q, nullptr, nullptr)) {
      err = "expected [x,y] entries in 'points'";
      return false;
    }
    out.push_back(q);
  }
  return true;
}

bool OptNumber(const JsonValue& obj, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isNumber() || !std::isfinite(v->numberValue)) {
    err = std::string("expected finite number for '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

bool OptString(const JsonValue& obj, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

bool OptBool(const JsonValue& obj, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isBool()) {
    err = std::string("expected boolean for '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

// Returns false with an empty error for unknown entity types (skipped by the caller).
bool ParseEntity(const JsonValue& obj, CadEntity& out, std::string& err)
{
  if (!obj.isObject()) {
    err = "entity must be an object";
    return false;
  }
  const JsonValue* type = FindJsonMember(obj, "type");
  if (!type || !type->isString()) {
    err = "entity is missing a string 'type'";
    return false;
  }
  const std::string& t = type->stringValue;

  std::string layer;
  if (!OptString(obj, "layer", layer, err)) return false;

  if (t == "line") {
    CadLine line;
    line.layer = layer;
    if (!RequirePoint(obj, "start", line.start, err, &line.startZ, &line.hasZ)) return false;
    if (!RequirePoint(obj, "end", line.end, err, &line.endZ, &line.hasZ)) return false;
    if (const JsonValue* z = FindJsonMember(obj, "z")) {
      if (!z->isArray() || z->arrayValue.size() != 2 || !z->arrayValue[0].isNumber() || !z->arrayValue[1].isNumber()) {
        err = "expected [z1,z2] for 'z'";
        return false;
      }
      line.hasZ = true;
      line.startZ = z->arrayValue[0].numberValue;
      line.endZ = z->arrayValue[1].numberValue;
    }
    out = line;
    return true;
  }

  if (t == "polyline" || t == "lwpolyline") {
    CadPolyline pl;
    pl.layer = layer;
    if (!RequirePoints(obj, pl.points, err)) return false;
    if (!OptBool(obj, "closed", pl.closed, err)) return false;
    out = pl;
    return true;
  }

  if (t == "arc" || t == "circle") {
    CadArc arc;
    arc.layer = layer;
    if (!RequirePoint(obj, "center", arc.center, err)) return false;
    if (!OptNumber(obj, "radius", arc.radius, err)) return false;
    if (t == "arc") {
      if (!OptNumber(obj, "start_angle", arc.startAngleDeg, err)) return false;
      if (!OptNumber(obj, "end_angle", arc.endAngleDeg, err)) return false;
    }
    out = arc;
    return true;
  }

  if (t == "spline") {
    CadSpline sp;
    sp.layer = layer;
    if (!RequirePoints(obj, sp.points, err)) return false;
    out = sp;
    return true;
  }

  if (t == "dimension") {
    CadDimension dim;
    dim.layer = layer;
    if (!OptString(obj, "text", dim.text, err)) return false;
    if (!RequirePoint(obj, "start", dim.start, err)) return false;
    if (!RequirePoint(obj, "end", dim.end, err)) return false;
    out = dim;
    return true;
  }

  err.clear();
  return false;
}

bool ParseEntityList(const JsonValue& arr, const char* where, std::vector<CadEntity>& out, std::string& outError)
{
  if (!arr.isArray()) {
    outError = std::string("expected array for '") + where + "'";
    return false;
  }
  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    CadEntity e;
    std::string err;
    if (ParseEntity(arr.arrayValue[i], e, err)) {
      out.push_back(std::move(e));
      continue;
    }
    if (err.empty()) {
      const JsonValue* type = FindJsonMember(arr.arrayValue[i], "type");
      Logf(LogLevel::Debug, "drawing", "skipping non-structural entity '%s'",
           type ? type->stringValue.c_str() : "?");
      continue;
    }
    std::ostringstream oss;
    oss << where << "[" << i << "]: " << err;
    outError = oss.str();
    return false;
  }
  return true;
}

void WritePoint(JsonWriter& w, const Vec2& p)
{
  w.beginArray();
  w.numberValue(p.x);
  w.numberValue(p.y);
  w.endArray();
}

void WritePointList(JsonWriter& w, const std::vector<Vec2>& pts)
{
  w.key("points");
  w.beginArray();
  for (const Vec2& p : pts) WritePoint(w, p);
  w.endArray();
}

void WriteEntity(JsonWriter& w, const CadEntity& e)
{
  w.beginObject();
  w.member("type", CadEntityKindName(e));
  std::visit(
      [&](const auto& ent) {
        using T = std::decay_t<decltype(ent)>;
        if (!ent.layer.empty()) w.member("layer", ent.layer);
        if constexpr (std::is_same_v<T, CadLine>) {
          w.key("start");
          WritePoint(w, ent.start);
          w.key("end");
          WritePoint(w, ent.end);
          if (ent.hasZ) {
            w.key("z");
            w.beginArray();
            w.numberValue(ent.startZ);
            w.numberValue(ent.endZ);
            w.endArray();
          }
        } else if constexpr (std::is_same_v<T, CadPolyline>) {
          WritePointList(w, ent.points);
          w.member("closed", ent.closed);
        } else if constexpr (std::is_same_v<T, CadArc>) {
          w.key("center");
          WritePoint(w, ent.center);
          w.member("radius", ent.radius);
          w.member("start_angle", ent.startAngleDeg);
          w.member("end_angle", ent.endAngleDeg);
        } else if constexpr (std::is_same_v<T, CadSpline>) {
          WritePointList(w, ent.points);
        } else {
          w.member("text", ent.text);
          w.key("start");
          WritePoint(w, ent.start);
          w.key("end");
          WritePoint(w, ent.end);
        }
      },
      e);
  w.endObject();
}

} // namespace

bool ParseDrawingJson(const JsonValue& root, VectorDrawing& outDrawing, std::string& outError)
{
  outError.clear();
  if (!root.isObject()) {
    outError = "drawing document must be a JSON object";
    return false;
  }

  VectorDrawing d;

  if (const JsonValue* unit = FindJsonMember(root, "unit")) {
    if (!unit->isString() || !ParseDrawingUnit(unit->stringValue, &d.unit)) {
      outError = "invalid 'unit' (expected mm, cm or m)";
      return false;
    }
  } else if (const JsonValue* ins = FindJsonMember(root, "insunits")) {
    if (!ins->isNumber()) {
      outError = "expected number for 'insunits'";
      return false;
    }
    d.unit = DrawingUnitFromInsUnits(static_cast<int>(std::lround(ins->numberValue)));
  }

  const JsonValue* entities = FindJsonMember(root, "entities");
  if (!entities) {
    outError = "missing 'entities'";
    return false;
  }
  if (!ParseEntityList(*entities, "entities", d.entities, outError)) return false;

  if (const JsonValue* blocks = FindJsonMember(root, "blocks")) {
    if (!blocks->isArray()) {
      outError = "expected array for 'blocks'";
      return false;
    }
    for (const JsonValue& b : blocks->arrayValue) {
      CadBlock block;
      const JsonValue* name = FindJsonMember(b, "name");
      const JsonValue* ents = FindJsonMember(b, "entities");
      if (!name || !name->isString() || !ents) {
        outError = "block needs a string 'name' and 'entities'";
        return false;
      }
      block.name = name->stringValue;
      if (!ParseEntityList(*ents, "blocks.entities", block.entities, outError)) return false;
      d.blocks.push_back(std::move(block));
    }
  }

  if (const JsonValue* inserts = FindJsonMember(root, "inserts")) {
    if (!inserts->isArray()) {
      outError = "expected array for 'inserts'";
      return false;
    }
    for (const JsonValue& v : inserts->arrayValue) {
      CadInsert ins;
      std::string err;
      const JsonValue* block = FindJsonMember(v, "block");
      if (!block || !block->isString()) {
        outError = "insert needs a string 'block'";
        return false;
      }
      ins.blockName = block->stringValue;
      if (FindJsonMember(v, "position") && !RequirePoint(v, "position", ins.position, err)) {
        outError = "insert: " + err;
        return false;
      }
      if (const JsonValue* scale = FindJsonMember(v, "scale")) {
        Vec2 s;
        if (!ReadPoint(*scale, s, nullptr, nullptr)) {
          outError = "insert: expected [sx,sy] for 'scale'";
          return false;
        }
        ins.scaleX = s.x;
        ins.scaleY = s.y;
      }
      if (!OptNumber(v, "rotation", ins.rotationDeg, err) || !OptString(v, "layer", ins.layer, err)) {
        outError = "insert: " + err;
        return false;
      }
      d.inserts.push_back(std::move(ins));
    }
  }

  outDrawing = std::move(d);
  return true;
}

bool LoadDrawingJsonFile(const std::string& path, VectorDrawing& outDrawing, std::string& outError)
{
  JsonValue root;
  if (!LoadJsonFile(path, root, outError)) return false;
  if (!ParseDrawingJson(root, outDrawing, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

std::string DrawingToJson(const VectorDrawing& drawing, bool pretty)
{
  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.pretty = pretty;
  JsonWriter w(oss, opt);

  w.beginObject();
  w.member("unit", DrawingUnitName(drawing.unit));

  w.key("entities");
  w.beginArray();
  for (const CadEntity& e : drawing.entities) WriteEntity(w, e);
  w.endArray();

  if (!drawing.blocks.empty()) {
    w.key("blocks");
    w.beginArray();
    for (const CadBlock& b : drawing.blocks) {
      w.beginObject();
      w.member("name", b.name);
      w.key("entities");
      w.beginArray();
      for (const CadEntity& e : b.entities) WriteEntity(w, e);
      w.endArray();
      w.endObject();
    }
    w.endArray();
  }

  if (!drawing.inserts.empty()) {
    w.key("inserts");
    w.beginArray();
    for (const CadInsert& ins : drawing.inserts) {
      w.beginObject();
      w.member("block", ins.blockName);
      w.key("position");
      WritePoint(w, ins.position);
      w.key("scale");
      WritePoint(w, Vec2{ins.scaleX, ins.scaleY});
      w.member("rotation", ins.rotationDeg);
      if (!ins.layer.empty()) w.member("layer", ins.layer);
      w.endObject();
    }
    w.endArray();
  }

  w.endObject();
  return w.ok() ? oss.str() : std::string();
}

} // namespace footprint

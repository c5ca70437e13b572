#include "footprint/CadEntity.hpp"

#include "footprint/Log.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <type_traits>

namespace footprint {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kDegToRad = kPi / 180.0;

// Identity unless a block insert is being expanded.
struct PlacementTransform {
  bool identity = true;
  Vec2 position;
  double scaleX = 1.0;
  double scaleY = 1.0;
  double cosR = 1.0;
  double sinR = 0.0;
  bool rotated = false;

  Vec2 apply(const Vec2& p) const
  {
    if (identity) return p;
    double px = p.x * scaleX;
    double py = p.y * scaleY;
    if (rotated) {
      const double rx = px * cosR - py * sinR;
      const double ry = px * sinR + py * cosR;
      px = rx;
      py = ry;
    }
    return Vec2{px + position.x, py + position.y};
  }
};

PlacementTransform MakePlacement(const CadInsert& ins)
{
  PlacementTransform t;
  t.identity = false;
  t.position = ins.position;
  t.scaleX = ins.scaleX;
  t.scaleY = ins.scaleY;
  const double r = ins.rotationDeg * kDegToRad;
  t.rotated = (r != 0.0);
  t.cosR = std::cos(r);
  t.sinR = std::sin(r);
  return t;
}

// Append a chain of points as segments, skipping zero-length pieces.
void AppendChain(const std::vector<Vec2>& pts, bool closed, const PlacementTransform& xf, std::vector<Segment>& out)
{
  if (pts.size() < 2) return;
  for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
    const Segment s = MakeSegment(xf.apply(pts[i]), xf.apply(pts[i + 1]));
    if (s.length > 0.0) out.push_back(s);
  }
  if (closed && pts.size() >= 3) {
    const Segment s = MakeSegment(xf.apply(pts.back()), xf.apply(pts.front()));
    if (s.length > 0.0) out.push_back(s);
  }
}

void NoteLayer(const std::string& layer, std::vector<std::string>& layers)
{
  const std::string name = layer.empty() ? std::string("default") : layer;
  if (std::find(layers.begin(), layers.end(), name) == layers.end()) layers.push_back(name);
}

void IncludeZ(ZRange& z, double v)
{
  if (!z.hasZ) {
    z.hasZ = true;
    z.minZ = v;
    z.maxZ = v;
    return;
  }
  z.minZ = std::min(z.minZ, v);
  z.maxZ = std::max(z.maxZ, v);
}

// Geometry-carrying entities only. Returns false for dimensions.
bool AppendGeometry(const CadEntity& e, const PlacementTransform& xf, std::vector<Segment>& out)
{
  return std::visit(
      [&](const auto& ent) -> bool {
        using T = std::decay_t<decltype(ent)>;
        if constexpr (std::is_same_v<T, CadLine>) {
          out.push_back(MakeSegment(xf.apply(ent.start), xf.apply(ent.end)));
          return true;
        } else if constexpr (std::is_same_v<T, CadPolyline>) {
          AppendChain(ent.points, ent.closed, xf, out);
          return true;
        } else if constexpr (std::is_same_v<T, CadArc>) {
          if (xf.identity) {
            LinearizeArc(ent, out);
          } else {
            std::vector<Segment> local;
            LinearizeArc(ent, local);
            for (const Segment& s : local) {
              const Segment t = MakeSegment(xf.apply(s.start), xf.apply(s.end));
              if (t.length > 0.0) out.push_back(t);
            }
          }
          return true;
        } else if constexpr (std::is_same_v<T, CadSpline>) {
          AppendChain(ent.points, false, xf, out);
          return true;
        } else {
          return false;
        }
      },
      e);
}

const std::string& EntityLayer(const CadEntity& e)
{
  return std::visit([](const auto& ent) -> const std::string& { return ent.layer; }, e);
}

} // namespace

const char* CadEntityKindName(const CadEntity& e)
{
  switch (e.index()) {
  case 0: return "line";
  case 1: return "polyline";
  case 2: return "arc";
  case 3: return "spline";
  case 4: return "dimension";
  default: return "unknown";
  }
}

void LinearizeArc(const CadArc& arc, std::vector<Segment>& out)
{
  if (!(arc.radius > 0.0)) return;

  const double start = arc.startAngleDeg * kDegToRad;
  double end = arc.endAngleDeg * kDegToRad;
  if (end <= start) end += 2.0 * kPi;

  const double sweep = end - start;
  const int n = std::max(4, static_cast<int>(std::ceil(sweep / (2.0 * kPi) * kArcSegmentsPerTurn)));

  for (int i = 0; i < n; ++i) {
    const double a1 = start + sweep * static_cast<double>(i) / static_cast<double>(n);
    const double a2 = start + sweep * static_cast<double>(i + 1) / static_cast<double>(n);
    const Vec2 p1{arc.center.x + arc.radius * std::cos(a1), arc.center.y + arc.radius * std::sin(a1)};
    const Vec2 p2{arc.center.x + arc.radius * std::cos(a2), arc.center.y + arc.radius * std::sin(a2)};
    const Segment s = MakeSegment(p1, p2);
    if (s.length > 0.0) out.push_back(s);
  }
}

std::optional<double> ParseDimensionValue(const std::string& text)
{
  std::size_t i = 0;
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) == 0) ++i;
  if (i >= text.size()) return std::nullopt;

  const std::size_t begin = i;
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) ++i;
  if (i < text.size() && text[i] == '.') {
    ++i;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) ++i;
  }

  const std::string num = text.substr(begin, i - begin);
  return std::strtod(num.c_str(), nullptr);
}

DimensionHint MakeDimensionHint(const CadDimension& d)
{
  DimensionHint h;
  h.value = ParseDimensionValue(d.text);
  h.text = d.text;
  h.start = d.start;
  h.end = d.end;
  h.layer = d.layer.empty() ? std::string("default") : d.layer;

  const double dx = std::fabs(d.end.x - d.start.x);
  const double dy = std::fabs(d.end.y - d.start.y);
  h.isVertical = dy > dx * 3.0;
  return h;
}

FlattenedDrawing FlattenDrawing(const VectorDrawing& drawing)
{
  FlattenedDrawing out;
  const PlacementTransform identity;

  for (const CadEntity& e : drawing.entities) {
    NoteLayer(EntityLayer(e), out.layers);

    if (const CadDimension* dim = std::get_if<CadDimension>(&e)) {
      out.dimensions.push_back(MakeDimensionHint(*dim));
      continue;
    }
    if (const CadLine* line = std::get_if<CadLine>(&e)) {
      if (line->hasZ) {
        IncludeZ(out.zRange, line->startZ);
        IncludeZ(out.zRange, line->endZ);
      }
    }
    AppendGeometry(e, identity, out.segments);
  }

  for (const CadInsert& ins : drawing.inserts) {
    const auto it = std::find_if(drawing.blocks.begin(), drawing.blocks.end(),
                                 [&](const CadBlock& b) { return b.name == ins.blockName; });
    if (it == drawing.blocks.end()) {
      Logf(LogLevel::Warn, "cad", "insert references unknown block '%s'", ins.blockName.c_str());
      continue;
    }

    const PlacementTransform xf = MakePlacement(ins);
    std::size_t added = 0;
    for (const CadEntity& e : it->entities) {
      const std::size_t before = out.segments.size();
      if (AppendGeometry(e, xf, out.segments)) {
        const std::string& layer = EntityLayer(e);
        NoteLayer(layer.empty() ? ins.layer : layer, out.layers);
      }
      added += out.segments.size() - before;
    }
    Logf(LogLevel::Debug, "cad", "block '%s' expanded into %zu segments", ins.blockName.c_str(), added);
  }

  if (out.segments.empty()) {
    out.bounds.include(Vec2{0.0, 0.0});
    out.bounds.include(Vec2{1000.0, 1000.0});
  } else {
    out.bounds = ComputeSegmentBounds(out.segments);
  }

  Logf(LogLevel::Info, "cad", "flattened %zu entities into %zu segments, %zu dimensions, %zu layers, hasZ=%d",
       drawing.entities.size(), out.segments.size(), out.dimensions.size(), out.layers.size(),
       out.zRange.hasZ ? 1 : 0);
  return out;
}

} // namespace footprint

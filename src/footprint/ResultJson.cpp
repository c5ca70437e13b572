#include "footprint/ResultJson.hpp"

#include <fstream>
#include <ostream>

namespace footprint {

namespace {

bool WritePoint(JsonWriter& w, const Vec2& p)
{
  return w.beginObject() && w.member("x", p.x) && w.member("y", p.y) && w.endObject();
}

bool WriteError(JsonWriter& w, bool success, PipelineError e, const std::string& msg)
{
  w.member("success", success);
  if (success) return w.ok();
  w.member("error", PipelineErrorName(e));
  return w.member("message", msg);
}

bool WriteInfo(JsonWriter& w, const ExtractionInfo& info)
{
  w.key("info");
  w.beginObject();
  w.member("unit", DrawingUnitName(info.unit));
  w.member("raw_segments", info.rawSegments);
  w.member("cleaned_segments", info.cleanedSegments);
  w.member("graph_nodes", info.graphNodes);
  w.member("graph_edges", info.graphEdges);
  w.member("loops_found", info.loopsFound);
  w.member("boundary_points", info.boundaryPoints);
  w.member("wall_count", info.wallCount);
  w.member("used_hull_fallback", info.usedHullFallback);
  w.member("snap_tolerance", info.tolerances.snap);
  w.member("min_length", info.tolerances.minLength);

  w.key("cleaning");
  w.beginObject();
  w.member("too_short", info.cleaning.tooShort);
  w.member("duplicates", info.cleaning.duplicates);
  w.member("disconnected", info.cleaning.disconnected);
  w.member("merged", info.cleaning.merged);
  w.endObject();

  w.key("layers");
  w.beginArray();
  for (const std::string& l : info.layers) w.stringValue(l);
  w.endArray();

  return w.endObject();
}

bool WriteStats(JsonWriter& w, const OutlineStats& s)
{
  w.key("stats");
  w.beginObject();
  w.member("source_width", s.sourceWidth);
  w.member("source_height", s.sourceHeight);
  w.member("work_width", s.workWidth);
  w.member("work_height", s.workHeight);
  w.member("building_fraction", s.buildingFraction);
  w.member("contour_points", s.contourPoints);
  w.member("simplified_points", s.simplifiedPoints);
  w.member("final_points", s.finalPoints);
  w.member("used_bounding_box", s.usedBoundingBox);
  return w.endObject();
}

template <typename Fn>
bool WriteFile(const std::string& path, std::string& outError, Fn fn)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open " + path;
    return false;
  }
  if (!fn(f)) return false;
  if (!f) {
    outError = "failed to write " + path;
    return false;
  }
  return true;
}

} // namespace

bool WriteExtractionJson(JsonWriter& w, const ExtractionResult& r, bool includeGeometry)
{
  w.beginObject();

  w.key("wallSegments");
  w.beginArray();
  for (const WallSegment& s : r.wallSegments) {
    w.beginObject();
    w.member("id", s.id);
    w.key("start");
    WritePoint(w, s.start);
    w.key("end");
    WritePoint(w, s.end);
    w.member("length", s.length);
    w.member("angle", s.angleDeg);
    w.member("side", WallSideName(s.side));
    w.endObject();
  }
  w.endArray();

  w.member("perimeterTotal", r.perimeterTotal);
  w.key("buildingHeight");
  if (r.buildingHeight) {
    w.numberValue(*r.buildingHeight);
  } else {
    w.nullValue();
  }
  w.member("heightNote", r.heightNote);
  w.member("unit", r.unit);

  if (includeGeometry) {
    w.key("allGeometry");
    w.beginArray();
    for (const Segment& s : r.allGeometry) {
      w.beginObject();
      w.member("x1", s.start.x);
      w.member("y1", s.start.y);
      w.member("x2", s.end.x);
      w.member("y2", s.end.y);
      w.endObject();
    }
    w.endArray();
  }

  return w.endObject();
}

bool WriteVectorResultJson(std::ostream& os, const VectorResult& r, const ResultJsonOptions& opt,
                           std::string& outError)
{
  JsonWriteOptions wo;
  wo.pretty = opt.pretty;
  JsonWriter w(os, wo);

  w.beginObject();
  WriteError(w, r.success, r.error, r.message);
  WriteInfo(w, r.info);
  if (r.success) {
    w.key("extraction");
    WriteExtractionJson(w, r.extraction, opt.includeGeometry);
  }
  w.endObject();
  os << "\n";

  if (!w.ok()) {
    outError = w.error();
    return false;
  }
  outError.clear();
  return true;
}

bool WriteRasterResultJson(std::ostream& os, const RasterResult& r, const ResultJsonOptions& opt,
                           std::string& outError)
{
  JsonWriteOptions wo;
  wo.pretty = opt.pretty;
  JsonWriter w(os, wo);

  w.beginObject();
  WriteError(w, r.success, r.error, r.message);
  WriteStats(w, r.stats);

  w.key("outline");
  w.beginArray();
  for (const OutlinePoint& p : r.outline) {
    w.beginObject();
    w.member("x", p.xFrac);
    w.member("y", p.yFrac);
    w.endObject();
  }
  w.endArray();

  if (r.extraction) {
    w.key("extraction");
    WriteExtractionJson(w, *r.extraction, opt.includeGeometry);
  }
  w.endObject();
  os << "\n";

  if (!w.ok()) {
    outError = w.error();
    return false;
  }
  outError.clear();
  return true;
}

bool WriteVectorResultJsonFile(const std::string& path, const VectorResult& r, const ResultJsonOptions& opt,
                               std::string& outError)
{
  return WriteFile(path, outError, [&](std::ostream& os) { return WriteVectorResultJson(os, r, opt, outError); });
}

bool WriteRasterResultJsonFile(const std::string& path, const RasterResult& r, const ResultJsonOptions& opt,
                               std::string& outError)
{
  return WriteFile(path, outError, [&](std::ostream& os) { return WriteRasterResultJson(os, r, opt, outError); });
}

} // namespace footprint

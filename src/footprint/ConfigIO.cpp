#include "footprint/ConfigIO.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <string>

namespace footprint {

namespace {

bool IsFiniteDouble(double v)
{
  return std::isfinite(v) != 0;
}

// Missing section => nothing to apply. Present but not an object => error.
bool GetSection(const JsonValue& root, const char* key, const JsonValue** out, std::string& err)
{
  *out = nullptr;
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isObject()) {
    err = std::string("expected object for key '") + key + "'";
    return false;
  }
  *out = v;
  return true;
}

bool ApplyBool(const JsonValue& obj, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true; // missing => keep
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "'";
    return false;
  }
  io = v->boolValue;
  return true;
}

bool ApplyI32(const JsonValue& obj, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!IsFiniteDouble(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  if (std::fabs(v->numberValue) > 2.0e9) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(std::lround(v->numberValue));
  return true;
}

bool ApplyF64(const JsonValue& obj, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  if (!IsFiniteDouble(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

bool ApplyCleaner(const JsonValue& o, CleanerConfig& c, std::string& err)
{
  return ApplyF64(o, "snap_factor", c.snapFactor, err) && ApplyF64(o, "snap_floor_mm", c.snapFloorMm, err) &&
         ApplyF64(o, "min_length_factor", c.minLengthFactor, err) &&
         ApplyF64(o, "min_length_floor_mm", c.minLengthFloorMm, err) &&
         ApplyF64(o, "collinear_angle_deg", c.collinearAngleDeg, err) &&
         ApplyF64(o, "zero_length", c.zeroLength, err);
}

bool ApplyDetector(const JsonValue& o, DetectorConfig& d, std::string& err)
{
  return ApplyF64(o, "min_loop_area", d.minLoopArea, err) && ApplyI32(o, "walk_step_slack", d.walkStepSlack, err) &&
         ApplyBool(o, "dedupe_loops", d.dedupeLoops, err);
}

bool ApplyRaster(const JsonValue& o, RasterConfig& r, std::string& err)
{
  return ApplyI32(o, "working_max_side", r.workingMaxSide, err) &&
         ApplyI32(o, "working_min_side", r.workingMinSide, err) && ApplyI32(o, "threshold", r.threshold, err) &&
         ApplyI32(o, "dilate_radius", r.dilateRadius, err) &&
         ApplyF64(o, "min_building_fraction", r.minBuildingFraction, err) &&
         ApplyF64(o, "max_building_fraction", r.maxBuildingFraction, err) &&
         ApplyI32(o, "min_contour_points", r.minContourPoints, err) &&
         ApplyF64(o, "simplify_factor", r.simplifyFactor, err) &&
         ApplyF64(o, "simplify_floor", r.simplifyFloor, err) &&
         ApplyF64(o, "simplify_factor_2", r.simplifyFactor2, err) &&
         ApplyF64(o, "simplify_floor_2", r.simplifyFloor2, err) &&
         ApplyI32(o, "second_pass_above", r.secondPassAbove, err) &&
         ApplyF64(o, "axis_snap_ratio", r.axisSnapRatio, err) &&
         ApplyF64(o, "axis_snap_factor", r.axisSnapFactor, err) &&
         ApplyF64(o, "axis_snap_floor", r.axisSnapFloor, err) &&
         ApplyF64(o, "min_edge_factor", r.minEdgeFactor, err) && ApplyI32(o, "max_vertices", r.maxVertices, err) &&
         ApplyF64(o, "min_area_fraction", r.minAreaFraction, err);
}

bool ApplyHeight(const JsonValue& o, HeightConfig& h, std::string& err)
{
  return ApplyF64(o, "min_plausible_mm", h.minPlausibleMm, err) &&
         ApplyF64(o, "max_plausible_mm", h.maxPlausibleMm, err);
}

bool ReadFileText(const std::string& path, std::string& out)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream oss;
  oss << f.rdbuf();
  out = oss.str();
  return true;
}

bool WriteFileText(const std::string& path, const std::string& text)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  f << text;
  return static_cast<bool>(f);
}

} // namespace

std::string FootprintConfigToJson(const FootprintConfig& cfg, int indentSpaces)
{
  std::ostringstream oss;
  JsonWriteOptions opt;
  opt.pretty = indentSpaces > 0;
  opt.indent = indentSpaces;
  JsonWriter w(oss, opt);

  w.beginObject();

  w.key("cleaner");
  w.beginObject();
  w.member("snap_factor", cfg.cleaner.snapFactor);
  w.member("snap_floor_mm", cfg.cleaner.snapFloorMm);
  w.member("min_length_factor", cfg.cleaner.minLengthFactor);
  w.member("min_length_floor_mm", cfg.cleaner.minLengthFloorMm);
  w.member("collinear_angle_deg", cfg.cleaner.collinearAngleDeg);
  w.member("zero_length", cfg.cleaner.zeroLength);
  w.endObject();

  w.key("detector");
  w.beginObject();
  w.member("min_loop_area", cfg.detector.minLoopArea);
  w.member("walk_step_slack", cfg.detector.walkStepSlack);
  w.member("dedupe_loops", cfg.detector.dedupeLoops);
  w.endObject();

  const RasterConfig& r = cfg.raster;
  w.key("raster");
  w.beginObject();
  w.member("working_max_side", r.workingMaxSide);
  w.member("working_min_side", r.workingMinSide);
  w.member("threshold", r.threshold);
  w.member("dilate_radius", r.dilateRadius);
  w.member("min_building_fraction", r.minBuildingFraction);
  w.member("max_building_fraction", r.maxBuildingFraction);
  w.member("min_contour_points", r.minContourPoints);
  w.member("simplify_factor", r.simplifyFactor);
  w.member("simplify_floor", r.simplifyFloor);
  w.member("simplify_factor_2", r.simplifyFactor2);
  w.member("simplify_floor_2", r.simplifyFloor2);
  w.member("second_pass_above", r.secondPassAbove);
  w.member("axis_snap_ratio", r.axisSnapRatio);
  w.member("axis_snap_factor", r.axisSnapFactor);
  w.member("axis_snap_floor", r.axisSnapFloor);
  w.member("min_edge_factor", r.minEdgeFactor);
  w.member("max_vertices", r.maxVertices);
  w.member("min_area_fraction", r.minAreaFraction);
  w.endObject();

  w.key("height");
  w.beginObject();
  w.member("min_plausible_mm", cfg.height.minPlausibleMm);
  w.member("max_plausible_mm", cfg.height.maxPlausibleMm);
  w.endObject();

  w.endObject();
  oss << "\n";
  return oss.str();
}

bool ValidateFootprintConfig(const FootprintConfig& cfg, std::string& outError)
{
  const CleanerConfig& c = cfg.cleaner;
  if (c.snapFactor < 0.0 || c.snapFloorMm < 0.0 || c.minLengthFactor < 0.0 || c.minLengthFloorMm < 0.0) {
    outError = "cleaner tolerances must be >= 0";
    return false;
  }
  if (c.collinearAngleDeg < 0.0 || c.collinearAngleDeg >= 90.0) {
    outError = "cleaner.collinear_angle_deg must be in [0,90)";
    return false;
  }
  if (c.zeroLength < 0.0) {
    outError = "cleaner.zero_length must be >= 0";
    return false;
  }

  if (cfg.detector.minLoopArea < 0.0) {
    outError = "detector.min_loop_area must be >= 0";
    return false;
  }
  if (cfg.detector.walkStepSlack < 0) {
    outError = "detector.walk_step_slack must be >= 0";
    return false;
  }

  const RasterConfig& r = cfg.raster;
  if (r.workingMinSide < 1 || r.workingMaxSide < r.workingMinSide) {
    outError = "raster working size must satisfy 1 <= working_min_side <= working_max_side";
    return false;
  }
  if (r.threshold < 1 || r.threshold > 255) {
    outError = "raster.threshold must be in [1,255]";
    return false;
  }
  if (r.dilateRadius < 0) {
    outError = "raster.dilate_radius must be >= 0";
    return false;
  }
  if (r.minBuildingFraction < 0.0 || r.maxBuildingFraction > 1.0 || r.minBuildingFraction >= r.maxBuildingFraction) {
    outError = "raster building fractions must satisfy 0 <= min < max <= 1";
    return false;
  }
  if (r.minContourPoints < 3 || r.maxVertices < 3) {
    outError = "raster.min_contour_points and raster.max_vertices must be >= 3";
    return false;
  }
  if (r.simplifyFactor < 0.0 || r.simplifyFloor < 0.0 || r.simplifyFactor2 < 0.0 || r.simplifyFloor2 < 0.0 ||
      r.axisSnapRatio < 0.0 || r.axisSnapFactor < 0.0 || r.axisSnapFloor < 0.0 || r.minEdgeFactor < 0.0 ||
      r.minAreaFraction < 0.0) {
    outError = "raster tolerances must be >= 0";
    return false;
  }

  if (cfg.height.minPlausibleMm < 0.0 || cfg.height.maxPlausibleMm < cfg.height.minPlausibleMm) {
    outError = "height range must satisfy 0 <= min_plausible_mm <= max_plausible_mm";
    return false;
  }

  outError.clear();
  return true;
}

bool ApplyFootprintConfigJson(const JsonValue& root, FootprintConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "config root must be an object";
    return false;
  }

  // Work on a copy so a failed apply leaves the caller's config untouched.
  FootprintConfig cfg = ioCfg;
  std::string err;
  const JsonValue* sec = nullptr;

  if (!GetSection(root, "cleaner", &sec, err)) {
    outError = err;
    return false;
  }
  if (sec && !ApplyCleaner(*sec, cfg.cleaner, err)) {
    outError = "cleaner: " + err;
    return false;
  }

  if (!GetSection(root, "detector", &sec, err)) {
    outError = err;
    return false;
  }
  if (sec && !ApplyDetector(*sec, cfg.detector, err)) {
    outError = "detector: " + err;
    return false;
  }

  if (!GetSection(root, "raster", &sec, err)) {
    outError = err;
    return false;
  }
  if (sec && !ApplyRaster(*sec, cfg.raster, err)) {
    outError = "raster: " + err;
    return false;
  }

  if (!GetSection(root, "height", &sec, err)) {
    outError = err;
    return false;
  }
  if (sec && !ApplyHeight(*sec, cfg.height, err)) {
    outError = "height: " + err;
    return false;
  }

  if (!ValidateFootprintConfig(cfg, err)) {
    outError = err;
    return false;
  }

  ioCfg = cfg;
  outError.clear();
  return true;
}

bool WriteFootprintConfigJsonFile(const std::string& path, const FootprintConfig& cfg, std::string& outError,
                                  int indentSpaces)
{
  const std::string text = FootprintConfigToJson(cfg, indentSpaces);
  if (!WriteFileText(path, text)) {
    outError = "failed to write file";
    return false;
  }
  outError.clear();
  return true;
}

bool LoadFootprintConfigJsonFile(const std::string& path, FootprintConfig& ioCfg, std::string& outError)
{
  std::string text;
  if (!ReadFileText(path, text)) {
    outError = "failed to read file";
    return false;
  }

  JsonValue root;
  std::string err;
  if (!ParseJson(text, root, err)) {
    outError = err;
    return false;
  }

  if (!ApplyFootprintConfigJson(root, ioCfg, err)) {
    outError = err;
    return false;
  }

  outError.clear();
  return true;
}

} // namespace footprint

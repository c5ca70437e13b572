#include "footprint/CadEntity.hpp"
#include "footprint/ConfigIO.hpp"
#include "footprint/Json.hpp"
#include "footprint/Log.hpp"
#include "footprint/LogTee.hpp"
#include "footprint/Pipeline.hpp"
#include "footprint/ResultJson.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using namespace footprint;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                       \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp =
      static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static std::string ReadText(const fs::path& p)
{
  std::ifstream f(p, std::ios::binary);
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

static void TestJsonParse()
{
  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson(R"({"a": 1.5, "b": [true, null, "x"], "c": {"d": -2e3}})", v, err));
  ASSERT_TRUE(v.isObject());
  EXPECT_EQ(v.objectValue.size(), static_cast<std::size_t>(3));

  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a && a->isNumber());
  EXPECT_NEAR(a->numberValue, 1.5, 1e-12);

  const JsonValue* b = FindJsonMember(v, "b");
  ASSERT_TRUE(b && b->isArray() && b->arrayValue.size() == 3);
  EXPECT_TRUE(b->arrayValue[0].isBool() && b->arrayValue[0].boolValue);
  EXPECT_TRUE(b->arrayValue[1].isNull());
  EXPECT_EQ(b->arrayValue[2].stringValue, std::string("x"));

  const JsonValue* c = FindJsonMember(v, "c");
  ASSERT_TRUE(c && c->isObject());
  const JsonValue* d = FindJsonMember(*c, "d");
  ASSERT_TRUE(d != nullptr);
  EXPECT_NEAR(d->numberValue, -2000.0, 1e-12);
  EXPECT_TRUE(FindJsonMember(v, "missing") == nullptr);

  // Dimension labels in Japanese survive escaping.
  ASSERT_TRUE(ParseJson(R"("\u9ad8\u3055 H=6500 \ud83d\ude00")", v, err));
  EXPECT_EQ(v.stringValue, std::string("\xE9\xAB\x98\xE3\x81\x95 H=6500 \xF0\x9F\x98\x80"));

  EXPECT_FALSE(ParseJson("[1, 2,]", v, err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(ParseJson("{\"a\": 1} // note", v, err));
  EXPECT_FALSE(ParseJson("{\"a\" 1}", v, err));
  EXPECT_TRUE(err.find("expected ':'") != std::string::npos);
  EXPECT_FALSE(ParseJson("\"unterminated", v, err));

  std::string deep;
  for (int i = 0; i < kMaxJsonDepth + 10; ++i) deep += "[";
  for (int i = 0; i < kMaxJsonDepth + 10; ++i) deep += "]";
  EXPECT_FALSE(ParseJson(deep, v, err));
}

static void TestJsonWrite()
{
  JsonValue v;
  std::string err;
  ASSERT_TRUE(ParseJson(R"({"a":1,"b":[true,null],"s":"x\"y\n","f":0.1})", v, err));

  JsonWriteOptions compact;
  compact.pretty = false;
  EXPECT_EQ(JsonStringify(v, compact), std::string(R"({"a":1,"b":[true,null],"s":"x\"y\n","f":0.1})"));

  // Pretty output parses back to the same compact form.
  JsonValue again;
  ASSERT_TRUE(ParseJson(JsonStringify(v), again, err));
  EXPECT_EQ(JsonStringify(again, compact), JsonStringify(v, compact));

  {
    std::ostringstream oss;
    JsonWriter w(oss, compact);
    w.beginObject();
    EXPECT_FALSE(w.numberValue(3.0));
    EXPECT_FALSE(w.ok());
    EXPECT_TRUE(w.error().find("without a key") != std::string::npos);
  }
  {
    std::ostringstream oss;
    JsonWriter w(oss, compact);
    w.beginArray();
    EXPECT_FALSE(w.numberValue(std::nan("")));
    EXPECT_TRUE(w.error().find("non-finite") != std::string::npos);
  }
  {
    std::ostringstream oss;
    JsonWriter w(oss, compact);
    w.beginObject();
    EXPECT_FALSE(w.endArray());
    EXPECT_TRUE(w.error().find("unbalanced") != std::string::npos);
  }
  {
    std::ostringstream oss;
    JsonWriter w(oss, compact);
    EXPECT_TRUE(w.beginObject() && w.member("n", 2) && w.member("ok", true) && w.endObject());
    EXPECT_TRUE(w.finished());
    EXPECT_EQ(oss.str(), std::string(R"({"n":2,"ok":true})"));
    EXPECT_FALSE(w.beginObject());
  }
}

static void TestConfigRoundTrip()
{
  const FootprintConfig defaults;
  JsonValue root;
  std::string err;
  ASSERT_TRUE(ParseJson(FootprintConfigToJson(defaults), root, err));

  FootprintConfig cfg;
  cfg.cleaner.snapFactor = 0.5;
  cfg.raster.threshold = 99;
  cfg.detector.dedupeLoops = false;
  cfg.height.maxPlausibleMm = 7000.0;
  ASSERT_TRUE(ApplyFootprintConfigJson(root, cfg, err));
  EXPECT_NEAR(cfg.cleaner.snapFactor, defaults.cleaner.snapFactor, 1e-15);
  EXPECT_EQ(cfg.raster.threshold, defaults.raster.threshold);
  EXPECT_EQ(cfg.detector.dedupeLoops, defaults.detector.dedupeLoops);
  EXPECT_NEAR(cfg.height.maxPlausibleMm, defaults.height.maxPlausibleMm, 1e-9);
  EXPECT_NEAR(cfg.raster.simplifyFactor2, defaults.raster.simplifyFactor2, 1e-15);

  const fs::path path = MakeTempPath("footprint_cfg") += ".json";
  FootprintConfig tuned;
  tuned.raster.dilateRadius = 6;
  tuned.cleaner.collinearAngleDeg = 2.5;
  ASSERT_TRUE(WriteFootprintConfigJsonFile(path.string(), tuned, err));

  FootprintConfig loaded;
  ASSERT_TRUE(LoadFootprintConfigJsonFile(path.string(), loaded, err));
  EXPECT_EQ(loaded.raster.dilateRadius, 6);
  EXPECT_NEAR(loaded.cleaner.collinearAngleDeg, 2.5, 1e-12);

  std::error_code ec;
  fs::remove(path, ec);

  EXPECT_FALSE(LoadFootprintConfigJsonFile(path.string(), loaded, err));
}

static void TestConfigOverrides()
{
  FootprintConfig cfg;
  JsonValue root;
  std::string err;

  ASSERT_TRUE(ParseJson(R"({"raster": {"threshold": 128}, "height": {}})", root, err));
  ASSERT_TRUE(ApplyFootprintConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.raster.threshold, 128);
  EXPECT_EQ(cfg.raster.dilateRadius, 4);
  EXPECT_NEAR(cfg.cleaner.snapFloorMm, 5.0, 1e-12);

  ASSERT_TRUE(ParseJson(R"({"raster": {"threshold": "dark"}})", root, err));
  EXPECT_FALSE(ApplyFootprintConfigJson(root, cfg, err));
  EXPECT_EQ(err, std::string("raster: expected number for key 'threshold'"));
  EXPECT_EQ(cfg.raster.threshold, 128);

  ASSERT_TRUE(ParseJson(R"({"detector": {"dedupe_loops": 1}})", root, err));
  EXPECT_FALSE(ApplyFootprintConfigJson(root, cfg, err));
  EXPECT_EQ(err, std::string("detector: expected boolean for key 'dedupe_loops'"));

  ASSERT_TRUE(ParseJson(R"({"height": 5})", root, err));
  EXPECT_FALSE(ApplyFootprintConfigJson(root, cfg, err));
  EXPECT_EQ(err, std::string("expected object for key 'height'"));

  ASSERT_TRUE(ParseJson("[]", root, err));
  EXPECT_FALSE(ApplyFootprintConfigJson(root, cfg, err));

  // Validation runs on the merged copy; a rejected apply changes nothing.
  ASSERT_TRUE(ParseJson(R"({"cleaner": {"snap_factor": 0.01}, "raster": {"threshold": 0}})", root, err));
  EXPECT_FALSE(ApplyFootprintConfigJson(root, cfg, err));
  EXPECT_EQ(err, std::string("raster.threshold must be in [1,255]"));
  EXPECT_EQ(cfg.raster.threshold, 128);
  EXPECT_NEAR(cfg.cleaner.snapFactor, 0.001, 1e-15);

  FootprintConfig bad;
  bad.raster.minBuildingFraction = 0.95;
  EXPECT_FALSE(ValidateFootprintConfig(bad, err));
  bad = FootprintConfig{};
  bad.height.maxPlausibleMm = 1000.0;
  EXPECT_FALSE(ValidateFootprintConfig(bad, err));
  EXPECT_TRUE(ValidateFootprintConfig(FootprintConfig{}, err));
}

static VectorDrawing RectDrawing()
{
  CadPolyline pl;
  pl.points = {Vec2{0, 0}, Vec2{8000, 0}, Vec2{8000, 5000}, Vec2{0, 5000}};
  pl.closed = true;
  pl.layer = "WALL";

  VectorDrawing d;
  d.unit = DrawingUnit::Millimeter;
  d.entities.push_back(pl);
  return d;
}

static void TestResultJson()
{
  const VectorResult ok = ProcessVectorDrawing(RectDrawing());
  ASSERT_TRUE(ok.success);

  std::ostringstream oss;
  std::string err;
  ASSERT_TRUE(WriteVectorResultJson(oss, ok, ResultJsonOptions{}, err));

  JsonValue root;
  ASSERT_TRUE(ParseJson(oss.str(), root, err));
  const JsonValue* success = FindJsonMember(root, "success");
  ASSERT_TRUE(success && success->isBool());
  EXPECT_TRUE(success->boolValue);

  const JsonValue* ex = FindJsonMember(root, "extraction");
  ASSERT_TRUE(ex && ex->isObject());
  const JsonValue* walls = FindJsonMember(*ex, "wallSegments");
  ASSERT_TRUE(walls && walls->isArray());
  EXPECT_EQ(walls->arrayValue.size(), static_cast<std::size_t>(4));
  const JsonValue* perim = FindJsonMember(*ex, "perimeterTotal");
  ASSERT_TRUE(perim != nullptr);
  EXPECT_NEAR(perim->numberValue, 26000.0, 1e-6);
  const JsonValue* height = FindJsonMember(*ex, "buildingHeight");
  ASSERT_TRUE(height != nullptr);
  EXPECT_TRUE(height->isNull());
  const JsonValue* unit = FindJsonMember(*ex, "unit");
  ASSERT_TRUE(unit != nullptr);
  EXPECT_EQ(unit->stringValue, std::string("mm"));
  EXPECT_TRUE(FindJsonMember(*ex, "allGeometry") != nullptr);

  const JsonValue* first = FindJsonMember(walls->arrayValue[0], "side");
  ASSERT_TRUE(first != nullptr);
  EXPECT_TRUE(first->isString());

  ResultJsonOptions slim;
  slim.pretty = false;
  slim.includeGeometry = false;
  std::ostringstream slimOss;
  ASSERT_TRUE(WriteVectorResultJson(slimOss, ok, slim, err));
  ASSERT_TRUE(ParseJson(slimOss.str(), root, err));
  ex = FindJsonMember(root, "extraction");
  ASSERT_TRUE(ex != nullptr);
  EXPECT_TRUE(FindJsonMember(*ex, "allGeometry") == nullptr);

  const VectorResult failed = ProcessVectorDrawing(VectorDrawing{});
  std::ostringstream failOss;
  ASSERT_TRUE(WriteVectorResultJson(failOss, failed, ResultJsonOptions{}, err));
  ASSERT_TRUE(ParseJson(failOss.str(), root, err));
  const JsonValue* code = FindJsonMember(root, "error");
  ASSERT_TRUE(code != nullptr);
  EXPECT_EQ(code->stringValue, std::string("no_geometry"));
  EXPECT_TRUE(FindJsonMember(root, "extraction") == nullptr);

  RasterResult raster;
  raster.error = PipelineError::DecodeFailed;
  raster.message = "empty image";
  std::ostringstream rasterOss;
  ASSERT_TRUE(WriteRasterResultJson(rasterOss, raster, ResultJsonOptions{}, err));
  ASSERT_TRUE(ParseJson(rasterOss.str(), root, err));
  const JsonValue* outline = FindJsonMember(root, "outline");
  ASSERT_TRUE(outline && outline->isArray());
  EXPECT_TRUE(outline->arrayValue.empty());
  code = FindJsonMember(root, "error");
  ASSERT_TRUE(code != nullptr);
  EXPECT_EQ(code->stringValue, std::string("decode_failed"));
}

static void TestLogLevels()
{
  EXPECT_TRUE(ParseLogLevel("WARNING", LogLevel::Error) == LogLevel::Warn);
  EXPECT_TRUE(ParseLogLevel("off", LogLevel::Error) == LogLevel::None);
  EXPECT_TRUE(ParseLogLevel("loud", LogLevel::Info) == LogLevel::Info);
  EXPECT_EQ(std::string(LogLevelName(LogLevel::Debug)), std::string("DEBUG"));

  SetLogLevel(LogLevel::Warn);
  EXPECT_TRUE(LogEnabled(LogLevel::Error));
  EXPECT_FALSE(LogEnabled(LogLevel::Info));
  EXPECT_FALSE(LogEnabled(LogLevel::None));
}

static void TestLogTee()
{
  const fs::path path = MakeTempPath("footprint_log") += ".log";
  {
    std::ofstream old(path, std::ios::binary);
    old << "previous run\n";
  }

  LogTeeOptions opt;
  opt.path = path;
  opt.keepFiles = 2;
  opt.teeStdout = false;

  LogTee tee;
  std::string err;
  ASSERT_TRUE(tee.start(opt, err));
  EXPECT_TRUE(tee.active());

  SetLogLevel(LogLevel::Warn);
  Logf(LogLevel::Warn, "walls", "height %d not found", 7);
  Logf(LogLevel::Info, "walls", "suppressed");
  tee.stop();
  EXPECT_FALSE(tee.active());
  SetLogLevel(LogLevel::Error);

  const std::string text = ReadText(path);
  EXPECT_TRUE(text.find("[ERR] [footprint:WARN] walls: height 7 not found") != std::string::npos);
  EXPECT_TRUE(text.find("suppressed") == std::string::npos);

  fs::path rotated = path;
  rotated += ".1";
  EXPECT_EQ(ReadText(rotated), std::string("previous run\n"));

  LogTeeOptions empty;
  EXPECT_FALSE(tee.start(empty, err));

  std::error_code ec;
  fs::remove(path, ec);
  fs::remove(rotated, ec);
}

int main()
{
  SetLogLevel(LogLevel::Error);

  TestJsonParse();
  TestJsonWrite();
  TestConfigRoundTrip();
  TestConfigOverrides();
  TestResultJson();
  TestLogLevels();
  TestLogTee();

  if (g_failures == 0) {
    std::cout << "footprint_support_tests: OK\n";
    return 0;
  }

  std::cerr << "footprint_support_tests: FAILED (" << g_failures << ")\n";
  return 1;
}

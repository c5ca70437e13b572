#include "cli/CliCommon.hpp"
#include "cli/CliParse.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                    \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";   \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                    \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = fs::current_path(ec);
    if (ec || root.empty()) {
      root = fs::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());

  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

// argv-style storage that outlives the char* view.
struct Args {
  std::vector<std::string> storage;
  std::vector<char*> ptrs;

  explicit Args(std::vector<std::string> a) : storage(std::move(a))
  {
    for (std::string& s : storage) ptrs.push_back(s.data());
    ptrs.push_back(nullptr);
  }

  int argc() const { return static_cast<int>(storage.size()); }
  char** argv() { return ptrs.data(); }
};

static void TestParseI32()
{
  using namespace footprint::cli;

  int v = 0;
  EXPECT_TRUE(ParseI32("0", &v));
  EXPECT_EQ(v, 0);
  EXPECT_TRUE(ParseI32("-1", &v));
  EXPECT_EQ(v, -1);
  EXPECT_TRUE(ParseI32("+7", &v));
  EXPECT_EQ(v, 7);

  EXPECT_FALSE(ParseI32("1.0", &v));
  EXPECT_FALSE(ParseI32("1 ", &v));
  EXPECT_FALSE(ParseI32(" 1", &v));
  EXPECT_FALSE(ParseI32("4x", &v));
  EXPECT_FALSE(ParseI32("", &v));
  EXPECT_FALSE(ParseI32("+", &v));
  EXPECT_FALSE(ParseI32("2147483648", &v));
  EXPECT_FALSE(ParseI32("1", nullptr));
}

static void TestParseF64()
{
  using namespace footprint::cli;

  double d = 0.0;
  EXPECT_TRUE(ParseF64("3.5", &d));
  EXPECT_EQ(d, 3.5);
  EXPECT_TRUE(ParseF64("-1e-3", &d));
  EXPECT_EQ(d, -1e-3);
  EXPECT_TRUE(ParseF64("12000", &d));
  EXPECT_EQ(d, 12000.0);

  EXPECT_FALSE(ParseF64("nan", &d));
  EXPECT_FALSE(ParseF64("inf", &d));
  EXPECT_FALSE(ParseF64("1e309", &d));
  EXPECT_FALSE(ParseF64("1 ", &d));
  EXPECT_FALSE(ParseF64("12mm", &d));
  EXPECT_FALSE(ParseF64("", &d));
}

static void TestParseExtent()
{
  using namespace footprint::cli;

  double w = 0.0;
  double h = 0.0;
  EXPECT_TRUE(ParseExtent("12000x8000", &w, &h));
  EXPECT_EQ(w, 12000.0);
  EXPECT_EQ(h, 8000.0);

  EXPECT_TRUE(ParseExtent("1.5X2", &w, &h));
  EXPECT_EQ(w, 1.5);
  EXPECT_EQ(h, 2.0);

  EXPECT_FALSE(ParseExtent("12000", &w, &h));
  EXPECT_FALSE(ParseExtent("12000x", &w, &h));
  EXPECT_FALSE(ParseExtent("x8000", &w, &h));
  EXPECT_FALSE(ParseExtent("0x8000", &w, &h));
  EXPECT_FALSE(ParseExtent("-5x3", &w, &h));
  EXPECT_EQ(w, 1.5);
}

static void TestOutputPaths()
{
  using namespace footprint::cli;

  EXPECT_EQ(OutputPathFor("out", "plans/house.json", ".json"), fs::path("out") / "house.json");
  EXPECT_EQ(OutputPathFor("out", "scan.png", "_overlay.png"), fs::path("out") / "scan_overlay.png");

  std::error_code ec;
  const fs::path base = MakeTempPath("footprint_cli_parse_dirs");

  EXPECT_FALSE(EnsureParentDir(fs::path{}));
  EXPECT_TRUE(EnsureParentDir("relative_file_without_dir.json"));

  const fs::path file = base / "c" / "d" / "out.json";
  EXPECT_TRUE(EnsureParentDir(file));
  EXPECT_TRUE(fs::exists(base / "c" / "d"));

  fs::remove_all(base, ec);
}

static void TestCommonOptions()
{
  using namespace footprint::cli;

  Args args({"tool", "--jobs", "4", "--compact", "--json", "r.json", "plan.json", "--log-level"});
  CommonOptions opt;

  int i = 1;
  EXPECT_EQ(ParseCommonOption(args.argc(), args.argv(), i, opt), 1);
  EXPECT_EQ(i, 2);
  EXPECT_EQ(opt.jobs, 4);

  i = 3;
  EXPECT_EQ(ParseCommonOption(args.argc(), args.argv(), i, opt), 1);
  EXPECT_TRUE(opt.compact);

  i = 4;
  EXPECT_EQ(ParseCommonOption(args.argc(), args.argv(), i, opt), 1);
  EXPECT_EQ(opt.jsonPath, std::string("r.json"));

  // Positional arguments are left to the caller.
  i = 6;
  EXPECT_EQ(ParseCommonOption(args.argc(), args.argv(), i, opt), 0);
  EXPECT_EQ(i, 6);

  // Missing value.
  i = 7;
  EXPECT_EQ(ParseCommonOption(args.argc(), args.argv(), i, opt), -1);

  Args bad({"tool", "--jobs", "-2"});
  i = 1;
  EXPECT_EQ(ParseCommonOption(bad.argc(), bad.argv(), i, opt), -1);
}

int main()
{
  TestParseI32();
  TestParseF64();
  TestParseExtent();
  TestOutputPaths();
  TestCommonOptions();

  if (g_failures == 0) {
    std::cout << "footprint_cli_parse_tests: OK\n";
    return 0;
  }

  std::cerr << "footprint_cli_parse_tests: FAILED (" << g_failures << ")\n";
  return 1;
}

#pragma once

// Options every footprint tool understands: config file, log level, log tee, jobs.

#include "cli/CliParse.hpp"

#include "footprint/ConfigIO.hpp"
#include "footprint/Log.hpp"
#include "footprint/LogTee.hpp"

#include <iostream>
#include <string>

namespace footprint::cli {

struct CommonOptions {
  std::string configPath;
  std::string writeConfigPath;
  std::string logPath;
  std::string logLevel;
  std::string outDir;
  std::string jsonPath;
  int jobs = 1;
  bool compact = false;
  bool noGeometry = false;
  bool quiet = false;
};

inline void PrintCommonHelp(std::ostream& os)
{
  os << "  --config <cfg.json>      Apply config overrides (merge semantics).\n"
     << "  --write-config <out>     Write the effective config as JSON and continue.\n"
     << "  --json <out.json>        Write the JSON report (single input only).\n"
     << "  --out-dir <dir>          Write <stem>.json reports for every input.\n"
     << "  --jobs <N>               Worker threads (0 = hardware concurrency). Default: 1\n"
     << "  --compact                Compact JSON instead of pretty-printed.\n"
     << "  --no-geometry            Omit allGeometry from JSON reports.\n"
     << "  --log <file>             Copy console output into <file> (rotated).\n"
     << "  --log-level <lvl>        trace|debug|info|warn|error|none (or FOOTPRINT_LOG_LEVEL).\n"
     << "  --quiet                  Suppress the stdout summary.\n"
     << "  -h, --help               Show this help.\n";
}

// Returns 1 if argv[i] was a common option (consuming its value), 0 if not, -1 on error.
inline int ParseCommonOption(int argc, char** argv, int& i, CommonOptions& opt)
{
  const std::string arg = argv[i] ? std::string(argv[i]) : std::string();

  auto need = [&](const char* name) -> const char* {
    if (i + 1 >= argc) {
      std::cerr << name << " requires a value\n";
      return nullptr;
    }
    return argv[++i];
  };

  if (arg == "--compact") {
    opt.compact = true;
    return 1;
  }
  if (arg == "--no-geometry") {
    opt.noGeometry = true;
    return 1;
  }
  if (arg == "--quiet") {
    opt.quiet = true;
    return 1;
  }

  std::string* target = nullptr;
  if (arg == "--config") target = &opt.configPath;
  else if (arg == "--write-config") target = &opt.writeConfigPath;
  else if (arg == "--log") target = &opt.logPath;
  else if (arg == "--log-level") target = &opt.logLevel;
  else if (arg == "--out-dir") target = &opt.outDir;
  else if (arg == "--json") target = &opt.jsonPath;

  if (target) {
    const char* v = need(arg.c_str());
    if (!v) return -1;
    *target = v;
    return 1;
  }

  if (arg == "--jobs") {
    const char* v = need("--jobs");
    if (!v) return -1;
    if (!ParseI32(v, &opt.jobs) || opt.jobs < 0) {
      std::cerr << "invalid --jobs: " << v << "\n";
      return -1;
    }
    return 1;
  }

  return 0;
}

// Logging, log tee and config. Returns false (after printing why) on any failure.
inline bool SetupSession(const CommonOptions& opt, LogTee& tee, FootprintConfig& cfg)
{
  ApplyLogLevelFromEnv();
  if (!opt.logLevel.empty()) {
    const LogLevel fallback = static_cast<LogLevel>(0xFF);
    const LogLevel lvl = ParseLogLevel(opt.logLevel, fallback);
    if (lvl == fallback) {
      std::cerr << "invalid --log-level: " << opt.logLevel << "\n";
      return false;
    }
    SetLogLevel(lvl);
  }

  std::string err;
  if (!opt.logPath.empty()) {
    LogTeeOptions lo;
    lo.path = opt.logPath;
    if (!tee.start(lo, err)) {
      std::cerr << "failed to start log: " << err << "\n";
      return false;
    }
  }

  if (!opt.configPath.empty() && !LoadFootprintConfigJsonFile(opt.configPath, cfg, err)) {
    std::cerr << "failed to load config " << opt.configPath << ": " << err << "\n";
    return false;
  }

  if (!opt.writeConfigPath.empty()) {
    if (!EnsureParentDir(opt.writeConfigPath) || !WriteFootprintConfigJsonFile(opt.writeConfigPath, cfg, err)) {
      std::cerr << "failed to write config " << opt.writeConfigPath << ": " << err << "\n";
      return false;
    }
  }
  return true;
}

} // namespace footprint::cli

#include "cli/CliCommon.hpp"

#include "footprint/Batch.hpp"
#include "footprint/Pipeline.hpp"
#include "footprint/ResultJson.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

using namespace footprint;

void PrintHelp()
{
  std::cout << "footprint_vector (building outline from vector drawings)\n\n"
            << "Usage:\n"
            << "  footprint_vector <drawing.json> [more.json...] [options]\n\n"
            << "Reconstructs the outer wall loop of each drawing and reports walls in mm.\n\n"
            << "Options:\n";
  cli::PrintCommonHelp(std::cout);
}

void PrintSummary(const std::string& path, const VectorResult& r)
{
  if (!r.success) {
    std::cout << path << ": FAILED (" << PipelineErrorName(r.error) << ") " << r.message << "\n";
    return;
  }

  const ExtractionResult& e = r.extraction;
  std::cout << path << ": " << e.wallSegments.size() << " walls, perimeter " << e.perimeterTotal << " mm, height ";
  if (e.buildingHeight) {
    std::cout << *e.buildingHeight << " mm\n";
  } else {
    std::cout << "unknown\n";
  }
  std::cout << "  segments " << r.info.rawSegments << " -> " << r.info.cleanedSegments << ", nodes "
            << r.info.graphNodes << ", loops " << r.info.loopsFound << (r.info.usedHullFallback ? " (hull)" : "")
            << "\n";
  for (const WallSegment& w : e.wallSegments) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "  #%d %-8s %8.0f mm  %6.2f deg\n", w.id, WallSideName(w.side), w.length,
                  w.angleDeg);
    std::cout << buf;
  }
  std::cout << "  " << e.heightNote << "\n";
}

} // namespace

int main(int argc, char** argv)
{
  cli::CommonOptions opt;
  std::vector<std::string> inputs;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
    if (arg == "-h" || arg == "--help") {
      PrintHelp();
      return 0;
    }

    const int common = cli::ParseCommonOption(argc, argv, i, opt);
    if (common < 0) return 2;
    if (common > 0) continue;

    if (!arg.empty() && arg[0] == '-') {
      std::cerr << "unknown option: " << arg << "\n";
      return 2;
    }
    inputs.push_back(arg);
  }

  if (inputs.empty()) {
    PrintHelp();
    return 2;
  }
  if (!opt.jsonPath.empty() && inputs.size() > 1) {
    std::cerr << "--json takes a single input; use --out-dir for several\n";
    return 2;
  }

  LogTee tee;
  FootprintConfig cfg;
  if (!cli::SetupSession(opt, tee, cfg)) return 2;

  const std::vector<VectorResult> results = ProcessVectorFiles(inputs, cfg, opt.jobs);

  ResultJsonOptions jo;
  jo.pretty = !opt.compact;
  jo.includeGeometry = !opt.noGeometry;

  int failures = 0;
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    const VectorResult& r = results[i];
    if (!r.success) ++failures;
    if (!opt.quiet) PrintSummary(inputs[i], r);

    std::string outPath = opt.jsonPath;
    if (!opt.outDir.empty()) outPath = cli::OutputPathFor(opt.outDir, inputs[i], ".json").string();
    if (outPath.empty()) continue;

    std::string err;
    if (!cli::EnsureParentDir(outPath) || !WriteVectorResultJsonFile(outPath, r, jo, err)) {
      std::cerr << "failed to write JSON " << outPath << ": " << err << "\n";
      return 1;
    }
  }

  return failures == 0 ? 0 : 1;
}

#include "cli/CliCommon.hpp"

#include "footprint/Batch.hpp"
#include "footprint/Image.hpp"
#include "footprint/Pipeline.hpp"
#include "footprint/RasterOutline.hpp"
#include "footprint/ResultJson.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace footprint;

void PrintHelp()
{
  std::cout << "footprint_raster (building outline from scanned or rendered drawings)\n\n"
            << "Usage:\n"
            << "  footprint_raster <image.png|image.ppm> [more...] [options]\n\n"
            << "Options:\n"
            << "  --extent <WxH>           Real-world size of the whole image in mm; enables wall output.\n"
            << "  --width-mm <W>           Same as --extent, one axis at a time.\n"
            << "  --height-mm <H>\n"
            << "  --overlay <out.png>      Draw the outline over the working image (single input).\n"
            << "  --overlays               With --out-dir: write <stem>_overlay.png for every input.\n";
  cli::PrintCommonHelp(std::cout);
}

void PrintSummary(const std::string& path, const RasterResult& r)
{
  const OutlineStats& s = r.stats;
  if (!r.success) {
    std::cout << path << ": no outline (" << PipelineErrorName(r.error) << ") " << r.message << "\n";
    return;
  }

  std::cout << path << ": " << r.outline.size() << " vertices" << (s.usedBoundingBox ? " (bounding box)" : "")
            << ", work " << s.workWidth << "x" << s.workHeight << ", building " << (s.buildingFraction * 100.0)
            << "%\n";
  for (const OutlinePoint& p : r.outline) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "  (%.4f, %.4f)\n", p.xFrac, p.yFrac);
    std::cout << buf;
  }
  if (r.extraction) {
    std::cout << "  perimeter " << r.extraction->perimeterTotal << " mm, " << r.extraction->wallSegments.size()
              << " walls\n";
  }
}

bool WriteOverlay(const std::string& imagePath, const RasterResult& r, const FootprintConfig& cfg,
                  const std::string& outPath, std::string& outError)
{
  RgbImage img;
  if (!ReadImageAuto(imagePath, img, outError)) return false;
  const GrayImage work = MakeWorkingImage(img, cfg.raster);
  const RgbImage overlay = RenderOutlineOverlay(work, r.outline);
  if (!cli::EnsureParentDir(outPath)) {
    outError = "failed to create output directory";
    return false;
  }
  return WriteImageAuto(outPath, overlay, outError);
}

} // namespace

int main(int argc, char** argv)
{
  cli::CommonOptions opt;
  std::vector<std::string> inputs;
  std::string overlayPath;
  bool overlays = false;
  double widthMm = 0.0;
  double heightMm = 0.0;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
    auto need = [&](const char* name) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << name << " requires a value\n";
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help") {
      PrintHelp();
      return 0;
    }
    if (arg == "--extent") {
      const char* v = need("--extent");
      if (!v) return 2;
      if (!cli::ParseExtent(v, &widthMm, &heightMm)) {
        std::cerr << "invalid --extent (expected WxH in mm): " << v << "\n";
        return 2;
      }
      continue;
    }
    if (arg == "--width-mm" || arg == "--height-mm") {
      const char* v = need(arg.c_str());
      if (!v) return 2;
      double mm = 0.0;
      if (!cli::ParseF64(v, &mm) || !(mm > 0.0)) {
        std::cerr << "invalid " << arg << ": " << v << "\n";
        return 2;
      }
      (arg == "--width-mm" ? widthMm : heightMm) = mm;
      continue;
    }
    if (arg == "--overlay") {
      const char* v = need("--overlay");
      if (!v) return 2;
      overlayPath = v;
      continue;
    }
    if (arg == "--overlays") {
      overlays = true;
      continue;
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
  if (inputs.size() > 1 && (!opt.jsonPath.empty() || !overlayPath.empty())) {
    std::cerr << "--json/--overlay take a single input; use --out-dir (and --overlays) for several\n";
    return 2;
  }
  if (overlays && opt.outDir.empty()) {
    std::cerr << "--overlays requires --out-dir\n";
    return 2;
  }
  if ((widthMm > 0.0) != (heightMm > 0.0)) {
    std::cerr << "both --width-mm and --height-mm are required\n";
    return 2;
  }

  std::optional<RasterExtent> extent;
  if (widthMm > 0.0) extent = RasterExtent{widthMm, heightMm};

  LogTee tee;
  FootprintConfig cfg;
  if (!cli::SetupSession(opt, tee, cfg)) return 2;

  const std::vector<RasterResult> results = ProcessRasterFiles(inputs, cfg, opt.jobs, extent);

  ResultJsonOptions jo;
  jo.pretty = !opt.compact;
  jo.includeGeometry = !opt.noGeometry;

  int failures = 0;
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    const RasterResult& r = results[i];
    if (!r.success) ++failures;
    if (!opt.quiet) PrintSummary(inputs[i], r);

    std::string err;
    std::string outPath = opt.jsonPath;
    if (!opt.outDir.empty()) outPath = cli::OutputPathFor(opt.outDir, inputs[i], ".json").string();
    if (!outPath.empty()) {
      if (!cli::EnsureParentDir(outPath) || !WriteRasterResultJsonFile(outPath, r, jo, err)) {
        std::cerr << "failed to write JSON " << outPath << ": " << err << "\n";
        return 1;
      }
    }

    std::string ovPath = overlayPath;
    if (overlays) ovPath = cli::OutputPathFor(opt.outDir, inputs[i], "_overlay.png").string();
    if (!ovPath.empty() && r.success) {
      if (!WriteOverlay(inputs[i], r, cfg, ovPath, err)) {
        std::cerr << "failed to write overlay " << ovPath << ": " << err << "\n";
        return 1;
      }
    }
  }

  return failures == 0 ? 0 : 1;
}

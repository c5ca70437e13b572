#pragma once

#include "footprint/Config.hpp"
#include "footprint/Pipeline.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace footprint {

// Multi-file processing across worker threads.
//
// Work items are claimed through an atomic index and results are stored at stable
// indices, so the output order never depends on scheduling.

// threads <= 0 selects std::thread::hardware_concurrency(). Never more than `total`,
// never less than 1.
int ResolveThreadCount(int threads, int total);

// Runs fn(i) for every i in [0, count). `fn` must only touch state owned by index i.
//
// If `progress` is provided it is called on the calling thread, in index order, once
// fn(i) has completed.
void RunBatch(int count, int threads, const std::function<void(int)>& fn,
              const std::function<void(int)>& progress = {});

std::vector<VectorResult> ProcessVectorFiles(const std::vector<std::string>& paths, const FootprintConfig& cfg,
                                             int threads);

std::vector<RasterResult> ProcessRasterFiles(const std::vector<std::string>& paths, const FootprintConfig& cfg,
                                             int threads, const std::optional<RasterExtent>& extent = std::nullopt);

} // namespace footprint

#include "footprint/Batch.hpp"

#include "footprint/Log.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace footprint {

int ResolveThreadCount(int threads, int total)
{
  if (threads <= 0) threads = static_cast<int>(std::thread::hardware_concurrency());
  if (threads <= 0) threads = 1;
  threads = std::min(threads, total);
  return std::max(threads, 1);
}

void RunBatch(int count, int threads, const std::function<void(int)>& fn, const std::function<void(int)>& progress)
{
  if (count <= 0 || !fn) return;

  threads = ResolveThreadCount(threads, count);
  Logf(LogLevel::Debug, "batch", "%d items on %d thread(s)", count, threads);

  if (threads <= 1) {
    for (int i = 0; i < count; ++i) {
      fn(i);
      if (progress) progress(i);
    }
    return;
  }

  std::atomic<int> nextIndex{0};

  std::mutex readyMutex;
  std::condition_variable readyCv;
  std::vector<std::uint8_t> ready;
  if (progress) ready.resize(static_cast<std::size_t>(count), 0u);

  auto worker = [&]() {
    for (;;) {
      const int i = nextIndex.fetch_add(1);
      if (i >= count) break;

      fn(i);

      if (progress) {
        {
          std::lock_guard<std::mutex> lock(readyMutex);
          ready[static_cast<std::size_t>(i)] = 1u;
        }
        readyCv.notify_all();
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(threads));
  for (int t = 0; t < threads; ++t) pool.emplace_back(worker);

  if (progress) {
    for (int i = 0; i < count; ++i) {
      {
        std::unique_lock<std::mutex> lock(readyMutex);
        readyCv.wait(lock, [&]() { return ready[static_cast<std::size_t>(i)] != 0u; });
      }
      progress(i);
    }
  }

  for (std::thread& th : pool) {
    if (th.joinable()) th.join();
  }
}

std::vector<VectorResult> ProcessVectorFiles(const std::vector<std::string>& paths, const FootprintConfig& cfg,
                                             int threads)
{
  std::vector<VectorResult> out(paths.size());
  RunBatch(static_cast<int>(paths.size()), threads, [&](int i) {
    out[static_cast<std::size_t>(i)] = ProcessVectorFile(paths[static_cast<std::size_t>(i)], cfg);
  });
  return out;
}

std::vector<RasterResult> ProcessRasterFiles(const std::vector<std::string>& paths, const FootprintConfig& cfg,
                                             int threads, const std::optional<RasterExtent>& extent)
{
  std::vector<RasterResult> out(paths.size());
  RunBatch(static_cast<int>(paths.size()), threads, [&](int i) {
    out[static_cast<std::size_t>(i)] = ProcessRasterDrawing(paths[static_cast<std::size_t>(i)], cfg, extent);
  });
  return out;
}

} // namespace footprint

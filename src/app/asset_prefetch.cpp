#include <packslip/app/asset_prefetch.hpp>
#include <glog/logging.h>
#include <algorithm>
#include <expected>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace packslip::app {

namespace {

using packslip::layout::AssetCache;
using packslip::layout::AssetRequest;
using FetchResult = std::expected<cv::Mat, packslip::core::Error>;

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

void store_result(AssetCache& cache, const AssetRequest& request, FetchResult& result) {
  if (result) {
    cache.store(request, std::move(*result));
    return;
  }
  LOG(WARNING) << "Image unavailable (" << request.ref.substr(0, 80)
               << "): " << result.error().message;
  cache.store_failure(request);
}

}  // namespace

AssetCache prefetch_assets(packslip::layout::IImageSource& source,
                           const std::vector<AssetRequest>& requests) {
  AssetCache cache;
  for (const auto& request : requests) {
    if (cache.contains(request)) continue;
    auto result = source.fetch(request.ref, request.max_px);
    store_result(cache, request, result);
  }
  return cache;
}

AssetCache prefetch_assets_parallel(packslip::layout::IImageSource& source,
                                    const std::vector<AssetRequest>& requests,
                                    std::size_t num_workers) {
  const std::size_t n = requests.size();
  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) return prefetch_assets(source, requests);

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }

  std::mutex queue_mutex;
  std::vector<std::optional<FetchResult>> results(n);

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      results[idx] = source.fetch(requests[idx].ref, requests[idx].max_px);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }

  AssetCache cache;
  for (std::size_t i = 0; i < n; ++i) {
    if (!results[i] || cache.contains(requests[i])) continue;
    store_result(cache, requests[i], *results[i]);
  }
  VLOG(1) << "Prefetched " << cache.size() << " image(s) with " << workers << " worker(s), "
          << cache.failures() << " failed";
  return cache;
}

}  // namespace packslip::app

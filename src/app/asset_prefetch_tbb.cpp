#include <packslip/app/asset_prefetch_tbb.hpp>

#ifdef PACKSLIP_HAS_TBB

#include <glog/logging.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

namespace packslip::app {

packslip::layout::AssetCache prefetch_assets_tbb(
    packslip::layout::IImageSource& source,
    const std::vector<packslip::layout::AssetRequest>& requests, std::size_t num_workers) {
  packslip::layout::AssetCache cache;
  if (requests.empty()) return cache;

  const std::size_t n = requests.size();
  std::vector<std::optional<std::expected<cv::Mat, packslip::core::Error>>> results(n);
  tbb::task_arena arena(num_workers > 0 ? static_cast<int>(num_workers)
                                        : tbb::task_arena::automatic);
  arena.execute([&source, &requests, &results, n] {
    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, n),
        [&source, &requests, &results](const tbb::blocked_range<std::size_t>& range) {
          for (std::size_t i = range.begin(); i != range.end(); ++i) {
            results[i] = source.fetch(requests[i].ref, requests[i].max_px);
          }
        });
  });

  for (std::size_t i = 0; i < n; ++i) {
    if (cache.contains(requests[i])) continue;
    auto& result = *results[i];
    if (result) {
      cache.store(requests[i], std::move(*result));
    } else {
      LOG(WARNING) << "Image unavailable (" << requests[i].ref.substr(0, 80)
                   << "): " << result.error().message;
      cache.store_failure(requests[i]);
    }
  }
  return cache;
}

}  // namespace packslip::app

#endif  // PACKSLIP_HAS_TBB

#pragma once

#include <packslip/layout/asset_cache.hpp>
#include <packslip/layout/image_source.hpp>
#include <cstddef>
#include <vector>

#ifdef PACKSLIP_HAS_TBB

namespace packslip::app {

/// Resolves requests in parallel using TBB.
///
/// Each request is fetched from a TBB task into its own result slot; the cache is filled
/// on the calling thread once every task has finished, in request order.
/// \p source must tolerate concurrent fetch() calls (HttpImageSource and
/// MockImageSource do). At most \p num_workers fetches run at once; 0 = TBB default.
[[nodiscard]] packslip::layout::AssetCache prefetch_assets_tbb(
    packslip::layout::IImageSource& source,
    const std::vector<packslip::layout::AssetRequest>& requests,
    std::size_t num_workers = 0);

}  // namespace packslip::app

#endif  // PACKSLIP_HAS_TBB

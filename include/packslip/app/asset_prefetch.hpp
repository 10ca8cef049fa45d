#pragma once

#include <packslip/layout/asset_cache.hpp>
#include <packslip/layout/image_source.hpp>
#include <cstddef>
#include <vector>

namespace packslip::app {

/// Resolves requests one after another. Failures become blank slots in the cache.
[[nodiscard]] packslip::layout::AssetCache prefetch_assets(
    packslip::layout::IImageSource& source,
    const std::vector<packslip::layout::AssetRequest>& requests);

/// Resolves requests with a bounded pool of worker threads. source.fetch() is called
/// from workers; results land in the cache keyed by request, so completion order does
/// not affect layout. num_workers 0 = use hardware concurrency.
[[nodiscard]] packslip::layout::AssetCache prefetch_assets_parallel(
    packslip::layout::IImageSource& source,
    const std::vector<packslip::layout::AssetRequest>& requests,
    std::size_t num_workers = 0);

}  // namespace packslip::app

#pragma once

#include <packslip/core/fallback.hpp>
#include <packslip/core/order.hpp>
#include <packslip/core/raw_record.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace packslip::core {

/// SKU suffix marking a personalized variant.
inline constexpr std::string_view kPersonalizationSuffix = "-PERS";

/// Largest quantity accepted on one line. Larger (or unparseable, or non-positive)
/// values are read as 1.
inline constexpr std::uint32_t kMaxLineQuantity = 100000;

/// Uppercased first five SKU characters if they form a classification prefix (DPT##).
[[nodiscard]] std::optional<std::string> extract_sku_prefix(std::string_view sku);

/// Size code from a prefix's two-digit suffix (10/16/26 only).
[[nodiscard]] std::optional<std::string> size_from_prefix(
    const std::optional<std::string>& prefix);

/// True for strings starting with http:// or https://.
[[nodiscard]] bool is_http_url(std::string_view text) noexcept;

/// SKU with a trailing personalization suffix removed.
[[nodiscard]] std::string base_sku(std::string_view sku);

[[nodiscard]] bool is_personalized_sku(std::string_view sku) noexcept;

/// Image fallback order used when the dual-purpose field is not a URL.
[[nodiscard]] const FallbackChain<RawRecord>& alternate_image_chain();

/// Converts one raw line record into an OrderItem.
[[nodiscard]] OrderItem normalize_item(const RawRecord& record);

/// Drops exploded kit components: non-kit rows whose base SKU equals a kit's base SKU.
/// Kit rows and unrelated rows keep their order. Applying twice equals applying once.
[[nodiscard]] std::vector<RawRecord> dedupe_kit_components(
    const std::vector<RawRecord>& group);

}  // namespace packslip::core

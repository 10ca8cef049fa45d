#pragma once

#include <packslip/core/box_size_catalog.hpp>
#include <packslip/core/order.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace packslip::core {

/// Units per classification prefix.
using PrefixCounts = std::map<std::string, std::size_t>;

/// Classified units of the items, counted per prefix (quantity-weighted).
[[nodiscard]] PrefixCounts prefix_counts(const std::vector<OrderItem>& items);

/// One catalog combination as per-prefix counts.
[[nodiscard]] PrefixCounts combination_counts(const std::vector<std::string>& combination);

/// Pack category for the items: nullopt if no classified units, "singles" for one unit,
/// otherwise the first catalog key with an exactly equal combination (nullopt if none).
[[nodiscard]] std::optional<std::string> classify_box_size(
    const std::vector<OrderItem>& items,
    const BoxSizeCatalog& catalog);

}  // namespace packslip::core

#pragma once

#include <packslip/core/order.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace packslip::core {

/// Quantity one order contributes to a picklist record.
struct OrderQuantity {
  std::string tranid;
  std::string order_number;
  std::uint64_t quantity{0};
};

/// Aggregate for one (pick location, SKU) pair across the selected orders.
struct PicklistRecord {
  std::optional<std::string> location;
  std::string sku;
  std::string base_sku;
  bool personalized{false};
  std::uint64_t total_quantity{0};
  std::vector<OrderQuantity> orders;  // first-seen order
};

/// True for absent locations and placeholders such as "N/A", "-" or "TBD".
[[nodiscard]] bool is_placeholder_location(const std::optional<std::string>& location);

/// One record per (location, SKU), in first-seen order. Quantities from the same order
/// for the same pair are folded into one breakdown entry.
[[nodiscard]] std::vector<PicklistRecord> aggregate_picklist(
    const std::vector<ProcessedOrder>& orders);

/// Records sharing a base SKU, split by family. Each side is sorted by location
/// (placeholders last) then SKU.
struct PicklistBlock {
  std::string base_sku;
  std::vector<PicklistRecord> personalized;
  std::vector<PicklistRecord> standard;

  /// Sub-rows the block occupies: the taller side, at least one.
  [[nodiscard]] std::size_t row_count() const noexcept;
  /// Location that orders the block: personalized side first, else standard.
  [[nodiscard]] std::optional<std::string> sort_location() const;
};

/// Union of base SKUs from both families ordered by (sort location, base SKU).
[[nodiscard]] std::vector<PicklistBlock> build_picklist_blocks(
    const std::vector<PicklistRecord>& records);

}  // namespace packslip::core

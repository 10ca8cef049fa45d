#pragma once

#include <packslip/core/box_size_catalog.hpp>
#include <packslip/core/fallback.hpp>
#include <packslip/core/order.hpp>
#include <packslip/core/raw_record.hpp>
#include <vector>

namespace packslip::core {

/// Display order number: shop order number, then the sales order id.
[[nodiscard]] const FallbackChain<RawRecord>& order_number_chain();

/// Order date: intended shop order date, then system creation date.
[[nodiscard]] const FallbackChain<RawRecord>& order_date_chain();

/// Notes: sales order memo, then the warehouse note.
[[nodiscard]] const FallbackChain<RawRecord>& memo_chain();

/// Options for aggregate_orders.
struct AggregateOptions {
  bool assign_zones{true};
};

/// Groups records by fulfillment id (first-seen order), dedupes kit components, normalizes
/// the remaining lines and classifies each group into one ProcessedOrder.
[[nodiscard]] std::vector<ProcessedOrder> aggregate_orders(
    const RawRecords& records,
    const BoxSizeCatalog& catalog,
    const AggregateOptions& options = {});

}  // namespace packslip::core

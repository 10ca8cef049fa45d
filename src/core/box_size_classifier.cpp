#include <packslip/core/box_size_classifier.hpp>
#include <glog/logging.h>
#include <numeric>

namespace packslip::core {

namespace {

std::size_t unit_count(const PrefixCounts& counts) {
  return std::accumulate(counts.begin(), counts.end(), std::size_t{0},
                         [](std::size_t sum, const auto& entry) { return sum + entry.second; });
}

}  // namespace

PrefixCounts prefix_counts(const std::vector<OrderItem>& items) {
  PrefixCounts counts;
  for (const auto& item : items) {
    if (!item.sku_prefix) continue;
    counts[*item.sku_prefix] += item.quantity;
  }
  return counts;
}

PrefixCounts combination_counts(const std::vector<std::string>& combination) {
  PrefixCounts counts;
  for (const auto& prefix : combination) ++counts[prefix];
  return counts;
}

std::optional<std::string> classify_box_size(const std::vector<OrderItem>& items,
                                             const BoxSizeCatalog& catalog) {
  const auto counts = prefix_counts(items);
  const std::size_t units = unit_count(counts);
  if (units == 0) return std::nullopt;
  if (units == 1) return std::string(kSinglesKey);

  for (const auto& entry : catalog.entries()) {
    for (const auto& combo : entry.combinations) {
      if (combo.size() == units && combination_counts(combo) == counts) return entry.key;
    }
  }
  VLOG(2) << "No catalog combination for " << units << " units";
  return std::nullopt;
}

}  // namespace packslip::core

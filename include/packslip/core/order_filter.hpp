#pragma once

#include <packslip/core/order.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace packslip::core {

/// Calendar day; ordering compares year, month, day.
struct CalendarDate {
  int year{0};
  int month{0};
  int day{0};

  auto operator<=>(const CalendarDate&) const = default;
};

/// Parses "MM/DD/YYYY" with an optional trailing "hh:mm am|pm" (time is ignored).
[[nodiscard]] std::optional<CalendarDate> parse_order_date(std::string_view text);

/// Selects orders that carry no box-size category.
struct Unclassified {
  bool operator==(const Unclassified&) const = default;
};

using BoxSizeFilter = std::variant<std::string, Unclassified>;

/// Unset members do not filter.
struct OrderFilter {
  std::optional<bool> personalized;
  std::set<std::string> cup_sizes;  // exact set match when non-empty
  std::optional<BoxSizeFilter> box_size;
  std::optional<CalendarDate> date_from;  // inclusive
  std::optional<CalendarDate> date_to;    // inclusive
  std::optional<bool> printed;
};

/// Keeps orders matching every set criterion; printed_ids is a store snapshot.
[[nodiscard]] std::vector<ProcessedOrder> filter_orders(
    const std::vector<ProcessedOrder>& orders,
    const OrderFilter& filter,
    const std::set<std::string>& printed_ids = {});

/// Stable sort: farthest zones first (lowest priority value), orders without a zone last.
void sort_by_zone_priority(std::vector<ProcessedOrder>& orders);

}  // namespace packslip::core

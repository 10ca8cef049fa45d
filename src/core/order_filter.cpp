#include <packslip/core/order_filter.hpp>
#include <algorithm>
#include <charconv>
#include <limits>

namespace packslip::core {

namespace {

bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

bool matches_box_size(const ProcessedOrder& order, const BoxSizeFilter& filter) {
  if (std::holds_alternative<Unclassified>(filter)) return !order.box_size.has_value();
  return order.box_size.has_value() && *order.box_size == std::get<std::string>(filter);
}

}  // namespace

std::optional<CalendarDate> parse_order_date(std::string_view text) {
  const auto start = text.find_first_not_of(" \t");
  if (start == std::string_view::npos) return std::nullopt;
  text.remove_prefix(start);
  const auto space = text.find(' ');
  const std::string_view date_part = text.substr(0, space);

  const auto s1 = date_part.find('/');
  if (s1 == std::string_view::npos) return std::nullopt;
  const auto s2 = date_part.find('/', s1 + 1);
  if (s2 == std::string_view::npos) return std::nullopt;

  CalendarDate d;
  if (!parse_int(date_part.substr(0, s1), d.month) ||
      !parse_int(date_part.substr(s1 + 1, s2 - s1 - 1), d.day) ||
      !parse_int(date_part.substr(s2 + 1), d.year)) {
    return std::nullopt;
  }
  if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > 31 || d.year <= 0) {
    return std::nullopt;
  }
  return d;
}

std::vector<ProcessedOrder> filter_orders(const std::vector<ProcessedOrder>& orders,
                                          const OrderFilter& filter,
                                          const std::set<std::string>& printed_ids) {
  std::vector<ProcessedOrder> out;
  for (const auto& order : orders) {
    if (filter.personalized && order.personalized != *filter.personalized) continue;
    if (!filter.cup_sizes.empty() && order.cup_sizes != filter.cup_sizes) continue;
    if (filter.box_size && !matches_box_size(order, *filter.box_size)) continue;

    if (filter.date_from || filter.date_to) {
      const auto date = parse_order_date(order.date_created);
      if (!date) continue;
      if (filter.date_from && *date < *filter.date_from) continue;
      if (filter.date_to && *date > *filter.date_to) continue;
    }

    if (filter.printed) {
      const bool is_printed = printed_ids.contains(order.tranid);
      if (is_printed != *filter.printed) continue;
    }
    out.push_back(order);
  }
  return out;
}

void sort_by_zone_priority(std::vector<ProcessedOrder>& orders) {
  auto rank = [](const ProcessedOrder& o) {
    return o.zone ? o.zone->priority : std::numeric_limits<int>::max();
  };
  std::stable_sort(orders.begin(), orders.end(),
                   [&](const ProcessedOrder& a, const ProcessedOrder& b) {
                     return rank(a) < rank(b);
                   });
}

}  // namespace packslip::core

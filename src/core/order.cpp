#include <packslip/core/order.hpp>

namespace packslip::core {

std::string zone_display_name(const ProcessedOrder& order) {
  if (!order.zone || order.zone->name.empty()) return "Unknown";
  return order.zone->name;
}

}  // namespace packslip::core

#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace packslip::core {

/// One normalized line of an order. Built once by normalize_item; read-only afterwards.
struct OrderItem {
  std::string sku;
  std::optional<std::string> sku_prefix;  // e.g. "DPT16"
  std::optional<std::string> size;        // "10oz" / "16oz" / "26oz"
  std::uint32_t quantity{1};              // never 0
  std::optional<std::string> color;
  std::optional<std::string> image_ref;   // http(s) URL or data: URI
  std::optional<std::string> barcode;
  std::string description;
  std::optional<std::string> pick_location;  // trimmed, never empty
};

/// Advisory shipping zone derived from the ship-to address.
struct ShippingZone {
  std::string id;    // local / regional / national / distant
  std::string name;  // "Regional (50-499 mi)"
  int priority{0};   // lower ships sooner
  std::optional<double> distance_miles;
};

/// Canonical order keyed by its fulfillment id.
struct ProcessedOrder {
  std::string tranid;        // fulfillment id, unique per refresh
  std::string order_number;  // display number
  std::string date_created;
  std::string ship_address;
  bool personalized{false};
  std::vector<OrderItem> items;  // source row order
  std::set<std::string> cup_sizes;
  std::optional<std::string> box_size;  // nullopt = unclassified

  std::optional<std::string> ship_method;
  std::optional<std::string> po_number;
  std::optional<std::string> memo;
  std::optional<std::string> tracking_id;
  std::optional<std::string> artwork_ref;

  std::optional<ShippingZone> zone;
};

/// Display name for an order's zone; "Unknown" when none was assigned.
[[nodiscard]] std::string zone_display_name(const ProcessedOrder& order);

}  // namespace packslip::core

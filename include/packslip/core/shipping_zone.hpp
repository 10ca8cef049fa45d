#pragma once

#include <packslip/core/order.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace packslip::core {

/// Distance band; bands are checked in order and the first with distance <= max wins.
struct ZoneBand {
  std::string_view id;
  std::string_view name;
  double max_distance_miles;
  int priority;
};

/// Bands ordered nearest to farthest; the last band is unbounded.
[[nodiscard]] const std::array<ZoneBand, 4>& zone_bands() noexcept;

struct GeoPoint {
  double lat{0.0};
  double lon{0.0};
};

/// Fixed shipping origin (Asheville, NC).
inline constexpr GeoPoint kOrigin{35.5951, -82.5515};

struct ParsedAddress {
  std::optional<std::string> zip;
  std::optional<std::string> state;
  std::optional<std::string> city;
};

/// Finds the city/state/zip line (bottom-up, skipping a "United States" line).
[[nodiscard]] ParsedAddress parse_ship_address(std::string_view address);

/// Great-circle distance in miles.
[[nodiscard]] double haversine_miles(GeoPoint a, GeoPoint b) noexcept;

/// Coarse location: state centroid, then zip-prefix ranges, then the origin.
[[nodiscard]] GeoPoint estimate_location(std::string_view zip,
                                         const std::optional<std::string>& state);

/// Distance from the origin; nullopt when the address carries no zip.
[[nodiscard]] std::optional<double> distance_from_origin(std::string_view address);

/// Distance-estimate zone policy. Unresolvable addresses land in "national".
[[nodiscard]] ShippingZone assign_shipping_zone(std::string_view address);

}  // namespace packslip::core

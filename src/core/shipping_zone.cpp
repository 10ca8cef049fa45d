#include <packslip/core/shipping_zone.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <numbers>
#include <regex>
#include <unordered_map>
#include <vector>

namespace packslip::core {

namespace {

constexpr double kEarthRadiusMiles = 3959.0;

const std::unordered_map<std::string, GeoPoint>& state_centroids() {
  static const std::unordered_map<std::string, GeoPoint> table = {
      {"NC", {35.5, -80.0}},  {"SC", {33.8, -80.9}},  {"GA", {32.6, -83.4}},
      {"TN", {35.7, -86.8}},  {"VA", {37.5, -78.2}},  {"FL", {27.8, -81.8}},
      {"AL", {32.8, -86.8}},  {"MS", {32.7, -89.7}},  {"KY", {37.7, -85.3}},
      {"WV", {38.3, -80.9}},  {"OH", {40.4, -82.8}},  {"PA", {40.6, -77.2}},
      {"NY", {42.2, -74.8}},  {"MA", {42.2, -71.5}},  {"CT", {41.6, -72.7}},
      {"NJ", {40.2, -74.5}},  {"MD", {39.0, -76.5}},  {"DE", {39.2, -75.5}},
      {"TX", {31.0, -99.9}},  {"CA", {36.1, -119.4}}, {"WA", {47.0, -120.7}},
      {"OR", {44.0, -120.5}}, {"AZ", {34.0, -111.5}}, {"NV", {39.3, -116.6}},
      {"UT", {39.3, -111.6}}, {"CO", {39.0, -105.5}}, {"NM", {34.5, -106.2}},
      {"OK", {35.5, -97.5}},  {"AR", {34.7, -92.3}},  {"LA", {30.4, -91.2}},
      {"MO", {38.5, -92.2}},  {"IA", {41.9, -93.6}},  {"MN", {46.7, -94.7}},
      {"WI", {44.3, -89.6}},  {"IL", {40.3, -89.1}},  {"IN", {39.8, -86.1}},
      {"MI", {43.3, -84.5}},  {"ME", {44.3, -69.8}},  {"NH", {43.4, -71.6}},
      {"VT", {44.2, -72.6}},  {"RI", {41.8, -71.4}},  {"HI", {21.3, -157.8}},
      {"AK", {61.2, -149.9}},
  };
  return table;
}

struct ZipRange {
  int first;
  int last;
  GeoPoint point;
};

constexpr std::array<ZipRange, 5> kZipRanges = {{
    {280, 289, {35.5, -80.0}},  // NC
    {290, 299, {33.8, -80.9}},  // SC
    {300, 319, {33.7, -84.4}},  // GA
    {370, 385, {35.7, -86.8}},  // TN
    {220, 246, {37.5, -78.2}},  // VA
}};

double to_radians(double degrees) noexcept { return degrees * std::numbers::pi / 180.0; }

std::string lower_copy(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string trim_copy(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(start, end - start + 1));
}

}  // namespace

const std::array<ZoneBand, 4>& zone_bands() noexcept {
  static const std::array<ZoneBand, 4> bands = {{
      {"local", "Local (0-50 mi)", 50.0, 4},
      {"regional", "Regional (50-499 mi)", 499.0, 3},
      {"national", "National (500-1000 mi)", 1000.0, 2},
      {"distant", "Distant (1000+ mi)", std::numeric_limits<double>::infinity(), 1},
  }};
  return bands;
}

ParsedAddress parse_ship_address(std::string_view address) {
  std::vector<std::string> lines;
  std::size_t pos = 0;
  while (pos <= address.size()) {
    const auto nl = address.find('\n', pos);
    const auto end = nl == std::string_view::npos ? address.size() : nl;
    std::string line = trim_copy(address.substr(pos, end - pos));
    if (!line.empty()) lines.push_back(std::move(line));
    if (nl == std::string_view::npos) break;
    pos = nl + 1;
  }

  static const std::regex zip_re(R"(\b(\d{5})(?:[-\s]?\d{4})?\b)");
  static const std::regex state_re(R"(\b([A-Z]{2})\s+\d{5})");
  static const std::regex city_re(R"(^(.+?)\s+[A-Z]{2}\s+\d{5})");

  ParsedAddress out;
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    const std::string& line = *it;
    if (lower_copy(line).find("united states") != std::string::npos) continue;

    std::smatch m;
    if (!std::regex_search(line, m, zip_re)) continue;
    out.zip = m[1].str();
    if (std::regex_search(line, m, state_re)) out.state = m[1].str();
    if (std::regex_search(line, m, city_re)) {
      std::string city = trim_copy(m[1].str());
      // Drop a trailing comma of "City, ST 12345".
      if (!city.empty() && city.back() == ',') city.pop_back();
      out.city = std::move(city);
    }
    break;
  }
  return out;
}

double haversine_miles(GeoPoint a, GeoPoint b) noexcept {
  const double d_lat = to_radians(b.lat - a.lat);
  const double d_lon = to_radians(b.lon - a.lon);
  const double h = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
                   std::cos(to_radians(a.lat)) * std::cos(to_radians(b.lat)) *
                       std::sin(d_lon / 2) * std::sin(d_lon / 2);
  const double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
  return kEarthRadiusMiles * c;
}

GeoPoint estimate_location(std::string_view zip, const std::optional<std::string>& state) {
  if (state) {
    std::string key = *state;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    const auto& centroids = state_centroids();
    if (auto it = centroids.find(key); it != centroids.end()) return it->second;
  }
  if (zip.size() >= 3) {
    int prefix = 0;
    for (char c : zip.substr(0, 3)) {
      if (!std::isdigit(static_cast<unsigned char>(c))) return kOrigin;
      prefix = prefix * 10 + (c - '0');
    }
    for (const auto& range : kZipRanges) {
      if (prefix >= range.first && prefix <= range.last) return range.point;
    }
  }
  return kOrigin;
}

std::optional<double> distance_from_origin(std::string_view address) {
  const ParsedAddress parsed = parse_ship_address(address);
  if (!parsed.zip) return std::nullopt;
  return haversine_miles(kOrigin, estimate_location(*parsed.zip, parsed.state));
}

ShippingZone assign_shipping_zone(std::string_view address) {
  const auto& bands = zone_bands();
  const auto distance = distance_from_origin(address);
  if (!distance) {
    const ZoneBand& fallback = bands[2];
    return ShippingZone{std::string(fallback.id), std::string(fallback.name),
                        fallback.priority, std::nullopt};
  }
  for (const auto& band : bands) {
    if (*distance <= band.max_distance_miles) {
      return ShippingZone{std::string(band.id), std::string(band.name), band.priority,
                          distance};
    }
  }
  const ZoneBand& last = bands.back();
  return ShippingZone{std::string(last.id), std::string(last.name), last.priority, distance};
}

}  // namespace packslip::core

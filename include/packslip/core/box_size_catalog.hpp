#pragma once

#include <packslip/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace packslip::core {

/// Reserved category for orders with exactly one classified unit.
inline constexpr std::string_view kSinglesKey = "singles";

/// One named pack category: a max item count and the prefix multisets it accepts.
struct BoxSizeConfig {
  std::string key;  // catalog key, e.g. "4pack"
  std::string name;
  std::uint32_t max_items{0};
  std::vector<std::vector<std::string>> combinations;  // each sorted on load
};

/// Read-only catalog; entries keep document order, which is the match order.
class BoxSizeCatalog {
 public:
  BoxSizeCatalog() = default;
  explicit BoxSizeCatalog(std::vector<BoxSizeConfig> entries);

  [[nodiscard]] const std::vector<BoxSizeConfig>& entries() const noexcept {
    return entries_;
  }
  [[nodiscard]] const BoxSizeConfig* find(std::string_view key) const noexcept;
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

 private:
  std::vector<BoxSizeConfig> entries_;
};

/// Parses {"packSizes": {key: {name, maxItems, combinations}}} preserving key order.
[[nodiscard]] std::expected<BoxSizeCatalog, Error> parse_box_size_catalog(
    std::string_view json_text);

[[nodiscard]] std::expected<BoxSizeCatalog, Error> load_box_size_catalog(
    const std::string& path);

}  // namespace packslip::core

#pragma once

#include <packslip/core/error.hpp>
#include <cstddef>
#include <expected>
#include <set>
#include <string>

namespace packslip::app {

/// Runtime configuration: catalog location, two-up policy, image fetching, printing.
struct AppConfig {
  std::string catalog_path;
  std::set<std::string> two_up_categories{"singles"};
  long image_timeout_ms{10000};
  std::size_t image_fetch_parallelism{4};  // 0 = hardware concurrency
  int barcode_print_scale{4};
  std::string printed_store_path;
  bool sort_by_zone{false};
};

/// Load config from a simple key=value file (one per line, '#' comments). A missing
/// file yields the defaults; a malformed value is a ConfigError.
[[nodiscard]] std::expected<AppConfig, packslip::core::Error> load_config(
    const std::string& path);

/// Same format, from text.
[[nodiscard]] std::expected<AppConfig, packslip::core::Error> parse_config(
    const std::string& text);

/// Default config when no file is provided.
AppConfig default_config();

}  // namespace packslip::app

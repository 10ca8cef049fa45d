#pragma once

#include <packslip/core/error.hpp>
#include <opencv2/core/mat.hpp>
#include <expected>
#include <string_view>
#include <vector>

namespace packslip::layout {

/// Code 128 symbol values for value in code set B: start, data, checksum, stop.
/// Fails with AssetError on empty input or characters outside ASCII 32..127.
[[nodiscard]] std::expected<std::vector<int>, packslip::core::Error> encode_code128(
    std::string_view value);

/// Module widths (bar, space, bar, ...) of the full symbol, stop pattern included.
[[nodiscard]] std::expected<std::vector<int>, packslip::core::Error> code128_widths(
    std::string_view value);

struct BarcodeOptions {
  int module_px{2};        // narrowest bar at preview scale
  int print_scale{4};      // raster multiplier for print fidelity
  int bar_height_px{30};   // at preview scale
  int quiet_zone_modules{10};
  bool show_text{true};
};

/// Renders value as a white-background BGR raster.
[[nodiscard]] std::expected<cv::Mat, packslip::core::Error> render_barcode(
    std::string_view value, const BarcodeOptions& options = {});

}  // namespace packslip::layout

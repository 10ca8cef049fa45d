#include <packslip/layout/barcode.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <numeric>
#include <string>

namespace packslip::layout {

namespace {

using packslip::core::Error;
using packslip::core::ErrorCode;

constexpr int kStartB = 104;
constexpr int kStop = 106;

// Bar/space widths for symbol values 0..105; the stop pattern is separate.
constexpr std::array<const char*, 106> kPatterns = {
    "212222", "222122", "222221", "121223", "121322", "131222", "122213", "122312",
    "132212", "221213", "221312", "231212", "112232", "122132", "122231", "113222",
    "123122", "123221", "223211", "221132", "221231", "213212", "223112", "312131",
    "311222", "321122", "321221", "312212", "322112", "322211", "212123", "212321",
    "232121", "111323", "131123", "131321", "112313", "132113", "132311", "211313",
    "231113", "231311", "112133", "112331", "132131", "113123", "113321", "133121",
    "313121", "211331", "231131", "213113", "213311", "213131", "311123", "311321",
    "331121", "312113", "312311", "332111", "314111", "221411", "431111", "111224",
    "111422", "121124", "121421", "141122", "141221", "112214", "112412", "122114",
    "122411", "142112", "142211", "241211", "221114", "413111", "241112", "134111",
    "111242", "121142", "121241", "114212", "124112", "124211", "411212", "421112",
    "421211", "212141", "214121", "412121", "111143", "111341", "131141", "114113",
    "114311", "411113", "411311", "113141", "114131", "311141", "411131", "211412",
    "211214", "211232",
};
constexpr const char* kStopPattern = "2331112";

}  // namespace

std::expected<std::vector<int>, Error> encode_code128(std::string_view value) {
  if (value.empty()) {
    return std::unexpected(Error{ErrorCode::AssetError, "empty barcode value"});
  }
  std::vector<int> symbols;
  symbols.reserve(value.size() + 3);
  symbols.push_back(kStartB);
  long checksum = kStartB;
  for (std::size_t i = 0; i < value.size(); ++i) {
    const auto c = static_cast<unsigned char>(value[i]);
    if (c < 32 || c > 127) {
      return std::unexpected(Error{ErrorCode::AssetError,
                                   "character not encodable in Code 128 set B at position " +
                                       std::to_string(i)});
    }
    const int symbol = c - 32;
    symbols.push_back(symbol);
    checksum += static_cast<long>(i + 1) * symbol;
  }
  symbols.push_back(static_cast<int>(checksum % 103));
  symbols.push_back(kStop);
  return symbols;
}

std::expected<std::vector<int>, Error> code128_widths(std::string_view value) {
  auto symbols = encode_code128(value);
  if (!symbols) return std::unexpected(symbols.error());

  std::vector<int> widths;
  widths.reserve(symbols->size() * 6 + 1);
  for (int symbol : *symbols) {
    const char* pattern = symbol == kStop ? kStopPattern : kPatterns[static_cast<std::size_t>(symbol)];
    for (const char* p = pattern; *p; ++p) widths.push_back(*p - '0');
  }
  return widths;
}

std::expected<cv::Mat, Error> render_barcode(std::string_view value,
                                             const BarcodeOptions& options) {
  auto widths = code128_widths(value);
  if (!widths) return std::unexpected(widths.error());
  if (options.module_px <= 0 || options.print_scale <= 0 || options.bar_height_px <= 0) {
    return std::unexpected(Error{ErrorCode::AssetError, "invalid barcode raster options"});
  }

  const int unit = options.module_px * options.print_scale;
  const int modules = std::accumulate(widths->begin(), widths->end(), 0);
  const int quiet = options.quiet_zone_modules * unit;
  const int bar_height = options.bar_height_px * options.print_scale;
  const int text_band = options.show_text ? 16 * options.print_scale : 0;

  const int width = modules * unit + 2 * quiet;
  const int height = bar_height + text_band + 2 * options.print_scale;
  cv::Mat raster(height, width, CV_8UC3, cv::Scalar(255, 255, 255));

  int x = quiet;
  bool bar = true;
  for (int w : *widths) {
    const int px = w * unit;
    if (bar) {
      cv::rectangle(raster, cv::Rect(x, options.print_scale, px, bar_height),
                    cv::Scalar(0, 0, 0), cv::FILLED);
    }
    x += px;
    bar = !bar;
  }

  if (options.show_text) {
    const std::string text(value);
    const double font_scale = 0.4 * options.print_scale;
    const int thickness = std::max(1, options.print_scale);
    int baseline = 0;
    const cv::Size size =
        cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, font_scale, thickness, &baseline);
    const cv::Point origin((width - size.width) / 2,
                           options.print_scale + bar_height + size.height + 2 * options.print_scale);
    cv::putText(raster, text, origin, cv::FONT_HERSHEY_SIMPLEX, font_scale,
                cv::Scalar(0, 0, 0), thickness, cv::LINE_AA);
  }
  return raster;
}

}  // namespace packslip::layout

#pragma once

#include <packslip/core/error.hpp>
#include <packslip/layout/geometry.hpp>
#include <opencv2/core/mat.hpp>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace packslip::layout {

enum class FontWeight { Regular, Bold };

enum class TextAlign { Left, Center, Right };

struct LineStyle {
  double width{0.01};  // inches
  double gray{0.0};    // 0 = black, 1 = white
  bool dashed{false};
};

/// Drawing surface for paginated documents. Coordinates in inches, origin top-left,
/// text y is the baseline. Implementations record the first backend failure and
/// report it from finish(); drawing calls never throw.
class ICanvas {
 public:
  virtual ~ICanvas() = default;

  virtual void begin_page() = 0;
  [[nodiscard]] virtual std::size_t page_count() const noexcept = 0;

  virtual void set_font(FontWeight weight, double size_pt) = 0;
  /// Width in inches of text in the current font.
  [[nodiscard]] virtual double text_width(std::string_view text) const = 0;
  virtual void draw_text(double x, double y, std::string_view text,
                         TextAlign align = TextAlign::Left) = 0;
  virtual void draw_line(double x1, double y1, double x2, double y2,
                         const LineStyle& style = {}) = 0;
  /// Draws a BGR, BGRA or grayscale image stretched to box.
  virtual void draw_image(const cv::Mat& image, const Rect& box) = 0;

  /// Completes the document; returns its bytes or the first recorded failure.
  [[nodiscard]] virtual std::expected<std::string, packslip::core::Error> finish() = 0;
};

/// Text shortened with "..." so it fits max_width in the canvas's current font.
[[nodiscard]] std::string fit_text(const ICanvas& canvas, std::string_view text,
                                   double max_width);

}  // namespace packslip::layout

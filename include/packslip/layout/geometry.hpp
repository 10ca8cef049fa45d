#pragma once

namespace packslip::layout {

/// All layout coordinates are inches from the top-left corner of a Letter page.
inline constexpr double kPageWidth = 8.5;
inline constexpr double kPageHeight = 11.0;
inline constexpr double kMargin = 0.5;
inline constexpr double kContentWidth = kPageWidth - 2 * kMargin;
inline constexpr double kFooterBand = 0.5;

/// Lowest y a table row may reach on a full page.
inline constexpr double kContentBottom = kPageHeight - kMargin - kFooterBand;

struct Rect {
  double x{0.0};
  double y{0.0};
  double w{0.0};
  double h{0.0};

  [[nodiscard]] double right() const noexcept { return x + w; }
  [[nodiscard]] double bottom() const noexcept { return y + h; }
};

/// Largest rect with the source aspect ratio that fits in box, centered in it.
[[nodiscard]] Rect fit_centered(double src_w, double src_h, const Rect& box) noexcept;

}  // namespace packslip::layout

#include <packslip/layout/geometry.hpp>
#include <algorithm>

namespace packslip::layout {

Rect fit_centered(double src_w, double src_h, const Rect& box) noexcept {
  if (src_w <= 0.0 || src_h <= 0.0 || box.w <= 0.0 || box.h <= 0.0) {
    return Rect{box.x, box.y, 0.0, 0.0};
  }
  const double scale = std::min(box.w / src_w, box.h / src_h);
  const double w = src_w * scale;
  const double h = src_h * scale;
  return Rect{box.x + (box.w - w) / 2, box.y + (box.h - h) / 2, w, h};
}

}  // namespace packslip::layout

#include <packslip/layout/canvas.hpp>

namespace packslip::layout {

std::string fit_text(const ICanvas& canvas, std::string_view text, double max_width) {
  if (max_width <= 0.0) return {};
  if (canvas.text_width(text) <= max_width) return std::string(text);

  constexpr std::string_view kEllipsis = "...";
  std::string out(text);
  while (!out.empty()) {
    // Remove one whole UTF-8 code point.
    while (!out.empty() && (static_cast<unsigned char>(out.back()) & 0xC0) == 0x80) {
      out.pop_back();
    }
    if (!out.empty()) out.pop_back();
    if (canvas.text_width(out + std::string(kEllipsis)) <= max_width) {
      return out + std::string(kEllipsis);
    }
  }
  return {};
}

}  // namespace packslip::layout

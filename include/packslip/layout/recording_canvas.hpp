#pragma once

#include <packslip/layout/canvas.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace packslip::layout {

/// One recorded drawing operation.
struct DrawOp {
  enum class Kind { Text, Line, Image };
  Kind kind{Kind::Text};
  Rect rect{};  // text: (x, baseline, width, 0); line: (x1, y1, dx, dy); image: box
  std::string text;
  FontWeight weight{FontWeight::Regular};
  double font_size{0.0};
  bool dashed{false};
};

/// Canvas that records operations per page instead of producing a file (tests, previews).
/// Text width is approximated as 0.5 em per character.
class RecordingCanvas : public ICanvas {
 public:
  void begin_page() override;
  [[nodiscard]] std::size_t page_count() const noexcept override { return pages_.size(); }

  void set_font(FontWeight weight, double size_pt) override;
  [[nodiscard]] double text_width(std::string_view text) const override;
  void draw_text(double x, double y, std::string_view text, TextAlign align) override;
  void draw_line(double x1, double y1, double x2, double y2, const LineStyle& style) override;
  void draw_image(const cv::Mat& image, const Rect& box) override;

  /// Text dump: one "T|L|I" line per op, pages separated by "--- page N".
  [[nodiscard]] std::expected<std::string, packslip::core::Error> finish() override;

  [[nodiscard]] const std::vector<std::vector<DrawOp>>& pages() const noexcept {
    return pages_;
  }
  /// Number of text ops on page equal to text.
  [[nodiscard]] std::size_t count_text(std::size_t page, std::string_view text) const;
  /// Baseline y of the first text op on page equal to text, or -1.
  [[nodiscard]] double text_y(std::size_t page, std::string_view text) const;
  [[nodiscard]] std::size_t count_images(std::size_t page) const;
  [[nodiscard]] std::size_t count_dashed_lines(std::size_t page) const;

 private:
  std::vector<DrawOp>& current();

  std::vector<std::vector<DrawOp>> pages_;
  FontWeight weight_{FontWeight::Regular};
  double size_pt_{10.0};
};

}  // namespace packslip::layout

#pragma once

#include <packslip/layout/canvas.hpp>
#include <memory>
#include <optional>

namespace packslip::layout {

/// PDF canvas backed by PoDoFo. The whole document stays in memory until finish().
class PdfCanvas : public ICanvas {
 public:
  /// Creates the in-memory document and base-14 Helvetica fonts.
  [[nodiscard]] static std::expected<std::unique_ptr<PdfCanvas>, packslip::core::Error>
  create();

  ~PdfCanvas() override;

  PdfCanvas(const PdfCanvas&) = delete;
  PdfCanvas& operator=(const PdfCanvas&) = delete;

  void begin_page() override;
  [[nodiscard]] std::size_t page_count() const noexcept override;

  void set_font(FontWeight weight, double size_pt) override;
  [[nodiscard]] double text_width(std::string_view text) const override;
  void draw_text(double x, double y, std::string_view text, TextAlign align) override;
  void draw_line(double x1, double y1, double x2, double y2, const LineStyle& style) override;
  void draw_image(const cv::Mat& image, const Rect& box) override;

  [[nodiscard]] std::expected<std::string, packslip::core::Error> finish() override;

 private:
  PdfCanvas();

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace packslip::layout

#include <packslip/layout/recording_canvas.hpp>
#include <sstream>

namespace packslip::layout {

void RecordingCanvas::begin_page() { pages_.emplace_back(); }

std::vector<DrawOp>& RecordingCanvas::current() {
  if (pages_.empty()) pages_.emplace_back();
  return pages_.back();
}

void RecordingCanvas::set_font(FontWeight weight, double size_pt) {
  weight_ = weight;
  size_pt_ = size_pt;
}

double RecordingCanvas::text_width(std::string_view text) const {
  return static_cast<double>(text.size()) * 0.5 * size_pt_ / 72.0;
}

void RecordingCanvas::draw_text(double x, double y, std::string_view text, TextAlign align) {
  const double w = text_width(text);
  double left = x;
  if (align == TextAlign::Center) left = x - w / 2;
  if (align == TextAlign::Right) left = x - w;

  DrawOp op;
  op.kind = DrawOp::Kind::Text;
  op.rect = Rect{left, y, w, 0.0};
  op.text = std::string(text);
  op.weight = weight_;
  op.font_size = size_pt_;
  current().push_back(std::move(op));
}

void RecordingCanvas::draw_line(double x1, double y1, double x2, double y2,
                                const LineStyle& style) {
  DrawOp op;
  op.kind = DrawOp::Kind::Line;
  op.rect = Rect{x1, y1, x2 - x1, y2 - y1};
  op.dashed = style.dashed;
  current().push_back(std::move(op));
}

void RecordingCanvas::draw_image(const cv::Mat& /*image*/, const Rect& box) {
  DrawOp op;
  op.kind = DrawOp::Kind::Image;
  op.rect = box;
  current().push_back(std::move(op));
}

std::expected<std::string, packslip::core::Error> RecordingCanvas::finish() {
  std::ostringstream out;
  for (std::size_t p = 0; p < pages_.size(); ++p) {
    out << "--- page " << (p + 1) << "\n";
    for (const auto& op : pages_[p]) {
      switch (op.kind) {
        case DrawOp::Kind::Text:
          out << "T " << op.rect.x << ' ' << op.rect.y << ' ' << op.text << "\n";
          break;
        case DrawOp::Kind::Line:
          out << "L " << op.rect.x << ' ' << op.rect.y << (op.dashed ? " dashed" : "") << "\n";
          break;
        case DrawOp::Kind::Image:
          out << "I " << op.rect.x << ' ' << op.rect.y << ' ' << op.rect.w << ' '
              << op.rect.h << "\n";
          break;
      }
    }
  }
  return out.str();
}

std::size_t RecordingCanvas::count_text(std::size_t page, std::string_view text) const {
  if (page >= pages_.size()) return 0;
  std::size_t n = 0;
  for (const auto& op : pages_[page]) {
    if (op.kind == DrawOp::Kind::Text && op.text == text) ++n;
  }
  return n;
}

double RecordingCanvas::text_y(std::size_t page, std::string_view text) const {
  if (page >= pages_.size()) return -1.0;
  for (const auto& op : pages_[page]) {
    if (op.kind == DrawOp::Kind::Text && op.text == text) return op.rect.y;
  }
  return -1.0;
}

std::size_t RecordingCanvas::count_images(std::size_t page) const {
  if (page >= pages_.size()) return 0;
  std::size_t n = 0;
  for (const auto& op : pages_[page]) {
    if (op.kind == DrawOp::Kind::Image) ++n;
  }
  return n;
}

std::size_t RecordingCanvas::count_dashed_lines(std::size_t page) const {
  if (page >= pages_.size()) return 0;
  std::size_t n = 0;
  for (const auto& op : pages_[page]) {
    if (op.kind == DrawOp::Kind::Line && op.dashed) ++n;
  }
  return n;
}

}  // namespace packslip::layout

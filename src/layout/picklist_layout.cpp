#include <packslip/layout/picklist_layout.hpp>
#include <packslip/layout/geometry.hpp>
#include <glog/logging.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <string_view>
#include <utility>

namespace packslip::layout {

namespace {

constexpr double kFooterBaseline = 10.7;

// Sub-column shares of one family column: location, SKU, quantity, orders.
constexpr std::array<double, 4> kSubColumns{0.22, 0.36, 0.12, 0.30};
constexpr std::array<std::string_view, 4> kSubTitles{"LOCATION", "SKU", "QTY", "ORDERS"};

double column_width(const PicklistStyle& style) {
  return (kContentWidth - style.column_gap) / 2;
}

double standard_x(const PicklistStyle& style) {
  return kMargin + column_width(style) + style.column_gap;
}

}  // namespace

PageFrame picklist_frame(const PicklistStyle& style) {
  return PageFrame{kMargin, kContentBottom, style.header_height, style.table_header_height};
}

std::size_t picklist_rows_per_page(const PicklistStyle& style) {
  const auto frame = picklist_frame(style);
  const double available = frame.content_bottom - frame.top - frame.header_height -
                           frame.table_header_height - style.block_gap;
  const auto rows = static_cast<std::size_t>(std::floor(available / style.row_height + 1e-9));
  return std::max<std::size_t>(rows, 1);
}

std::vector<core::PicklistBlock> split_picklist_blocks(
    const std::vector<core::PicklistBlock>& blocks, const PicklistStyle& style) {
  const std::size_t limit = picklist_rows_per_page(style);
  const auto slice = [](const std::vector<core::PicklistRecord>& side, std::size_t first,
                        std::size_t count) {
    if (first >= side.size()) return std::vector<core::PicklistRecord>{};
    const auto begin = side.begin() + static_cast<std::ptrdiff_t>(first);
    const auto end = side.begin() + static_cast<std::ptrdiff_t>(
                                        std::min(side.size(), first + count));
    return std::vector<core::PicklistRecord>(begin, end);
  };

  std::vector<core::PicklistBlock> out;
  out.reserve(blocks.size());
  for (const auto& block : blocks) {
    const std::size_t rows = block.row_count();
    if (rows <= limit) {
      out.push_back(block);
      continue;
    }
    for (std::size_t first = 0; first < rows; first += limit) {
      core::PicklistBlock piece;
      piece.base_sku = block.base_sku;
      piece.personalized = slice(block.personalized, first, limit);
      piece.standard = slice(block.standard, first, limit);
      out.push_back(std::move(piece));
    }
    VLOG(1) << "Picklist block " << block.base_sku << " split: " << rows << " sub-rows";
  }
  return out;
}

std::vector<double> picklist_block_heights(const std::vector<core::PicklistBlock>& blocks,
                                           const PicklistStyle& style) {
  std::vector<double> heights;
  heights.reserve(blocks.size());
  for (const auto& block : blocks)
    heights.push_back(static_cast<double>(block.row_count()) * style.row_height +
                      style.block_gap);
  return heights;
}

std::string display_location(const std::optional<std::string>& location) {
  return core::is_placeholder_location(location) ? "UNASSIGNED" : *location;
}

std::string order_breakdown(const core::PicklistRecord& record) {
  std::string out;
  for (const auto& entry : record.orders) {
    if (!out.empty()) out += ", ";
    out += entry.order_number.empty() ? entry.tranid : entry.order_number;
    out += " x" + std::to_string(entry.quantity);
  }
  return out;
}

PicklistRenderer::PicklistRenderer(ICanvas& canvas, PicklistStyle style)
    : canvas_(canvas), style_(style) {}

std::size_t PicklistRenderer::render(const std::vector<core::PicklistBlock>& input,
                                     std::size_t order_count, const std::string& date_label) {
  const auto blocks = split_picklist_blocks(input, style_);
  const auto frame = picklist_frame(style_);
  const auto slices = plan_pages(frame, frame, picklist_block_heights(blocks, style_));

  for (std::size_t p = 0; p < slices.size(); ++p) {
    const auto& slice = slices[p];
    canvas_.begin_page();
    draw_page_header(frame.top, order_count, date_label);
    draw_table_header(slice.table_top - style_.table_header_height);

    double y = slice.table_top;
    for (std::size_t i = 0; i < slice.row_count; ++i) {
      const auto& block = blocks[slice.first_row + i];
      draw_block(block, y);
      y += static_cast<double>(block.row_count()) * style_.row_height + style_.block_gap;
    }

    canvas_.set_font(FontWeight::Regular, style_.subtitle_pt);
    canvas_.draw_text(kPageWidth - kMargin, kFooterBaseline,
                      "Page " + std::to_string(p + 1) + " of " + std::to_string(slices.size()),
                      TextAlign::Right);
  }
  VLOG(1) << "Picklist: " << blocks.size() << " blocks on " << slices.size() << " page(s)";
  return slices.size();
}

void PicklistRenderer::draw_page_header(double top, std::size_t order_count,
                                        const std::string& date_label) {
  canvas_.set_font(FontWeight::Bold, style_.title_pt);
  canvas_.draw_text(kMargin, top + 0.22, "PICKLIST");

  std::string subtitle = std::to_string(order_count) + (order_count == 1 ? " order" : " orders");
  if (!date_label.empty()) subtitle += " | " + date_label;
  canvas_.set_font(FontWeight::Regular, style_.subtitle_pt);
  canvas_.draw_text(kMargin, top + 0.42, subtitle);
}

void PicklistRenderer::draw_table_header(double y) {
  const double width = column_width(style_);
  const std::array<std::pair<double, std::string_view>, 2> families{{
      {kMargin, "PERSONALIZED"},
      {standard_x(style_), "STANDARD"},
  }};

  for (const auto& [x, title] : families) {
    canvas_.set_font(FontWeight::Bold, style_.column_title_pt);
    canvas_.draw_text(x, y + 0.15, title);

    canvas_.set_font(FontWeight::Bold, style_.header_pt);
    double sub_x = x;
    for (std::size_t i = 0; i < kSubColumns.size(); ++i) {
      canvas_.draw_text(sub_x, y + 0.33, kSubTitles[i]);
      sub_x += kSubColumns[i] * width;
    }
    canvas_.draw_line(x, y + 0.38, x + width, y + 0.38);
  }
}

void PicklistRenderer::draw_block(const core::PicklistBlock& block, double y) {
  const std::size_t rows = block.row_count();
  for (std::size_t r = 0; r < rows; ++r) {
    const double baseline = y + static_cast<double>(r) * style_.row_height + 0.2;
    if (r < block.personalized.size()) draw_record(block.personalized[r], kMargin, baseline);
    if (r < block.standard.size()) draw_record(block.standard[r], standard_x(style_), baseline);
  }

  const double bottom = y + static_cast<double>(rows) * style_.row_height;
  const double divider = kMargin + column_width(style_) + style_.column_gap / 2;
  canvas_.draw_line(divider, y, divider, bottom, LineStyle{0.005, 0.6, false});
  canvas_.draw_line(kMargin, bottom + style_.block_gap / 2, kPageWidth - kMargin,
                    bottom + style_.block_gap / 2, LineStyle{0.005, 0.8, false});
}

void PicklistRenderer::draw_record(const core::PicklistRecord& record, double x,
                                   double baseline) {
  const double width = column_width(style_);
  std::array<double, 4> cols{};
  for (std::size_t i = 0; i < cols.size(); ++i) cols[i] = kSubColumns[i] * width;

  canvas_.set_font(FontWeight::Bold, style_.body_pt);
  canvas_.draw_text(x, baseline,
                    fit_text(canvas_, display_location(record.location), cols[0] - 0.05));
  x += cols[0];

  canvas_.set_font(FontWeight::Regular, style_.body_pt);
  canvas_.draw_text(x, baseline, fit_text(canvas_, record.sku, cols[1] - 0.05));
  x += cols[1];

  canvas_.set_font(FontWeight::Bold, style_.body_pt);
  canvas_.draw_text(x, baseline, std::to_string(record.total_quantity));
  x += cols[2];

  canvas_.set_font(FontWeight::Regular, style_.body_pt);
  canvas_.draw_text(x, baseline, fit_text(canvas_, order_breakdown(record), cols[3]));
}

}  // namespace packslip::layout

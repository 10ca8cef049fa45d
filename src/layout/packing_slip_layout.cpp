#include <packslip/layout/packing_slip_layout.hpp>
#include <glog/logging.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <numeric>
#include <string_view>
#include <utility>

namespace packslip::layout {

namespace {

constexpr double kHeaderLabelBaseline = 0.1;
constexpr double kArtworkTop = 0.2;
constexpr double kDescender = 0.05;
constexpr double kHeaderBottomGap = 0.1;
constexpr double kFullFooterBaseline = 10.7;

// Two-up halves share the page between the top and bottom margins, minus the
// separator band around the cut guide.
constexpr double kTwoUpGap = 0.3;
constexpr double kTwoUpHalf = (kPageHeight - 2 * kMargin - 2 * kTwoUpGap) / 2;  // 4.7
constexpr double kTwoUpFooterBand = 0.3;

// Relative column widths: image, item, barcode, bin, color, size, qty.
constexpr std::array<double, 7> kColumnWeights{0.5, 2.2, 2.0, 0.7, 1.0, 0.6, 0.5};
constexpr std::array<std::string_view, 7> kColumnTitles{"",    "Item", "BARCODE", "BIN",
                                                        "COLOR", "SIZE", "QTY"};

constexpr std::size_t kDetailRows = 6;

std::array<double, 7> column_widths(double width) {
  const double total = std::accumulate(kColumnWeights.begin(), kColumnWeights.end(), 0.0);
  std::array<double, 7> out{};
  for (std::size_t i = 0; i < out.size(); ++i) out[i] = kColumnWeights[i] / total * width;
  return out;
}

std::string or_na(const std::optional<std::string>& value) {
  return value && !value->empty() ? *value : std::string("N/A");
}

std::string or_na(const std::string& value) { return value.empty() ? "N/A" : value; }

double address_top(const SlipStyle& style) {
  return kHeaderLabelBaseline + style.line_leading + kDescender;
}

double detail_top(const SlipStyle& style) { return style.title_baseline + style.detail_gap; }

bool contains_ci(std::string_view haystack, std::string_view needle) {
  const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                              [](char a, char b) {
                                return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b));
                              });
  return it != haystack.end();
}

}  // namespace

SlipStyle full_slip_style() { return SlipStyle{}; }

SlipStyle compact_slip_style() {
  SlipStyle s;
  s.compact = true;
  s.label_pt = 8;
  s.body_pt = 7;
  s.title_pt = 14;
  s.detail_pt = 7;
  s.table_pt = 7;
  s.description_pt = 6;
  s.line_leading = 0.12;
  s.title_baseline = 0.18;
  s.detail_gap = 0.2;
  s.detail_leading = 0.16;
  s.artwork_w = 0.85;
  s.artwork_h = 0.65;
  s.artwork_px = 200;
  s.item_image_w = 0.3;
  s.item_image_h = 0.25;
  s.item_image_px = 100;
  s.barcode_w = 0.75;
  s.barcode_h = 0.15;
  s.row_height = 0.4;
  s.text_offset = 0.22;
  s.sku_offset = 0.12;
  s.description_offset = 0.1;
  s.table_gap = 0.15;
  s.show_page_numbers = false;
  return s;
}

SlipRegion full_page_region() { return SlipRegion{kMargin, kContentBottom, kFullFooterBaseline}; }

SlipRegion two_up_top_region() {
  const double bottom = kMargin + kTwoUpHalf - kTwoUpFooterBand;  // 4.9
  return SlipRegion{kMargin, bottom, bottom + 0.2};
}

SlipRegion two_up_bottom_region() {
  const double top = kMargin + kTwoUpHalf + 2 * kTwoUpGap;  // 5.8
  return SlipRegion{top, kContentBottom, kContentBottom + 0.2};
}

double cut_guide_y() { return kMargin + kTwoUpHalf + kTwoUpGap / 2; }

std::vector<std::string> address_lines(const std::string& address) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= address.size()) {
    auto end = address.find('\n', start);
    if (end == std::string::npos) end = address.size();
    std::string line = address.substr(start, end - start);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    if (!line.empty()) lines.push_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

double slip_header_height(const core::ProcessedOrder& order, const SlipStyle& style) {
  const auto lines = address_lines(order.ship_address);
  const double left =
      lines.empty() ? kHeaderLabelBaseline + kDescender
                    : address_top(style) +
                          static_cast<double>(lines.size() - 1) * style.line_leading +
                          kDescender;
  const double middle = order.artwork_ref ? kArtworkTop + style.artwork_h : 0.0;
  const double right = detail_top(style) +
                       static_cast<double>(kDetailRows - 1) * style.detail_leading +
                       kDescender;
  return std::max({left, middle, right}) + kHeaderBottomGap;
}

PageFrame slip_frame(const core::ProcessedOrder& order, const SlipRegion& region,
                     const SlipStyle& style) {
  PageFrame frame;
  frame.top = region.top;
  frame.content_bottom = region.content_bottom;
  frame.header_height = slip_header_height(order, style) + style.table_gap;
  frame.table_header_height = style.table_header_height;
  return frame;
}

std::vector<PageSlice> plan_slip(const core::ProcessedOrder& order, const SlipRegion& region,
                                 const SlipStyle& style) {
  const auto frame = slip_frame(order, region, style);
  std::vector<double> rows(order.items.size(), style.row_height + style.row_gap);
  return plan_pages(frame, frame, rows);
}

bool footer_barcode_allowed(const core::ProcessedOrder& order) {
  if (!order.tracking_id || order.tracking_id->empty()) return false;
  if (!order.ship_method) return false;
  return !contains_ci(*order.ship_method, "LTL") &&
         !contains_ci(*order.ship_method, "Local Pickup");
}

std::vector<AssetRequest> slip_asset_requests(const core::ProcessedOrder& order,
                                              const SlipStyle& style) {
  std::vector<AssetRequest> out;
  if (order.artwork_ref && !order.artwork_ref->empty())
    out.push_back(AssetRequest{*order.artwork_ref, style.artwork_px});
  for (const auto& item : order.items) {
    if (item.image_ref && !item.image_ref->empty())
      out.push_back(AssetRequest{*item.image_ref, style.item_image_px});
  }
  return out;
}

PackingSlipRenderer::PackingSlipRenderer(ICanvas& canvas, const AssetCache& assets,
                                         BarcodeOptions barcode)
    : canvas_(canvas), assets_(assets), barcode_(barcode) {}

void PackingSlipRenderer::render_order(const core::ProcessedOrder& order,
                                       const SlipRegion& region, const SlipStyle& style) {
  const auto slices = plan_slip(order, region, style);
  for (std::size_t p = 0; p < slices.size(); ++p) {
    canvas_.begin_page();
    draw_slice(order, region, style, slices[p], p + 1, slices.size());
  }
  VLOG(1) << "Order " << order.tranid << ": " << order.items.size() << " rows on "
          << slices.size() << " page(s)";
}

void PackingSlipRenderer::render_two_up(const core::ProcessedOrder& top,
                                        const core::ProcessedOrder* bottom) {
  const auto style = compact_slip_style();
  canvas_.begin_page();

  const auto top_region = two_up_top_region();
  const auto top_slices = plan_slip(top, top_region, style);
  draw_slice(top, top_region, style, top_slices.front(), 1, 1);

  draw_cut_guide(cut_guide_y());

  if (bottom != nullptr) {
    const auto bottom_region = two_up_bottom_region();
    const auto bottom_slices = plan_slip(*bottom, bottom_region, style);
    draw_slice(*bottom, bottom_region, style, bottom_slices.front(), 1, 1);
  }
}

void PackingSlipRenderer::draw_slice(const core::ProcessedOrder& order, const SlipRegion& region,
                                     const SlipStyle& style, const PageSlice& slice,
                                     std::size_t page, std::size_t pages) {
  const double x = kMargin;
  const double width = kContentWidth;

  draw_header(order, x, region.top, width, style);
  draw_table_header(x, slice.table_top - style.table_header_height, width, style);

  double y = slice.table_top;
  for (std::size_t i = 0; i < slice.row_count; ++i) {
    draw_row(order.items[slice.first_row + i], x, y, width, style);
    y += style.row_height + style.row_gap;
  }
  draw_footer(order, x, region.footer_baseline, width, style, page, pages);
}

double PackingSlipRenderer::draw_header(const core::ProcessedOrder& order, double x, double y,
                                        double width, const SlipStyle& style) {
  const double left_w = width * 0.35;
  const double mid_w = width * 0.30;
  const double right_w = width * 0.35;

  // Ship-to column.
  canvas_.set_font(FontWeight::Bold, style.label_pt);
  canvas_.draw_text(x, y + kHeaderLabelBaseline, "SHIP TO");
  canvas_.set_font(FontWeight::Regular, style.body_pt);
  const auto lines = address_lines(order.ship_address);
  double line_y = y + address_top(style);
  for (const auto& line : lines) {
    canvas_.draw_text(x, line_y, fit_text(canvas_, line, left_w - 0.1));
    line_y += style.line_leading;
  }

  // Artwork column; the slot stays reserved when the image is unavailable.
  if (order.artwork_ref) {
    const double mid_x = x + left_w;
    canvas_.set_font(FontWeight::Bold, style.label_pt);
    canvas_.draw_text(mid_x + mid_w / 2, y + kHeaderLabelBaseline, "Custom Artwork",
                      TextAlign::Center);
    const Rect slot{mid_x + (mid_w - style.artwork_w) / 2, y + kArtworkTop, style.artwork_w,
                    style.artwork_h};
    if (const cv::Mat* image = assets_.find(*order.artwork_ref, style.artwork_px)) {
      canvas_.draw_image(*image, fit_centered(image->cols, image->rows, slot));
    }
  }

  // Title and detail rows.
  const double right_x = x + left_w + mid_w;
  const double right_edge = right_x + right_w;
  canvas_.set_font(FontWeight::Bold, style.title_pt);
  canvas_.draw_text(right_edge, y + style.title_baseline, "PACKING SLIP", TextAlign::Right);

  const std::array<std::pair<std::string_view, std::string>, kDetailRows> details{{
      {"Order Number", or_na(order.order_number)},
      {"Item Fulfillment", or_na(order.tranid)},
      {"PO Number", or_na(order.po_number)},
      {"Order Notes", or_na(order.memo)},
      {"Ship Method", or_na(order.ship_method)},
      {"Date", or_na(order.date_created)},
  }};
  const LineStyle rule{0.005, 0.6, false};
  double row_y = y + detail_top(style);
  for (const auto& [label, value] : details) {
    canvas_.set_font(FontWeight::Bold, style.detail_pt);
    canvas_.draw_text(right_x, row_y, label);
    canvas_.set_font(FontWeight::Regular, style.detail_pt);
    canvas_.draw_text(right_edge, row_y, fit_text(canvas_, value, right_w * 0.6),
                      TextAlign::Right);
    canvas_.draw_line(right_x, row_y + kDescender, right_edge, row_y + kDescender, rule);
    row_y += style.detail_leading;
  }

  const double bottom = y + slip_header_height(order, style);
  canvas_.draw_line(x, bottom, x + width, bottom);
  return bottom;
}

void PackingSlipRenderer::draw_table_header(double x, double y, double width,
                                            const SlipStyle& style) {
  const auto widths = column_widths(width);
  canvas_.set_font(FontWeight::Bold, style.table_pt);
  double col_x = x;
  for (std::size_t i = 0; i < widths.size(); ++i) {
    if (!kColumnTitles[i].empty()) {
      if (i == widths.size() - 1) {
        canvas_.draw_text(col_x + widths[i], y + 0.1, kColumnTitles[i], TextAlign::Right);
      } else if (i == 1) {
        canvas_.draw_text(col_x, y + 0.1, kColumnTitles[i]);
      } else {
        canvas_.draw_text(col_x + widths[i] / 2, y + 0.1, kColumnTitles[i], TextAlign::Center);
      }
    }
    col_x += widths[i];
  }
  canvas_.draw_line(x, y + 0.14, x + width, y + 0.14);
}

void PackingSlipRenderer::draw_row(const core::OrderItem& item, double x, double y,
                                   double width, const SlipStyle& style) {
  const auto w = column_widths(width);
  double col_x = x;

  // Image.
  if (item.image_ref) {
    const Rect slot{col_x + 0.05, y + (style.row_height - style.item_image_h) / 2,
                    style.item_image_w, style.item_image_h};
    if (const cv::Mat* image = assets_.find(*item.image_ref, style.item_image_px)) {
      canvas_.draw_image(*image, fit_centered(image->cols, image->rows, slot));
    }
  }
  col_x += w[0];

  // SKU and description.
  canvas_.set_font(FontWeight::Bold, style.table_pt);
  canvas_.draw_text(col_x, y + style.sku_offset, fit_text(canvas_, item.sku, w[1] - 0.1));
  if (!item.description.empty()) {
    canvas_.set_font(FontWeight::Regular, style.description_pt);
    canvas_.draw_text(col_x, y + style.sku_offset + style.description_offset,
                      fit_text(canvas_, item.description, w[1] - 0.1));
  }
  col_x += w[1];

  // Barcode.
  canvas_.set_font(FontWeight::Regular, style.table_pt);
  if (item.barcode && !item.barcode->empty()) {
    const double bw = std::min(style.barcode_w, w[2] - 0.1);
    const Rect box{col_x + (w[2] - bw) / 2, y + (style.row_height - style.barcode_h) / 2, bw,
                   style.barcode_h};
    draw_barcode_or_text(*item.barcode, box, col_x + w[2] / 2, y + style.text_offset,
                         TextAlign::Center);
    canvas_.set_font(FontWeight::Regular, style.table_pt);
  }
  col_x += w[2];

  const double text_y = y + style.text_offset;
  canvas_.draw_text(col_x + w[3] / 2, text_y,
                    fit_text(canvas_, item.pick_location.value_or(""), w[3] - 0.05),
                    TextAlign::Center);
  col_x += w[3];
  canvas_.draw_text(col_x + w[4] / 2, text_y,
                    fit_text(canvas_, item.color.value_or(""), w[4] - 0.05), TextAlign::Center);
  col_x += w[4];
  canvas_.draw_text(col_x + w[5] / 2, text_y,
                    fit_text(canvas_, item.size.value_or(""), w[5] - 0.05), TextAlign::Center);
  col_x += w[5];
  canvas_.set_font(FontWeight::Bold, style.table_pt);
  canvas_.draw_text(col_x + w[6], text_y, std::to_string(item.quantity), TextAlign::Right);

  const double sep = y + style.row_height;
  canvas_.draw_line(x, sep, x + width, sep, LineStyle{0.005, 0.8, false});
}

void PackingSlipRenderer::draw_footer(const core::ProcessedOrder& order, double x,
                                      double baseline, double width, const SlipStyle& style,
                                      std::size_t page, std::size_t pages) {
  canvas_.set_font(FontWeight::Regular, style.body_pt);
  if (footer_barcode_allowed(order)) {
    const Rect box{x, baseline - style.barcode_h * 0.8, style.barcode_w, style.barcode_h};
    draw_barcode_or_text(*order.tracking_id, box, x, baseline, TextAlign::Left);
    canvas_.set_font(FontWeight::Regular, style.body_pt);
  }
  if (style.show_page_numbers) {
    canvas_.draw_text(x + width, baseline,
                      "Page " + std::to_string(page) + " of " + std::to_string(pages),
                      TextAlign::Right);
  }
}

void PackingSlipRenderer::draw_cut_guide(double y) {
  canvas_.draw_line(kMargin, y, kPageWidth - kMargin, y, LineStyle{0.01, 0.0, false});
  canvas_.draw_line(kMargin, y, kPageWidth - kMargin, y, LineStyle{0.01, 0.5, true});
}

void PackingSlipRenderer::draw_barcode_or_text(const std::string& value, const Rect& box,
                                               double text_x, double text_y,
                                               TextAlign align) {
  auto raster = render_barcode(value, barcode_);
  if (raster) {
    canvas_.draw_image(*raster, box);
    return;
  }
  LOG(WARNING) << "Barcode for '" << value << "' printed as text: " << raster.error().message;
  canvas_.draw_text(text_x, text_y, fit_text(canvas_, value, box.w), align);
}

}  // namespace packslip::layout

#pragma once

#include <packslip/core/order.hpp>
#include <packslip/layout/asset_cache.hpp>
#include <packslip/layout/barcode.hpp>
#include <packslip/layout/canvas.hpp>
#include <packslip/layout/pagination.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace packslip::layout {

/// Fonts, spacing and asset sizes for one packing-slip variant.
struct SlipStyle {
  bool compact{false};
  double label_pt{10};
  double body_pt{9};
  double title_pt{20};
  double detail_pt{9};
  double table_pt{8};
  double description_pt{7};
  double line_leading{0.15};
  double title_baseline{0.25};
  double detail_gap{0.25};
  double detail_leading{0.2};
  double artwork_w{1.7};
  double artwork_h{1.3};
  int artwork_px{400};
  double item_image_w{0.4};
  double item_image_h{0.3};
  int item_image_px{200};
  double barcode_w{1.5};
  double barcode_h{0.3};
  double row_height{0.5};
  double row_gap{0.02};
  double text_offset{0.2};
  double sku_offset{0.15};
  double description_offset{0.12};
  double table_gap{0.2};
  double table_header_height{0.24};
  bool show_page_numbers{true};
};

[[nodiscard]] SlipStyle full_slip_style();
[[nodiscard]] SlipStyle compact_slip_style();

/// Vertical band an order is laid out in.
struct SlipRegion {
  double top{0.0};
  double content_bottom{0.0};
  double footer_baseline{0.0};
};

[[nodiscard]] SlipRegion full_page_region();
[[nodiscard]] SlipRegion two_up_top_region();
[[nodiscard]] SlipRegion two_up_bottom_region();
/// y of the cut guide between the two halves.
[[nodiscard]] double cut_guide_y();

/// Non-empty address lines, CR stripped.
[[nodiscard]] std::vector<std::string> address_lines(const std::string& address);

/// Header height below its top edge, including the closing rule.
[[nodiscard]] double slip_header_height(const core::ProcessedOrder& order, const SlipStyle& style);

/// Frame for pages of this order inside region.
[[nodiscard]] PageFrame slip_frame(const core::ProcessedOrder& order, const SlipRegion& region,
                                   const SlipStyle& style);

/// Page slices for the order's item rows.
[[nodiscard]] std::vector<PageSlice> plan_slip(const core::ProcessedOrder& order,
                                               const SlipRegion& region,
                                               const SlipStyle& style);

/// Footer tracking barcode is printed only with a tracking id and a ship method that is
/// not terminal (LTL freight, local pickup).
[[nodiscard]] bool footer_barcode_allowed(const core::ProcessedOrder& order);

/// Image and artwork references an order needs under style.
[[nodiscard]] std::vector<AssetRequest> slip_asset_requests(const core::ProcessedOrder& order,
                                                            const SlipStyle& style);

/// Draws packing slips onto a canvas. Assets come from a pre-resolved cache; a missing
/// image leaves its slot blank and an unencodable barcode prints as text.
class PackingSlipRenderer {
 public:
  PackingSlipRenderer(ICanvas& canvas, const AssetCache& assets, BarcodeOptions barcode);

  /// Every page of one order in region; starts a new canvas page per slice.
  void render_order(const core::ProcessedOrder& order, const SlipRegion& region,
                    const SlipStyle& style);

  /// One physical page: first order on top, optional second below a cut guide.
  void render_two_up(const core::ProcessedOrder& top, const core::ProcessedOrder* bottom);

  /// Returns the y of the header's closing rule.
  double draw_header(const core::ProcessedOrder& order, double x, double y, double width,
                     const SlipStyle& style);
  void draw_table_header(double x, double y, double width, const SlipStyle& style);
  void draw_row(const core::OrderItem& item, double x, double y, double width,
                const SlipStyle& style);
  void draw_footer(const core::ProcessedOrder& order, double x, double baseline, double width,
                   const SlipStyle& style, std::size_t page, std::size_t pages);
  void draw_cut_guide(double y);

 private:
  /// Draws a barcode stretched to box, or value as text when it cannot be encoded.
  void draw_barcode_or_text(const std::string& value, const Rect& box, double text_x,
                            double text_y, TextAlign align);
  /// Draws the slice's header, table and rows; the caller has started the page.
  void draw_slice(const core::ProcessedOrder& order, const SlipRegion& region,
                  const SlipStyle& style, const PageSlice& slice, std::size_t page,
                  std::size_t pages);

  ICanvas& canvas_;
  const AssetCache& assets_;
  BarcodeOptions barcode_;
};

}  // namespace packslip::layout

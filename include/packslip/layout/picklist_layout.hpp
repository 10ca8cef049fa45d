#pragma once

#include <packslip/core/picklist_aggregator.hpp>
#include <packslip/layout/canvas.hpp>
#include <packslip/layout/pagination.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace packslip::layout {

struct PicklistStyle {
  double title_pt{16};
  double subtitle_pt{9};
  double column_title_pt{10};
  double header_pt{8};
  double body_pt{8};
  double row_height{0.3};
  double block_gap{0.04};
  double column_gap{0.2};
  double header_height{0.65};        // title block and gap before the table
  double table_header_height{0.45};  // family titles, sub-headers and rule
};

/// Frame shared by the first and every continuation picklist page.
[[nodiscard]] PageFrame picklist_frame(const PicklistStyle& style = {});

/// Sub-rows that fit below the table header of one picklist page.
[[nodiscard]] std::size_t picklist_rows_per_page(const PicklistStyle& style = {});

/// Blocks with more sub-rows than a page holds, cut into consecutive pieces of at most
/// picklist_rows_per_page() sub-rows. Both sides are cut at the same sub-row, so the
/// families stay aligned; other blocks pass through unchanged.
[[nodiscard]] std::vector<core::PicklistBlock> split_picklist_blocks(
    const std::vector<core::PicklistBlock>& blocks, const PicklistStyle& style = {});

/// Height of each block: its taller side's sub-rows plus the separator gap.
[[nodiscard]] std::vector<double> picklist_block_heights(
    const std::vector<core::PicklistBlock>& blocks, const PicklistStyle& style = {});

/// Location text as printed; placeholders read "UNASSIGNED".
[[nodiscard]] std::string display_location(const std::optional<std::string>& location);

/// "#1001 x2, #1002 x3": each order's display number as stored (fulfillment id when it
/// has none) and its quantity.
[[nodiscard]] std::string order_breakdown(const core::PicklistRecord& record);

/// Two-column picklist: personalized records on the left, standard on the right, one
/// block per base SKU so both families of a product share a horizontal band.
class PicklistRenderer {
 public:
  explicit PicklistRenderer(ICanvas& canvas, PicklistStyle style = {});

  /// Starts its own pages. Blocks taller than a page continue on the next page under
  /// repeated column headers. Returns the number of pages drawn.
  std::size_t render(const std::vector<core::PicklistBlock>& blocks, std::size_t order_count,
                     const std::string& date_label);

 private:
  void draw_page_header(double top, std::size_t order_count, const std::string& date_label);
  void draw_table_header(double y);
  void draw_block(const core::PicklistBlock& block, double y);
  void draw_record(const core::PicklistRecord& record, double x, double baseline);

  ICanvas& canvas_;
  PicklistStyle style_;
};

}  // namespace packslip::layout

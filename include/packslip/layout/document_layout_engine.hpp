#pragma once

#include <packslip/core/error.hpp>
#include <packslip/core/order.hpp>
#include <packslip/layout/asset_cache.hpp>
#include <packslip/layout/barcode.hpp>
#include <packslip/layout/canvas.hpp>
#include <expected>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace packslip::layout {

enum class DocumentKind {
  Slips,
  Picklist,
  Combined,  // picklist pages, page break, slips
};

[[nodiscard]] const char* to_string(DocumentKind kind) noexcept;
[[nodiscard]] std::optional<DocumentKind> parse_document_kind(std::string_view text);

struct LayoutOptions {
  /// Box-size categories paired two per page.
  std::set<std::string> two_up_categories{"singles"};
  BarcodeOptions barcode;
  /// Printed under the picklist title; omitted when empty.
  std::string date_label;
};

/// One physical placement of packing slips: a two-up page or a full-page sequence.
struct SlipSheet {
  enum class Mode { TwoUp, FullPage };

  Mode mode{Mode::FullPage};
  const core::ProcessedOrder* first{nullptr};
  const core::ProcessedOrder* second{nullptr};  // TwoUp only, may be null
};

/// True when the order's rows fit either half of a two-up page.
[[nodiscard]] bool fits_half_page(const core::ProcessedOrder& order);

/// Two-up candidates are paired in input order and come first; an odd leftover and
/// candidates too long for a half page get full pages, followed by every other order in
/// input order. Pointers refer into orders.
[[nodiscard]] std::vector<SlipSheet> plan_slip_sheets(
    const std::vector<core::ProcessedOrder>& orders, const LayoutOptions& options);

/// Every image the document will place, at the size its layout asks for.
[[nodiscard]] std::vector<AssetRequest> collect_asset_requests(
    const std::vector<core::ProcessedOrder>& orders, DocumentKind kind,
    const LayoutOptions& options);

/// Lays out packing slips and picklists onto a canvas. Images must already be resolved
/// into the cache; rendering itself performs no I/O.
class DocumentLayoutEngine {
 public:
  explicit DocumentLayoutEngine(LayoutOptions options = {});

  /// Fails with InputError on an empty selection. Canvas failures are reported by the
  /// canvas's finish().
  [[nodiscard]] std::expected<void, core::Error> render(
      const std::vector<core::ProcessedOrder>& orders, DocumentKind kind,
      const AssetCache& assets, ICanvas& canvas) const;

  [[nodiscard]] const LayoutOptions& options() const noexcept { return options_; }

 private:
  void render_slips(const std::vector<core::ProcessedOrder>& orders, const AssetCache& assets,
                    ICanvas& canvas) const;
  void render_picklist(const std::vector<core::ProcessedOrder>& orders, ICanvas& canvas) const;

  LayoutOptions options_;
};

}  // namespace packslip::layout

#include <packslip/layout/document_layout_engine.hpp>
#include <packslip/core/picklist_aggregator.hpp>
#include <packslip/layout/packing_slip_layout.hpp>
#include <packslip/layout/picklist_layout.hpp>
#include <glog/logging.h>
#include <utility>

namespace packslip::layout {

namespace {

bool is_two_up_candidate(const core::ProcessedOrder& order, const LayoutOptions& options) {
  return order.box_size && options.two_up_categories.contains(*order.box_size);
}

}  // namespace

const char* to_string(DocumentKind kind) noexcept {
  switch (kind) {
    case DocumentKind::Slips:
      return "slips";
    case DocumentKind::Picklist:
      return "picklist";
    case DocumentKind::Combined:
      return "combined";
    default:
      return "unknown";
  }
}

std::optional<DocumentKind> parse_document_kind(std::string_view text) {
  if (text == "slips") return DocumentKind::Slips;
  if (text == "picklist") return DocumentKind::Picklist;
  if (text == "combined") return DocumentKind::Combined;
  return std::nullopt;
}

bool fits_half_page(const core::ProcessedOrder& order) {
  const auto style = compact_slip_style();
  // The bottom half is the shorter of the two.
  const auto slices = plan_slip(order, two_up_bottom_region(), style);
  return slices.size() == 1 && !slices.front().overfull;
}

std::vector<SlipSheet> plan_slip_sheets(const std::vector<core::ProcessedOrder>& orders,
                                        const LayoutOptions& options) {
  std::vector<const core::ProcessedOrder*> pool;
  std::vector<const core::ProcessedOrder*> full;
  for (const auto& order : orders) {
    if (is_two_up_candidate(order, options) && fits_half_page(order)) {
      pool.push_back(&order);
    } else {
      full.push_back(&order);
    }
  }

  std::vector<SlipSheet> sheets;
  std::size_t i = 0;
  for (; i + 1 < pool.size(); i += 2)
    sheets.push_back(SlipSheet{SlipSheet::Mode::TwoUp, pool[i], pool[i + 1]});
  if (i < pool.size()) sheets.push_back(SlipSheet{SlipSheet::Mode::FullPage, pool[i], nullptr});
  for (const auto* order : full)
    sheets.push_back(SlipSheet{SlipSheet::Mode::FullPage, order, nullptr});
  return sheets;
}

std::vector<AssetRequest> collect_asset_requests(const std::vector<core::ProcessedOrder>& orders,
                                                 DocumentKind kind,
                                                 const LayoutOptions& options) {
  std::vector<AssetRequest> requests;
  if (kind == DocumentKind::Picklist) return requests;

  const auto add = [&requests](const core::ProcessedOrder& order, const SlipStyle& style) {
    auto more = slip_asset_requests(order, style);
    requests.insert(requests.end(), std::make_move_iterator(more.begin()),
                    std::make_move_iterator(more.end()));
  };
  for (const auto& sheet : plan_slip_sheets(orders, options)) {
    if (sheet.mode == SlipSheet::Mode::TwoUp) {
      add(*sheet.first, compact_slip_style());
      if (sheet.second != nullptr) add(*sheet.second, compact_slip_style());
    } else {
      add(*sheet.first, full_slip_style());
    }
  }
  return unique_requests(std::move(requests));
}

DocumentLayoutEngine::DocumentLayoutEngine(LayoutOptions options)
    : options_(std::move(options)) {}

std::expected<void, core::Error> DocumentLayoutEngine::render(
    const std::vector<core::ProcessedOrder>& orders, DocumentKind kind, const AssetCache& assets,
    ICanvas& canvas) const {
  if (orders.empty())
    return std::unexpected(core::Error{core::ErrorCode::InputError, "No orders selected"});

  LOG(INFO) << "Rendering " << to_string(kind) << " for " << orders.size() << " order(s)";
  if (kind == DocumentKind::Picklist || kind == DocumentKind::Combined)
    render_picklist(orders, canvas);
  if (kind == DocumentKind::Slips || kind == DocumentKind::Combined)
    render_slips(orders, assets, canvas);
  return {};
}

void DocumentLayoutEngine::render_slips(const std::vector<core::ProcessedOrder>& orders,
                                        const AssetCache& assets, ICanvas& canvas) const {
  PackingSlipRenderer renderer(canvas, assets, options_.barcode);
  std::size_t two_up = 0;
  for (const auto& sheet : plan_slip_sheets(orders, options_)) {
    if (sheet.mode == SlipSheet::Mode::TwoUp) {
      renderer.render_two_up(*sheet.first, sheet.second);
      ++two_up;
    } else {
      renderer.render_order(*sheet.first, full_page_region(), full_slip_style());
    }
  }
  VLOG(1) << "Slips: " << two_up << " two-up page(s)";
}

void DocumentLayoutEngine::render_picklist(const std::vector<core::ProcessedOrder>& orders,
                                           ICanvas& canvas) const {
  const auto blocks = core::build_picklist_blocks(core::aggregate_picklist(orders));
  PicklistRenderer renderer(canvas);
  renderer.render(blocks, orders.size(), options_.date_label);
}

}  // namespace packslip::layout

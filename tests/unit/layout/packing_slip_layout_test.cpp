#include <packslip/layout/asset_cache.hpp>
#include <packslip/layout/packing_slip_layout.hpp>
#include <packslip/layout/recording_canvas.hpp>
#include <gtest/gtest.h>
#include <string>

namespace pl = packslip::layout;
namespace pc = packslip::core;

namespace {

pc::ProcessedOrder order_with_rows(std::size_t rows) {
  pc::ProcessedOrder o;
  o.tranid = "IF-500";
  o.order_number = "#500";
  o.date_created = "3/1/2024";
  o.ship_address = "Jane Doe\n1 Main St\nAsheville NC 28801\nUnited States";
  for (std::size_t i = 0; i < rows; ++i) {
    pc::OrderItem item;
    item.sku = "DPT16-" + std::to_string(i);
    item.pick_location = "A" + std::to_string(i);
    o.items.push_back(item);
  }
  return o;
}

std::size_t full_page_capacity() {
  const auto big = order_with_rows(60);
  return pl::plan_slip(big, pl::full_page_region(), pl::full_slip_style()).front().row_count;
}

}  // namespace

TEST(PackingSlipLayout, RegionsSplitThePage) {
  const auto top = pl::two_up_top_region();
  const auto bottom = pl::two_up_bottom_region();
  EXPECT_DOUBLE_EQ(top.top, 0.5);
  EXPECT_NEAR(top.content_bottom, 4.9, 1e-9);
  EXPECT_NEAR(pl::cut_guide_y(), 5.35, 1e-9);
  EXPECT_NEAR(bottom.top, 5.8, 1e-9);
  EXPECT_NEAR(bottom.content_bottom, 10.0, 1e-9);
  EXPECT_LT(top.footer_baseline, pl::cut_guide_y());
  EXPECT_GT(bottom.top, pl::cut_guide_y());
}

TEST(PackingSlipLayout, AddressLinesDropBlanksAndCarriageReturns) {
  EXPECT_EQ(pl::address_lines("A\r\n\r\nB \n"), (std::vector<std::string>{"A", "B"}));
  EXPECT_TRUE(pl::address_lines("").empty());
}

TEST(PackingSlipLayout, ArtworkReservesSlotOnlyWhenReferenced) {
  auto o = order_with_rows(1);
  const auto style = pl::full_slip_style();
  const double without = pl::slip_header_height(o, style);
  o.artwork_ref = "https://x/art.png";
  EXPECT_GE(pl::slip_header_height(o, style), without);
  EXPECT_NEAR(pl::slip_header_height(o, style), 1.65, 1e-9);
}

TEST(PackingSlipLayout, OneRowOverCapacityGivesTwoPagesWithRepeatedHeader) {
  const std::size_t capacity = full_page_capacity();
  ASSERT_GT(capacity, 5u);
  EXPECT_EQ(pl::plan_slip(order_with_rows(capacity), pl::full_page_region(),
                          pl::full_slip_style()).size(), 1u);

  const auto order = order_with_rows(capacity + 1);
  pl::RecordingCanvas canvas;
  pl::AssetCache assets;
  pl::PackingSlipRenderer renderer(canvas, assets, {});
  renderer.render_order(order, pl::full_page_region(), pl::full_slip_style());

  ASSERT_EQ(canvas.page_count(), 2u);
  for (std::size_t page = 0; page < 2; ++page) {
    EXPECT_EQ(canvas.count_text(page, "PACKING SLIP"), 1u);
    EXPECT_EQ(canvas.count_text(page, "SHIP TO"), 1u);
    EXPECT_EQ(canvas.count_text(page, "BARCODE"), 1u);
    EXPECT_EQ(canvas.count_text(page, "#500"), 1u);
  }
  EXPECT_EQ(canvas.count_text(0, "Page 1 of 2"), 1u);
  EXPECT_EQ(canvas.count_text(1, "Page 2 of 2"), 1u);
  const std::string last_sku = "DPT16-" + std::to_string(capacity);
  EXPECT_EQ(canvas.count_text(0, last_sku), 0u);
  EXPECT_EQ(canvas.count_text(1, last_sku), 1u);
  // The header is drawn at the same place on both pages.
  EXPECT_DOUBLE_EQ(canvas.text_y(0, "PACKING SLIP"), canvas.text_y(1, "PACKING SLIP"));
}

TEST(PackingSlipLayout, RowsStayInsideContentBoundary) {
  const auto order = order_with_rows(40);
  const auto style = pl::full_slip_style();
  for (const auto& slice : pl::plan_slip(order, pl::full_page_region(), style)) {
    const double bottom = slice.table_top +
                          static_cast<double>(slice.row_count) * (style.row_height + style.row_gap);
    EXPECT_LE(bottom, pl::kContentBottom + 1e-9);
  }
}

TEST(PackingSlipLayout, EmptyMetadataPrintsNA) {
  auto order = order_with_rows(1);
  pl::RecordingCanvas canvas;
  pl::AssetCache assets;
  pl::PackingSlipRenderer renderer(canvas, assets, {});
  renderer.render_order(order, pl::full_page_region(), pl::full_slip_style());
  // PO number, order notes and ship method are absent.
  EXPECT_EQ(canvas.count_text(0, "N/A"), 3u);
  EXPECT_EQ(canvas.count_text(0, "IF-500"), 1u);
}

TEST(PackingSlipLayout, FailedArtworkLeavesBlankSlot) {
  auto order = order_with_rows(1);
  order.artwork_ref = "https://x/art.png";
  pl::RecordingCanvas canvas;
  pl::AssetCache assets;
  assets.store_failure({"https://x/art.png", pl::full_slip_style().artwork_px});
  pl::PackingSlipRenderer renderer(canvas, assets, {});
  renderer.render_order(order, pl::full_page_region(), pl::full_slip_style());
  EXPECT_EQ(canvas.page_count(), 1u);
  EXPECT_EQ(canvas.count_images(0), 0u);
  EXPECT_EQ(canvas.count_text(0, "Custom Artwork"), 1u);
}

TEST(PackingSlipLayout, ResolvedImagesAreDrawn) {
  auto order = order_with_rows(1);
  order.artwork_ref = "https://x/art.png";
  order.items[0].image_ref = "https://x/item.png";
  const auto style = pl::full_slip_style();
  pl::AssetCache assets;
  assets.store({"https://x/art.png", style.artwork_px}, cv::Mat(10, 20, CV_8UC3));
  assets.store({"https://x/item.png", style.item_image_px}, cv::Mat(10, 10, CV_8UC3));
  pl::RecordingCanvas canvas;
  pl::PackingSlipRenderer renderer(canvas, assets, {});
  renderer.render_order(order, pl::full_page_region(), style);
  EXPECT_EQ(canvas.count_images(0), 2u);
}

TEST(PackingSlipLayout, UnencodableBarcodeFallsBackToText) {
  auto order = order_with_rows(2);
  order.items[0].barcode = "caf\xC3\xA9";
  order.items[1].barcode = "PRS-0042";
  pl::RecordingCanvas canvas;
  pl::AssetCache assets;
  pl::PackingSlipRenderer renderer(canvas, assets, {});
  renderer.render_order(order, pl::full_page_region(), pl::full_slip_style());
  EXPECT_EQ(canvas.count_text(0, "caf\xC3\xA9"), 1u);
  EXPECT_EQ(canvas.count_text(0, "PRS-0042"), 0u);
  EXPECT_EQ(canvas.count_images(0), 1u);
}

TEST(PackingSlipLayout, FooterBarcodeRules) {
  auto order = order_with_rows(1);
  EXPECT_FALSE(pl::footer_barcode_allowed(order));
  order.tracking_id = "SS-9";
  EXPECT_FALSE(pl::footer_barcode_allowed(order));
  order.ship_method = "UPS Ground";
  EXPECT_TRUE(pl::footer_barcode_allowed(order));
  order.ship_method = "LTL Freight";
  EXPECT_FALSE(pl::footer_barcode_allowed(order));
  order.ship_method = "Local Pickup - Asheville";
  EXPECT_FALSE(pl::footer_barcode_allowed(order));

  order.ship_method = "UPS Ground";
  pl::RecordingCanvas canvas;
  pl::AssetCache assets;
  pl::PackingSlipRenderer renderer(canvas, assets, {});
  renderer.render_order(order, pl::full_page_region(), pl::full_slip_style());
  EXPECT_EQ(canvas.count_images(0), 1u);
}

TEST(PackingSlipLayout, CompactOmitsPageNumbers) {
  const auto a = order_with_rows(1);
  pl::RecordingCanvas canvas;
  pl::AssetCache assets;
  pl::PackingSlipRenderer renderer(canvas, assets, {});
  renderer.render_two_up(a, &a);
  ASSERT_EQ(canvas.page_count(), 1u);
  EXPECT_EQ(canvas.count_text(0, "PACKING SLIP"), 2u);
  EXPECT_EQ(canvas.count_text(0, "Page 1 of 1"), 0u);
  EXPECT_EQ(canvas.count_dashed_lines(0), 1u);
}

TEST(PackingSlipLayout, AssetRequestsUseStyleSizes) {
  auto order = order_with_rows(2);
  order.artwork_ref = "https://x/art.png";
  order.items[1].image_ref = "https://x/item.png";
  const auto full = pl::slip_asset_requests(order, pl::full_slip_style());
  ASSERT_EQ(full.size(), 2u);
  EXPECT_EQ(full[0], (pl::AssetRequest{"https://x/art.png", 400}));
  EXPECT_EQ(full[1], (pl::AssetRequest{"https://x/item.png", 200}));
  const auto compact = pl::slip_asset_requests(order, pl::compact_slip_style());
  EXPECT_EQ(compact[0].max_px, 200);
  EXPECT_EQ(compact[1].max_px, 100);
}

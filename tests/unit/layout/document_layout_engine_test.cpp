#include <packslip/layout/asset_cache.hpp>
#include <packslip/layout/document_layout_engine.hpp>
#include <packslip/layout/packing_slip_layout.hpp>
#include <packslip/layout/recording_canvas.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace pl = packslip::layout;
namespace pc = packslip::core;

namespace {

pc::ProcessedOrder order(const std::string& id, std::optional<std::string> box,
                         std::size_t rows = 1) {
  pc::ProcessedOrder o;
  o.tranid = "IF-" + id;
  o.order_number = "#" + id;
  o.ship_address = "Customer " + id + "\nAsheville NC 28801";
  o.box_size = std::move(box);
  for (std::size_t i = 0; i < rows; ++i) {
    pc::OrderItem item;
    item.sku = "SKU-" + id + "-" + std::to_string(i);
    item.pick_location = "A1";
    item.image_ref = "https://img.example/" + id + ".png";
    o.items.push_back(item);
  }
  return o;
}

std::vector<std::string> sheet_ids(const std::vector<pl::SlipSheet>& sheets) {
  std::vector<std::string> out;
  for (const auto& s : sheets) {
    std::string id = s.first->tranid;
    if (s.mode == pl::SlipSheet::Mode::TwoUp) id += s.second ? "+" + s.second->tranid : "+";
    out.push_back(id);
  }
  return out;
}

}  // namespace

TEST(DocumentLayoutEngine, ParsesKinds) {
  EXPECT_EQ(pl::parse_document_kind("combined"), pl::DocumentKind::Combined);
  EXPECT_EQ(pl::parse_document_kind("picklist"), pl::DocumentKind::Picklist);
  EXPECT_FALSE(pl::parse_document_kind("labels").has_value());
  EXPECT_STREQ(pl::to_string(pl::DocumentKind::Slips), "slips");
}

TEST(DocumentLayoutEngine, EmptySelectionIsInputError) {
  pl::DocumentLayoutEngine engine;
  pl::RecordingCanvas canvas;
  auto result = engine.render({}, pl::DocumentKind::Slips, pl::AssetCache{}, canvas);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, pc::ErrorCode::InputError);
  EXPECT_EQ(canvas.page_count(), 0u);
}

TEST(DocumentLayoutEngine, ThreeSinglesPairThenLeftover) {
  const std::vector<pc::ProcessedOrder> orders{order("A", "singles"), order("B", "singles"),
                                               order("C", "singles")};
  pl::DocumentLayoutEngine engine;
  pl::RecordingCanvas canvas;
  ASSERT_TRUE(engine.render(orders, pl::DocumentKind::Slips, pl::AssetCache{}, canvas));

  ASSERT_EQ(canvas.page_count(), 2u);
  EXPECT_EQ(canvas.count_text(0, "#A"), 1u);
  EXPECT_EQ(canvas.count_text(0, "#B"), 1u);
  EXPECT_LT(canvas.text_y(0, "#A"), pl::cut_guide_y());
  EXPECT_GT(canvas.text_y(0, "#B"), pl::cut_guide_y());
  EXPECT_EQ(canvas.count_dashed_lines(0), 1u);

  EXPECT_EQ(canvas.count_text(1, "#C"), 1u);
  EXPECT_EQ(canvas.count_text(1, "#A"), 0u);
  EXPECT_EQ(canvas.count_dashed_lines(1), 0u);
  // The leftover is a full-page slip.
  EXPECT_EQ(canvas.count_text(1, "Page 1 of 1"), 1u);
}

TEST(DocumentLayoutEngine, TwoUpFirstThenOthersInInputOrder) {
  const std::vector<pc::ProcessedOrder> orders{order("P", "4pack"), order("A", "singles"),
                                               order("U", std::nullopt), order("B", "singles")};
  const auto sheets = pl::plan_slip_sheets(orders, {});
  EXPECT_EQ(sheet_ids(sheets), (std::vector<std::string>{"IF-A+IF-B", "IF-P", "IF-U"}));
}

TEST(DocumentLayoutEngine, TwoUpCategoriesAreConfigurable) {
  const std::vector<pc::ProcessedOrder> orders{order("A", "singles"), order("S", "2pack")};
  pl::LayoutOptions options;
  EXPECT_EQ(sheet_ids(pl::plan_slip_sheets(orders, options)),
            (std::vector<std::string>{"IF-A", "IF-S"}));
  options.two_up_categories.insert("2pack");
  EXPECT_EQ(sheet_ids(pl::plan_slip_sheets(orders, options)),
            (std::vector<std::string>{"IF-A+IF-S"}));
}

TEST(DocumentLayoutEngine, CandidateTooLongForHalfPageGetsFullPage) {
  const auto long_single = order("L", "singles", 12);
  EXPECT_FALSE(pl::fits_half_page(long_single));
  EXPECT_TRUE(pl::fits_half_page(order("S", "singles")));

  const std::vector<pc::ProcessedOrder> orders{order("A", "singles"), long_single,
                                               order("B", "singles")};
  EXPECT_EQ(sheet_ids(pl::plan_slip_sheets(orders, {})),
            (std::vector<std::string>{"IF-A+IF-B", "IF-L"}));
}

TEST(DocumentLayoutEngine, EveryOtherCategoryGetsDedicatedPages) {
  const std::vector<pc::ProcessedOrder> orders{order("X", "4pack"), order("Y", "4pack")};
  pl::DocumentLayoutEngine engine;
  pl::RecordingCanvas canvas;
  ASSERT_TRUE(engine.render(orders, pl::DocumentKind::Slips, pl::AssetCache{}, canvas));
  ASSERT_EQ(canvas.page_count(), 2u);
  EXPECT_EQ(canvas.count_text(0, "#X"), 1u);
  EXPECT_EQ(canvas.count_text(1, "#Y"), 1u);
}

TEST(DocumentLayoutEngine, CombinedIsPicklistThenSlips) {
  const std::vector<pc::ProcessedOrder> orders{order("A", "singles"), order("X", "4pack")};
  pl::DocumentLayoutEngine engine;
  pl::RecordingCanvas canvas;
  ASSERT_TRUE(engine.render(orders, pl::DocumentKind::Combined, pl::AssetCache{}, canvas));
  ASSERT_EQ(canvas.page_count(), 3u);
  EXPECT_EQ(canvas.count_text(0, "PICKLIST"), 1u);
  EXPECT_EQ(canvas.count_text(0, "PACKING SLIP"), 0u);
  EXPECT_EQ(canvas.count_text(1, "PACKING SLIP"), 1u);
  EXPECT_EQ(canvas.count_text(1, "#A"), 1u);
  EXPECT_EQ(canvas.count_text(2, "#X"), 1u);
}

TEST(DocumentLayoutEngine, AssetRequestsFollowPlacement) {
  const std::vector<pc::ProcessedOrder> orders{order("A", "singles"), order("B", "singles"),
                                               order("X", "4pack")};
  const auto requests = pl::collect_asset_requests(orders, pl::DocumentKind::Slips, {});
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[0], (pl::AssetRequest{"https://img.example/A.png", 100}));
  EXPECT_EQ(requests[1], (pl::AssetRequest{"https://img.example/B.png", 100}));
  EXPECT_EQ(requests[2], (pl::AssetRequest{"https://img.example/X.png", 200}));
  EXPECT_TRUE(pl::collect_asset_requests(orders, pl::DocumentKind::Picklist, {}).empty());
}

TEST(DocumentLayoutEngine, MissingImagesNeverAbort) {
  const std::vector<pc::ProcessedOrder> orders{order("X", "4pack", 3)};
  pl::AssetCache assets;
  for (const auto& r : pl::collect_asset_requests(orders, pl::DocumentKind::Slips, {}))
    assets.store_failure(r);
  pl::DocumentLayoutEngine engine;
  pl::RecordingCanvas canvas;
  ASSERT_TRUE(engine.render(orders, pl::DocumentKind::Slips, assets, canvas));
  EXPECT_EQ(canvas.page_count(), 1u);
  EXPECT_EQ(canvas.count_images(0), 0u);
  EXPECT_EQ(canvas.count_text(0, "SKU-X-2"), 1u);
}

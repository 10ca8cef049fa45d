#include <packslip/app/asset_prefetch.hpp>
#include <packslip/app/document_runner.hpp>
#include <packslip/core/box_size_catalog.hpp>
#include <packslip/core/order_aggregator.hpp>
#include <packslip/core/order_filter.hpp>
#include <packslip/core/record_reader.hpp>
#include <packslip/layout/document_layout_engine.hpp>
#include <packslip/layout/image_source.hpp>
#include <packslip/layout/recording_canvas.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace {

using namespace packslip::core;
using namespace packslip::layout;
using namespace packslip::app;

constexpr const char* kCatalog = R"({
  "packSizes": {
    "4pack": {"name": "4 Pack", "maxItems": 4,
              "combinations": [["DPT10", "DPT10", "DPT10", "DPT10"]]}
  }
})";

std::string line(const std::string& id, const std::string& tranid, const std::string& sku,
                 int qty, const std::string& location) {
  return R"({"recordType": "itemfulfillment", "id": ")" + id + R"(", "values": {
    "tranid": ")" + tranid + R"(",
    "createdFrom.otherrefnum_1": "#)" + tranid + R"(",
    "datecreated": "3/2/2024 9:15 am",
    "shipaddress": "Customer\n1 Main St\nAsheville NC 28801",
    "shipmethod": [{"value": "7", "text": "UPS Ground"}],
    "custbody_pir_shipstation_ordid": "TRK)" + tranid + R"(",
    "item": [{"value": "1", "text": ")" + sku + R"("}],
    "quantity": ")" + std::to_string(qty) + R"(",
    "custcol_custom_image_url": "https://img.example/)" + sku + R"(.png",
    "item.custitem_pir_pick_location": ")" + location + R"("
  }})";
}

std::string export_document() {
  return "[" + line("1", "F1", "DPT16", 1, "A1") + "," + line("2", "F2", "DPT26", 1, "A2") +
         "," + line("3", "F3", "DPT10", 4, "B1") + "," + line("4", "F4", "DPT16", 1, "N/A") +
         "]";
}

std::vector<ProcessedOrder> load_orders() {
  auto records = parse_raw_records(export_document());
  auto catalog = parse_box_size_catalog(kCatalog);
  if (!records || !catalog) return {};
  return aggregate_orders(*records, *catalog);
}

}  // namespace

TEST(DocumentPipeline, RecordsToSlipPages) {
  const auto orders = load_orders();
  ASSERT_EQ(orders.size(), 4u);
  EXPECT_EQ(orders[0].box_size, std::optional<std::string>("singles"));
  EXPECT_EQ(orders[2].box_size, std::optional<std::string>("4pack"));

  MockImageSource images;
  images.set_image("https://img.example/DPT16.png", cv::Mat(50, 50, CV_8UC3, cv::Scalar::all(9)));
  images.set_image("https://img.example/DPT10.png", cv::Mat(50, 50, CV_8UC3, cv::Scalar::all(9)));
  // DPT26 has no image: its slot stays blank.

  const DocumentLayoutEngine engine;
  const auto requests = collect_asset_requests(orders, DocumentKind::Slips, engine.options());
  const auto assets = prefetch_assets_parallel(images, requests, 2);
  EXPECT_EQ(assets.failures(), 1u);

  RecordingCanvas canvas;
  ASSERT_TRUE(engine.render(orders, DocumentKind::Slips, assets, canvas));
  // F1+F2 share a page, F4 is the odd single, F3 gets its own page.
  ASSERT_EQ(canvas.page_count(), 3u);
  EXPECT_EQ(canvas.count_text(0, "#F1"), 1u);
  EXPECT_EQ(canvas.count_text(0, "#F2"), 1u);
  EXPECT_EQ(canvas.count_text(1, "#F4"), 1u);
  EXPECT_EQ(canvas.count_text(2, "#F3"), 1u);
}

TEST(DocumentPipeline, FilteredPicklist) {
  const auto all = load_orders();
  OrderFilter filter;
  filter.box_size = BoxSizeFilter{std::string("singles")};
  const auto orders = filter_orders(all, filter, {"F2"});
  ASSERT_EQ(orders.size(), 3u);

  filter.printed = false;
  const auto unprinted = filter_orders(all, filter, {"F2"});
  ASSERT_EQ(unprinted.size(), 2u);

  DocumentLayoutEngine engine;
  RecordingCanvas canvas;
  ASSERT_TRUE(engine.render(unprinted, DocumentKind::Picklist, AssetCache{}, canvas));
  ASSERT_EQ(canvas.page_count(), 1u);
  EXPECT_EQ(canvas.count_text(0, "2 orders"), 1u);
  EXPECT_EQ(canvas.count_text(0, "A1"), 1u);
  EXPECT_EQ(canvas.count_text(0, "UNASSIGNED"), 1u);
  // Same SKU at two locations: two rows of one block.
  EXPECT_EQ(canvas.count_text(0, "DPT16"), 2u);
  EXPECT_EQ(canvas.count_text(0, "#F1 x1"), 1u);
  EXPECT_EQ(canvas.count_text(0, "#F4 x1"), 1u);
}

TEST(DocumentPipeline, EmptySelectionIsRejected) {
  MockImageSource images;
  auto bytes = generate_document({}, DocumentKind::Combined, default_config(), images);
  ASSERT_FALSE(bytes.has_value());
  EXPECT_EQ(bytes.error().code, ErrorCode::InputError);
  EXPECT_EQ(images.fetch_count(), 0u);
}

TEST(DocumentPipeline, WritesOutputAtomically) {
  const auto dir = std::filesystem::temp_directory_path() / "packslip_pipeline_test";
  std::filesystem::create_directories(dir);
  const auto path = dir / "slips.pdf";

  ASSERT_TRUE(write_document_atomically(path.string(), "%PDF-1.4 first"));
  ASSERT_TRUE(write_document_atomically(path.string(), "%PDF-1.4 second"));
  std::ifstream in(path, std::ios::binary);
  const std::string contents((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());
  EXPECT_EQ(contents, "%PDF-1.4 second");
  EXPECT_FALSE(std::filesystem::exists(dir / "slips.pdf.tmp"));

  auto failed = write_document_atomically((dir / "missing" / "x.pdf").string(), "x");
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error().code, ErrorCode::IoError);
  std::filesystem::remove_all(dir);
}

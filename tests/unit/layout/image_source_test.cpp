#include <packslip/layout/asset_cache.hpp>
#include <packslip/layout/geometry.hpp>
#include <packslip/layout/image_source.hpp>
#include <packslip/layout/recording_canvas.hpp>
#include <gtest/gtest.h>
#include <string>

namespace pl = packslip::layout;
namespace pc = packslip::core;

namespace {

// 1x1 RGBA PNG.
constexpr const char* kPixelPng =
    "data:image/png;base64,"
    "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mNk+M9QDwADhgGAWjR9awAAAABJRU5ErkJggg==";

cv::Mat solid(int w, int h) { return cv::Mat(h, w, CV_8UC3, cv::Scalar(10, 20, 30)); }

}  // namespace

TEST(ImageUrl, ImgixGetsSizeParameters) {
  EXPECT_EQ(pl::optimize_image_url("https://shop.imgix.net/a.png", 200, 200),
            "https://shop.imgix.net/a.png?w=200&h=200&auto=compress,format");
  EXPECT_EQ(pl::optimize_image_url("https://shop.imgix.net/a.png?v=2", 100, 100),
            "https://shop.imgix.net/a.png?v=2&w=100&h=100&auto=compress,format");
}

TEST(ImageUrl, OtherHostsUnchanged) {
  EXPECT_EQ(pl::optimize_image_url("https://cdn.example/a.png", 200, 200),
            "https://cdn.example/a.png");
  EXPECT_EQ(pl::optimize_image_url(kPixelPng, 200, 200), kPixelPng);
}

TEST(DataUri, DecodesBase64Png) {
  auto image = pl::decode_data_uri(kPixelPng);
  ASSERT_TRUE(image.has_value()) << image.error().message;
  EXPECT_EQ(image->cols, 1);
  EXPECT_EQ(image->rows, 1);
}

TEST(DataUri, RejectsMalformed) {
  auto not_data = pl::decode_data_uri("https://x/y.png");
  ASSERT_FALSE(not_data.has_value());
  EXPECT_EQ(not_data.error().code, pc::ErrorCode::AssetError);
  EXPECT_FALSE(pl::decode_data_uri("data:image/png;base64").has_value());
  EXPECT_FALSE(pl::decode_data_uri("data:text/plain,hello").has_value());
  EXPECT_FALSE(pl::decode_data_uri("data:image/png;base64,bm90IGFuIGltYWdl").has_value());
}

TEST(ImageBytes, GarbageIsAssetError) {
  auto decoded = pl::decode_image_bytes("definitely not an image");
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error().code, pc::ErrorCode::AssetError);
  EXPECT_FALSE(pl::decode_image_bytes("").has_value());
}

TEST(ImageScaling, ShrinkPreservesAspect) {
  const auto out = pl::shrink_to_fit(solid(400, 200), 100);
  EXPECT_EQ(out.cols, 100);
  EXPECT_EQ(out.rows, 50);
  EXPECT_EQ(pl::shrink_to_fit(solid(40, 20), 100).cols, 40);
}

TEST(ImageScaling, FitCenteredInBox) {
  const auto r = pl::fit_centered(200, 100, pl::Rect{1.0, 1.0, 1.0, 1.0});
  EXPECT_DOUBLE_EQ(r.w, 1.0);
  EXPECT_DOUBLE_EQ(r.h, 0.5);
  EXPECT_DOUBLE_EQ(r.x, 1.0);
  EXPECT_DOUBLE_EQ(r.y, 1.25);
  EXPECT_DOUBLE_EQ(pl::fit_centered(0, 10, pl::Rect{0, 0, 1, 1}).w, 0.0);
}

TEST(TextFitting, TruncatesWithEllipsis) {
  pl::RecordingCanvas canvas;
  canvas.set_font(pl::FontWeight::Regular, 72.0);  // 0.5 in per character
  EXPECT_EQ(pl::fit_text(canvas, "ABCD", 2.0), "ABCD");
  EXPECT_EQ(pl::fit_text(canvas, "ABCDEFG", 2.5), "AB...");
  EXPECT_EQ(pl::fit_text(canvas, "ABCDEFG", 1.0), "");
  EXPECT_EQ(pl::fit_text(canvas, "ABC", 0.0), "");
}

TEST(TextFitting, NeverSplitsUtf8) {
  pl::RecordingCanvas canvas;
  canvas.set_font(pl::FontWeight::Regular, 72.0);
  // "é" is two bytes; the fitted text must stay valid UTF-8.
  const auto fitted = pl::fit_text(canvas, "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9", 3.0);
  EXPECT_EQ(fitted, "\xC3\xA9...");
}

TEST(AssetCache, FailureIsBlankSlot) {
  pl::AssetCache cache;
  cache.store({"a", 200}, solid(4, 4));
  cache.store_failure({"b", 200});
  ASSERT_NE(cache.find("a", 200), nullptr);
  EXPECT_EQ(cache.find("a", 200)->cols, 4);
  EXPECT_EQ(cache.find("a", 100), nullptr);
  EXPECT_EQ(cache.find("b", 200), nullptr);
  EXPECT_TRUE(cache.contains({"b", 200}));
  EXPECT_EQ(cache.size(), 2u);
  EXPECT_EQ(cache.failures(), 1u);
}

TEST(AssetCache, UniqueRequestsKeepFirstSeenOrder) {
  const auto unique = pl::unique_requests({{"b", 1}, {"a", 1}, {"b", 1}, {"b", 2}});
  ASSERT_EQ(unique.size(), 3u);
  EXPECT_EQ(unique[0], (pl::AssetRequest{"b", 1}));
  EXPECT_EQ(unique[1], (pl::AssetRequest{"a", 1}));
  EXPECT_EQ(unique[2], (pl::AssetRequest{"b", 2}));
}

TEST(MockImageSource, ServesConfiguredImages) {
  pl::MockImageSource source;
  source.set_image("https://x/a.png", solid(400, 400));
  source.set_failure("https://x/broken.png");

  auto a = source.fetch("https://x/a.png", 100);
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->cols, 100);
  EXPECT_FALSE(source.fetch("https://x/broken.png", 100).has_value());
  EXPECT_FALSE(source.fetch("https://x/unknown.png", 100).has_value());
  EXPECT_TRUE(source.fetch(kPixelPng, 100).has_value());
  EXPECT_EQ(source.fetch_count(), 4u);
}

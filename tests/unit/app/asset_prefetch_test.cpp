#include <packslip/app/asset_prefetch.hpp>
#include <packslip/layout/image_source.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace pa = packslip::app;
namespace pl = packslip::layout;

namespace {

void populate(pl::MockImageSource& source, int ok, int failing) {
  for (int i = 0; i < ok; ++i)
    source.set_image("img" + std::to_string(i), cv::Mat(4 + i, 4, CV_8UC3, cv::Scalar(i, i, i)));
  for (int i = 0; i < failing; ++i) source.set_failure("bad" + std::to_string(i));
}

}  // namespace

TEST(AssetPrefetch, SequentialStoresImagesAndFailures) {
  pl::MockImageSource source;
  populate(source, 2, 1);
  const std::vector<pl::AssetRequest> requests{{"img0", 200}, {"bad0", 200}, {"img1", 100}};
  const auto cache = pa::prefetch_assets(source, requests);
  EXPECT_EQ(cache.size(), 3u);
  EXPECT_EQ(cache.failures(), 1u);
  ASSERT_NE(cache.find("img1", 100), nullptr);
  EXPECT_EQ(cache.find("img1", 100)->rows, 5);
  EXPECT_EQ(cache.find("bad0", 200), nullptr);
  EXPECT_TRUE(cache.contains({"bad0", 200}));
}

TEST(AssetPrefetch, DuplicateRequestsFetchOnce) {
  pl::MockImageSource source;
  populate(source, 1, 0);
  const auto cache = pa::prefetch_assets(source, {{"img0", 200}, {"img0", 200}});
  EXPECT_EQ(source.fetch_count(), 1u);
  EXPECT_EQ(cache.size(), 1u);
}

TEST(AssetPrefetch, ParallelMatchesSequential) {
  pl::MockImageSource source;
  populate(source, 16, 4);
  std::vector<pl::AssetRequest> requests;
  for (int i = 0; i < 16; ++i) requests.push_back({"img" + std::to_string(i), 200});
  for (int i = 0; i < 4; ++i) requests.push_back({"bad" + std::to_string(i), 200});
  requests.push_back({"unknown", 200});

  const auto cache = pa::prefetch_assets_parallel(source, requests, 4);
  EXPECT_EQ(source.fetch_count(), requests.size());
  EXPECT_EQ(cache.size(), requests.size());
  EXPECT_EQ(cache.failures(), 5u);
  for (int i = 0; i < 16; ++i) {
    const auto* image = cache.find("img" + std::to_string(i), 200);
    ASSERT_NE(image, nullptr) << i;
    EXPECT_EQ(image->rows, 4 + i);
  }
}

TEST(AssetPrefetch, ParallelWithNoRequests) {
  pl::MockImageSource source;
  populate(source, 0, 0);
  const auto cache = pa::prefetch_assets_parallel(source, {}, 0);
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_EQ(source.fetch_count(), 0u);
}

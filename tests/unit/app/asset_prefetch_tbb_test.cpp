#ifdef PACKSLIP_HAS_TBB

#include <packslip/app/asset_prefetch_tbb.hpp>
#include <packslip/layout/image_source.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <thread>
#include <vector>

namespace {

void populate(packslip::layout::MockImageSource& source, int count) {
  for (int i = 0; i < count; ++i)
    source.set_image("img" + std::to_string(i), cv::Mat(2, 2 + i, CV_8UC3, cv::Scalar::all(0)));
}

// Records the largest number of fetch() calls in flight at once.
class ConcurrencyTrackingSource : public packslip::layout::IImageSource {
 public:
  std::expected<cv::Mat, packslip::core::Error> fetch(const std::string&, int) override {
    const std::size_t now = ++in_flight_;
    std::size_t seen = peak_.load();
    while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    --in_flight_;
    return cv::Mat(1, 1, CV_8UC3, cv::Scalar::all(0));
  }

  [[nodiscard]] std::size_t peak() const noexcept { return peak_.load(); }

 private:
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::size_t> peak_{0};
};

}  // namespace

TEST(AssetPrefetchTbbTest, WorkerLimitBoundsConcurrentFetches) {
  std::vector<packslip::layout::AssetRequest> requests;
  for (int i = 0; i < 64; ++i) requests.push_back({"img" + std::to_string(i), 100});

  ConcurrencyTrackingSource serial;
  const auto one = packslip::app::prefetch_assets_tbb(serial, requests, 1);
  EXPECT_EQ(one.size(), requests.size());
  EXPECT_EQ(serial.peak(), 1u);

  ConcurrencyTrackingSource bounded;
  const auto two = packslip::app::prefetch_assets_tbb(bounded, requests, 2);
  EXPECT_EQ(two.size(), requests.size());
  EXPECT_LE(bounded.peak(), 2u);
}

TEST(AssetPrefetchTbbTest, ResolvesEveryRequest) {
  packslip::layout::MockImageSource source;
  populate(source, 32);
  std::vector<packslip::layout::AssetRequest> requests;
  for (int i = 0; i < 32; ++i) requests.push_back({"img" + std::to_string(i), 100});
  requests.push_back({"missing", 100});

  const auto cache = packslip::app::prefetch_assets_tbb(source, requests);
  EXPECT_EQ(source.fetch_count(), requests.size());
  EXPECT_EQ(cache.size(), requests.size());
  EXPECT_EQ(cache.failures(), 1u);
  for (int i = 0; i < 32; ++i) {
    const auto* image = cache.find("img" + std::to_string(i), 100);
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->cols, 2 + i);
  }
}

TEST(AssetPrefetchTbbTest, EmptyRequestsFetchNothing) {
  packslip::layout::MockImageSource source;
  populate(source, 1);
  const auto cache = packslip::app::prefetch_assets_tbb(source, {});
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_EQ(source.fetch_count(), 0u);
}

#endif  // PACKSLIP_HAS_TBB

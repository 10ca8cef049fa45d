#pragma once

#include <opencv2/core/mat.hpp>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace packslip::layout {

/// One image to resolve before layout: reference plus requested pixel bound.
struct AssetRequest {
  std::string ref;
  int max_px{0};

  auto operator<=>(const AssetRequest&) const = default;
};

/// Images resolved ahead of layout so rows are placed in input order regardless of
/// fetch completion order. A failed request is remembered as a blank slot.
class AssetCache {
 public:
  void store(const AssetRequest& request, cv::Mat image);
  void store_failure(const AssetRequest& request);

  /// Decoded image, or nullptr when the request failed or was never resolved.
  [[nodiscard]] const cv::Mat* find(const std::string& ref, int max_px) const;
  [[nodiscard]] bool contains(const AssetRequest& request) const;

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] std::size_t failures() const noexcept { return failures_; }

 private:
  std::map<AssetRequest, cv::Mat> entries_;  // empty Mat = failed
  std::size_t failures_{0};
};

/// Requests in first-seen order without duplicates.
[[nodiscard]] std::vector<AssetRequest> unique_requests(std::vector<AssetRequest> requests);

}  // namespace packslip::layout

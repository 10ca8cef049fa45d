#pragma once

#include <packslip/core/error.hpp>
#include <opencv2/core/mat.hpp>
#include <atomic>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace packslip::layout {

/// Resolves an image reference (http(s) URL or data: URI) to a decoded BGR(A) image.
/// Implementations must be safe to call from several threads at once.
class IImageSource {
 public:
  virtual ~IImageSource() = default;

  /// max_px is a hint for hosts that can down-sample server side.
  [[nodiscard]] virtual std::expected<cv::Mat, packslip::core::Error> fetch(
      const std::string& ref, int max_px) = 0;
};

/// Adds resize/compress query parameters for hosts that support them (imgix).
[[nodiscard]] std::string optimize_image_url(std::string_view url, int max_w, int max_h);

/// Decodes a base64 "data:image/...;base64," URI.
[[nodiscard]] std::expected<cv::Mat, packslip::core::Error> decode_data_uri(
    std::string_view uri);

/// Decodes encoded image bytes (PNG, JPEG, ...).
[[nodiscard]] std::expected<cv::Mat, packslip::core::Error> decode_image_bytes(
    std::string_view bytes);

/// Down-samples so neither side exceeds max_px, preserving aspect ratio.
[[nodiscard]] cv::Mat shrink_to_fit(const cv::Mat& image, int max_px);

struct HttpImageOptions {
  long timeout_ms{10000};
  std::string user_agent{"packslip/1.0"};
};

/// libcurl-backed source; data: URIs are decoded without a request.
class HttpImageSource : public IImageSource {
 public:
  explicit HttpImageSource(HttpImageOptions options = {});
  ~HttpImageSource() override;

  HttpImageSource(const HttpImageSource&) = delete;
  HttpImageSource& operator=(const HttpImageSource&) = delete;

  [[nodiscard]] std::expected<cv::Mat, packslip::core::Error> fetch(
      const std::string& ref, int max_px) override;

 private:
  HttpImageOptions options_;
};

/// In-memory source for tests/demo: refs map to fixed images, everything else fails.
class MockImageSource : public IImageSource {
 public:
  void set_image(const std::string& ref, cv::Mat image);
  void set_failure(const std::string& ref);

  [[nodiscard]] std::expected<cv::Mat, packslip::core::Error> fetch(
      const std::string& ref, int max_px) override;

  [[nodiscard]] std::size_t fetch_count() const noexcept { return fetch_count_.load(); }

 private:
  std::unordered_map<std::string, cv::Mat> images_;
  std::unordered_set<std::string> failures_;
  std::atomic<std::size_t> fetch_count_{0};
};

}  // namespace packslip::layout

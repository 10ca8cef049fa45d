#include <packslip/layout/image_source.hpp>
#include <curl/curl.h>
#include <glog/logging.h>
#include <memory>
#include <mutex>

namespace packslip::layout {

namespace {

using packslip::core::Error;
using packslip::core::ErrorCode;

std::once_flag g_curl_init;

struct CurlDeleter {
  void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

std::size_t append_body(char* data, std::size_t size, std::size_t count, void* user) {
  auto* body = static_cast<std::string*>(user);
  body->append(data, size * count);
  return size * count;
}

}  // namespace

HttpImageSource::HttpImageSource(HttpImageOptions options) : options_(std::move(options)) {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpImageSource::~HttpImageSource() = default;

std::expected<cv::Mat, Error> HttpImageSource::fetch(const std::string& ref, int max_px) {
  if (ref.starts_with("data:")) {
    auto decoded = decode_data_uri(ref);
    if (!decoded) return decoded;
    return shrink_to_fit(*decoded, max_px);
  }

  const std::string url = optimize_image_url(ref, max_px, max_px);
  std::unique_ptr<CURL, CurlDeleter> handle(curl_easy_init());
  if (!handle) return std::unexpected(Error{ErrorCode::AssetError, "curl_easy_init failed"});

  std::string body;
  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, options_.timeout_ms);
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &append_body);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &body);

  const CURLcode rc = curl_easy_perform(handle.get());
  if (rc != CURLE_OK) {
    return std::unexpected(Error{ErrorCode::AssetError,
                                 "fetch " + url + " failed: " + curl_easy_strerror(rc)});
  }
  long status = 0;
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    return std::unexpected(Error{ErrorCode::AssetError,
                                 "fetch " + url + " returned HTTP " + std::to_string(status)});
  }
  VLOG(2) << "Fetched " << body.size() << " bytes from " << url;

  auto decoded = decode_image_bytes(body);
  if (!decoded) return decoded;
  return shrink_to_fit(*decoded, max_px);
}

}  // namespace packslip::layout

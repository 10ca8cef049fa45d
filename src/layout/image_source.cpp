#include <packslip/layout/image_source.hpp>
#include <glog/logging.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <vector>

namespace packslip::layout {

namespace {

using packslip::core::Error;
using packslip::core::ErrorCode;

int base64_value(unsigned char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+' || c == '-') return 62;
  if (c == '/' || c == '_') return 63;
  return -1;
}

std::expected<std::string, Error> base64_decode(std::string_view text) {
  std::string out;
  out.reserve(text.size() * 3 / 4);
  int buffer = 0;
  int bits = 0;
  for (unsigned char c : text) {
    if (c == '=') break;
    if (c == '\n' || c == '\r' || c == ' ') continue;
    const int v = base64_value(c);
    if (v < 0) return std::unexpected(Error{ErrorCode::AssetError, "invalid base64 payload"});
    buffer = ((buffer << 6) | v) & 0xFFFFFF;
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
    }
  }
  return out;
}

}  // namespace

std::string optimize_image_url(std::string_view url, int max_w, int max_h) {
  if (url.starts_with("data:")) return std::string(url);
  if (url.find("imgix.net") == std::string_view::npos) return std::string(url);
  const char separator = url.find('?') == std::string_view::npos ? '?' : '&';
  return std::string(url) + separator + "w=" + std::to_string(max_w) + "&h=" +
         std::to_string(max_h) + "&auto=compress,format";
}

std::expected<cv::Mat, Error> decode_image_bytes(std::string_view bytes) {
  if (bytes.empty()) return std::unexpected(Error{ErrorCode::AssetError, "empty image payload"});
  std::vector<unsigned char> buf(bytes.begin(), bytes.end());
  cv::Mat image;
  try {
    image = cv::imdecode(buf, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    return std::unexpected(Error{ErrorCode::AssetError, std::string("decode failed: ") + e.what()});
  }
  if (image.empty()) return std::unexpected(Error{ErrorCode::AssetError, "undecodable image"});
  if (image.depth() != CV_8U) {
    cv::Mat converted;
    image.convertTo(converted, CV_8U, image.depth() == CV_16U ? 1.0 / 257.0 : 1.0);
    image = converted;
  }
  return image;
}

std::expected<cv::Mat, Error> decode_data_uri(std::string_view uri) {
  if (!uri.starts_with("data:")) {
    return std::unexpected(Error{ErrorCode::AssetError, "not a data URI"});
  }
  const auto comma = uri.find(',');
  if (comma == std::string_view::npos) {
    return std::unexpected(Error{ErrorCode::AssetError, "data URI without payload"});
  }
  const std::string_view header = uri.substr(0, comma);
  if (header.find(";base64") == std::string_view::npos) {
    return std::unexpected(Error{ErrorCode::AssetError, "only base64 data URIs are supported"});
  }
  auto bytes = base64_decode(uri.substr(comma + 1));
  if (!bytes) return std::unexpected(bytes.error());
  return decode_image_bytes(*bytes);
}

cv::Mat shrink_to_fit(const cv::Mat& image, int max_px) {
  if (image.empty() || max_px <= 0) return image;
  const int longest = std::max(image.cols, image.rows);
  if (longest <= max_px) return image;
  const double scale = static_cast<double>(max_px) / longest;
  cv::Mat out;
  cv::resize(image, out,
             cv::Size(std::max(1, static_cast<int>(image.cols * scale)),
                      std::max(1, static_cast<int>(image.rows * scale))),
             0, 0, cv::INTER_AREA);
  return out;
}

void MockImageSource::set_image(const std::string& ref, cv::Mat image) {
  images_[ref] = std::move(image);
}

void MockImageSource::set_failure(const std::string& ref) { failures_.insert(ref); }

std::expected<cv::Mat, Error> MockImageSource::fetch(const std::string& ref, int max_px) {
  ++fetch_count_;
  if (failures_.contains(ref)) {
    return std::unexpected(Error{ErrorCode::AssetError, "mock failure for " + ref});
  }
  if (ref.starts_with("data:")) {
    auto decoded = decode_data_uri(ref);
    if (!decoded) return decoded;
    return shrink_to_fit(*decoded, max_px);
  }
  auto it = images_.find(ref);
  if (it == images_.end()) {
    return std::unexpected(Error{ErrorCode::AssetError, "no mock image for " + ref});
  }
  return shrink_to_fit(it->second, max_px);
}

}  // namespace packslip::layout

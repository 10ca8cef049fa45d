#include <packslip/layout/asset_cache.hpp>
#include <set>

namespace packslip::layout {

void AssetCache::store(const AssetRequest& request, cv::Mat image) {
  if (image.empty()) {
    store_failure(request);
    return;
  }
  entries_[request] = std::move(image);
}

void AssetCache::store_failure(const AssetRequest& request) {
  entries_[request] = cv::Mat();
  ++failures_;
}

const cv::Mat* AssetCache::find(const std::string& ref, int max_px) const {
  auto it = entries_.find(AssetRequest{ref, max_px});
  if (it == entries_.end() || it->second.empty()) return nullptr;
  return &it->second;
}

bool AssetCache::contains(const AssetRequest& request) const {
  return entries_.contains(request);
}

std::vector<AssetRequest> unique_requests(std::vector<AssetRequest> requests) {
  std::set<AssetRequest> seen;
  std::vector<AssetRequest> out;
  out.reserve(requests.size());
  for (auto& r : requests) {
    if (r.ref.empty()) continue;
    if (seen.insert(r).second) out.push_back(std::move(r));
  }
  return out;
}

}  // namespace packslip::layout

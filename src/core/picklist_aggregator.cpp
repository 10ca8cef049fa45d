#include <packslip/core/picklist_aggregator.hpp>
#include <packslip/core/item_normalizer.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include <tuple>

namespace packslip::core {

namespace {

std::string upper_copy(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

/// Sort key placing placeholder locations after every real one.
std::tuple<bool, std::string> location_key(const std::optional<std::string>& location) {
  if (is_placeholder_location(location)) return {true, std::string()};
  return {false, *location};
}

bool record_less(const PicklistRecord& a, const PicklistRecord& b) {
  const auto ka = location_key(a.location);
  const auto kb = location_key(b.location);
  if (ka != kb) return ka < kb;
  return a.sku < b.sku;
}

}  // namespace

bool is_placeholder_location(const std::optional<std::string>& location) {
  if (!location) return true;
  const std::string value = upper_copy(*location);
  return value.empty() || value == "N/A" || value == "NA" || value == "-" || value == "TBD" ||
         value == "NONE";
}

std::vector<PicklistRecord> aggregate_picklist(const std::vector<ProcessedOrder>& orders) {
  std::vector<PicklistRecord> records;
  std::map<std::pair<std::string, std::string>, std::size_t> index;

  for (const auto& order : orders) {
    for (const auto& item : order.items) {
      const auto key = std::make_pair(item.pick_location.value_or(""), item.sku);
      auto [it, inserted] = index.try_emplace(key, records.size());
      if (inserted) {
        PicklistRecord rec;
        rec.location = item.pick_location;
        rec.sku = item.sku;
        rec.base_sku = base_sku(item.sku);
        rec.personalized = is_personalized_sku(item.sku);
        records.push_back(std::move(rec));
      }
      PicklistRecord& rec = records[it->second];
      rec.total_quantity += item.quantity;
      if (!rec.orders.empty() && rec.orders.back().tranid == order.tranid) {
        rec.orders.back().quantity += item.quantity;
      } else {
        rec.orders.push_back(OrderQuantity{order.tranid, order.order_number, item.quantity});
      }
    }
  }
  return records;
}

std::size_t PicklistBlock::row_count() const noexcept {
  return std::max<std::size_t>({personalized.size(), standard.size(), 1});
}

std::optional<std::string> PicklistBlock::sort_location() const {
  if (!personalized.empty()) return personalized.front().location;
  if (!standard.empty()) return standard.front().location;
  return std::nullopt;
}

std::vector<PicklistBlock> build_picklist_blocks(const std::vector<PicklistRecord>& records) {
  std::map<std::string, PicklistBlock> by_base;
  for (const auto& rec : records) {
    PicklistBlock& block = by_base[rec.base_sku];
    block.base_sku = rec.base_sku;
    (rec.personalized ? block.personalized : block.standard).push_back(rec);
  }

  std::vector<PicklistBlock> blocks;
  blocks.reserve(by_base.size());
  for (auto& [base, block] : by_base) {
    std::sort(block.personalized.begin(), block.personalized.end(), record_less);
    std::sort(block.standard.begin(), block.standard.end(), record_less);
    blocks.push_back(std::move(block));
  }

  std::stable_sort(blocks.begin(), blocks.end(),
                   [](const PicklistBlock& a, const PicklistBlock& b) {
                     const auto ka = location_key(a.sort_location());
                     const auto kb = location_key(b.sort_location());
                     if (ka != kb) return ka < kb;
                     return a.base_sku < b.base_sku;
                   });
  return blocks;
}

}  // namespace packslip::core

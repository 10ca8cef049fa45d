#include <packslip/core/item_normalizer.hpp>
#include <glog/logging.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <unordered_set>

namespace packslip::core {

namespace {

constexpr std::string_view kPrefixFamily = "DPT";

bool is_kit(const RawRecord& r) {
  return r.item_type.has_value() && *r.item_type == "Kit";
}

std::string trim_copy(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(start, end - start + 1));
}

std::uint32_t parse_quantity(const std::optional<std::string>& text) {
  if (!text) return 1;
  const std::string t = trim_copy(*text);
  long value = 0;
  const auto* begin = t.data();
  const auto* end = t.data() + t.size();
  if (begin != end && *begin == '+') ++begin;
  auto [ptr, ec] = std::from_chars(begin, end, value);
  // Leading integer wins ("3.0" -> 3); anything non-positive falls back to 1.
  if (ec != std::errc{} || ptr == begin || value <= 0) return 1;
  if (value > static_cast<long>(kMaxLineQuantity)) {
    LOG(WARNING) << "Quantity '" << t << "' exceeds " << kMaxLineQuantity << "; using 1";
    return 1;
  }
  return static_cast<std::uint32_t>(value);
}

}  // namespace

std::optional<std::string> extract_sku_prefix(std::string_view sku) {
  if (sku.size() < 5) return std::nullopt;
  std::string prefix(sku.substr(0, 5));
  std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (prefix.compare(0, kPrefixFamily.size(), kPrefixFamily) != 0) return std::nullopt;
  if (!std::isdigit(static_cast<unsigned char>(prefix[3])) ||
      !std::isdigit(static_cast<unsigned char>(prefix[4]))) {
    return std::nullopt;
  }
  return prefix;
}

std::optional<std::string> size_from_prefix(const std::optional<std::string>& prefix) {
  if (!prefix || prefix->size() != 5) return std::nullopt;
  const std::string digits = prefix->substr(3, 2);
  if (digits == "10" || digits == "16" || digits == "26") return digits + "oz";
  return std::nullopt;
}

bool is_http_url(std::string_view text) noexcept {
  return text.starts_with("http://") || text.starts_with("https://");
}

std::string base_sku(std::string_view sku) {
  if (sku.ends_with(kPersonalizationSuffix)) {
    sku.remove_suffix(kPersonalizationSuffix.size());
  }
  return std::string(sku);
}

bool is_personalized_sku(std::string_view sku) noexcept {
  return sku.ends_with(kPersonalizationSuffix);
}

const FallbackChain<RawRecord>& alternate_image_chain() {
  static const FallbackChain<RawRecord> chain({
      field(&RawRecord::custom_image_url),
      field(&RawRecord::custcol1),
      field(&RawRecord::custcol1_1),
  });
  return chain;
}

OrderItem normalize_item(const RawRecord& record) {
  OrderItem item;
  item.sku = record.sku;
  item.sku_prefix = extract_sku_prefix(record.sku);
  item.size = size_from_prefix(item.sku_prefix);
  item.quantity = parse_quantity(record.quantity);
  item.color = record.color;
  item.barcode = record.barcode;

  const std::string dual = record.formulatext.value_or("");
  const bool dual_is_image = is_http_url(dual);
  if (dual_is_image) {
    item.image_ref = dual;
  } else {
    item.image_ref = alternate_image_chain().resolve(record);
  }

  if (record.formulatext_1 && !record.formulatext_1->empty()) {
    item.description = *record.formulatext_1;
  } else if (!dual_is_image) {
    item.description = dual;
  }

  if (record.pick_location) {
    std::string loc = trim_copy(*record.pick_location);
    if (!loc.empty()) item.pick_location = std::move(loc);
  }
  return item;
}

std::vector<RawRecord> dedupe_kit_components(const std::vector<RawRecord>& group) {
  std::unordered_set<std::string> kit_bases;
  for (const auto& r : group) {
    if (is_kit(r)) kit_bases.insert(base_sku(r.sku));
  }
  if (kit_bases.empty()) return group;

  std::vector<RawRecord> kept;
  kept.reserve(group.size());
  for (const auto& r : group) {
    if (is_kit(r) || !kit_bases.contains(base_sku(r.sku))) {
      kept.push_back(r);
    }
  }
  return kept;
}

}  // namespace packslip::core

#include <packslip/core/box_size_catalog.hpp>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace packslip::core {

BoxSizeCatalog::BoxSizeCatalog(std::vector<BoxSizeConfig> entries)
    : entries_(std::move(entries)) {
  for (auto& entry : entries_) {
    for (auto& combo : entry.combinations) {
      std::sort(combo.begin(), combo.end());
    }
  }
}

const BoxSizeConfig* BoxSizeCatalog::find(std::string_view key) const noexcept {
  for (const auto& entry : entries_) {
    if (entry.key == key) return &entry;
  }
  return nullptr;
}

std::expected<BoxSizeCatalog, Error> parse_box_size_catalog(std::string_view json_text) {
  // ordered_json keeps the document's key order, which decides match precedence.
  nlohmann::ordered_json doc;
  try {
    doc = nlohmann::ordered_json::parse(json_text);
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(Error{ErrorCode::ConfigError,
                                 std::string("box-size catalog is not valid JSON: ") + e.what()});
  }

  if (!doc.is_object() || !doc.contains("packSizes") || !doc["packSizes"].is_object()) {
    return std::unexpected(
        Error{ErrorCode::ConfigError, "box-size catalog must contain a packSizes object"});
  }

  std::vector<BoxSizeConfig> entries;
  try {
    for (const auto& [key, value] : doc["packSizes"].items()) {
      BoxSizeConfig cfg;
      cfg.key = key;
      cfg.name = value.value("name", key);
      cfg.max_items = value.value("maxItems", 0u);
      if (value.contains("combinations")) {
        for (const auto& combo : value.at("combinations")) {
          cfg.combinations.push_back(combo.get<std::vector<std::string>>());
        }
      }
      entries.push_back(std::move(cfg));
    }
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(Error{ErrorCode::ConfigError,
                                 std::string("malformed box-size entry: ") + e.what()});
  }

  VLOG(1) << "Loaded box-size catalog with " << entries.size() << " entries";
  return BoxSizeCatalog(std::move(entries));
}

std::expected<BoxSizeCatalog, Error> load_box_size_catalog(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(Error{ErrorCode::IoError, "cannot open box-size catalog: " + path});
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return parse_box_size_catalog(ss.str());
}

}  // namespace packslip::core

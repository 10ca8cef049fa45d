#include <packslip/app/config.hpp>
#include <glog/logging.h>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string_view>

namespace packslip::app {

namespace {

using packslip::core::Error;
using packslip::core::ErrorCode;

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

template <typename T>
bool parse_number(const std::string& value, T& out) {
  const char* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, out);
  return ec == std::errc{} && ptr == end;
}

bool parse_bool(const std::string& value, bool& out) {
  if (value == "true" || value == "yes" || value == "1") {
    out = true;
    return true;
  }
  if (value == "false" || value == "no" || value == "0") {
    out = false;
    return true;
  }
  return false;
}

std::set<std::string> parse_list(const std::string& value) {
  std::set<std::string> out;
  std::stringstream in(value);
  std::string item;
  while (std::getline(in, item, ',')) {
    trim(item);
    if (!item.empty()) out.insert(item);
  }
  return out;
}

Error bad_value(const std::string& key, const std::string& value) {
  return Error{ErrorCode::ConfigError, "Invalid value for " + key + ": '" + value + "'"};
}

}  // namespace

AppConfig default_config() { return AppConfig{}; }

std::expected<AppConfig, Error> parse_config(const std::string& text) {
  AppConfig c = default_config();
  std::istringstream f(text);

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    bool ok = true;
    if (key == "catalog_path") c.catalog_path = value;
    else if (key == "two_up_categories") {
      c.two_up_categories = parse_list(value);
      ok = !c.two_up_categories.empty();
    }
    else if (key == "image_timeout_ms")
      ok = parse_number(value, c.image_timeout_ms) && c.image_timeout_ms > 0;
    else if (key == "image_fetch_parallelism") ok = parse_number(value, c.image_fetch_parallelism);
    else if (key == "barcode_print_scale")
      ok = parse_number(value, c.barcode_print_scale) && c.barcode_print_scale > 0;
    else if (key == "printed_store_path") c.printed_store_path = value;
    else if (key == "sort_by_zone") ok = parse_bool(value, c.sort_by_zone);
    else LOG(WARNING) << "Ignoring unknown config key '" << key << "'";

    if (!ok) return std::unexpected(bad_value(key, value));
  }
  return c;
}

std::expected<AppConfig, Error> load_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    LOG(WARNING) << "Config " << path << " not found; using defaults";
    return default_config();
  }
  std::ostringstream buffer;
  buffer << f.rdbuf();
  return parse_config(buffer.str());
}

}  // namespace packslip::app

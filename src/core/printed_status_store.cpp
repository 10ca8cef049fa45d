#include <packslip/core/printed_status_store.hpp>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace packslip::core {

namespace {

Error not_open() { return Error{ErrorCode::IoError, "printed-status store is not open"}; }

}  // namespace

std::expected<void, Error> InMemoryPrintedStatusStore::open() {
  open_ = true;
  return {};
}

void InMemoryPrintedStatusStore::close() { open_ = false; }

std::expected<std::set<std::string>, Error> InMemoryPrintedStatusStore::get_all() const {
  if (!open_) return std::unexpected(not_open());
  return ids_;
}

std::expected<void, Error> InMemoryPrintedStatusStore::mark_many(
    const std::vector<std::string>& ids) {
  if (!open_) return std::unexpected(not_open());
  ids_.insert(ids.begin(), ids.end());
  return {};
}

std::expected<void, Error> InMemoryPrintedStatusStore::unmark_many(
    const std::vector<std::string>& ids) {
  if (!open_) return std::unexpected(not_open());
  for (const auto& id : ids) ids_.erase(id);
  return {};
}

std::expected<void, Error> InMemoryPrintedStatusStore::clear_all() {
  if (!open_) return std::unexpected(not_open());
  ids_.clear();
  return {};
}

JsonFilePrintedStatusStore::JsonFilePrintedStatusStore(std::string path)
    : path_(std::move(path)) {}

JsonFilePrintedStatusStore::~JsonFilePrintedStatusStore() { close(); }

std::expected<void, Error> JsonFilePrintedStatusStore::open() {
  ids_.clear();
  std::error_code ec;
  if (std::filesystem::exists(path_, ec)) {
    std::ifstream f(path_);
    if (!f) {
      return std::unexpected(Error{ErrorCode::IoError, "cannot read printed store: " + path_});
    }
    try {
      const auto doc = nlohmann::json::parse(f);
      for (const auto& id : doc.at("printedOrders")) {
        ids_.insert(id.get<std::string>());
      }
    } catch (const nlohmann::json::exception& e) {
      return std::unexpected(Error{ErrorCode::ParseError,
                                   "printed store " + path_ + " is malformed: " + e.what()});
    }
  }
  open_ = true;
  VLOG(1) << "Opened printed store " << path_ << " with " << ids_.size() << " ids";
  return {};
}

void JsonFilePrintedStatusStore::close() {
  if (!open_) return;
  open_ = false;
  ids_.clear();
}

std::expected<void, Error> JsonFilePrintedStatusStore::require_open() const {
  if (!open_) return std::unexpected(not_open());
  return {};
}

std::expected<std::set<std::string>, Error> JsonFilePrintedStatusStore::get_all() const {
  if (auto ok = require_open(); !ok) return std::unexpected(ok.error());
  return ids_;
}

std::expected<void, Error> JsonFilePrintedStatusStore::mark_many(
    const std::vector<std::string>& ids) {
  if (auto ok = require_open(); !ok) return ok;
  ids_.insert(ids.begin(), ids.end());
  return persist();
}

std::expected<void, Error> JsonFilePrintedStatusStore::unmark_many(
    const std::vector<std::string>& ids) {
  if (auto ok = require_open(); !ok) return ok;
  for (const auto& id : ids) ids_.erase(id);
  return persist();
}

std::expected<void, Error> JsonFilePrintedStatusStore::clear_all() {
  if (auto ok = require_open(); !ok) return ok;
  ids_.clear();
  return persist();
}

std::expected<void, Error> JsonFilePrintedStatusStore::persist() const {
  nlohmann::json doc;
  doc["printedOrders"] = nlohmann::json::array();
  for (const auto& id : ids_) doc["printedOrders"].push_back(id);

  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream f(tmp, std::ios::trunc);
    if (!f) return std::unexpected(Error{ErrorCode::IoError, "cannot write " + tmp});
    f << doc.dump(2);
    if (!f) return std::unexpected(Error{ErrorCode::IoError, "write failed: " + tmp});
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return std::unexpected(Error{ErrorCode::IoError, "cannot replace " + path_});
  }
  return {};
}

}  // namespace packslip::core

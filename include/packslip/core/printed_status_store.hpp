#pragma once

#include <packslip/core/error.hpp>
#include <expected>
#include <set>
#include <string>
#include <vector>

namespace packslip::core {

/// Key-presence store of printed order ids. Constructed and injected by the caller;
/// open() before use, close() when done. The document pipeline only reads it.
class IPrintedStatusStore {
 public:
  virtual ~IPrintedStatusStore() = default;

  [[nodiscard]] virtual std::expected<void, Error> open() = 0;
  virtual void close() = 0;
  [[nodiscard]] virtual bool is_open() const noexcept = 0;

  [[nodiscard]] virtual std::expected<std::set<std::string>, Error> get_all() const = 0;
  [[nodiscard]] virtual std::expected<void, Error> mark_many(
      const std::vector<std::string>& ids) = 0;
  [[nodiscard]] virtual std::expected<void, Error> unmark_many(
      const std::vector<std::string>& ids) = 0;
  [[nodiscard]] virtual std::expected<void, Error> clear_all() = 0;
};

/// Process-local store (tests, dry runs).
class InMemoryPrintedStatusStore : public IPrintedStatusStore {
 public:
  [[nodiscard]] std::expected<void, Error> open() override;
  void close() override;
  [[nodiscard]] bool is_open() const noexcept override { return open_; }

  [[nodiscard]] std::expected<std::set<std::string>, Error> get_all() const override;
  [[nodiscard]] std::expected<void, Error> mark_many(
      const std::vector<std::string>& ids) override;
  [[nodiscard]] std::expected<void, Error> unmark_many(
      const std::vector<std::string>& ids) override;
  [[nodiscard]] std::expected<void, Error> clear_all() override;

 private:
  bool open_{false};
  std::set<std::string> ids_;
};

/// JSON file of {"printedOrders": [ids...]}; every mutation rewrites the file atomically.
class JsonFilePrintedStatusStore : public IPrintedStatusStore {
 public:
  explicit JsonFilePrintedStatusStore(std::string path);
  ~JsonFilePrintedStatusStore() override;

  JsonFilePrintedStatusStore(const JsonFilePrintedStatusStore&) = delete;
  JsonFilePrintedStatusStore& operator=(const JsonFilePrintedStatusStore&) = delete;

  [[nodiscard]] std::expected<void, Error> open() override;
  void close() override;
  [[nodiscard]] bool is_open() const noexcept override { return open_; }

  [[nodiscard]] std::expected<std::set<std::string>, Error> get_all() const override;
  [[nodiscard]] std::expected<void, Error> mark_many(
      const std::vector<std::string>& ids) override;
  [[nodiscard]] std::expected<void, Error> unmark_many(
      const std::vector<std::string>& ids) override;
  [[nodiscard]] std::expected<void, Error> clear_all() override;

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

 private:
  [[nodiscard]] std::expected<void, Error> persist() const;
  [[nodiscard]] std::expected<void, Error> require_open() const;

  std::string path_;
  bool open_{false};
  std::set<std::string> ids_;
};

}  // namespace packslip::core

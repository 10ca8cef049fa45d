#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace packslip::core {

/// Ordered list of accessors; resolve() returns the first populated value.
/// "Populated" means present and non-empty.
template <typename Source>
class FallbackChain {
 public:
  using Accessor = std::function<std::optional<std::string>(const Source&)>;

  FallbackChain() = default;
  explicit FallbackChain(std::vector<Accessor> accessors)
      : accessors_(std::move(accessors)) {}

  FallbackChain& then(Accessor accessor) {
    accessors_.push_back(std::move(accessor));
    return *this;
  }

  [[nodiscard]] std::optional<std::string> resolve(const Source& source) const {
    for (const auto& accessor : accessors_) {
      auto value = accessor(source);
      if (value && !value->empty()) return value;
    }
    return std::nullopt;
  }

  /// Index of the accessor that produced the value (for tests and diagnostics).
  [[nodiscard]] std::optional<std::size_t> winner(const Source& source) const {
    for (std::size_t i = 0; i < accessors_.size(); ++i) {
      auto value = accessors_[i](source);
      if (value && !value->empty()) return i;
    }
    return std::nullopt;
  }

  [[nodiscard]] std::size_t size() const noexcept { return accessors_.size(); }

 private:
  std::vector<Accessor> accessors_;
};

/// Accessor for an optional<string> data member.
template <typename Source>
[[nodiscard]] typename FallbackChain<Source>::Accessor field(
    std::optional<std::string> Source::*member) {
  return [member](const Source& s) { return s.*member; };
}

/// Accessor for a plain string data member.
template <typename Source>
[[nodiscard]] typename FallbackChain<Source>::Accessor field(std::string Source::*member) {
  return [member](const Source& s) -> std::optional<std::string> { return s.*member; };
}

}  // namespace packslip::core

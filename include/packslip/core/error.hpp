#pragma once

#include <string>
#include <utility>

namespace packslip::core {

/// Error codes; used with std::expected for recoverable failures.
enum class ErrorCode {
  None = 0,
  InputError,      // empty selection, malformed record document
  AssetError,      // one image or barcode could not be produced
  ConfigMismatch,  // taxonomy label only: a multiset with no catalog match is reported
                   // as an unclassified (nullopt) box size, never returned as an Error
  ConfigError,     // catalog or config document is malformed
  ParseError,
  RenderError,     // PDF backend failure
  IoError,
};

/// Error value carried by std::expected: code plus a human-readable message.
struct Error {
  ErrorCode code{ErrorCode::None};
  std::string message;

  Error() = default;
  Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

[[nodiscard]] const char* to_string(ErrorCode code) noexcept;

}  // namespace packslip::core

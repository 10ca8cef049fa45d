#include <packslip/core/error.hpp>

namespace packslip::core {

const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::None:
      return "None";
    case ErrorCode::InputError:
      return "InputError";
    case ErrorCode::AssetError:
      return "AssetError";
    case ErrorCode::ConfigMismatch:
      return "ConfigMismatch";
    case ErrorCode::ConfigError:
      return "ConfigError";
    case ErrorCode::ParseError:
      return "ParseError";
    case ErrorCode::RenderError:
      return "RenderError";
    case ErrorCode::IoError:
      return "IoError";
    default:
      return "Unknown";
  }
}

}  // namespace packslip::core

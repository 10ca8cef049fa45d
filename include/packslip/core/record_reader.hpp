#pragma once

#include <packslip/core/error.hpp>
#include <packslip/core/raw_record.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace packslip::core {

/// Parses the order-system export (a JSON array of {recordType, id, values}).
[[nodiscard]] std::expected<RawRecords, Error> parse_raw_records(std::string_view json_text);

[[nodiscard]] std::expected<RawRecords, Error> load_raw_records(const std::string& path);

}  // namespace packslip::core

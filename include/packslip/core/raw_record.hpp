#pragma once

#include <optional>
#include <string>
#include <vector>

namespace packslip::core {

/// One line record as exported by the order system. Field names mirror the
/// export contract; absent fields stay std::nullopt.
struct RawRecord {
  std::string record_type;
  std::string id;

  // Order-level fields (repeated on every line of the same fulfillment).
  std::string tranid;
  std::optional<std::string> created_from_tranid;
  std::optional<std::string> created_from_otherrefnum_1;
  std::optional<std::string> shop_order_date;
  std::string datecreated;
  std::string shipaddress;
  bool personalized_order{false};
  std::optional<std::string> shipmethod;
  std::optional<std::string> po_number;
  std::optional<std::string> memo;
  std::optional<std::string> warehouse_note;
  std::optional<std::string> shipstation_order_id;
  std::optional<std::string> mockup_url;

  // Line fields.
  std::string sku;
  std::optional<std::string> item_type;  // "Kit" marks a kit parent
  std::optional<std::string> formulatext;    // image URL or free-text description
  std::optional<std::string> formulatext_1;  // explicit description
  std::optional<std::string> custom_image_url;
  std::optional<std::string> custcol1;
  std::optional<std::string> custcol1_1;
  std::optional<std::string> color;
  std::optional<std::string> size;
  std::optional<std::string> pick_location;
  std::optional<std::string> barcode;
  std::optional<std::string> quantity;
};

using RawRecords = std::vector<RawRecord>;

}  // namespace packslip::core

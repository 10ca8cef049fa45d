#include <packslip/core/record_reader.hpp>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace packslip::core {

namespace {

using nlohmann::json;

/// String field; numbers are rendered, null/absent/other types give nullopt.
std::optional<std::string> str(const json& values, const char* key) {
  auto it = values.find(key);
  if (it == values.end() || it->is_null()) return std::nullopt;
  if (it->is_string()) return it->get<std::string>();
  if (it->is_number()) return it->dump();
  return std::nullopt;
}

/// First element's member of a [{value, text}] list field.
std::optional<std::string> list_member(const json& values, const char* key,
                                       const char* member) {
  auto it = values.find(key);
  if (it == values.end() || !it->is_array() || it->empty()) return std::nullopt;
  const json& first = it->front();
  if (!first.is_object()) return std::nullopt;
  return str(first, member);
}

bool truthy(const json& values, const char* key) {
  auto it = values.find(key);
  if (it == values.end()) return false;
  if (it->is_boolean()) return it->get<bool>();
  if (it->is_string()) return it->get<std::string>() == "T" || it->get<std::string>() == "true";
  return false;
}

RawRecord to_record(const json& element) {
  const json& v = element.at("values");
  RawRecord r;
  r.record_type = element.value("recordType", "");
  r.id = str(element, "id").value_or("");

  r.tranid = str(v, "tranid").value_or("");
  r.created_from_tranid = str(v, "createdFrom.tranid");
  r.created_from_otherrefnum_1 = str(v, "createdFrom.otherrefnum_1");
  r.shop_order_date = str(v, "createdFrom.custbody_pir_shop_order_date");
  r.datecreated = str(v, "datecreated").value_or("");
  r.shipaddress = str(v, "shipaddress").value_or("");
  r.personalized_order = truthy(v, "custbody_pir_pers_order");
  r.shipmethod = list_member(v, "shipmethod", "text");
  r.po_number = str(v, "createdFrom.otherrefnum");
  r.memo = str(v, "createdFrom.memo");
  r.warehouse_note = str(v, "createdFrom.custbodypir_sales_order_warehouse_note");
  r.shipstation_order_id = str(v, "custbody_pir_shipstation_ordid");
  r.mockup_url = str(v, "createdFrom.custbody_pir_mockup_url_sales_order");

  r.sku = list_member(v, "item", "text").value_or("");
  r.item_type = list_member(v, "item.type", "value");
  r.formulatext = str(v, "formulatext");
  r.formulatext_1 = str(v, "formulatext_1");
  r.custom_image_url = str(v, "custcol_custom_image_url");
  r.custcol1 = str(v, "custcol1");
  r.custcol1_1 = str(v, "custcol1_1");
  r.color = str(v, "item.custitem_item_color");
  r.size = str(v, "item.custitem_item_size");
  r.pick_location = str(v, "item.custitem_pir_pick_location");
  r.barcode = str(v, "custcol_customization_barcode");
  r.quantity = str(v, "quantity");
  return r;
}

}  // namespace

std::expected<RawRecords, Error> parse_raw_records(std::string_view json_text) {
  json doc;
  try {
    doc = json::parse(json_text);
  } catch (const json::exception& e) {
    return std::unexpected(
        Error{ErrorCode::InputError, std::string("order records are not valid JSON: ") + e.what()});
  }
  if (!doc.is_array()) {
    return std::unexpected(Error{ErrorCode::InputError, "order records must be a JSON array"});
  }

  RawRecords records;
  records.reserve(doc.size());
  for (std::size_t i = 0; i < doc.size(); ++i) {
    const json& element = doc[i];
    if (!element.is_object() || !element.contains("values") || !element["values"].is_object()) {
      return std::unexpected(Error{ErrorCode::InputError,
                                   "record " + std::to_string(i) + " has no values object"});
    }
    try {
      records.push_back(to_record(element));
    } catch (const json::exception& e) {
      return std::unexpected(Error{ErrorCode::InputError,
                                   "record " + std::to_string(i) + ": " + e.what()});
    }
  }
  VLOG(1) << "Parsed " << records.size() << " raw records";
  return records;
}

std::expected<RawRecords, Error> load_raw_records(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(Error{ErrorCode::IoError, "cannot open records file: " + path});
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return parse_raw_records(ss.str());
}

}  // namespace packslip::core

#include <packslip/core/order_aggregator.hpp>
#include <packslip/core/box_size_classifier.hpp>
#include <packslip/core/item_normalizer.hpp>
#include <packslip/core/shipping_zone.hpp>
#include <glog/logging.h>
#include <algorithm>
#include <unordered_map>

namespace packslip::core {

const FallbackChain<RawRecord>& order_number_chain() {
  static const FallbackChain<RawRecord> chain({
      field(&RawRecord::created_from_otherrefnum_1),
      field(&RawRecord::created_from_tranid),
  });
  return chain;
}

const FallbackChain<RawRecord>& order_date_chain() {
  static const FallbackChain<RawRecord> chain({
      field(&RawRecord::shop_order_date),
      field(&RawRecord::datecreated),
  });
  return chain;
}

const FallbackChain<RawRecord>& memo_chain() {
  static const FallbackChain<RawRecord> chain({
      field(&RawRecord::memo),
      field(&RawRecord::warehouse_note),
  });
  return chain;
}

namespace {

ProcessedOrder build_order(const std::string& tranid,
                           const std::vector<RawRecord>& group,
                           const BoxSizeCatalog& catalog,
                           const AggregateOptions& options) {
  const std::vector<RawRecord> kept = dedupe_kit_components(group);
  // Order-level fields repeat on every line; the first surviving line carries them.
  const RawRecord& head = kept.empty() ? group.front() : kept.front();

  ProcessedOrder order;
  order.tranid = tranid;
  order.order_number = order_number_chain().resolve(head).value_or("");
  order.date_created = order_date_chain().resolve(head).value_or("");
  order.ship_address = head.shipaddress;
  order.personalized = std::any_of(group.begin(), group.end(),
                                   [](const RawRecord& r) { return r.personalized_order; });

  order.items.reserve(kept.size());
  for (const auto& record : kept) {
    order.items.push_back(normalize_item(record));
  }
  for (const auto& item : order.items) {
    if (item.size) order.cup_sizes.insert(*item.size);
  }
  order.box_size = classify_box_size(order.items, catalog);

  order.ship_method = head.shipmethod;
  order.po_number = head.po_number;
  order.memo = memo_chain().resolve(head);
  order.tracking_id = head.shipstation_order_id;
  order.artwork_ref = head.mockup_url;
  if (options.assign_zones) {
    order.zone = assign_shipping_zone(order.ship_address);
  }
  return order;
}

}  // namespace

std::vector<ProcessedOrder> aggregate_orders(const RawRecords& records,
                                             const BoxSizeCatalog& catalog,
                                             const AggregateOptions& options) {
  std::vector<std::string> order_keys;
  std::unordered_map<std::string, std::vector<RawRecord>> groups;
  for (const auto& record : records) {
    auto [it, inserted] = groups.try_emplace(record.tranid);
    if (inserted) order_keys.push_back(record.tranid);
    it->second.push_back(record);
  }

  std::vector<ProcessedOrder> orders;
  orders.reserve(order_keys.size());
  std::size_t unclassified = 0;
  for (const auto& key : order_keys) {
    orders.push_back(build_order(key, groups.at(key), catalog, options));
    if (!orders.back().box_size) ++unclassified;
  }
  LOG(INFO) << "Aggregated " << records.size() << " records into " << orders.size()
            << " orders (" << unclassified << " unclassified)";
  return orders;
}

}  // namespace packslip::core

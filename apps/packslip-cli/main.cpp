/**
 * packslip-cli: turn an order-system export into packing slips and/or a picklist PDF.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/packslip_cli --records orders.json --catalog pack_sizes.json --kind combined
 * With --summary and no --output: prints the selected orders and writes nothing.
 */

#include <packslip/app/config.hpp>
#include <packslip/app/document_runner.hpp>
#include <packslip/core/box_size_catalog.hpp>
#include <packslip/core/error.hpp>
#include <packslip/core/order.hpp>
#include <packslip/core/order_aggregator.hpp>
#include <packslip/core/order_filter.hpp>
#include <packslip/core/printed_status_store.hpp>
#include <packslip/core/record_reader.hpp>
#include <packslip/layout/document_layout_engine.hpp>
#include <packslip/layout/image_source.hpp>
#include <glog/logging.h>

#include <expected>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

int fail(const packslip::core::Error& error) {
  std::cerr << "Error (" << packslip::core::to_string(error.code) << "): " << error.message
            << "\n";
  return 1;
}

int usage_error(const std::string& message) {
  std::cerr << message << " (see --help)\n";
  return 1;
}

std::optional<bool> parse_yes_no(const std::string& value) {
  if (value == "yes") return true;
  if (value == "no") return false;
  return std::nullopt;
}

void print_usage() {
  std::cout
      << "Usage: packslip_cli --records <json> [options]\n"
      << "  --records <path>        Order-system export (JSON array of line records)\n"
      << "  --catalog <path>        Box-size catalog JSON (overrides config catalog_path)\n"
      << "  --config <path>         key=value config file; default: built-in\n"
      << "  --kind <kind>           slips | picklist | combined (default slips)\n"
      << "  --output <path>         PDF to write (default <kind>.pdf)\n"
      << "  --personalized yes|no   Only personalized / standard orders\n"
      << "  --box-size <key>        Only this box size; 'unclassified' for none\n"
      << "  --cup-size <size>       Exact cup-size set, repeatable (e.g. 10oz)\n"
      << "  --from / --to MM/DD/YYYY  Inclusive order-date range\n"
      << "  --printed yes|no        Filter by printed status\n"
      << "  --printed-store <path>  Printed-status JSON file\n"
      << "  --mark-printed          Mark the selected orders printed after writing\n"
      << "  --sort-zone             Farthest shipping zones first\n"
      << "  --summary               Print one line per selected order\n";
}

void print_summary(const std::vector<packslip::core::ProcessedOrder>& orders) {
  for (const auto& order : orders) {
    std::cout << order.tranid << "\t" << order.order_number << "\t"
              << order.box_size.value_or("unclassified") << "\t"
              << packslip::core::zone_display_name(order) << "\t" << order.items.size()
              << " item(s)\n";
  }
  std::cout << orders.size() << " order(s)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  std::string records_path;
  std::string catalog_override;
  std::string config_path;
  std::string kind_text = "slips";
  std::string output_path;
  std::string store_override;
  bool mark_printed = false;
  bool sort_zone = false;
  bool summary = false;
  packslip::core::OrderFilter filter;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--records" && has_value) {
      records_path = argv[++i];
    } else if (arg == "--catalog" && has_value) {
      catalog_override = argv[++i];
    } else if (arg == "--config" && has_value) {
      config_path = argv[++i];
    } else if (arg == "--kind" && has_value) {
      kind_text = argv[++i];
    } else if (arg == "--output" && has_value) {
      output_path = argv[++i];
    } else if (arg == "--personalized" && has_value) {
      filter.personalized = parse_yes_no(argv[++i]);
      if (!filter.personalized) return usage_error("--personalized expects yes or no");
    } else if (arg == "--box-size" && has_value) {
      const std::string value = argv[++i];
      if (value == "unclassified") {
        filter.box_size = packslip::core::Unclassified{};
      } else {
        filter.box_size = value;
      }
    } else if (arg == "--cup-size" && has_value) {
      filter.cup_sizes.insert(argv[++i]);
    } else if ((arg == "--from" || arg == "--to") && has_value) {
      const auto date = packslip::core::parse_order_date(argv[++i]);
      if (!date) return usage_error(arg + " expects MM/DD/YYYY");
      (arg == "--from" ? filter.date_from : filter.date_to) = date;
    } else if (arg == "--printed" && has_value) {
      filter.printed = parse_yes_no(argv[++i]);
      if (!filter.printed) return usage_error("--printed expects yes or no");
    } else if (arg == "--printed-store" && has_value) {
      store_override = argv[++i];
    } else if (arg == "--mark-printed") {
      mark_printed = true;
    } else if (arg == "--sort-zone") {
      sort_zone = true;
    } else if (arg == "--summary") {
      summary = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      return usage_error("Unknown or incomplete option " + arg);
    }
  }

  if (records_path.empty()) return usage_error("--records is required");
  const auto kind = packslip::layout::parse_document_kind(kind_text);
  if (!kind) {
    return usage_error("Unknown --kind " + kind_text + " (use slips, picklist or combined)");
  }

  auto cfg = config_path.empty() ? std::expected<packslip::app::AppConfig, packslip::core::Error>(
                                       packslip::app::default_config())
                                 : packslip::app::load_config(config_path);
  if (!cfg) return fail(cfg.error());
  if (!catalog_override.empty()) cfg->catalog_path = catalog_override;
  if (!store_override.empty()) cfg->printed_store_path = store_override;
  if (sort_zone) cfg->sort_by_zone = true;

  packslip::core::BoxSizeCatalog catalog;
  if (!cfg->catalog_path.empty()) {
    auto loaded = packslip::core::load_box_size_catalog(cfg->catalog_path);
    if (!loaded) return fail(loaded.error());
    catalog = std::move(*loaded);
  } else {
    LOG(WARNING) << "No box-size catalog; only singles will be classified";
  }

  auto records = packslip::core::load_raw_records(records_path);
  if (!records) return fail(records.error());
  auto orders = packslip::core::aggregate_orders(*records, catalog);

  std::optional<packslip::core::JsonFilePrintedStatusStore> store;
  std::set<std::string> printed_ids;
  if (!cfg->printed_store_path.empty()) {
    store.emplace(cfg->printed_store_path);
    if (auto opened = store->open(); !opened) return fail(opened.error());
    auto ids = store->get_all();
    if (!ids) return fail(ids.error());
    printed_ids = std::move(*ids);
  } else if (filter.printed || mark_printed) {
    return usage_error("--printed and --mark-printed need a printed store");
  }

  auto selected = packslip::core::filter_orders(orders, filter, printed_ids);
  if (cfg->sort_by_zone) packslip::core::sort_by_zone_priority(selected);
  LOG(INFO) << "Selected " << selected.size() << " of " << orders.size() << " order(s)";

  if (summary) {
    print_summary(selected);
    if (output_path.empty()) return 0;
  }
  if (output_path.empty()) output_path = kind_text + ".pdf";

  packslip::layout::HttpImageOptions http_options;
  http_options.timeout_ms = cfg->image_timeout_ms;
  packslip::layout::HttpImageSource images(http_options);

  auto document = packslip::app::generate_document(selected, *kind, *cfg, images);
  if (!document) return fail(document.error());
  if (auto written = packslip::app::write_document_atomically(output_path, *document); !written)
    return fail(written.error());
  std::cout << "Wrote " << output_path << " (" << selected.size() << " order(s))\n";

  if (mark_printed) {
    std::vector<std::string> ids;
    ids.reserve(selected.size());
    for (const auto& order : selected) ids.push_back(order.tranid);
    if (auto marked = store->mark_many(ids); !marked) return fail(marked.error());
  }
  if (store) store->close();
  return 0;
}

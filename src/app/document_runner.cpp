#include <packslip/app/document_runner.hpp>
#include <packslip/app/asset_prefetch.hpp>
#include <packslip/layout/pdf_canvas.hpp>
#ifdef PACKSLIP_HAS_TBB
#include <packslip/app/asset_prefetch_tbb.hpp>
#endif
#include <glog/logging.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace packslip::app {

using packslip::core::Error;
using packslip::core::ErrorCode;

packslip::layout::LayoutOptions layout_options(const AppConfig& config) {
  packslip::layout::LayoutOptions options;
  options.two_up_categories = config.two_up_categories;
  options.barcode.print_scale = config.barcode_print_scale;
  return options;
}

std::string today_label() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%m/%d/%Y", &local);
  return buf;
}

std::expected<std::string, Error> generate_document(
    const std::vector<packslip::core::ProcessedOrder>& orders,
    packslip::layout::DocumentKind kind, const AppConfig& config,
    packslip::layout::IImageSource& images) {
  if (orders.empty())
    return std::unexpected(Error{ErrorCode::InputError, "No orders selected"});

  auto options = layout_options(config);
  options.date_label = today_label();
  const packslip::layout::DocumentLayoutEngine engine(options);

  const auto requests = packslip::layout::collect_asset_requests(orders, kind, engine.options());
  const auto started = std::chrono::steady_clock::now();
#ifdef PACKSLIP_HAS_TBB
  const auto assets = prefetch_assets_tbb(images, requests, config.image_fetch_parallelism);
#else
  const auto assets = prefetch_assets_parallel(images, requests, config.image_fetch_parallelism);
#endif
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  LOG(INFO) << "Resolved " << requests.size() << " image(s) in " << elapsed.count() << " ms ("
            << assets.failures() << " unavailable)";

  auto canvas = packslip::layout::PdfCanvas::create();
  if (!canvas) return std::unexpected(canvas.error());

  if (auto rendered = engine.render(orders, kind, assets, **canvas); !rendered)
    return std::unexpected(rendered.error());

  auto bytes = (*canvas)->finish();
  if (bytes) {
    LOG(INFO) << "Document: " << (*canvas)->page_count() << " page(s), " << bytes->size()
              << " bytes";
  }
  return bytes;
}

std::expected<void, Error> write_document_atomically(const std::string& path,
                                                     const std::string& bytes) {
  namespace fs = std::filesystem;
  const fs::path target(path);
  fs::path tmp = target;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) return std::unexpected(Error{ErrorCode::IoError, "Cannot open " + tmp.string()});
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      return std::unexpected(Error{ErrorCode::IoError, "Write failed: " + tmp.string()});
    }
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return std::unexpected(Error{ErrorCode::IoError, "Cannot move " + tmp.string() + " to " +
                                                         path + ": " + ec.message()});
  }
  return {};
}

}  // namespace packslip::app

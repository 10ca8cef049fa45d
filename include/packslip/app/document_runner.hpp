#pragma once

#include <packslip/app/config.hpp>
#include <packslip/core/error.hpp>
#include <packslip/core/order.hpp>
#include <packslip/layout/document_layout_engine.hpp>
#include <packslip/layout/image_source.hpp>
#include <expected>
#include <string>
#include <vector>

namespace packslip::app {

/// Layout options derived from config. date_label is left for the caller.
[[nodiscard]] packslip::layout::LayoutOptions layout_options(const AppConfig& config);

/// Today's date as MM/DD/YYYY in local time.
[[nodiscard]] std::string today_label();

/// Builds a complete PDF in memory: resolves every image first, lays out the orders,
/// then serializes. Fails with InputError on an empty selection and with RenderError
/// when the PDF backend fails; image failures only blank their slots.
[[nodiscard]] std::expected<std::string, packslip::core::Error> generate_document(
    const std::vector<packslip::core::ProcessedOrder>& orders,
    packslip::layout::DocumentKind kind, const AppConfig& config,
    packslip::layout::IImageSource& images);

/// Writes bytes to path via a temporary sibling and a rename, so readers never see a
/// partial file.
[[nodiscard]] std::expected<void, packslip::core::Error> write_document_atomically(
    const std::string& path, const std::string& bytes);

}  // namespace packslip::app

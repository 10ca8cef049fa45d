#include <packslip/layout/pdf_canvas.hpp>
#include <glog/logging.h>
#include <opencv2/imgproc.hpp>
#include <podofo/podofo.h>
#include <string>

namespace packslip::layout {

namespace {

constexpr double kPointsPerInch = 72.0;

double pt(double inches) { return inches * kPointsPerInch; }

/// PDF space has its origin bottom-left.
double pdf_y(double inches_from_top) { return pt(kPageHeight - inches_from_top); }

PoDoFo::PdfString utf8(std::string_view text) {
  const std::string copy(text);
  return PoDoFo::PdfString(reinterpret_cast<const PoDoFo::pdf_utf8*>(copy.c_str()));
}

}  // namespace

struct PdfCanvas::Impl {
  PoDoFo::PdfMemDocument document;
  PoDoFo::PdfPainter painter;
  PoDoFo::PdfPage* page{nullptr};
  PoDoFo::PdfFont* regular{nullptr};
  PoDoFo::PdfFont* bold{nullptr};
  PoDoFo::PdfFont* font{nullptr};
  double size_pt{10.0};
  std::size_t pages{0};
  std::optional<packslip::core::Error> failure;

  void fail(const std::string& what) {
    if (!failure) {
      failure = packslip::core::Error{packslip::core::ErrorCode::RenderError, what};
      LOG(ERROR) << "PDF rendering failed: " << what;
    }
  }

  bool ready() const { return !failure && page != nullptr; }
};

PdfCanvas::PdfCanvas() : impl_(std::make_unique<Impl>()) {}

PdfCanvas::~PdfCanvas() = default;

std::expected<std::unique_ptr<PdfCanvas>, packslip::core::Error> PdfCanvas::create() {
  std::unique_ptr<PdfCanvas> canvas(new PdfCanvas());
  try {
    Impl& impl = *canvas->impl_;
    impl.regular = impl.document.CreateFont("Helvetica");
    impl.bold = impl.document.CreateFont("Helvetica-Bold");
  } catch (const PoDoFo::PdfError& e) {
    return std::unexpected(packslip::core::Error{
        packslip::core::ErrorCode::RenderError,
        std::string("cannot create PDF fonts: ") + PoDoFo::PdfError::ErrorMessage(e.GetError())});
  }
  if (!canvas->impl_->regular || !canvas->impl_->bold) {
    return std::unexpected(packslip::core::Error{packslip::core::ErrorCode::RenderError,
                                                 "Helvetica base-14 font unavailable"});
  }
  canvas->impl_->font = canvas->impl_->regular;
  return canvas;
}

void PdfCanvas::begin_page() {
  if (impl_->failure) return;
  try {
    if (impl_->page) impl_->painter.FinishPage();
    impl_->page = impl_->document.CreatePage(
        PoDoFo::PdfPage::CreateStandardPageSize(PoDoFo::ePdfPageSize_Letter));
    impl_->painter.SetPage(impl_->page);
    ++impl_->pages;
    set_font(impl_->font == impl_->bold ? FontWeight::Bold : FontWeight::Regular,
             impl_->size_pt);
  } catch (const PoDoFo::PdfError& e) {
    impl_->fail(std::string("begin page: ") + PoDoFo::PdfError::ErrorMessage(e.GetError()));
  }
}

std::size_t PdfCanvas::page_count() const noexcept { return impl_->pages; }

void PdfCanvas::set_font(FontWeight weight, double size_pt) {
  impl_->font = weight == FontWeight::Bold ? impl_->bold : impl_->regular;
  impl_->size_pt = size_pt;
  impl_->font->SetFontSize(static_cast<float>(size_pt));
  if (!impl_->ready()) return;
  try {
    impl_->painter.SetFont(impl_->font);
  } catch (const PoDoFo::PdfError& e) {
    impl_->fail(std::string("set font: ") + PoDoFo::PdfError::ErrorMessage(e.GetError()));
  }
}

double PdfCanvas::text_width(std::string_view text) const {
  const std::string copy(text);
  const double width_pt = impl_->font->GetFontMetrics()->StringWidth(copy.c_str());
  return width_pt / kPointsPerInch;
}

void PdfCanvas::draw_text(double x, double y, std::string_view text, TextAlign align) {
  if (!impl_->ready() || text.empty()) return;
  double left = x;
  if (align != TextAlign::Left) {
    const double w = text_width(text);
    left = align == TextAlign::Center ? x - w / 2 : x - w;
  }
  try {
    impl_->painter.DrawText(pt(left), pdf_y(y), utf8(text));
  } catch (const PoDoFo::PdfError& e) {
    impl_->fail(std::string("draw text: ") + PoDoFo::PdfError::ErrorMessage(e.GetError()));
  }
}

void PdfCanvas::draw_line(double x1, double y1, double x2, double y2,
                          const LineStyle& style) {
  if (!impl_->ready()) return;
  try {
    auto& painter = impl_->painter;
    painter.Save();
    painter.SetStrokeWidth(pt(style.width));
    painter.SetStrokingColor(PoDoFo::PdfColor(style.gray));
    if (style.dashed) {
      painter.SetStrokeStyle(PoDoFo::ePdfStrokeStyle_Custom, "[3.6 3.6] 0");
    }
    painter.DrawLine(pt(x1), pdf_y(y1), pt(x2), pdf_y(y2));
    painter.Restore();
  } catch (const PoDoFo::PdfError& e) {
    impl_->fail(std::string("draw line: ") + PoDoFo::PdfError::ErrorMessage(e.GetError()));
  }
}

void PdfCanvas::draw_image(const cv::Mat& image, const Rect& box) {
  if (!impl_->ready() || image.empty() || box.w <= 0.0 || box.h <= 0.0) return;

  cv::Mat rgb;
  try {
    switch (image.channels()) {
      case 1:
        cv::cvtColor(image, rgb, cv::COLOR_GRAY2RGB);
        break;
      case 4:
        cv::cvtColor(image, rgb, cv::COLOR_BGRA2RGB);
        break;
      default:
        cv::cvtColor(image, rgb, cv::COLOR_BGR2RGB);
        break;
    }
  } catch (const cv::Exception& e) {
    impl_->fail(std::string("image conversion: ") + e.what());
    return;
  }
  if (!rgb.isContinuous()) rgb = rgb.clone();

  try {
    PoDoFo::PdfImage pdf_image(&impl_->document);
    pdf_image.SetImageColorSpace(PoDoFo::ePdfColorSpace_DeviceRGB);
    PoDoFo::PdfMemoryInputStream stream(reinterpret_cast<const char*>(rgb.data),
                                        static_cast<PoDoFo::pdf_long>(rgb.total() * rgb.elemSize()));
    pdf_image.SetImageData(static_cast<unsigned int>(rgb.cols),
                           static_cast<unsigned int>(rgb.rows), 8, &stream);
    impl_->painter.DrawImage(pt(box.x), pdf_y(box.bottom()), &pdf_image,
                             pt(box.w) / rgb.cols, pt(box.h) / rgb.rows);
  } catch (const PoDoFo::PdfError& e) {
    impl_->fail(std::string("draw image: ") + PoDoFo::PdfError::ErrorMessage(e.GetError()));
  }
}

std::expected<std::string, packslip::core::Error> PdfCanvas::finish() {
  if (impl_->failure) return std::unexpected(*impl_->failure);
  try {
    if (impl_->page) {
      impl_->painter.FinishPage();
      impl_->page = nullptr;
    }
    PoDoFo::PdfRefCountedBuffer buffer;
    PoDoFo::PdfOutputDevice device(&buffer);
    impl_->document.Write(&device);
    return std::string(buffer.GetBuffer(), device.GetLength());
  } catch (const PoDoFo::PdfError& e) {
    impl_->fail(std::string("write document: ") + PoDoFo::PdfError::ErrorMessage(e.GetError()));
    return std::unexpected(*impl_->failure);
  }
}

}  // namespace packslip::layout

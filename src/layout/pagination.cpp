#include <packslip/layout/pagination.hpp>
#include <utility>

namespace packslip::layout {

const char* to_string(PageState state) noexcept {
  switch (state) {
    case PageState::NewPage:
      return "NewPage";
    case PageState::DrawHeader:
      return "DrawHeader";
    case PageState::DrawRow:
      return "DrawRow";
    case PageState::PageFull:
      return "PageFull";
    case PageState::Done:
      return "Done";
    default:
      return "Unknown";
  }
}

Paginator::Paginator(PageFrame first, PageFrame next, std::vector<double> row_heights)
    : first_(first), next_(next), rows_(std::move(row_heights)) {}

PageState Paginator::advance() {
  switch (state_) {
    case PageState::NewPage:
      cursor_ = frame().top;
      rows_on_page_ = 0;
      slices_.push_back(PageSlice{row_, 0, 0.0, false});
      state_ = PageState::DrawHeader;
      break;

    case PageState::DrawHeader:
      cursor_ += frame().header_height + frame().table_header_height;
      slices_.back().table_top = cursor_;
      state_ = row_ < rows_.size() ? PageState::DrawRow : PageState::Done;
      break;

    case PageState::DrawRow: {
      const double h = rows_[row_];
      const bool fits = cursor_ + h <= frame().content_bottom;
      if (!fits && rows_on_page_ > 0) {
        state_ = PageState::PageFull;
        break;
      }
      if (!fits) slices_.back().overfull = true;
      cursor_ += h;
      ++row_;
      ++rows_on_page_;
      ++slices_.back().row_count;
      state_ = row_ < rows_.size() ? PageState::DrawRow : PageState::Done;
      break;
    }

    case PageState::PageFull:
      ++page_;
      state_ = PageState::NewPage;
      break;

    case PageState::Done:
      break;
  }
  return state_;
}

std::vector<PageSlice> Paginator::run() {
  while (!done()) advance();
  return slices_;
}

std::vector<PageSlice> plan_pages(const PageFrame& first,
                                  const PageFrame& next,
                                  const std::vector<double>& row_heights) {
  Paginator paginator(first, next, row_heights);
  return paginator.run();
}

}  // namespace packslip::layout

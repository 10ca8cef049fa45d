#pragma once

#include <cstddef>
#include <vector>

namespace packslip::layout {

/// Pagination states. Overflow is ordinary control flow: DrawRow -> PageFull -> NewPage.
enum class PageState {
  NewPage,
  DrawHeader,
  DrawRow,
  PageFull,
  Done,
};

[[nodiscard]] const char* to_string(PageState state) noexcept;

/// Vertical budget of one page (inches from the page top).
struct PageFrame {
  double top{0.0};                 // page header starts here
  double content_bottom{0.0};      // rows may not extend below
  double header_height{0.0};       // page header including the gap before the table
  double table_header_height{0.0}; // column titles + rule
};

/// Rows placed on one page.
struct PageSlice {
  std::size_t first_row{0};
  std::size_t row_count{0};
  double table_top{0.0};  // y of the first row
  bool overfull{false};   // a single row taller than the page was forced onto it
};

/// Steps through the states for a sequence of row heights. The first page uses
/// `first`, every continuation page uses `next`. A page always receives at least one
/// row so an oversized row cannot loop forever.
class Paginator {
 public:
  Paginator(PageFrame first, PageFrame next, std::vector<double> row_heights);

  /// Performs one transition and returns the new state.
  PageState advance();

  [[nodiscard]] PageState state() const noexcept { return state_; }
  [[nodiscard]] bool done() const noexcept { return state_ == PageState::Done; }
  [[nodiscard]] std::size_t page_index() const noexcept { return page_; }
  [[nodiscard]] std::size_t row_index() const noexcept { return row_; }
  [[nodiscard]] double cursor() const noexcept { return cursor_; }
  [[nodiscard]] const PageFrame& frame() const noexcept {
    return page_ == 0 ? first_ : next_;
  }

  /// Runs to Done and returns one slice per page.
  [[nodiscard]] std::vector<PageSlice> run();

 private:
  PageFrame first_;
  PageFrame next_;
  std::vector<double> rows_;
  PageState state_{PageState::NewPage};
  std::size_t page_{0};
  std::size_t row_{0};
  std::size_t rows_on_page_{0};
  double cursor_{0.0};
  std::vector<PageSlice> slices_;
};

/// Convenience: slices for rows under the given frames.
[[nodiscard]] std::vector<PageSlice> plan_pages(const PageFrame& first,
                                                const PageFrame& next,
                                                const std::vector<double>& row_heights);

}  // namespace packslip::layout

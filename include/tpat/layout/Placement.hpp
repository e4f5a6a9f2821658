#pragma once

#include <tpat/core/Error.hpp>
#include <tpat/document/Document.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace TP {

// 0-based cell rectangle within a parent grid.
struct CellSpan {
    std::uint32_t row = 0;
    std::uint32_t column = 0;
    std::uint32_t rows = 1;
    std::uint32_t columns = 1;

    friend auto operator==(CellSpan const&, CellSpan const&) -> bool = default;
};

// Default position and span for the next sibling. Threaded through the child
// list as a fold accumulator.
struct PlacementCursor {
    std::uint32_t row = 0;
    std::uint32_t column = 0;
    std::uint32_t rows = 1;
    std::uint32_t columns = 1;

    friend auto operator==(PlacementCursor const&, PlacementCursor const&) -> bool = default;
};

struct GridShape {
    std::uint32_t rows = 1;
    std::uint32_t columns = 1;
};

struct PlacementStep {
    CellSpan        span;
    PlacementCursor next;
};

// Moves the cursor past a placed span, wrapping one span-height down when the
// next span would run past the last column.
[[nodiscard]] auto advance_cursor(CellSpan const& placed, GridShape shape) -> PlacementCursor;

// Places one child. `field` names the child in error messages.
[[nodiscard]] auto place_child(PlacementCursor const& cursor,
                               PlacementSpec const& spec,
                               GridShape shape,
                               std::string_view field) -> Expected<PlacementStep>;

[[nodiscard]] auto spans_overlap(CellSpan const& a, CellSpan const& b) -> bool;

// True when some span shares a cell with an earlier one.
[[nodiscard]] auto any_spans_overlap(std::span<CellSpan const> spans) -> bool;

// Places every child of `parent` in order.
[[nodiscard]] auto place_children(Document const& document, Patch const& parent, GridShape shape)
    -> Expected<std::vector<CellSpan>>;

} // namespace TP

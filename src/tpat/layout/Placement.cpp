#include <tpat/layout/Placement.hpp>

#include <string>

namespace TP {
namespace {

auto describe(CellSpan const& span) -> std::string {
    return "rows " + std::to_string(span.row) + ".." + std::to_string(span.row + span.rows - 1) + ", columns "
           + std::to_string(span.column) + ".." + std::to_string(span.column + span.columns - 1);
}

auto field_of(std::string_view location, std::string_view key) -> std::string {
    std::string field{location};
    if (!field.empty()) {
        field.push_back('.');
    }
    field.append(key);
    return field;
}

} // namespace

auto advance_cursor(CellSpan const& placed, GridShape shape) -> PlacementCursor {
    PlacementCursor next{.row = placed.row,
                         .column = placed.column + placed.columns,
                         .rows = placed.rows,
                         .columns = placed.columns};
    if (next.column + next.columns > shape.columns) {
        next.column = 0;
        next.row += next.rows;
    }
    return next;
}

auto place_child(PlacementCursor const& cursor, PlacementSpec const& spec, GridShape shape, std::string_view field)
    -> Expected<PlacementStep> {
    CellSpan span{.row = cursor.row, .column = cursor.column, .rows = cursor.rows, .columns = cursor.columns};

    if (spec.cell && spec.legacy.any()) {
        return std::unexpected(makeError(Error::Code::ConflictingFields, field_of(field, "cell"),
                                         "cannot be combined with left/top/right/bottom"));
    }
    if (spec.cell) {
        auto const& cell = *spec.cell;
        if (cell.row == 0 || cell.column == 0) {
            return std::unexpected(makeError(Error::Code::OutOfBounds, field_of(field, "cell"), "cells are numbered from 1"));
        }
        auto const last_row = cell.last_row.value_or(cell.row);
        auto const last_column = cell.last_column.value_or(cell.column);
        if (last_row < cell.row || last_column < cell.column) {
            return std::unexpected(makeError(Error::Code::OutOfBounds, field_of(field, "cell"),
                                             "the bottom-right cell precedes the top-left cell"));
        }
        // A 2-tuple addresses exactly one cell, a 4-tuple a rectangle.
        span = CellSpan{.row = cell.row - 1,
                        .column = cell.column - 1,
                        .rows = last_row - cell.row + 1,
                        .columns = last_column - cell.column + 1};
    } else {
        auto const& legacy = spec.legacy;
        if (legacy.left) {
            span.column = *legacy.left;
        }
        if (legacy.top) {
            span.row = *legacy.top;
        }
        if (legacy.right) {
            if (*legacy.right <= span.column) {
                return std::unexpected(makeError(Error::Code::OutOfBounds, field_of(field, "right"),
                                                 "must be greater than the left column " + std::to_string(span.column)));
            }
            span.columns = *legacy.right - span.column;
        }
        if (legacy.bottom) {
            if (*legacy.bottom <= span.row) {
                return std::unexpected(makeError(Error::Code::OutOfBounds, field_of(field, "bottom"),
                                                 "must be greater than the top row " + std::to_string(span.row)));
            }
            span.rows = *legacy.bottom - span.row;
        }
    }

    if (static_cast<std::uint64_t>(span.row) + span.rows > shape.rows
        || static_cast<std::uint64_t>(span.column) + span.columns > shape.columns) {
        return std::unexpected(makeError(Error::Code::OutOfBounds, field,
                                         describe(span) + " fall outside a grid of " + std::to_string(shape.rows)
                                             + " rows and " + std::to_string(shape.columns) + " columns"));
    }
    return PlacementStep{.span = span, .next = advance_cursor(span, shape)};
}

auto spans_overlap(CellSpan const& a, CellSpan const& b) -> bool {
    return a.row < b.row + b.rows && b.row < a.row + a.rows && a.column < b.column + b.columns
           && b.column < a.column + a.columns;
}

auto any_spans_overlap(std::span<CellSpan const> spans) -> bool {
    for (std::size_t i = 1; i < spans.size(); ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            if (spans_overlap(spans[j], spans[i])) {
                return true;
            }
        }
    }
    return false;
}

auto place_children(Document const& document, Patch const& parent, GridShape shape) -> Expected<std::vector<CellSpan>> {
    std::vector<CellSpan> spans;
    spans.reserve(parent.children.size());
    PlacementCursor cursor;
    for (auto child : parent.children) {
        auto const& patch = document.patch(child);
        auto step = place_child(cursor, patch.placement, shape, patch.location);
        if (!step) {
            return std::unexpected(step.error());
        }
        spans.push_back(step->span);
        cursor = step->next;
    }
    return spans;
}

} // namespace TP

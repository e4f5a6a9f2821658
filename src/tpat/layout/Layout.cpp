#include <tpat/layout/Layout.hpp>

#include "log/TaggedLogger.hpp"

#include <optional>
#include <string>

namespace TP {
namespace {

// Parent cells covered by the patch being resolved, one context per axis.
struct ParentContext {
    ParentAxisContext columns;
    ParentAxisContext rows;
};

auto field_of(std::string_view location, std::string_view key) -> std::string {
    std::string field{location};
    if (!field.empty()) {
        field.push_back('.');
    }
    field.append(key);
    return field;
}

class LayoutResolver {
public:
    LayoutResolver(Document const& document, Layout& layout)
        : document_(document), layout_(layout) {}

    auto resolve_root() -> Expected<void> {
        auto const& root = document_.root();
        auto columns = resolve_axis(column_request(root), 0, std::nullopt, std::nullopt, root.location);
        if (!columns) {
            return std::unexpected(columns.error());
        }
        auto rows = resolve_axis(row_request(root), 0, std::nullopt, std::nullopt, root.location);
        if (!rows) {
            return std::unexpected(rows.error());
        }
        layout_.width = columns->total;
        layout_.height = rows->total;
        if (layout_.width == 0 || layout_.height == 0) {
            return std::unexpected(makeError(Error::Code::InvalidValue, "root", "the image has no pixels"));
        }
        Rect rect{.x = 0, .y = 0, .width = layout_.width, .height = layout_.height};
        return finish(kRootPatch, rect, std::move(*columns), std::move(*rows));
    }

private:
    static auto column_request(Patch const& patch) -> AxisRequest {
        return AxisRequest{.total = patch.grid.width,
                           .breakdown = patch.grid.columns,
                           .border = patch.border ? patch.border->horizontal : 0,
                           .spacing = patch.spacing ? std::optional{patch.spacing->horizontal} : std::nullopt,
                           .total_key = "width",
                           .breakdown_key = "columns"};
    }

    static auto row_request(Patch const& patch) -> AxisRequest {
        return AxisRequest{.total = patch.grid.height,
                           .breakdown = patch.grid.rows,
                           .border = patch.border ? patch.border->vertical : 0,
                           .spacing = patch.spacing ? std::optional{patch.spacing->vertical} : std::nullopt,
                           .total_key = "height",
                           .breakdown_key = "rows"};
    }

    auto resolve_patch(PatchIndex index, Rect rect, ParentContext const& parent) -> Expected<void> {
        auto const& patch = document_.patch(index);
        auto columns = resolve_axis(column_request(patch), rect.x, rect.width, parent.columns, patch.location);
        if (!columns) {
            return std::unexpected(columns.error());
        }
        auto rows = resolve_axis(row_request(patch), rect.y, rect.height, parent.rows, patch.location);
        if (!rows) {
            return std::unexpected(rows.error());
        }
        // A grid may leave part of the patch unused but may not spill out of it.
        if (columns->total > rect.width) {
            return std::unexpected(makeError(Error::Code::OutOfBounds, field_of(patch.location, "width"),
                                             "the grid needs " + std::to_string(columns->total)
                                                 + " pixels but the patch is " + std::to_string(rect.width) + " wide"));
        }
        if (rows->total > rect.height) {
            return std::unexpected(makeError(Error::Code::OutOfBounds, field_of(patch.location, "height"),
                                             "the grid needs " + std::to_string(rows->total) + " pixels but the patch is "
                                                 + std::to_string(rect.height) + " high"));
        }
        return finish(index, rect, std::move(*columns), std::move(*rows));
    }

    auto finish(PatchIndex index, Rect rect, AxisGrid columns, AxisGrid rows) -> Expected<void> {
        auto const& patch = document_.patch(index);
        layout_.patches[index] = ResolvedGeometry{.rect = rect, .columns = std::move(columns), .rows = std::move(rows)};
        if (patch.children.empty()) {
            return {};
        }

        // Read through the layout: the vector is not resized during the walk.
        auto const& geometry = layout_.patches[index];
        GridShape shape{.rows = geometry.rows.count(), .columns = geometry.columns.count()};
        auto spans = place_children(document_, patch, shape);
        if (!spans) {
            return std::unexpected(spans.error());
        }
        if (any_spans_overlap(*spans)) {
            layout_.patches[index].overlapping_children = true;
            tp_log("Children of " + (patch.location.empty() ? std::string{"the root"} : patch.location)
                       + " overlap, drawing them in order",
                   "Layout");
        }

        for (std::size_t i = 0; i < patch.children.size(); ++i) {
            auto const& span = (*spans)[i];
            auto const& cols = layout_.patches[index].columns;
            auto const& rws = layout_.patches[index].rows;
            Rect child_rect{.x = cols.span_start(span.column),
                            .y = rws.span_start(span.row),
                            .width = cols.span_length(span.column, span.columns),
                            .height = rws.span_length(span.row, span.rows)};
            ParentContext context{
                .columns = ParentAxisContext{.sizes = std::span{cols.sizes}.subspan(span.column, span.columns),
                                             .spacing = cols.spacing},
                .rows = ParentAxisContext{.sizes = std::span{rws.sizes}.subspan(span.row, span.rows),
                                          .spacing = rws.spacing},
            };
            if (auto child = resolve_patch(patch.children[i], child_rect, context); !child) {
                return child;
            }
        }
        return {};
    }

    Document const& document_;
    Layout&         layout_;
};

} // namespace

auto ResolveLayout(Document const& document) -> Expected<Layout> {
    if (auto valid = ValidateDocument(document); !valid) {
        return std::unexpected(valid.error());
    }
    Layout layout;
    layout.patches.resize(document.size());
    LayoutResolver resolver{document, layout};
    if (auto resolved = resolver.resolve_root(); !resolved) {
        tp_log("Layout failed: " + describeError(resolved.error()), "Layout", "Error");
        return std::unexpected(resolved.error());
    }
    tp_log("Resolved layout " + std::to_string(layout.width) + "x" + std::to_string(layout.height), "Layout");
    return layout;
}

} // namespace TP

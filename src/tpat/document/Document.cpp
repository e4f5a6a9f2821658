#include <tpat/document/Document.hpp>

#include <string>

namespace TP {
namespace {

auto field_of(Patch const& patch, std::string_view key) -> std::string {
    if (patch.location.empty()) {
        return std::string{key};
    }
    std::string field = patch.location;
    field.push_back('.');
    field.append(key);
    return field;
}

auto check_background(Patch const& patch, Depth depth) -> Expected<void> {
    struct Visitor {
        Patch const& patch;
        Depth depth;

        auto operator()(std::monostate) const -> Expected<void> {
            return {};
        }
        auto operator()(SolidFill const& fill) const -> Expected<void> {
            return check_color(fill.color, depth, field_of(patch, "color"));
        }
        auto operator()(GradientFill const& fill) const -> Expected<void> {
            auto field = field_of(patch, background_name(patch.background));
            if (auto ok = check_color(fill.from, depth, field); !ok) {
                return ok;
            }
            return check_color(fill.to, depth, field);
        }
        auto operator()(GratingFill const& fill) const -> Expected<void> {
            auto field = field_of(patch, background_name(patch.background));
            if (!(fill.start_half_period > 0.0) || !(fill.end_half_period > 0.0)) {
                return std::unexpected(makeError(Error::Code::InvalidValue, field, "half-periods must be positive"));
            }
            if (auto ok = check_color(fill.first, depth, field); !ok) {
                return ok;
            }
            return check_color(fill.second, depth, field);
        }
    };
    return std::visit(Visitor{patch, depth}, patch.background);
}

auto is_parent(std::optional<AxisSpec> const& axis) -> bool {
    return axis && std::holds_alternative<ParentAxis>(*axis);
}

auto check_root(Document const& document) -> Expected<void> {
    auto const& root = document.root();
    if (!root.grid.width && !root.grid.columns) {
        return std::unexpected(makeError(Error::Code::MissingField, "width", "the root needs width or columns"));
    }
    if (!root.grid.height && !root.grid.rows) {
        return std::unexpected(makeError(Error::Code::MissingField, "height", "the root needs height or rows"));
    }
    if (is_parent(root.grid.width) || is_parent(root.grid.columns) || is_parent(root.grid.height)
        || is_parent(root.grid.rows)) {
        return std::unexpected(makeError(Error::Code::InvalidParentReference, "root",
                                         "'parent' grid sizes need an enclosing patch"));
    }
    if (root.placement.cell || root.placement.legacy.any()) {
        return std::unexpected(makeError(Error::Code::InvalidValue, "root", "the root patch cannot be placed in a cell"));
    }
    return {};
}

auto check_placement(Patch const& patch) -> Expected<void> {
    auto const& placement = patch.placement;
    if (placement.cell && placement.legacy.any()) {
        return std::unexpected(makeError(Error::Code::ConflictingFields, field_of(patch, "cell"),
                                         "cannot be combined with left/top/right/bottom"));
    }
    if (placement.cell) {
        auto const& cell = *placement.cell;
        if (cell.row == 0 || cell.column == 0) {
            return std::unexpected(makeError(Error::Code::OutOfBounds, field_of(patch, "cell"), "cells are numbered from 1"));
        }
        if (cell.last_row.value_or(cell.row) < cell.row || cell.last_column.value_or(cell.column) < cell.column) {
            return std::unexpected(makeError(Error::Code::OutOfBounds, field_of(patch, "cell"),
                                             "the bottom-right cell precedes the top-left cell"));
        }
    }
    auto const& legacy = placement.legacy;
    if (legacy.left && legacy.right && *legacy.right <= *legacy.left) {
        return std::unexpected(makeError(Error::Code::OutOfBounds, field_of(patch, "right"), "must be greater than left"));
    }
    if (legacy.top && legacy.bottom && *legacy.bottom <= *legacy.top) {
        return std::unexpected(makeError(Error::Code::OutOfBounds, field_of(patch, "bottom"), "must be greater than top"));
    }
    return {};
}

} // namespace

auto Document::add_patch(Patch patch) -> PatchIndex {
    patches.push_back(std::move(patch));
    return static_cast<PatchIndex>(patches.size() - 1);
}

auto Document::resolve_resource(std::string const& path) const -> std::filesystem::path {
    std::filesystem::path resource{path};
    if (resource.is_absolute() || base_directory.empty()) {
        return resource;
    }
    return base_directory / resource;
}

auto background_name(Background const& background) -> char const* {
    if (std::holds_alternative<SolidFill>(background)) {
        return "color";
    }
    if (auto const* gradient = std::get_if<GradientFill>(&background)) {
        return gradient->axis == Axis::Horizontal ? "hramp" : "vramp";
    }
    if (auto const* grating = std::get_if<GratingFill>(&background)) {
        bool horizontal = grating->axis == Axis::Horizontal;
        switch (grating->waveform) {
        case Waveform::Square:
            return horizontal ? "hsquare" : "vsquare";
        case Waveform::Sine:
            return horizontal ? "hsine" : "vsine";
        case Waveform::Cosine:
            return horizontal ? "hcosine" : "vcosine";
        }
    }
    return "none";
}

auto ValidateDocument(Document const& document) -> Expected<void> {
    if (document.patches.empty()) {
        return std::unexpected(makeError(Error::Code::MalformedInput, "", "document has no root patch"));
    }
    if (document.version < 1 || document.version > kLatestVersion) {
        return std::unexpected(makeError(Error::Code::UnsupportedVersion, "version",
                                         "supported versions are 1 and 2, got " + std::to_string(document.version)));
    }
    if (auto root = check_root(document); !root) {
        return root;
    }

    std::vector<bool> owned(document.patches.size(), false);
    for (std::size_t index = 0; index < document.patches.size(); ++index) {
        auto const& patch = document.patches[index];
        if (auto placement = check_placement(patch); !placement) {
            return placement;
        }
        if (auto background = check_background(patch, document.depth); !background) {
            return background;
        }
        if (patch.border_color) {
            if (auto ok = check_color(*patch.border_color, document.depth, field_of(patch, "bordercolor")); !ok) {
                return ok;
            }
        }
        for (auto child : patch.children) {
            // Children always come after their parent in the arena, which rules out cycles.
            if (child <= index || child >= document.patches.size()) {
                return std::unexpected(makeError(Error::Code::MalformedInput, field_of(patch, "patches"),
                                                 "child index " + std::to_string(child) + " is not a descendant"));
            }
            if (owned[child]) {
                return std::unexpected(makeError(Error::Code::MalformedInput, field_of(patch, "patches"),
                                                 "child index " + std::to_string(child) + " has two parents"));
            }
            owned[child] = true;
        }
    }
    return {};
}

} // namespace TP

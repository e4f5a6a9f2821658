#pragma once

#include <tpat/core/Error.hpp>
#include <tpat/document/Document.hpp>
#include <tpat/layout/GridResolver.hpp>
#include <tpat/layout/Placement.hpp>

#include <cstdint>
#include <vector>

namespace TP {

struct Rect {
    std::uint32_t x = 0;
    std::uint32_t y = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;

    [[nodiscard]] auto right() const -> std::uint32_t { return x + width; }
    [[nodiscard]] auto bottom() const -> std::uint32_t { return y + height; }
    [[nodiscard]] auto empty() const -> bool { return width == 0 || height == 0; }

    friend auto operator==(Rect const&, Rect const&) -> bool = default;
};

// Where a patch lands in the image. A patch without a grid still gets one
// implicit cell covering its area inside the border.
struct ResolvedGeometry {
    Rect     rect;
    AxisGrid columns;
    AxisGrid rows;
    // Some children share cells. They are drawn one after another in document
    // order so that later siblings cover earlier ones.
    bool overlapping_children = false;
};

// Geometry for every patch of a document, indexed like Document::patches.
struct Layout {
    std::uint32_t                 width = 0;
    std::uint32_t                 height = 0;
    std::vector<ResolvedGeometry> patches;

    [[nodiscard]] auto geometry(PatchIndex index) const -> ResolvedGeometry const& { return patches.at(index); }
};

// Resolves the whole tree top-down. Every size, placement and bounds error is
// reported here, before rendering starts.
[[nodiscard]] auto ResolveLayout(Document const& document) -> Expected<Layout>;

} // namespace TP

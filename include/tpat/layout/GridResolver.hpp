#pragma once

#include <tpat/core/Error.hpp>
#include <tpat/document/Document.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace TP {

// Largest image side accepted, in pixels.
inline constexpr std::uint64_t kMaxAxisLength = std::uint64_t{1} << 20;

// One resolved axis of a patch grid. Offsets are absolute image coordinates of
// each cell's first pixel.
struct AxisGrid {
    std::uint32_t              origin = 0;
    std::uint32_t              border = 0;
    std::uint32_t              spacing = 0;
    std::vector<std::uint32_t> sizes;
    std::vector<std::uint32_t> offsets;
    std::uint32_t              total = 0;

    [[nodiscard]] auto count() const -> std::uint32_t { return static_cast<std::uint32_t>(sizes.size()); }
    // Pixel extent of `cells` consecutive cells starting at `first`, spacing included.
    [[nodiscard]] auto span_start(std::uint32_t first) const -> std::uint32_t { return offsets.at(first); }
    [[nodiscard]] auto span_length(std::uint32_t first, std::uint32_t cells) const -> std::uint32_t;
};

// What the descriptor says about one axis of one patch.
struct AxisRequest {
    std::optional<AxisSpec>      total;     // width / height
    std::optional<AxisSpec>      breakdown; // columns / rows
    std::uint32_t                border = 0;
    std::optional<std::uint32_t> spacing;
    std::string_view             total_key;
    std::string_view             breakdown_key;
};

// The parent cells a patch covers on one axis, handed down for "parent" sizes.
struct ParentAxisContext {
    std::span<std::uint32_t const> sizes;
    std::uint32_t                  spacing = 0;
};

[[nodiscard]] auto axis_total(std::span<std::uint32_t const> sizes, std::uint32_t border, std::uint32_t spacing)
    -> std::uint64_t;

// Resolves one axis. `extent` is the patch length along the axis and is only
// used for the implicit single cell of a patch without sizes; pass nullopt at
// the root, which always declares its sizes.
[[nodiscard]] auto resolve_axis(AxisRequest const& request,
                                std::uint32_t origin,
                                std::optional<std::uint32_t> extent,
                                std::optional<ParentAxisContext> const& parent,
                                std::string_view location) -> Expected<AxisGrid>;

} // namespace TP

#pragma once

#include <tpat/core/Error.hpp>
#include <tpat/render/Color.hpp>
#include <tpat/render/Waveform.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace TP {

using PatchIndex = std::uint32_t;

inline constexpr PatchIndex kRootPatch = 0;
inline constexpr int kLatestVersion = 2;

// The "parent" sentinel: reuse the sizes of the parent cells this patch spans.
struct ParentAxis {
    friend auto operator==(ParentAxis, ParentAxis) -> bool = default;
};

// One axis of a grid: explicit pixel sizes (a scalar is a single entry) or parent delegation.
using AxisSpec = std::variant<std::vector<std::uint32_t>, ParentAxis>;

struct GridSpec {
    std::optional<AxisSpec> width;
    std::optional<AxisSpec> columns;
    std::optional<AxisSpec> height;
    std::optional<AxisSpec> rows;

    [[nodiscard]] auto defined() const -> bool {
        return width || columns || height || rows;
    }
};

// `vertical` is the thickness along the y axis (top/bottom bands, gaps between
// rows); `horizontal` along the x axis (left/right bands, gaps between columns).
struct AxisPair {
    std::uint32_t vertical = 0;
    std::uint32_t horizontal = 0;
};

struct SolidFill {
    Color color{};
};

// Exactly one background kind per patch; monostate leaves the area untouched.
using Background = std::variant<std::monostate, SolidFill, GradientFill, GratingFill>;

// `cell` as authored: 1-based and inclusive.
struct CellRef {
    std::uint32_t row = 1;
    std::uint32_t column = 1;
    std::optional<std::uint32_t> last_row;
    std::optional<std::uint32_t> last_column;
};

// Legacy placement: 0-based, half-open.
struct LegacyPlacement {
    std::optional<std::uint32_t> left;
    std::optional<std::uint32_t> top;
    std::optional<std::uint32_t> right;
    std::optional<std::uint32_t> bottom;

    [[nodiscard]] auto any() const -> bool {
        return left || top || right || bottom;
    }
};

struct PlacementSpec {
    std::optional<CellRef> cell;
    LegacyPlacement legacy;
};

struct OverlaySpec {
    std::string path;
    // Unset means the overlay's alpha is taken as premultiplied.
    std::optional<bool> premultiplied;
};

struct Patch {
    GridSpec grid;
    std::optional<AxisPair> border;
    std::optional<AxisPair> spacing;
    std::optional<Color> border_color;
    Background background;
    std::optional<OverlaySpec> image;
    PlacementSpec placement;
    std::vector<PatchIndex> children;
    std::optional<std::string> description;
    std::vector<std::string> descriptions;
    // Location in the descriptor, used in error messages ("patches[2].patches[0]").
    std::string location;
};

// Owns the whole patch tree as an arena; children refer to their siblings by index.
struct Document {
    int version = 1;
    Depth depth = Depth::Bits8;
    std::optional<std::string> name;
    std::filesystem::path base_directory;
    std::vector<Patch> patches;

    [[nodiscard]] auto root() const -> Patch const& { return patches.at(kRootPatch); }
    [[nodiscard]] auto patch(PatchIndex index) const -> Patch const& { return patches.at(index); }
    [[nodiscard]] auto size() const -> std::size_t { return patches.size(); }

    auto add_patch(Patch patch) -> PatchIndex;
    // Absolute overlay path: relative paths resolve against base_directory.
    [[nodiscard]] auto resolve_resource(std::string const& path) const -> std::filesystem::path;
};

[[nodiscard]] auto background_name(Background const& background) -> char const*;

// Checks the invariants that do not need geometry: root-only rules, placement
// shapes, color ranges for the document depth.
[[nodiscard]] auto ValidateDocument(Document const& document) -> Expected<void>;

} // namespace TP

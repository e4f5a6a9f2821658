#pragma once

#include <tpat/render/Color.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace TP {

struct Rect;

// Interleaved RGB buffer in the depth's sample domain: whole code values for
// integer depths, floats for the 32-bit depth. Starts out black.
class RasterImage {
public:
    RasterImage() = default;
    RasterImage(std::uint32_t width, std::uint32_t height, Depth depth);

    [[nodiscard]] auto width() const -> std::uint32_t { return width_; }
    [[nodiscard]] auto height() const -> std::uint32_t { return height_; }
    [[nodiscard]] auto depth() const -> Depth { return depth_; }
    [[nodiscard]] auto empty() const -> bool { return samples_.empty(); }

    [[nodiscard]] auto at(std::uint32_t x, std::uint32_t y) const -> Pixel;
    auto set(std::uint32_t x, std::uint32_t y, Pixel const& pixel) -> void;
    // Fills the part of `rect` that lies inside the image.
    auto fill(Rect const& rect, Pixel const& pixel) -> void;

    [[nodiscard]] auto samples() const -> std::span<float const> { return samples_; }
    [[nodiscard]] auto row(std::uint32_t y) -> std::span<float>;
    [[nodiscard]] auto row(std::uint32_t y) const -> std::span<float const>;

private:
    [[nodiscard]] auto index_of(std::uint32_t x, std::uint32_t y) const -> std::size_t {
        return (static_cast<std::size_t>(y) * width_ + x) * 3;
    }

    std::uint32_t      width_ = 0;
    std::uint32_t      height_ = 0;
    Depth              depth_ = Depth::Bits8;
    std::vector<float> samples_;
};

} // namespace TP

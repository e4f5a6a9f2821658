#include <tpat/render/RasterImage.hpp>

#include <tpat/layout/Layout.hpp>

#include <algorithm>

namespace TP {

RasterImage::RasterImage(std::uint32_t width, std::uint32_t height, Depth depth)
    : width_(width), height_(height), depth_(depth),
      samples_(static_cast<std::size_t>(width) * height * 3, 0.0f) {}

auto RasterImage::at(std::uint32_t x, std::uint32_t y) const -> Pixel {
    auto const index = index_of(x, y);
    return Pixel{samples_.at(index), samples_.at(index + 1), samples_.at(index + 2)};
}

auto RasterImage::set(std::uint32_t x, std::uint32_t y, Pixel const& pixel) -> void {
    auto const index = index_of(x, y);
    samples_.at(index) = pixel[0];
    samples_.at(index + 1) = pixel[1];
    samples_.at(index + 2) = pixel[2];
}

auto RasterImage::fill(Rect const& rect, Pixel const& pixel) -> void {
    auto const x_end = std::min(rect.right(), width_);
    auto const y_end = std::min(rect.bottom(), height_);
    for (auto y = rect.y; y < y_end; ++y) {
        auto* line = samples_.data() + index_of(0, y);
        for (auto x = rect.x; x < x_end; ++x) {
            std::copy(pixel.begin(), pixel.end(), line + static_cast<std::size_t>(x) * 3);
        }
    }
}

auto RasterImage::row(std::uint32_t y) -> std::span<float> {
    return std::span{samples_}.subspan(index_of(0, y), static_cast<std::size_t>(width_) * 3);
}

auto RasterImage::row(std::uint32_t y) const -> std::span<float const> {
    return std::span{samples_}.subspan(index_of(0, y), static_cast<std::size_t>(width_) * 3);
}

} // namespace TP

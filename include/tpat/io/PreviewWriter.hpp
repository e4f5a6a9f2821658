#pragma once

#include <tpat/core/Error.hpp>
#include <tpat/render/RasterImage.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace TP {

// Interleaved 8-bit RGB copy of the image for quick viewing.
[[nodiscard]] auto PreviewPixels(RasterImage const& image) -> std::vector<std::uint8_t>;

[[nodiscard]] auto WritePreviewPng(RasterImage const& image, std::filesystem::path const& path) -> Expected<void>;

} // namespace TP

#pragma once

#include <tpat/core/Error.hpp>
#include <tpat/render/RasterImage.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace TP {

struct TiffOptions {
    // For 10 and 12-bit depths, repeat the most significant bits in the unused
    // low bits so that full scale maps to 65535.
    bool max_16bit_scaling = true;
};

// Baseline little-endian RGB TIFF with a single uncompressed strip. 8-bit
// images are stored as 8-bit samples, 10 to 16-bit images as 16-bit samples
// aligned to the top bit, float images as 32-bit IEEE samples.
[[nodiscard]] auto EncodeTiff(RasterImage const& image, TiffOptions const& options = {})
    -> Expected<std::vector<std::uint8_t>>;

[[nodiscard]] auto WriteTiff(RasterImage const& image, std::filesystem::path const& path, TiffOptions const& options = {})
    -> Expected<void>;

// Sample value stored for a code value at an integer depth of 10 to 16 bits.
[[nodiscard]] auto widen_to_16bit(float code, int bits, bool max_16bit_scaling) -> std::uint16_t;

} // namespace TP

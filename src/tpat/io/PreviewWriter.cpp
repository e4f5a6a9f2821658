#include <tpat/io/PreviewWriter.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

namespace TP {

auto PreviewPixels(RasterImage const& image) -> std::vector<std::uint8_t> {
    auto const depth = image.depth();
    auto const samples = image.samples();
    std::vector<std::uint8_t> pixels(samples.size());
    if (is_float(depth)) {
        std::transform(samples.begin(), samples.end(), pixels.begin(), [](float v) {
            auto scaled = std::floor(static_cast<double>(v) * 255.0 + 0.5);
            return static_cast<std::uint8_t>(std::clamp(scaled, 0.0, 255.0));
        });
    } else {
        auto const limit = max_code(depth);
        std::transform(samples.begin(), samples.end(), pixels.begin(), [limit](float v) {
            auto scaled = static_cast<double>(v) * 255.0 / limit;
            return static_cast<std::uint8_t>(std::clamp(scaled, 0.0, 255.0));
        });
    }
    return pixels;
}

auto WritePreviewPng(RasterImage const& image, std::filesystem::path const& path) -> Expected<void> {
    if (image.empty()) {
        return std::unexpected(makeError(Error::Code::WriteFailed, path.string(), "the image has no pixels"));
    }
    auto const row_bytes = static_cast<std::size_t>(image.width()) * 3u;
    if (row_bytes > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::unexpected(makeError(Error::Code::WriteFailed, path.string(), "the image is too wide for a preview"));
    }
    auto pixels = PreviewPixels(image);
    if (stbi_write_png(path.string().c_str(),
                       static_cast<int>(image.width()),
                       static_cast<int>(image.height()),
                       3,
                       pixels.data(),
                       static_cast<int>(row_bytes)) == 0) {
        return std::unexpected(makeError(Error::Code::WriteFailed, path.string(), "failed to encode the png preview"));
    }
    tp_log("Wrote preview " + path.string(), "Output");
    return {};
}

} // namespace TP

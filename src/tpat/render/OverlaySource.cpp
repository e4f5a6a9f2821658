#include <tpat/render/OverlaySource.hpp>

#include "log/TaggedLogger.hpp"

#include <fstream>
#include <iterator>
#include <limits>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#include <stb/stb_image.h>

namespace TP {

namespace {

auto read_file(std::filesystem::path const& path) -> Expected<std::vector<std::uint8_t>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(makeError(Error::Code::ResourceNotFound, path.string(), "overlay image does not exist"));
    }
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(makeError(Error::Code::ResourceUnreadable, path.string(), "overlay image cannot be opened"));
    }
    std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (stream.bad()) {
        return std::unexpected(makeError(Error::Code::ResourceUnreadable, path.string(), "failed while reading the overlay image"));
    }
    return bytes;
}

// Grey and grey+alpha sources are widened to RGB and RGBA.
template <typename Sample, typename Normalize>
auto widen(Sample const* source, int width, int height, int channels, Normalize normalize) -> std::vector<float> {
    auto const has_alpha = channels == 2 || channels == 4;
    auto const out_channels = has_alpha ? 4 : 3;
    auto const count = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    std::vector<float> samples(count * static_cast<std::size_t>(out_channels));
    for (std::size_t i = 0; i < count; ++i) {
        auto const* in = source + i * static_cast<std::size_t>(channels);
        auto* out = samples.data() + i * static_cast<std::size_t>(out_channels);
        if (channels <= 2) {
            out[0] = out[1] = out[2] = normalize(in[0]);
        } else {
            out[0] = normalize(in[0]);
            out[1] = normalize(in[1]);
            out[2] = normalize(in[2]);
        }
        if (has_alpha) {
            out[3] = normalize(in[channels - 1]);
        }
    }
    return samples;
}

} // namespace

auto FileOverlaySource::load(std::filesystem::path const& path) -> Expected<std::shared_ptr<OverlayImage const>> {
    auto const key = path.lexically_normal().string();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    auto bytes = read_file(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    auto decoded = decode(*bytes, key);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    tp_log("Decoded overlay " + key + " (" + std::to_string((*decoded)->width) + "x" + std::to_string((*decoded)->height)
               + ", " + std::to_string((*decoded)->source_bits) + "-bit)",
           "Overlay");

    std::lock_guard<std::mutex> lock(mutex_);
    // Another thread may have decoded the same file meanwhile; keep the first copy.
    return cache_.emplace(key, std::move(*decoded)).first->second;
}

void FileOverlaySource::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

auto FileOverlaySource::decode(std::vector<std::uint8_t> const& bytes, std::string const& label)
    -> Expected<std::shared_ptr<OverlayImage const>> {
    if (bytes.empty() || bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::unexpected(makeError(Error::Code::ImageDecodeFailed, label, "unsupported image size"));
    }
    auto const* data = bytes.data();
    auto const length = static_cast<int>(bytes.size());

    int width = 0;
    int height = 0;
    int channels = 0;
    auto image = std::make_shared<OverlayImage>();

    if (stbi_is_hdr_from_memory(data, length)) {
        float* decoded = stbi_loadf_from_memory(data, length, &width, &height, &channels, 0);
        if (!decoded) {
            return std::unexpected(makeError(Error::Code::ImageDecodeFailed, label, stbi_failure_reason()));
        }
        std::unique_ptr<float, void (*)(void*)> pixels(decoded, stbi_image_free);
        image->source_bits = 32;
        image->samples = widen(pixels.get(), width, height, channels, [](float v) { return v; });
    } else if (stbi_is_16_bit_from_memory(data, length)) {
        stbi_us* decoded = stbi_load_16_from_memory(data, length, &width, &height, &channels, 0);
        if (!decoded) {
            return std::unexpected(makeError(Error::Code::ImageDecodeFailed, label, stbi_failure_reason()));
        }
        std::unique_ptr<stbi_us, void (*)(void*)> pixels(decoded, stbi_image_free);
        image->source_bits = 16;
        image->samples = widen(pixels.get(), width, height, channels,
                               [](stbi_us v) { return static_cast<float>(v) / 65535.0f; });
    } else {
        stbi_uc* decoded = stbi_load_from_memory(data, length, &width, &height, &channels, 0);
        if (!decoded) {
            return std::unexpected(makeError(Error::Code::ImageDecodeFailed, label, stbi_failure_reason()));
        }
        std::unique_ptr<stbi_uc, void (*)(void*)> pixels(decoded, stbi_image_free);
        image->source_bits = 8;
        image->samples = widen(pixels.get(), width, height, channels,
                               [](stbi_uc v) { return static_cast<float>(v) / 255.0f; });
    }

    if (width <= 0 || height <= 0) {
        return std::unexpected(makeError(Error::Code::ImageDecodeFailed, label, "image has no pixels"));
    }
    image->width = static_cast<std::uint32_t>(width);
    image->height = static_cast<std::uint32_t>(height);
    image->channels = (channels == 2 || channels == 4) ? 4u : 3u;
    return image;
}

} // namespace TP

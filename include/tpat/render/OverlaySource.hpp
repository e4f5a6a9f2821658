#pragma once

#include <tpat/core/Error.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace TP {

struct OverlayImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    // 3 for RGB, 4 when the file carries alpha.
    std::uint32_t channels = 3;
    // Sample precision of the file: 8, 16, or 32 for floating point sources.
    std::uint32_t source_bits = 8;
    // Interleaved samples scaled to [0, 1], row-major.
    std::vector<float> samples;

    [[nodiscard]] auto has_alpha() const -> bool { return channels == 4; }
};

// Supplies decoded overlay images to the compositor. Implementations must be
// safe to call from several worker threads at once.
class OverlaySource {
public:
    virtual ~OverlaySource() = default;

    [[nodiscard]] virtual auto load(std::filesystem::path const& path) -> Expected<std::shared_ptr<OverlayImage const>> = 0;
};

// Decodes image files with stb_image and keeps each decoded file for reuse.
class FileOverlaySource final : public OverlaySource {
public:
    FileOverlaySource() = default;

    [[nodiscard]] auto load(std::filesystem::path const& path) -> Expected<std::shared_ptr<OverlayImage const>> override;

    void clear();

    // Decodes an in-memory encoded image. `label` names the source in errors.
    [[nodiscard]] static auto decode(std::vector<std::uint8_t> const& bytes, std::string const& label)
        -> Expected<std::shared_ptr<OverlayImage const>>;

private:
    mutable std::mutex                                                    mutex_;
    std::unordered_map<std::string, std::shared_ptr<OverlayImage const>> cache_;
};

} // namespace TP

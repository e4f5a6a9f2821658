#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>

namespace TP {

struct RenderSettings {
    struct Threads {
        // 0 renders on the calling thread only.
        std::size_t workers = 0;
    } threads;

    struct Output {
        // Overrides <name>.tif next to the descriptor.
        std::optional<std::filesystem::path> tiff_path;
        bool write_preview = true;
        bool max_16bit_scaling = true;
    } output;

    bool verbose = false;
};

// Defaults, then TPAT_THREADS, TPAT_MAX_16BIT_SCALING and TPAT_PREVIEW from the environment.
[[nodiscard]] auto RenderSettingsFromEnvironment() -> RenderSettings;

// Accepts "", "1", "true", "on", "yes" as true and "0", "false", "off", "no" as false.
[[nodiscard]] auto parse_truthy(char const* value, bool fallback) -> bool;

} // namespace TP

#include <tpat/RenderSettings.hpp>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

namespace TP {
namespace {

auto trim(std::string_view text) -> std::string_view {
    auto is_space = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto default_worker_count() -> std::size_t {
    auto const hardware = std::thread::hardware_concurrency();
    return hardware == 0 ? 1 : hardware;
}

} // namespace

auto parse_truthy(char const* value, bool fallback) -> bool {
    if (value == nullptr) {
        return fallback;
    }
    auto text = trim(value);
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no") {
        return false;
    }
    if (normalized == "1" || normalized == "true" || normalized == "on" || normalized == "yes") {
        return true;
    }
    return fallback;
}

auto RenderSettingsFromEnvironment() -> RenderSettings {
    RenderSettings settings;
    settings.threads.workers = default_worker_count();

    if (auto const* threads = std::getenv("TPAT_THREADS")) {
        auto text = trim(threads);
        std::size_t parsed = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec == std::errc{} && end == text.data() + text.size()) {
            settings.threads.workers = parsed;
        }
    }
    settings.output.max_16bit_scaling = parse_truthy(std::getenv("TPAT_MAX_16BIT_SCALING"), true);
    settings.output.write_preview = parse_truthy(std::getenv("TPAT_PREVIEW"), true);
    return settings;
}

} // namespace TP

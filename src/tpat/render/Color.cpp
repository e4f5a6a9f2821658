#include <tpat/render/Color.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace TP {
namespace {

auto round_code(double value) -> double {
    return std::floor(value + 0.5);
}

auto channel_name(std::size_t index) -> char const* {
    static constexpr char const* kNames[] = {"red", "green", "blue"};
    return kNames[index];
}

} // namespace

auto depth_from_bits(long long bits) -> std::optional<Depth> {
    switch (bits) {
    case 8:
        return Depth::Bits8;
    case 10:
        return Depth::Bits10;
    case 12:
        return Depth::Bits12;
    case 16:
        return Depth::Bits16;
    case 32:
        return Depth::Float32;
    default:
        break;
    }
    return std::nullopt;
}

auto lerp(Color const& from, Color const& to, double t) -> Color {
    Color result;
    result.greyscale = from.greyscale && to.greyscale;
    for (std::size_t i = 0; i < 3; ++i) {
        result.channels[i] = from.channels[i] + t * (to.channels[i] - from.channels[i]);
    }
    return result;
}

auto check_color(Color const& color, Depth depth, std::string_view field) -> Expected<void> {
    if (is_float(depth)) {
        return {};
    }
    auto const limit = max_code(depth);
    auto const count = color.greyscale ? 1u : 3u;
    for (std::size_t i = 0; i < count; ++i) {
        auto value = color.channels[i];
        if (!std::isfinite(value)) {
            return std::unexpected(makeError(Error::Code::ColorOutOfRange, field, "value is not finite"));
        }
        auto rounded = round_code(value);
        if (rounded < 0.0 || rounded > limit) {
            std::ostringstream detail;
            if (!color.greyscale) {
                detail << channel_name(i) << ' ';
            }
            detail << "value " << value << " is outside [0, " << static_cast<long long>(limit) << "] for "
                   << bit_count(depth) << "-bit depth";
            return std::unexpected(makeError(Error::Code::ColorOutOfRange, field, detail.str()));
        }
    }
    return {};
}

auto quantize_unchecked(Color const& color, Depth depth) -> Pixel {
    Pixel pixel{};
    for (std::size_t i = 0; i < 3; ++i) {
        auto value = color.channels[i];
        pixel[i] = is_float(depth) ? static_cast<float>(value) : static_cast<float>(round_code(value));
    }
    return pixel;
}

auto quantize(Color const& color, Depth depth) -> Expected<Pixel> {
    if (auto checked = check_color(color, depth, "color"); !checked) {
        return std::unexpected(checked.error());
    }
    return quantize_unchecked(color, depth);
}

auto normalize_sample(float sample, Depth depth) -> float {
    if (is_float(depth)) {
        return sample;
    }
    return static_cast<float>(static_cast<double>(sample) / max_code(depth));
}

auto denormalize_sample(float value, Depth depth) -> float {
    if (is_float(depth)) {
        return value;
    }
    auto const limit = max_code(depth);
    auto code = round_code(static_cast<double>(value) * limit);
    return static_cast<float>(std::clamp(code, 0.0, limit));
}

} // namespace TP

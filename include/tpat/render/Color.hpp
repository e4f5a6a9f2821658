#pragma once

#include <tpat/core/Error.hpp>

#include <array>
#include <optional>
#include <string_view>

namespace TP {

enum class Depth : int {
    Bits8 = 8,
    Bits10 = 10,
    Bits12 = 12,
    Bits16 = 16,
    Float32 = 32,
};

[[nodiscard]] auto depth_from_bits(long long bits) -> std::optional<Depth>;

[[nodiscard]] constexpr auto bit_count(Depth depth) -> int {
    return static_cast<int>(depth);
}

[[nodiscard]] constexpr auto is_float(Depth depth) -> bool {
    return depth == Depth::Float32;
}

// Largest code value of an integer depth; 1.0 for float samples.
[[nodiscard]] constexpr auto max_code(Depth depth) -> double {
    if (is_float(depth)) {
        return 1.0;
    }
    return static_cast<double>((1u << bit_count(depth)) - 1u);
}

// A color as authored: a greyscale scalar or an RGB triplet, in the depth's
// code-value domain, before quantization.
struct Color {
    std::array<double, 3> channels{0.0, 0.0, 0.0};
    bool greyscale = true;

    [[nodiscard]] static auto Grey(double value) -> Color {
        return Color{.channels = {value, value, value}, .greyscale = true};
    }
    [[nodiscard]] static auto Rgb(double r, double g, double b) -> Color {
        return Color{.channels = {r, g, b}, .greyscale = false};
    }

    friend auto operator==(Color const&, Color const&) -> bool = default;
};

// One output sample triplet. Integer depths hold whole code values, which a
// float represents exactly up to 16 bits.
using Pixel = std::array<float, 3>;

// Interpolates in the authored representation; quantize the result once.
[[nodiscard]] auto lerp(Color const& from, Color const& to, double t) -> Color;

[[nodiscard]] auto quantize(Color const& color, Depth depth) -> Expected<Pixel>;
[[nodiscard]] auto quantize_unchecked(Color const& color, Depth depth) -> Pixel;
[[nodiscard]] auto check_color(Color const& color, Depth depth, std::string_view field) -> Expected<void>;

// Conversions between the depth's sample domain and normalized [0, 1].
[[nodiscard]] auto normalize_sample(float sample, Depth depth) -> float;
[[nodiscard]] auto denormalize_sample(float value, Depth depth) -> float;

} // namespace TP

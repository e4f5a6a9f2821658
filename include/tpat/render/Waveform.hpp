#pragma once

#include <tpat/render/Color.hpp>

#include <cstdint>

namespace TP {

enum class Axis {
    Horizontal,
    Vertical,
};

enum class Waveform {
    Square,
    Sine,
    Cosine,
};

struct GradientFill {
    Axis axis = Axis::Horizontal;
    Color from{};
    Color to{};
};

// Half-periods are in pixels; a constant grating has start == end.
struct GratingFill {
    Axis axis = Axis::Horizontal;
    Waveform waveform = Waveform::Square;
    double start_half_period = 1.0;
    double end_half_period = 1.0;
    Color first{};
    Color second{};
};

// Color at `offset` along a ramp of `length` pixels: `from` at 0, `to` at length - 1.
[[nodiscard]] auto gradient_color(GradientFill const& fill, std::uint32_t offset, std::uint32_t length) -> Color;

// Accumulated phase in half-cycles at `offset`: the integral of 1 / halfPeriod(x)
// where the half-period sweeps linearly from start to end over the length.
[[nodiscard]] auto grating_phase(GratingFill const& fill, double offset, std::uint32_t length) -> double;

// The waveform actually drawn. A constant 1 px half-period sits at the Nyquist
// limit where a sampled sinusoid is flat, so it is drawn as a square wave.
[[nodiscard]] auto effective_waveform(GratingFill const& fill) -> Waveform;

[[nodiscard]] auto grating_color(GratingFill const& fill, std::uint32_t offset, std::uint32_t length) -> Color;

} // namespace TP

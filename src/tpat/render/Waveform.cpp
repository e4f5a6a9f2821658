#include <tpat/render/Waveform.hpp>

#include <cmath>
#include <numbers>

namespace TP {

auto gradient_color(GradientFill const& fill, std::uint32_t offset, std::uint32_t length) -> Color {
    if (length <= 1) {
        return lerp(fill.from, fill.to, 0.0);
    }
    auto t = static_cast<double>(offset) / static_cast<double>(length - 1);
    return lerp(fill.from, fill.to, t);
}

auto grating_phase(GratingFill const& fill, double offset, std::uint32_t length) -> double {
    auto const start = fill.start_half_period;
    auto const end = fill.end_half_period;
    if (start == end || length <= 1) {
        return offset / start;
    }
    // halfPeriod(x) = start + slope * x, so the integral of its reciprocal is logarithmic.
    auto const slope = (end - start) / static_cast<double>(length - 1);
    return std::log((start + slope * offset) / start) / slope;
}

auto effective_waveform(GratingFill const& fill) -> Waveform {
    if (fill.start_half_period == 1.0 && fill.end_half_period == 1.0) {
        return Waveform::Square;
    }
    return fill.waveform;
}

auto grating_color(GratingFill const& fill, std::uint32_t offset, std::uint32_t length) -> Color {
    auto const half_cycles = grating_phase(fill, static_cast<double>(offset), length);
    auto const phase = half_cycles * std::numbers::pi;

    switch (effective_waveform(fill)) {
    case Waveform::Square:
        // sin(phase) >= 0 on the even half-cycles.
        return std::fmod(half_cycles, 2.0) < 1.0 ? fill.first : fill.second;
    case Waveform::Sine:
        return lerp(fill.first, fill.second, (std::sin(phase) + 1.0) / 2.0);
    case Waveform::Cosine:
        return lerp(fill.first, fill.second, (std::sin(phase + std::numbers::pi / 2.0) + 1.0) / 2.0);
    }
    return fill.first;
}

} // namespace TP

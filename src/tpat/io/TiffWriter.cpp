#include <tpat/io/TiffWriter.hpp>

#include "log/TaggedLogger.hpp"

#include <bit>
#include <cmath>
#include <fstream>
#include <limits>
#include <string>

namespace TP {
namespace {

enum class FieldType : std::uint16_t {
    Short = 3,
    Long = 4,
    Rational = 5,
};

enum Tag : std::uint16_t {
    ImageWidth = 256,
    ImageLength = 257,
    BitsPerSample = 258,
    Compression = 259,
    PhotometricInterpretation = 262,
    StripOffsets = 273,
    SamplesPerPixel = 277,
    RowsPerStrip = 278,
    StripByteCounts = 279,
    XResolution = 282,
    YResolution = 283,
    PlanarConfiguration = 284,
    ResolutionUnit = 296,
    SampleFormat = 339,
};

constexpr std::uint16_t kEntryCount = 14;
constexpr std::size_t kHeaderSize = 8;
constexpr std::size_t kIfdSize = 2 + kEntryCount * 12 + 4;

class ByteWriter {
public:
    explicit ByteWriter(std::vector<std::uint8_t>& out)
        : out_(out) {}

    auto u16(std::uint16_t value) -> void {
        out_.push_back(static_cast<std::uint8_t>(value & 0xFFu));
        out_.push_back(static_cast<std::uint8_t>(value >> 8));
    }
    auto u32(std::uint32_t value) -> void {
        u16(static_cast<std::uint16_t>(value & 0xFFFFu));
        u16(static_cast<std::uint16_t>(value >> 16));
    }
    auto pad_to(std::size_t size) -> void {
        while (out_.size() < size) {
            out_.push_back(0);
        }
    }
    auto entry(Tag tag, FieldType type, std::uint32_t count, std::uint32_t value) -> void {
        u16(tag);
        u16(static_cast<std::uint16_t>(type));
        u32(count);
        // A single SHORT sits in the low-order bytes of the value field.
        if (type == FieldType::Short && count == 1) {
            u16(static_cast<std::uint16_t>(value));
            u16(0);
        } else {
            u32(value);
        }
    }

private:
    std::vector<std::uint8_t>& out_;
};

auto bytes_per_sample(Depth depth) -> std::size_t {
    switch (depth) {
    case Depth::Bits8:
        return 1;
    case Depth::Float32:
        return 4;
    default:
        return 2;
    }
}

} // namespace

auto widen_to_16bit(float code, int bits, bool max_16bit_scaling) -> std::uint16_t {
    auto const value = static_cast<double>(code);
    auto const scale_up = std::ldexp(1.0, 16 - bits);
    auto widened = value * scale_up;
    if (max_16bit_scaling) {
        widened += value / std::ldexp(1.0, 2 * bits - 16);
    }
    if (widened <= 0.0) {
        return 0;
    }
    if (widened >= 65535.0) {
        return 65535;
    }
    return static_cast<std::uint16_t>(widened);
}

auto EncodeTiff(RasterImage const& image, TiffOptions const& options) -> Expected<std::vector<std::uint8_t>> {
    if (image.empty()) {
        return std::unexpected(makeError(Error::Code::WriteFailed, "tiff", "the image has no pixels"));
    }
    auto const depth = image.depth();
    auto const sample_bytes = bytes_per_sample(depth);
    auto const strip_bytes = static_cast<std::uint64_t>(image.width()) * image.height() * 3 * sample_bytes;

    // Out-of-line values: BitsPerSample[3], SampleFormat[3], XResolution, YResolution.
    auto const bits_offset = kHeaderSize + kIfdSize;
    auto const format_offset = bits_offset + 8;
    auto const xres_offset = format_offset + 8;
    auto const yres_offset = xres_offset + 8;
    auto const data_offset = yres_offset + 8;
    if (data_offset + strip_bytes > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(makeError(Error::Code::WriteFailed, "tiff", "the image is too large for a baseline TIFF"));
    }

    std::vector<std::uint8_t> out;
    out.reserve(data_offset + static_cast<std::size_t>(strip_bytes));
    ByteWriter writer{out};

    out.push_back('I');
    out.push_back('I');
    writer.u16(42);
    writer.u32(static_cast<std::uint32_t>(kHeaderSize));

    auto const bits = static_cast<std::uint16_t>(sample_bytes * 8);
    auto const format = static_cast<std::uint16_t>(is_float(depth) ? 3 : 1);

    writer.u16(kEntryCount);
    writer.entry(ImageWidth, FieldType::Long, 1, image.width());
    writer.entry(ImageLength, FieldType::Long, 1, image.height());
    writer.entry(BitsPerSample, FieldType::Short, 3, static_cast<std::uint32_t>(bits_offset));
    writer.entry(Compression, FieldType::Short, 1, 1);
    writer.entry(PhotometricInterpretation, FieldType::Short, 1, 2);
    writer.entry(StripOffsets, FieldType::Long, 1, static_cast<std::uint32_t>(data_offset));
    writer.entry(SamplesPerPixel, FieldType::Short, 1, 3);
    writer.entry(RowsPerStrip, FieldType::Long, 1, image.height());
    writer.entry(StripByteCounts, FieldType::Long, 1, static_cast<std::uint32_t>(strip_bytes));
    writer.entry(XResolution, FieldType::Rational, 1, static_cast<std::uint32_t>(xres_offset));
    writer.entry(YResolution, FieldType::Rational, 1, static_cast<std::uint32_t>(yres_offset));
    writer.entry(PlanarConfiguration, FieldType::Short, 1, 1);
    writer.entry(ResolutionUnit, FieldType::Short, 1, 1);
    writer.entry(SampleFormat, FieldType::Short, 3, static_cast<std::uint32_t>(format_offset));
    writer.u32(0);

    for (int i = 0; i < 3; ++i) {
        writer.u16(bits);
    }
    writer.pad_to(format_offset);
    for (int i = 0; i < 3; ++i) {
        writer.u16(format);
    }
    writer.pad_to(xres_offset);
    writer.u32(1);
    writer.u32(1);
    writer.u32(1);
    writer.u32(1);

    auto const depth_bits = bit_count(depth);
    for (auto sample : image.samples()) {
        switch (depth) {
        case Depth::Bits8:
            out.push_back(static_cast<std::uint8_t>(sample));
            break;
        case Depth::Float32:
            writer.u32(std::bit_cast<std::uint32_t>(sample));
            break;
        default:
            writer.u16(widen_to_16bit(sample, depth_bits, options.max_16bit_scaling));
            break;
        }
    }
    return out;
}

auto WriteTiff(RasterImage const& image, std::filesystem::path const& path, TiffOptions const& options) -> Expected<void> {
    auto encoded = EncodeTiff(image, options);
    if (!encoded) {
        return std::unexpected(encoded.error());
    }
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream) {
        return std::unexpected(makeError(Error::Code::WriteFailed, path.string(), "cannot open for writing"));
    }
    stream.write(reinterpret_cast<char const*>(encoded->data()), static_cast<std::streamsize>(encoded->size()));
    stream.close();
    if (!stream) {
        return std::unexpected(makeError(Error::Code::WriteFailed, path.string(), "failed while writing"));
    }
    tp_log("Wrote " + path.string() + " (" + std::to_string(encoded->size()) + " bytes)", "Output");
    return {};
}

} // namespace TP

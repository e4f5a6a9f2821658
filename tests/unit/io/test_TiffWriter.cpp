#include <doctest/doctest.h>
#include <tpat/io/TiffWriter.hpp>
#include <tpat/layout/Layout.hpp>

#include <bit>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>

using namespace TP;

namespace {

auto u16_at(std::vector<std::uint8_t> const& bytes, std::size_t offset) -> std::uint16_t {
    return static_cast<std::uint16_t>(bytes.at(offset) | (bytes.at(offset + 1) << 8));
}

auto u32_at(std::vector<std::uint8_t> const& bytes, std::size_t offset) -> std::uint32_t {
    return static_cast<std::uint32_t>(u16_at(bytes, offset)) | (static_cast<std::uint32_t>(u16_at(bytes, offset + 2)) << 16);
}

struct Entry {
    std::uint16_t tag;
    std::uint16_t type;
    std::uint32_t count;
    std::uint32_t value;
};

auto entry_at(std::vector<std::uint8_t> const& bytes, std::size_t index) -> Entry {
    auto const offset = 10 + index * 12;
    return Entry{u16_at(bytes, offset), u16_at(bytes, offset + 2), u32_at(bytes, offset + 4), u32_at(bytes, offset + 8)};
}

auto find_entry(std::vector<std::uint8_t> const& bytes, std::uint16_t tag) -> std::optional<Entry> {
    auto const count = u16_at(bytes, 8);
    for (std::size_t i = 0; i < count; ++i) {
        auto entry = entry_at(bytes, i);
        if (entry.tag == tag) {
            return entry;
        }
    }
    return std::nullopt;
}

} // namespace

TEST_SUITE("io.tiff") {

TEST_CASE("header and directory") {
    RasterImage image{2, 1, Depth::Bits8};
    image.set(0, 0, Pixel{1.0f, 2.0f, 3.0f});
    image.set(1, 0, Pixel{250.0f, 251.0f, 252.0f});
    auto encoded = EncodeTiff(image);
    REQUIRE(encoded.has_value());
    auto const& bytes = *encoded;

    CHECK(bytes[0] == 'I');
    CHECK(bytes[1] == 'I');
    CHECK(u16_at(bytes, 2) == 42);
    CHECK(u32_at(bytes, 4) == 8);
    CHECK(u16_at(bytes, 8) == 14);

    // Tags are in ascending order.
    bool ascending = true;
    for (std::size_t i = 1; i < 14; ++i) {
        ascending = ascending && entry_at(bytes, i).tag > entry_at(bytes, i - 1).tag;
    }
    CHECK(ascending);

    CHECK(find_entry(bytes, 256)->value == 2);
    CHECK(find_entry(bytes, 257)->value == 1);
    CHECK(find_entry(bytes, 259)->value == 1);
    CHECK(find_entry(bytes, 262)->value == 2);
    CHECK(find_entry(bytes, 277)->value == 3);
    CHECK(find_entry(bytes, 279)->value == 6);

    auto bits = find_entry(bytes, 258);
    REQUIRE(bits.has_value());
    CHECK(bits->count == 3);
    CHECK(u16_at(bytes, bits->value) == 8);
    CHECK(u16_at(bytes, bits->value + 4) == 8);

    auto format = find_entry(bytes, 339);
    REQUIRE(format.has_value());
    CHECK(u16_at(bytes, format->value) == 1);

    auto data = find_entry(bytes, 273)->value;
    REQUIRE(bytes.size() == data + 6);
    CHECK(std::vector<std::uint8_t>(bytes.begin() + data, bytes.end()) == std::vector<std::uint8_t>{1, 2, 3, 250, 251, 252});
}

TEST_CASE("ten bit samples are widened to sixteen bits") {
    RasterImage image{1, 1, Depth::Bits10};
    image.set(0, 0, Pixel{1023.0f, 512.0f, 0.0f});

    SUBCASE("with max scaling") {
        auto encoded = EncodeTiff(image);
        REQUIRE(encoded.has_value());
        auto data = find_entry(*encoded, 273)->value;
        CHECK(u16_at(*encoded, data) == 65535);
        CHECK(u16_at(*encoded, data + 2) == 32800);
        CHECK(u16_at(*encoded, data + 4) == 0);
        CHECK(u16_at(*encoded, find_entry(*encoded, 258)->value) == 16);
    }
    SUBCASE("shift only") {
        auto encoded = EncodeTiff(image, TiffOptions{.max_16bit_scaling = false});
        REQUIRE(encoded.has_value());
        auto data = find_entry(*encoded, 273)->value;
        CHECK(u16_at(*encoded, data) == 65472);
        CHECK(u16_at(*encoded, data + 2) == 32768);
    }
}

TEST_CASE("widen_to_16bit") {
    CHECK(widen_to_16bit(4095.0f, 12, true) == 65535);
    CHECK(widen_to_16bit(4095.0f, 12, false) == 65520);
    CHECK(widen_to_16bit(65535.0f, 16, true) == 65535);
    CHECK(widen_to_16bit(100.0f, 16, true) == 100);
    CHECK(widen_to_16bit(0.0f, 10, true) == 0);
}

TEST_CASE("float images keep IEEE samples") {
    RasterImage image{1, 1, Depth::Float32};
    image.set(0, 0, Pixel{0.25f, 1.5f, -0.5f});
    auto encoded = EncodeTiff(image);
    REQUIRE(encoded.has_value());
    CHECK(u16_at(*encoded, find_entry(*encoded, 258)->value) == 32);
    CHECK(u16_at(*encoded, find_entry(*encoded, 339)->value) == 3);
    auto data = find_entry(*encoded, 273)->value;
    CHECK(std::bit_cast<float>(u32_at(*encoded, data)) == 0.25f);
    CHECK(std::bit_cast<float>(u32_at(*encoded, data + 4)) == 1.5f);
    CHECK(std::bit_cast<float>(u32_at(*encoded, data + 8)) == -0.5f);
}

TEST_CASE("empty image cannot be encoded") {
    RasterImage image;
    auto encoded = EncodeTiff(image);
    REQUIRE_FALSE(encoded.has_value());
    CHECK(encoded.error().code == Error::Code::WriteFailed);
}

TEST_CASE("WriteTiff writes the encoded bytes") {
    auto const path = std::filesystem::temp_directory_path() / "tpat_test_write.tif";
    RasterImage image{3, 2, Depth::Bits12};
    image.fill(Rect{.x = 0, .y = 0, .width = 3, .height = 2}, Pixel{4095.0f, 0.0f, 2048.0f});
    REQUIRE(WriteTiff(image, path).has_value());

    std::ifstream stream(path, std::ios::binary);
    std::vector<std::uint8_t> written{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    stream.close();
    std::filesystem::remove(path);

    auto encoded = EncodeTiff(image);
    REQUIRE(encoded.has_value());
    CHECK(written == *encoded);
}

TEST_CASE("WriteTiff reports unwritable paths") {
    RasterImage image{1, 1, Depth::Bits8};
    auto written = WriteTiff(image, std::filesystem::temp_directory_path() / "tpat_missing_dir" / "out.tif");
    REQUIRE_FALSE(written.has_value());
    CHECK(written.error().code == Error::Code::WriteFailed);
}

}

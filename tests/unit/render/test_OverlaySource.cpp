#include <doctest/doctest.h>
#include <tpat/io/PreviewWriter.hpp>
#include <tpat/layout/Layout.hpp>
#include <tpat/render/OverlaySource.hpp>

#include <filesystem>

using namespace TP;

TEST_SUITE("render.overlay_source") {

TEST_CASE("missing file") {
    FileOverlaySource source;
    auto image = source.load(std::filesystem::temp_directory_path() / "tpat_no_such_overlay.png");
    REQUIRE_FALSE(image.has_value());
    CHECK(image.error().code == Error::Code::ResourceNotFound);
    CHECK(image.error().message->find("tpat_no_such_overlay.png") != std::string::npos);
}

TEST_CASE("undecodable bytes") {
    std::vector<std::uint8_t> bytes{'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e'};
    auto image = FileOverlaySource::decode(bytes, "garbage.png");
    REQUIRE_FALSE(image.has_value());
    CHECK(image.error().code == Error::Code::ImageDecodeFailed);
    CHECK(image.error().message->starts_with("garbage.png"));
}

TEST_CASE("png files decode to normalized rgb and are cached") {
    auto const path = std::filesystem::temp_directory_path() / "tpat_test_overlay.png";
    RasterImage written{3, 2, Depth::Bits8};
    written.fill(Rect{.x = 0, .y = 0, .width = 3, .height = 2}, Pixel{255.0f, 0.0f, 51.0f});
    REQUIRE(WritePreviewPng(written, path).has_value());

    FileOverlaySource source;
    auto first = source.load(path);
    REQUIRE(first.has_value());
    auto const& image = **first;
    CHECK(image.width == 3);
    CHECK(image.height == 2);
    CHECK(image.channels == 3);
    CHECK(image.source_bits == 8);
    REQUIRE(image.samples.size() == 18);
    CHECK(image.samples[0] == doctest::Approx(1.0));
    CHECK(image.samples[1] == doctest::Approx(0.0));
    CHECK(image.samples[2] == doctest::Approx(0.2));

    auto second = source.load(path);
    REQUIRE(second.has_value());
    CHECK(second->get() == first->get());

    source.clear();
    auto third = source.load(path);
    REQUIRE(third.has_value());
    CHECK(third->get() != first->get());

    std::filesystem::remove(path);
}

}

#include <doctest/doctest.h>
#include <tpat/document/DescriptorParser.hpp>
#include <tpat/layout/Layout.hpp>

using namespace TP;

namespace {

auto layout_of(std::string_view text) -> Expected<Layout> {
    auto document = ParseDescriptor(text);
    REQUIRE(document.has_value());
    return ResolveLayout(*document);
}

} // namespace

TEST_SUITE("layout.resolve") {

TEST_CASE("three squares example") {
    auto layout = layout_of(R"({
        "version": 2, "depth": 32,
        "width": [210, 360, 210, 360, 210, 360, 210], "height": [360, 360, 360],
        "hramp": [0, 1],
        "patches": [
            {"cell": [2, 2], "color": 0.5},
            {"cell": [2, 4], "color": 0.5},
            {"cell": [2, 6], "color": 0.5}
        ]})");
    REQUIRE(layout.has_value());
    CHECK(layout->width == 1920);
    CHECK(layout->height == 1080);
    CHECK(layout->geometry(0).rect == Rect{.x = 0, .y = 0, .width = 1920, .height = 1080});
    CHECK(layout->geometry(1).rect == Rect{.x = 210, .y = 360, .width = 360, .height = 360});
    CHECK(layout->geometry(2).rect == Rect{.x = 780, .y = 360, .width = 360, .height = 360});
    CHECK(layout->geometry(3).rect == Rect{.x = 1350, .y = 360, .width = 360, .height = 360});
}

TEST_CASE("borders and spacing shift the cells") {
    auto layout = layout_of(R"({
        "version": 2, "depth": 8,
        "columns": [10, 10], "rows": [10],
        "border": [1, 2], "spacing": [0, 4],
        "patches": [1, 2]})");
    REQUIRE(layout.has_value());
    CHECK(layout->width == 28);
    CHECK(layout->height == 12);
    CHECK(layout->geometry(1).rect == Rect{.x = 2, .y = 1, .width = 10, .height = 10});
    CHECK(layout->geometry(2).rect == Rect{.x = 16, .y = 1, .width = 10, .height = 10});
}

TEST_CASE("spans include the spacing they cover") {
    auto layout = layout_of(R"({
        "version": 2, "depth": 8,
        "columns": [10, 20, 30], "rows": [5, 5], "spacing": 2,
        "patches": [{"cell": [1, 1, 2, 3]}]})");
    REQUIRE(layout.has_value());
    CHECK(layout->geometry(1).rect == Rect{.x = 0, .y = 0, .width = 64, .height = 12});
}

TEST_CASE("parent delegation aligns nested grids") {
    auto layout = layout_of(R"({
        "version": 2, "depth": 8,
        "columns": [10, 20, 30], "rows": [8, 8], "spacing": 2,
        "patches": [
            {"cell": [2, 1, 2, 3], "columns": "parent",
             "patches": [{"color": 1}, {"color": 2}, {"color": 3}]}
        ]})");
    REQUIRE(layout.has_value());
    auto const& band = layout->geometry(1);
    CHECK(band.columns.sizes == std::vector<std::uint32_t>{10, 20, 30});
    CHECK(band.columns.spacing == 2);
    CHECK(band.columns.offsets == layout->geometry(0).columns.offsets);
    // Rows were not delegated: one implicit row.
    CHECK(band.rows.count() == 1);
    CHECK(layout->geometry(4).rect == Rect{.x = 34, .y = 10, .width = 30, .height = 8});
}

TEST_CASE("patches with children and no grid use one implicit cell") {
    auto layout = layout_of(R"({
        "version": 2, "depth": 8, "width": [40, 40], "height": 20,
        "patches": [{"border": 3, "patches": [{"color": 9}]}]})");
    REQUIRE(layout.has_value());
    CHECK(layout->geometry(2).rect == Rect{.x = 3, .y = 3, .width = 34, .height = 14});
}

TEST_CASE("semantic errors surface before rendering") {
    SUBCASE("child grid larger than its cell") {
        auto layout = layout_of(R"({
            "version": 2, "depth": 8, "width": [10, 10], "height": 10,
            "patches": [{"columns": [6, 6]}]})");
        REQUIRE_FALSE(layout.has_value());
        CHECK(layout.error().code == Error::Code::OutOfBounds);
        CHECK(layout.error().message->starts_with("patches[0].width"));
    }
    SUBCASE("nested width and columns disagree") {
        auto layout = layout_of(R"({
            "version": 2, "depth": 8, "width": [40], "height": 10,
            "patches": [{"width": 30, "columns": [10, 10]}]})");
        REQUIRE_FALSE(layout.has_value());
        CHECK(layout.error().code == Error::Code::SizeMismatch);
    }
    SUBCASE("root width and columns disagree") {
        auto layout = layout_of(R"({"depth": 8, "width": 25, "columns": [10, 10], "height": 10})");
        REQUIRE_FALSE(layout.has_value());
        CHECK(layout.error().code == Error::Code::SizeMismatch);
    }
    SUBCASE("parent at the root") {
        // Caught as soon as the document is built.
        auto document = ParseDescriptor(R"({"depth": 8, "width": "parent", "height": 10})");
        REQUIRE_FALSE(document.has_value());
        CHECK(document.error().code == Error::Code::InvalidParentReference);
    }
    SUBCASE("children past the last row") {
        auto layout = layout_of(R"({"depth": 8, "width": [5, 5], "height": 5, "subpatches": [1, 2, 3]})");
        REQUIRE_FALSE(layout.has_value());
        CHECK(layout.error().code == Error::Code::OutOfBounds);
        CHECK(layout.error().message->starts_with("subpatches[2]"));
    }
}

TEST_CASE("siblings sharing cells are flagged") {
    auto disjoint = layout_of(R"({"version": 2, "depth": 8, "width": [4, 4], "height": 4, "patches": [1, 2]})");
    REQUIRE(disjoint.has_value());
    CHECK_FALSE(disjoint->geometry(kRootPatch).overlapping_children);

    auto shared = layout_of(R"({"version": 2, "depth": 8, "width": [4, 4], "height": [4, 4],
                                "patches": [{"cell": [1, 1, 2, 2], "color": 1}, {"cell": [2, 2], "color": 2}]})");
    REQUIRE(shared.has_value());
    CHECK(shared->geometry(kRootPatch).overlapping_children);
    CHECK(shared->geometry(1).rect == Rect{.x = 0, .y = 0, .width = 8, .height = 8});
    CHECK(shared->geometry(2).rect == Rect{.x = 4, .y = 4, .width = 4, .height = 4});
}

}

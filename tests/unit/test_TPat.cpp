#include <doctest/doctest.h>
#include <tpat/TPat.hpp>

#include "taskpool/TaskPool.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <unistd.h>

using namespace TP;

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

class ScratchDirectory {
public:
    ScratchDirectory() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path()
                / ("tpat_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~ScratchDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDirectory(ScratchDirectory const&)            = delete;
    ScratchDirectory& operator=(ScratchDirectory const&) = delete;

    auto write(std::string const& name, std::string const& text) const -> std::filesystem::path {
        auto file = path_ / name;
        std::ofstream stream(file);
        stream << text;
        return file;
    }

    auto path() const -> std::filesystem::path const& { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_SUITE("tpat") {

TEST_CASE("parse_truthy") {
    CHECK(parse_truthy(nullptr, true));
    CHECK_FALSE(parse_truthy(nullptr, false));
    CHECK(parse_truthy("", false));
    CHECK(parse_truthy(" Yes ", false));
    CHECK(parse_truthy("ON", false));
    CHECK_FALSE(parse_truthy("0", true));
    CHECK_FALSE(parse_truthy("off", true));
    CHECK(parse_truthy("maybe", true));
    CHECK_FALSE(parse_truthy("maybe", false));
}

TEST_CASE("RenderSettingsFromEnvironment") {
    SUBCASE("defaults") {
        EnvGuard threads{"TPAT_THREADS", nullptr};
        EnvGuard scaling{"TPAT_MAX_16BIT_SCALING", nullptr};
        EnvGuard preview{"TPAT_PREVIEW", nullptr};
        auto settings = RenderSettingsFromEnvironment();
        CHECK(settings.threads.workers >= 1);
        CHECK(settings.output.max_16bit_scaling);
        CHECK(settings.output.write_preview);
        CHECK_FALSE(settings.output.tiff_path.has_value());
    }
    SUBCASE("overrides") {
        EnvGuard threads{"TPAT_THREADS", "3"};
        EnvGuard scaling{"TPAT_MAX_16BIT_SCALING", "false"};
        EnvGuard preview{"TPAT_PREVIEW", "no"};
        auto settings = RenderSettingsFromEnvironment();
        CHECK(settings.threads.workers == 3);
        CHECK_FALSE(settings.output.max_16bit_scaling);
        CHECK_FALSE(settings.output.write_preview);
    }
    SUBCASE("malformed thread count keeps the default") {
        EnvGuard threads{"TPAT_THREADS", "lots"};
        CHECK(RenderSettingsFromEnvironment().threads.workers >= 1);
    }
}

TEST_CASE("output naming") {
    auto named = ParseDescriptor(R"({"depth": 8, "width": 1, "height": 1, "name": "three grey squares"})");
    REQUIRE(named.has_value());
    auto unnamed = ParseDescriptor(R"({"depth": 8, "width": 1, "height": 1})");
    REQUIRE(unnamed.has_value());
    std::filesystem::path const descriptor = "/patterns/squares.tpat";

    CHECK(OutputBaseName(*named, descriptor) == "three_grey_squares");
    CHECK(OutputBaseName(*unnamed, descriptor) == "squares");

    RenderSettings settings;
    auto paths = ResolveOutputPaths(*named, descriptor, settings);
    CHECK(paths.tiff == std::filesystem::path{"/patterns/three_grey_squares.tif"});
    REQUIRE(paths.preview.has_value());
    CHECK(*paths.preview == std::filesystem::path{"/patterns/three_grey_squares.png"});

    settings.output.write_preview = false;
    settings.output.tiff_path = "/elsewhere/out.tif";
    paths = ResolveOutputPaths(*unnamed, descriptor, settings);
    CHECK(paths.tiff == std::filesystem::path{"/elsewhere/out.tif"});
    CHECK_FALSE(paths.preview.has_value());
}

TEST_CASE("RenderDocument") {
    auto document = ParseDescriptor(R"({"version": 2, "depth": 12, "width": [2, 2], "height": 2,
                                        "patches": [100, 200]})");
    REQUIRE(document.has_value());
    TaskPool pool{2};
    FileOverlaySource overlays;
    auto result = RenderDocument(*document, pool, overlays);
    REQUIRE(result.has_value());
    CHECK(result->layout.width == 4);
    CHECK(result->layout.height == 2);
    CHECK(result->layout.patches.size() == 3);
    CHECK(result->image.at(1, 1) == Pixel{100.0f, 100.0f, 100.0f});
    CHECK(result->image.at(2, 0) == Pixel{200.0f, 200.0f, 200.0f});
}

TEST_CASE("descriptor file to tiff and preview") {
    ScratchDirectory scratch;
    auto descriptor = scratch.write("squares.tpat", R"({
        "version": 2, "depth": 10, "name": "small squares",
        "width": [4, 4, 4], "height": [4, 4, 4], "color": 64,
        "patches": [{"cell": [2, 2], "color": 1023}]
    })");

    RenderSettings settings;
    settings.threads.workers = 2;
    auto result = RenderDescriptorFile(descriptor, settings);
    REQUIRE(result.has_value());
    CHECK(result->image.width() == 12);
    CHECK(result->image.at(5, 5) == Pixel{1023.0f, 1023.0f, 1023.0f});
    CHECK(result->image.at(0, 0) == Pixel{64.0f, 64.0f, 64.0f});

    auto paths = ResolveOutputPaths(result->document, descriptor, settings);
    REQUIRE(WriteOutputs(*result, paths, settings).has_value());
    CHECK(std::filesystem::exists(scratch.path() / "small_squares.tif"));
    CHECK(std::filesystem::exists(scratch.path() / "small_squares.png"));
    // 12x12 RGB at 16 bits per sample.
    CHECK(std::filesystem::file_size(scratch.path() / "small_squares.tif") == 214 + 12 * 12 * 3 * 2);
}

TEST_CASE("relative overlay paths resolve against the descriptor directory") {
    ScratchDirectory scratch;
    auto descriptor = scratch.write("overlay.tpat", R"({
        "version": 2, "depth": 8, "width": 4, "height": 4, "image": "missing.png"
    })");
    RenderSettings settings;
    settings.threads.workers = 0;
    auto result = RenderDescriptorFile(descriptor, settings);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::ResourceNotFound);
    CHECK(result.error().message->find((scratch.path() / "missing.png").string()) != std::string::npos);
}

TEST_CASE("missing descriptor file") {
    RenderSettings settings;
    auto result = RenderDescriptorFile(std::filesystem::temp_directory_path() / "tpat_no_such.tpat", settings);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::ResourceNotFound);
}

}

#include <tpat/TPat.hpp>

#include "cli/ToolCli.hpp"
#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Tpat2TiffOptions {
    std::filesystem::path descriptor;
    TP::RenderSettings    settings;
};

constexpr char const* kAbout = "Renders a T-PAT test pattern descriptor to a TIFF image and an 8-bit PNG preview.\n";
constexpr char const* kEnvironment = "Environment: TPAT_THREADS, TPAT_PREVIEW, TPAT_MAX_16BIT_SCALING, TPAT_LOG_TAGS\n";

auto parse_cli(int argc, char** argv) -> std::optional<Tpat2TiffOptions> {
    Tpat2TiffOptions options;
    options.settings = TP::RenderSettingsFromEnvironment();
    auto& settings = options.settings;

    TP::CLI::ToolCli cli{"tpat2tiff"};
    cli.set_positionals("<descriptor.tpat> [<output.tif>]", 1, 2);
    std::vector<std::string> errors;
    cli.set_error_sink([&](std::string const& message) { errors.push_back(message); });

    bool show_help = false;
    cli.add_count("--threads", "n", "Worker threads (default: hardware concurrency, 0 renders inline)",
                  [&](std::size_t workers) { settings.threads.workers = workers; });
    cli.add_alias("-j", "--threads");
    cli.add_flag("--no-preview", "Do not write the PNG preview", [&] { settings.output.write_preview = false; });
    cli.add_flag("--no-max-16bit-scaling", "Leave the low bits of 10 and 12-bit samples at zero",
                 [&] { settings.output.max_16bit_scaling = false; });
    cli.add_flag("--verbose", "Log progress to stderr", [&] { settings.verbose = true; });
    cli.add_alias("-v", "--verbose");
    cli.add_flag("--help", "Show this message", [&] { show_help = true; });
    cli.add_alias("-h", "--help");

    auto const parsed = cli.parse(argc, argv);
    if (show_help) {
        std::cout << cli.usage() << kAbout << kEnvironment;
        std::exit(0);
    }
    if (!parsed) {
        for (auto const& error : errors) {
            std::cerr << error << "\n";
        }
        std::cerr << cli.usage();
        return std::nullopt;
    }

    auto const& positionals = cli.positionals();
    options.descriptor = positionals[0];
    if (positionals.size() > 1) {
        settings.output.tiff_path = std::filesystem::path{positionals[1]};
    }
    return options;
}

} // namespace

int main(int argc, char** argv) {
    auto options = parse_cli(argc, argv);
    if (!options) {
        return 1;
    }

#ifdef TPAT_LOG_DEBUG
    TP::set_logging_enabled(options->settings.verbose);
    TP::set_thread_name("main");
#endif

    auto result = TP::RenderDescriptorFile(options->descriptor, options->settings);
    if (!result) {
        std::cerr << "tpat2tiff: " << TP::describeError(result.error()) << "\n";
        return 1;
    }

    auto paths = TP::ResolveOutputPaths(result->document, options->descriptor, options->settings);
    if (auto written = TP::WriteOutputs(*result, paths, options->settings); !written) {
        std::cerr << "tpat2tiff: " << TP::describeError(written.error()) << "\n";
        return 1;
    }

    if (options->settings.verbose) {
        std::cout << "Wrote " << paths.tiff.string();
        if (paths.preview) {
            std::cout << " and " << paths.preview->string();
        }
        std::cout << " (" << result->image.width() << "x" << result->image.height() << ", "
                  << TP::bit_count(result->image.depth()) << "-bit)\n";
    }
    tp_log("Done", "Main");
#ifdef TPAT_LOG_DEBUG
    TP::logger().flush();
#endif
    return 0;
}

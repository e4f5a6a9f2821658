#include <tpat/TPat.hpp>

#include <tpat/io/PreviewWriter.hpp>
#include <tpat/io/TiffWriter.hpp>
#include <tpat/render/Compositor.hpp>

#include "log/TaggedLogger.hpp"
#include "taskpool/TaskPool.hpp"

#include <algorithm>

namespace TP {

auto RenderDocument(Document const& document, TaskPool& pool, OverlaySource& overlays) -> Expected<RenderResult> {
    auto layout = ResolveLayout(document);
    if (!layout) {
        return std::unexpected(layout.error());
    }
    Compositor compositor{pool, overlays};
    auto image = compositor.render(document, *layout);
    if (!image) {
        return std::unexpected(image.error());
    }
    return RenderResult{.document = document, .layout = std::move(*layout), .image = std::move(*image)};
}

auto RenderDescriptorFile(std::filesystem::path const& descriptor, RenderSettings const& settings)
    -> Expected<RenderResult> {
    auto document = LoadDescriptor(descriptor);
    if (!document) {
        return std::unexpected(document.error());
    }
    TaskPool pool{settings.threads.workers};
    FileOverlaySource overlays;
    tp_log("Rendering " + descriptor.string() + " with " + std::to_string(pool.size()) + " workers", "Render");
    return RenderDocument(*document, pool, overlays);
}

auto OutputBaseName(Document const& document, std::filesystem::path const& descriptor) -> std::string {
    if (document.name && !document.name->empty()) {
        auto base = *document.name;
        std::replace(base.begin(), base.end(), ' ', '_');
        return base;
    }
    return descriptor.stem().string();
}

auto ResolveOutputPaths(Document const& document, std::filesystem::path const& descriptor, RenderSettings const& settings)
    -> OutputPaths {
    auto const directory = descriptor.parent_path();
    auto const base = OutputBaseName(document, descriptor);
    OutputPaths paths;
    paths.tiff = settings.output.tiff_path.value_or(directory / (base + ".tif"));
    if (settings.output.write_preview) {
        paths.preview = directory / (base + ".png");
    }
    return paths;
}

auto WriteOutputs(RenderResult const& result, OutputPaths const& paths, RenderSettings const& settings) -> Expected<void> {
    TiffOptions options{.max_16bit_scaling = settings.output.max_16bit_scaling};
    if (auto written = WriteTiff(result.image, paths.tiff, options); !written) {
        return written;
    }
    if (paths.preview) {
        if (auto written = WritePreviewPng(result.image, *paths.preview); !written) {
            return written;
        }
    }
    return {};
}

} // namespace TP

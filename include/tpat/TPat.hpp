#pragma once

#include <tpat/RenderSettings.hpp>
#include <tpat/core/Error.hpp>
#include <tpat/document/DescriptorParser.hpp>
#include <tpat/document/Document.hpp>
#include <tpat/layout/Layout.hpp>
#include <tpat/render/OverlaySource.hpp>
#include <tpat/render/RasterImage.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace TP {

class TaskPool;

struct RenderResult {
    Document    document;
    Layout      layout;
    RasterImage image;
};

struct OutputPaths {
    std::filesystem::path                tiff;
    std::optional<std::filesystem::path> preview;
};

// Resolves and draws an already parsed document.
[[nodiscard]] auto RenderDocument(Document const& document, TaskPool& pool, OverlaySource& overlays)
    -> Expected<RenderResult>;

// Loads, resolves and draws a descriptor file, using a pool sized by `settings`.
[[nodiscard]] auto RenderDescriptorFile(std::filesystem::path const& descriptor, RenderSettings const& settings)
    -> Expected<RenderResult>;

// `name` with spaces replaced by underscores, or the descriptor file stem.
[[nodiscard]] auto OutputBaseName(Document const& document, std::filesystem::path const& descriptor) -> std::string;

[[nodiscard]] auto ResolveOutputPaths(Document const& document,
                                      std::filesystem::path const& descriptor,
                                      RenderSettings const& settings) -> OutputPaths;

// Writes the TIFF and, when enabled, the 8-bit PNG preview.
[[nodiscard]] auto WriteOutputs(RenderResult const& result, OutputPaths const& paths, RenderSettings const& settings)
    -> Expected<void>;

} // namespace TP

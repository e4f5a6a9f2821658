#pragma once

#include <tpat/core/Error.hpp>
#include <tpat/document/Document.hpp>
#include <tpat/render/OverlaySource.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <unordered_map>

namespace TP {

class TaskPool;

// Loads overlay images on the pool ahead of rendering. await() blocks only the
// patch that needs the image, and the blocked thread runs other pool tasks in
// the meantime.
class OverlayPrefetch {
public:
    using Result = Expected<std::shared_ptr<OverlayImage const>>;

    OverlayPrefetch(TaskPool& pool, OverlaySource& source);
    ~OverlayPrefetch();

    OverlayPrefetch(OverlayPrefetch const&) = delete;
    auto operator=(OverlayPrefetch const&) -> OverlayPrefetch& = delete;

    // Requests every overlay of the document. Call once, before rendering.
    auto request_all(Document const& document) -> void;
    auto request(PatchIndex patch, std::filesystem::path path) -> void;
    [[nodiscard]] auto await(PatchIndex patch) -> Result;

private:
    struct Slot {
        std::atomic<bool>     ready{false};
        std::optional<Result> result;
    };

    auto wait_for(Slot& slot) -> void;

    TaskPool&                                        pool_;
    OverlaySource&                                   source_;
    std::unordered_map<PatchIndex, std::unique_ptr<Slot>> slots_;
};

} // namespace TP

#include <tpat/render/OverlayPrefetch.hpp>

#include "log/TaggedLogger.hpp"
#include "taskpool/TaskPool.hpp"

#include <exception>

namespace TP {

OverlayPrefetch::OverlayPrefetch(TaskPool& pool, OverlaySource& source)
    : pool_(pool), source_(source) {}

OverlayPrefetch::~OverlayPrefetch() {
    // Outstanding loads write into the slots, so they must finish first.
    for (auto& entry : slots_) {
        wait_for(*entry.second);
    }
}

auto OverlayPrefetch::request_all(Document const& document) -> void {
    for (PatchIndex index = 0; index < document.size(); ++index) {
        auto const& patch = document.patch(index);
        if (patch.image) {
            request(index, document.resolve_resource(patch.image->path));
        }
    }
}

auto OverlayPrefetch::request(PatchIndex patch, std::filesystem::path path) -> void {
    auto [it, inserted] = slots_.emplace(patch, std::make_unique<Slot>());
    if (!inserted) {
        return;
    }
    Slot* slot = it->second.get();
    tp_log("Prefetching overlay " + path.string(), "Overlay");
    auto load = [this, slot, path = std::move(path)]() {
        try {
            slot->result = source_.load(path);
        } catch (std::exception const& ex) {
            slot->result = Result{std::unexpected(makeError(Error::Code::ImageDecodeFailed, path.string(), ex.what()))};
        } catch (...) {
            slot->result = Result{std::unexpected(makeError(Error::Code::UnknownError, path.string(), "overlay loader threw"))};
        }
        slot->ready.store(true, std::memory_order_release);
    };
    if (auto error = pool_.addTask(load)) {
        tp_log("Loading overlay inline: " + describeError(*error), "Overlay");
        load();
    }
}

auto OverlayPrefetch::await(PatchIndex patch) -> Result {
    auto it = slots_.find(patch);
    if (it == slots_.end()) {
        return std::unexpected(makeError(Error::Code::UnknownError, "image", "overlay was not requested"));
    }
    wait_for(*it->second);
    return *it->second->result;
}

auto OverlayPrefetch::wait_for(Slot& slot) -> void {
    pool_.waitUntil([&slot] { return slot.ready.load(std::memory_order_acquire); });
}

} // namespace TP

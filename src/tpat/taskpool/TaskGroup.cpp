#include "TaskGroup.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>

namespace TP {

TaskGroup::TaskGroup(TaskPool& pool)
    : pool_(pool) {}

TaskGroup::~TaskGroup() {
    if (pending_.load(std::memory_order_acquire) > 0) {
        pool_.waitUntil([this] { return pending_.load(std::memory_order_acquire) == 0; });
    }
}

auto TaskGroup::run(Function task) -> void {
    pending_.fetch_add(1, std::memory_order_acq_rel);
    auto wrapped = [this, task = std::move(task)]() mutable {
        invoke(task);
        pending_.fetch_sub(1, std::memory_order_acq_rel);
    };
    if (auto error = pool_.addTask(wrapped)) {
        tp_log("TaskGroup running task inline: " + describeError(*error), "TaskPool");
        wrapped();
    }
}

auto TaskGroup::wait() -> Expected<void> {
    pool_.waitUntil([this] { return pending_.load(std::memory_order_acquire) == 0; });
    std::lock_guard<std::mutex> lock(errorMutex_);
    if (firstError_) {
        return std::unexpected(*firstError_);
    }
    return {};
}

auto TaskGroup::invoke(Function& task) -> void {
    if (failed()) {
        return;
    }
    try {
        auto result = task();
        if (!result) {
            recordError(std::move(result.error()));
        }
    } catch (std::exception const& ex) {
        recordError(Error{Error::Code::UnknownError, ex.what()});
    } catch (...) {
        recordError(Error{Error::Code::UnknownError, "task threw a non-standard exception"});
    }
}

auto TaskGroup::recordError(Error error) -> void {
    std::lock_guard<std::mutex> lock(errorMutex_);
    if (!firstError_) {
        tp_log("TaskGroup task failed: " + describeError(error), "TaskPool", "Error");
        firstError_ = std::move(error);
    }
    failed_.store(true, std::memory_order_release);
}

} // namespace TP

#pragma once
#include "TaskPool.hpp"
#include "core/Error.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>

namespace TP {

// Fork-join barrier over a TaskPool. Tasks report failure through Expected; the
// first error is kept and tasks that have not started yet are skipped.
class TaskGroup {
public:
    using Function = std::function<Expected<void>()>;

    explicit TaskGroup(TaskPool& pool);
    ~TaskGroup();

    TaskGroup(TaskGroup const&) = delete;
    auto operator=(TaskGroup const&) -> TaskGroup& = delete;

    auto run(Function task) -> void;
    // Joins every task started through run() and returns the first error, if any.
    [[nodiscard]] auto wait() -> Expected<void>;
    [[nodiscard]] auto failed() const -> bool { return failed_.load(std::memory_order_acquire); }

private:
    auto invoke(Function& task) -> void;
    auto recordError(Error error) -> void;

    TaskPool&            pool_;
    std::atomic<size_t>  pending_{0};
    std::atomic<bool>    failed_{false};
    std::mutex           errorMutex_;
    std::optional<Error> firstError_;
};

} // namespace TP

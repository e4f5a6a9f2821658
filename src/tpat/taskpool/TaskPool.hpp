#pragma once
#include "core/Error.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace TP {

// Worker pool for fork-join rendering. A thread that waits on pool work
// (waitUntil) executes queued tasks itself, so nested joins never starve the
// pool, and a pool with zero workers runs everything on the waiting thread.
class TaskPool {
public:
    using Function = std::function<void()>;

    explicit TaskPool(size_t threadCount = std::thread::hardware_concurrency());
    ~TaskPool();

    TaskPool(TaskPool const&) = delete;
    auto operator=(TaskPool const&) -> TaskPool& = delete;

    auto addTask(Function task) -> std::optional<Error>;
    // Runs one queued task on the calling thread. Returns false when the queue was empty.
    auto runPendingTask() -> bool;
    // Helps with queued work until ready() holds. ready() is re-checked after every task completes.
    auto waitUntil(std::function<bool()> const& ready) -> void;
    // Wakes threads blocked in waitUntil so they re-check their condition.
    auto notifyProgress() -> void;

    auto shutdown() -> void;
    auto size() const -> size_t;

private:
    auto workerFunction(size_t index) -> void;
    auto popTask(std::unique_lock<std::mutex>& lock) -> std::optional<Function>;
    auto execute(Function& task) -> void;

    std::vector<std::jthread> workers;
    std::queue<Function>      tasks;
    mutable std::mutex        mutex;
    std::condition_variable   taskCV;
    std::condition_variable   progressCV;
    std::atomic<bool>         shuttingDown{false};
    std::uint64_t             progressEpoch = 0;
};

} // namespace TP

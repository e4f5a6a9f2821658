#include "TaskPool.hpp"
#include "log/TaggedLogger.hpp"
#include <string>

namespace TP {

TaskPool::TaskPool(size_t threadCount) {
    for (size_t i = 0; i < threadCount; ++i) {
        workers.emplace_back(&TaskPool::workerFunction, this, i);
    }
}

TaskPool::~TaskPool() {
    shutdown();
}

auto TaskPool::addTask(Function task) -> std::optional<Error> {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (shuttingDown) {
            return Error{Error::Code::UnknownError, "task pool is shutting down"};
        }
        tasks.push(std::move(task));
    }
    taskCV.notify_one();
    // Waiters help with queued work, so they need to see new tasks as well.
    progressCV.notify_all();
    return std::nullopt;
}

auto TaskPool::runPendingTask() -> bool {
    std::unique_lock<std::mutex> lock(mutex);
    auto task = popTask(lock);
    if (!task) {
        return false;
    }
    lock.unlock();
    execute(*task);
    return true;
}

auto TaskPool::waitUntil(std::function<bool()> const& ready) -> void {
    while (true) {
        if (ready()) {
            return;
        }
        std::unique_lock<std::mutex> lock(mutex);
        // Checked again under the lock: notifyProgress bumps the epoch while holding it.
        if (ready()) {
            return;
        }
        if (auto task = popTask(lock)) {
            lock.unlock();
            execute(*task);
            continue;
        }
        auto const epoch = progressEpoch;
        progressCV.wait(lock, [&] { return progressEpoch != epoch || !tasks.empty(); });
    }
}

auto TaskPool::notifyProgress() -> void {
    {
        std::lock_guard<std::mutex> lock(mutex);
        ++progressEpoch;
    }
    progressCV.notify_all();
}

auto TaskPool::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown) {
            return;
        }
        this->shuttingDown = true;
    }
    this->taskCV.notify_all();

    // Workers drain the queue before exiting; jthread joins on destruction.
    this->workers.clear();
    tp_log("TaskPool shut down", "TaskPool");
}

auto TaskPool::size() const -> size_t {
    return this->workers.size();
}

auto TaskPool::popTask(std::unique_lock<std::mutex>& lock) -> std::optional<Function> {
    (void)lock;
    if (tasks.empty()) {
        return std::nullopt;
    }
    auto task = std::move(tasks.front());
    tasks.pop();
    return task;
}

auto TaskPool::execute(Function& task) -> void {
    if (task) {
        task();
    }
    notifyProgress();
}

auto TaskPool::workerFunction(size_t index) -> void {
#ifdef TPAT_LOG_DEBUG
    set_thread_name("Worker " + std::to_string(index));
#else
    (void)index;
#endif
    while (true) {
        std::optional<Function> task;
        {
            std::unique_lock<std::mutex> lock(mutex);
            taskCV.wait(lock, [this] { return this->shuttingDown || !this->tasks.empty(); });

            if (this->shuttingDown && this->tasks.empty()) {
                break;
            }
            task = popTask(lock);
        }

        if (task) {
            execute(*task);
        }
    }
}

} // namespace TP

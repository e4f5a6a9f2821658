#ifdef TPAT_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <format>
#include <iostream>

namespace TP {
namespace {

// "dir/file.cpp" keeps log lines short while staying unambiguous across modules.
auto short_source_path(char const* file) -> std::string {
    std::filesystem::path path{file};
    auto parent = path.parent_path().filename();
    return parent.empty() ? path.filename().string() : (parent / path.filename()).string();
}

auto trim_spaces(std::string_view text) -> std::string_view {
    auto const first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // namespace

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    if (const char* tags = std::getenv("TPAT_LOG_TAGS"))
        enabledTags = parse_tag_list(tags);
    writer = std::thread(&TaggedLogger::run, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        stopping = true;
    }
    queued.notify_one();
    if (writer.joinable())
        writer.join();
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool value) -> void {
    enabled.store(value, std::memory_order_relaxed);
}

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return enabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(tagsMutex);
    enabledTags = std::move(tags);
}

auto TaggedLogger::setSink(Sink replacement) -> void {
    std::lock_guard<std::mutex> lock(queueMutex);
    sink = std::move(replacement);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(queueMutex);
    drained.wait(lock, [this] { return queue.empty() && inFlight == 0; });
}

auto TaggedLogger::accepts(std::set<std::string> const& tags) const -> bool {
    std::lock_guard<std::mutex> lock(tagsMutex);
    if (enabledTags.empty())
        return true;
    return std::ranges::any_of(tags, [this](std::string const& tag) { return enabledTags.contains(tag); });
}

auto TaggedLogger::enqueue(Record record) -> void {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        queue.push_back(std::move(record));
    }
    queued.notify_one();
}

auto TaggedLogger::run() -> void {
    std::unique_lock<std::mutex> lock(queueMutex);
    while (true) {
        queued.wait(lock, [this] { return !queue.empty() || stopping; });
        if (queue.empty()) {
            drained.notify_all();
            return;
        }
        auto batch = std::move(queue);
        queue.clear();
        inFlight = batch.size();
        auto target = sink;
        lock.unlock();

        for (auto const& record : batch) {
            auto line = format_record(record);
            if (target) {
                target(line);
            } else {
                std::lock_guard<std::mutex> out(outputMutex);
                std::cerr << line << '\n' << std::flush;
            }
        }

        lock.lock();
        inFlight = 0;
        drained.notify_all();
    }
}

auto TaggedLogger::threadNameFor(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto [it, inserted] = threadNames.try_emplace(id);
    if (inserted)
        it->second = "Thread " + std::to_string(nextThreadNumber++);
    return it->second;
}

auto format_record(TaggedLogger::Record const& record) -> std::string {
    auto const time   = std::chrono::system_clock::to_time_t(record.timestamp);
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp.time_since_epoch()) % 1000;
    std::tm    local{};
    localtime_r(&time, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::string tags;
    for (auto const& tag : record.tags)
        tags += "[" + tag + "]";

    return std::format("{}.{:03} {} [{}] [{}:{}] {}",
                       stamp,
                       millis.count(),
                       tags,
                       record.threadName,
                       short_source_path(record.location.file_name()),
                       record.location.line(),
                       record.message);
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

auto parse_tag_list(std::string_view text) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!text.empty()) {
        auto const comma = text.find(',');
        auto const item  = trim_spaces(text.substr(0, comma));
        if (!item.empty())
            tags.emplace(item);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace TP
#endif // TPAT_LOG_DEBUG

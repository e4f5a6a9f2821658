#ifdef TPAT_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace TP {

// Asynchronous logger: tp_log() queues a record, a background thread formats it as
// "time [tags] [thread] [file:line] message" and hands the line to the sink.
class TaggedLogger {
public:
    struct Record {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    using Sink = std::function<void(std::string_view line)>;

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(std::string message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto isLoggingEnabled() const -> bool;
    // Records without one of these tags are dropped. An empty set lets every tag through.
    auto setEnabledTags(std::set<std::string> tags) -> void;
    // Replaces the default stderr sink. Called from the writer thread only.
    auto setSink(Sink sink) -> void;
    // Blocks until every queued record has reached the sink.
    auto flush() -> void;

    // Held while a line is written to stderr; others printing to the console can share it.
    std::mutex outputMutex;

private:
    auto accepts(std::set<std::string> const& tags) const -> bool;
    auto enqueue(Record record) -> void;
    auto run() -> void;
    auto threadNameFor(std::thread::id id) -> std::string;

    std::deque<Record>      queue;
    std::mutex              queueMutex;
    std::condition_variable queued;
    std::condition_variable drained;
    bool                    stopping = false;
    std::size_t             inFlight = 0;
    Sink                    sink;

    std::atomic<bool>     enabled{false};
    std::set<std::string> enabledTags;
    mutable std::mutex    tagsMutex;

    std::unordered_map<std::thread::id, std::string> threadNames;
    std::mutex                                       threadNamesMutex;
    int                                              nextThreadNumber = 0;

    std::thread writer;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(std::string message, const std::source_location& location, Tags&&... tags) -> void {
    if (!isLoggingEnabled())
        return;
    std::set<std::string> tagSet{std::string(std::forward<Tags>(tags))...};
    if (!accepts(tagSet))
        return;
    enqueue(Record{.timestamp  = std::chrono::system_clock::now(),
                   .tags       = std::move(tagSet),
                   .message    = std::move(message),
                   .threadName = threadNameFor(std::this_thread::get_id()),
                   .location   = location});
}

#define tp_log(message, ...) ::TP::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);
// Parses a comma separated tag list, as found in TPAT_LOG_TAGS.
auto parse_tag_list(std::string_view text) -> std::set<std::string>;
// The line written for a record, without the trailing newline.
auto format_record(TaggedLogger::Record const& record) -> std::string;

} // namespace TP

#else
#define tp_log(message, ...) ((void)0)
#endif // TPAT_LOG_DEBUG

#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#ifdef TPAT_LOG_DEBUG

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    EnvGuard tags("TPAT_LOG_TAGS", nullptr);

    auto output = captureStderr([] {
        TP::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "TestTag");
        logger.flush();
    });

    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_thread_and_message") {
    EnvGuard tags("TPAT_LOG_TAGS", nullptr);

    auto output = captureStderr([] {
        TP::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("hello log", std::source_location::current(), "TestTag", "Second");
        logger.flush();
    });

    CHECK(output.find("[Second][TestTag]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
    CHECK(output.find("test_TaggedLogger.cpp:") != std::string::npos);
}

TEST_CASE("environment_tag_list_gates_output") {
    EnvGuard tags("TPAT_LOG_TAGS", "Layout, Render");

    auto accepted = captureStderr([] {
        TP::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("keep me", std::source_location::current(), "Render");
        logger.flush();
    });
    CHECK(accepted.find("keep me") != std::string::npos);

    auto rejected = captureStderr([] {
        TP::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("drop me", std::source_location::current(), "Overlay");
        logger.flush();
    });
    CHECK(rejected.empty());
}

TEST_CASE("set_enabled_tags_overrides_environment") {
    EnvGuard tags("TPAT_LOG_TAGS", "Layout");

    auto output = captureStderr([] {
        TP::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({});
        logger.log_impl("any tag passes", std::source_location::current(), "Overlay");
        logger.flush();
    });
    CHECK(output.find("any tag passes") != std::string::npos);
}

TEST_CASE("thread_name_is_used_in_output") {
    EnvGuard tags("TPAT_LOG_TAGS", nullptr);

    auto output = captureStderr([] {
        TP::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        std::thread worker([&] {
            logger.setThreadName("Renderer");
            logger.log_impl("from worker", std::source_location::current(), "Render");
        });
        worker.join();
        logger.flush();
    });
    CHECK(output.find("[Renderer]") != std::string::npos);
}

TEST_CASE("sink_receives_formatted_lines") {
    EnvGuard tags("TPAT_LOG_TAGS", nullptr);

    std::vector<std::string> lines;
    {
        TP::TaggedLogger logger;
        logger.setSink([&](std::string_view line) { lines.emplace_back(line); });
        logger.setLoggingEnabled(true);
        logger.log_impl("first", std::source_location::current(), "Layout");
        logger.log_impl("second", std::source_location::current(), "Render");
        logger.flush();
    }
    REQUIRE(lines.size() == 2);
    CHECK(lines[0].ends_with("first"));
    CHECK(lines[0].find("[Layout]") != std::string::npos);
    CHECK(lines[1].ends_with("second"));
}

TEST_CASE("format_record_layout") {
    TP::TaggedLogger::Record record{.timestamp  = std::chrono::system_clock::time_point{std::chrono::milliseconds{42}},
                                    .tags       = {"Output", "Io"},
                                    .message    = "wrote file",
                                    .threadName = "main",
                                    .location   = std::source_location::current()};
    auto line = TP::format_record(record);
    CHECK(line.find(".042 [Io][Output] [main] [log/test_TaggedLogger.cpp:") != std::string::npos);
    CHECK(line.ends_with("] wrote file"));
}

TEST_CASE("parse_tag_list_trims_and_skips_empty_entries") {
    auto tags = TP::parse_tag_list(" Layout , ,Render,");
    CHECK(tags.size() == 2);
    CHECK(tags.contains("Layout"));
    CHECK(tags.contains("Render"));
    CHECK(TP::parse_tag_list("").empty());
}

}

#endif // TPAT_LOG_DEBUG

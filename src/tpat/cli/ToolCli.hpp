#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace TP::CLI {

// Small option parser for the command line tools. Options are flags ("--name")
// or counts ("--name 4", "--name=4"); everything else, and anything after "--",
// is a positional argument.
class ToolCli {
public:
    using ParseError = std::optional<std::string>;

    explicit ToolCli(std::string program);

    void set_error_sink(std::function<void(std::string const&)> sink);
    void set_positionals(std::string_view synopsis, std::size_t minimum, std::size_t maximum);

    void add_flag(std::string_view name, std::string_view help, std::function<void()> on_set);
    // Non-negative integer value.
    void add_count(std::string_view name, std::string_view placeholder, std::string_view help,
                   std::function<void(std::size_t)> on_value);
    void add_alias(std::string_view alias, std::string_view target);

    [[nodiscard]] bool parse(int argc, char** argv);
    [[nodiscard]] bool had_errors() const { return had_error_; }
    [[nodiscard]] auto positionals() const -> std::vector<std::string> const& { return positionals_; }
    [[nodiscard]] auto usage() const -> std::string;

private:
    struct Option {
        std::string                                 name;
        std::string                                 placeholder;
        std::string                                 help;
        std::vector<std::string>                    aliases;
        std::function<void()>                       on_set;
        std::function<ParseError(std::string_view)> on_value;

        [[nodiscard]] bool takes_value() const { return static_cast<bool>(on_value); }
    };

    void add_value(std::string_view name,
                   std::string_view placeholder,
                   std::string_view help,
                   std::function<ParseError(std::string_view)> on_value);
    auto find(std::string_view name) -> Option*;
    void add_option(Option option);
    void report(std::string_view message);
    [[nodiscard]] static bool is_option_token(std::string_view token);

    std::string                                 program_;
    std::string                                 synopsis_;
    std::size_t                                 min_positionals_ = 0;
    std::size_t                                 max_positionals_ = 0;
    std::vector<Option>                         options_;
    std::unordered_map<std::string, std::size_t> lookup_;
    std::vector<std::string>                    positionals_;
    std::function<void(std::string const&)>     error_sink_;
    bool                                        had_error_ = false;
};

} // namespace TP::CLI

#include "ToolCli.hpp"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <sstream>

namespace TP::CLI {

ToolCli::ToolCli(std::string program)
    : program_(std::move(program)) {}

void ToolCli::set_error_sink(std::function<void(std::string const&)> sink) {
    error_sink_ = std::move(sink);
}

void ToolCli::set_positionals(std::string_view synopsis, std::size_t minimum, std::size_t maximum) {
    synopsis_.assign(synopsis);
    min_positionals_ = minimum;
    max_positionals_ = std::max(minimum, maximum);
}

void ToolCli::add_flag(std::string_view name, std::string_view help, std::function<void()> on_set) {
    add_option(Option{.name = std::string{name}, .help = std::string{help}, .on_set = std::move(on_set)});
}

void ToolCli::add_value(std::string_view name,
                        std::string_view placeholder,
                        std::string_view help,
                        std::function<ParseError(std::string_view)> on_value) {
    add_option(Option{.name = std::string{name},
                      .placeholder = std::string{placeholder},
                      .help = std::string{help},
                      .on_value = std::move(on_value)});
}

void ToolCli::add_count(std::string_view name, std::string_view placeholder, std::string_view help,
                        std::function<void(std::size_t)> on_value) {
    add_value(name, placeholder, help, [label = std::string{name}, on_value = std::move(on_value)](std::string_view text) -> ParseError {
        std::size_t parsed = 0;
        auto const* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, parsed);
        if (text.empty() || ec != std::errc{} || ptr != end) {
            return label + " expects a non-negative integer, got '" + std::string{text} + "'";
        }
        on_value(parsed);
        return std::nullopt;
    });
}

void ToolCli::add_alias(std::string_view alias, std::string_view target) {
    auto it = lookup_.find(std::string{target});
    if (it == lookup_.end()) {
        report("alias " + std::string{alias} + " refers to unknown option " + std::string{target});
        return;
    }
    options_[it->second].aliases.emplace_back(alias);
    lookup_.emplace(std::string{alias}, it->second);
}

bool ToolCli::parse(int argc, char** argv) {
    had_error_ = false;
    positionals_.clear();
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view token{argv[i]};

        if (options_done || !is_option_token(token)) {
            positionals_.emplace_back(token);
            continue;
        }
        if (token == "--") {
            options_done = true;
            continue;
        }

        std::optional<std::string_view> attached;
        auto name = token;
        if (auto equals = token.find('='); equals != std::string_view::npos) {
            name = token.substr(0, equals);
            attached = token.substr(equals + 1);
        }

        auto* option = find(name);
        if (option == nullptr) {
            report("unknown option '" + std::string{name} + "'");
            continue;
        }

        if (!option->takes_value()) {
            if (attached) {
                report(option->name + " does not take a value");
                continue;
            }
            option->on_set();
            continue;
        }

        std::string_view value;
        if (attached) {
            value = *attached;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            report(option->name + " requires a value");
            continue;
        }
        if (auto error = option->on_value(value)) {
            report(*error);
        }
    }

    if (positionals_.size() < min_positionals_) {
        report("missing " + (synopsis_.empty() ? std::string{"arguments"} : synopsis_));
    } else if (positionals_.size() > max_positionals_) {
        report("unexpected argument '" + positionals_[max_positionals_] + "'");
    }
    return !had_error_;
}

auto ToolCli::usage() const -> std::string {
    std::ostringstream out;
    out << "Usage: " << program_ << " [options]";
    if (!synopsis_.empty()) {
        out << ' ' << synopsis_;
    }
    out << '\n';
    if (options_.empty()) {
        return out.str();
    }

    std::vector<std::string> columns;
    std::size_t              width = 0;
    for (auto const& option : options_) {
        auto column = option.name;
        for (auto const& alias : option.aliases) {
            column += ", " + alias;
        }
        if (option.takes_value()) {
            column += " <" + option.placeholder + ">";
        }
        width = std::max(width, column.size());
        columns.push_back(std::move(column));
    }
    out << "Options:\n";
    for (std::size_t i = 0; i < options_.size(); ++i) {
        out << "  " << columns[i] << std::string(width - columns[i].size() + 2, ' ') << options_[i].help << '\n';
    }
    return out.str();
}

auto ToolCli::find(std::string_view name) -> Option* {
    auto it = lookup_.find(std::string{name});
    return it == lookup_.end() ? nullptr : &options_[it->second];
}

void ToolCli::add_option(Option option) {
    auto name = option.name;
    options_.push_back(std::move(option));
    lookup_[name] = options_.size() - 1;
}

void ToolCli::report(std::string_view message) {
    had_error_ = true;
    auto text = program_ + ": " + std::string{message};
    if (error_sink_) {
        error_sink_(text);
    } else {
        std::cerr << text << '\n';
    }
}

bool ToolCli::is_option_token(std::string_view token) {
    return token.size() > 1 && token.front() == '-';
}

} // namespace TP::CLI

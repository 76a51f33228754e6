/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for mongocopy
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>
#include <iomanip>

namespace mongocopy {

/**
 * @brief Simple command-line argument parser
 *
 * Supports long options (--name VALUE, --name=VALUE), single-letter short
 * aliases (-c VALUE) and boolean flags. Help text is generated from the
 * registered options, in registration order.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool has_value;
        std::string value_name;
        std::string default_value;

        // Default constructor for std::map
        Option() : has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool has_value,
               const std::string& value_name = "", const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              has_value(has_value), value_name(value_name), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, const std::string& value_name = "VALUE",
                    const std::string& default_value = "") {
        register_option(Option(long_name, short_name, description, true, value_name, default_value));
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option(long_name, short_name, description, false));
    }

    void add_example(const std::string& command_line, const std::string& comment) {
        examples_.emplace_back(command_line, comment);
    }

    /**
     * @brief Parse command line arguments
     * @return false on a parse error or when help was requested;
     *         check help_requested() to tell them apart
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        last_error_.clear();
        help_requested_ = false;

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::optional<std::string> inline_value;
                if (eq_pos != std::string::npos) {
                    inline_value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    return fail("Unknown option: --" + option_name);
                }

                const auto& option = it->second;
                if (option.has_value) {
                    if (inline_value) {
                        parsed_values_[option_name] = *inline_value;
                    } else {
                        if (i + 1 >= args_.size() || args_[i + 1].starts_with("-")) {
                            return fail("Option --" + option_name + " requires a value");
                        }
                        parsed_values_[option_name] = args_[++i];
                    }
                } else {
                    if (inline_value) {
                        return fail("Option --" + option_name + " does not take a value");
                    }
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);

                auto alias = short_to_long_.find(short_name);
                if (alias == short_to_long_.end()) {
                    return fail("Unknown option: -" + short_name);
                }

                const std::string& option_name = alias->second;
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (i + 1 >= args_.size() || args_[i + 1].starts_with("-")) {
                        return fail("Option -" + short_name + " requires a value");
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        return true;
    }

    /**
     * @brief Value given on the command line, falling back to the option default
     */
    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        auto opt = options_.find(option_name);
        if (opt != options_.end() && !opt->second.default_value.empty()) {
            return opt->second.default_value;
        }
        return std::nullopt;
    }

    /**
     * @brief True only if the option was given explicitly
     */
    bool was_given(const std::string& option_name) const {
        return parsed_values_.find(option_name) != parsed_values_.end();
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && iss.eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    bool help_requested() const { return help_requested_; }

    const std::string& last_error() const { return last_error_; }

    void show_help(std::ostream& out = std::cout) const {
        out << program_name_ << " - " << description_ << "\n\n";

        out << "USAGE:\n";
        out << "    " << program_name_ << " [OPTIONS]\n\n";

        out << "OPTIONS:\n";
        for (const auto& name : order_) {
            print_help_section(out, options_.at(name));
        }
        out << "\n";

        if (!examples_.empty()) {
            out << "EXAMPLES:\n";
            for (const auto& [command_line, comment] : examples_) {
                out << "    # " << comment << "\n";
                out << "    " << program_name_ << " " << command_line << "\n";
            }
            out << "\n";
        }
    }

private:
    void register_option(const Option& option) {
        if (options_.find(option.long_name) == options_.end()) {
            order_.push_back(option.long_name);
        }
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
    }

    bool fail(const std::string& message) {
        last_error_ = message;
        std::cerr << message << std::endl;
        return false;
    }

    void print_help_section(std::ostream& out, const Option& option) const {
        std::string flags = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        flags += "--" + option.long_name;
        if (option.has_value) {
            flags += " " + option.value_name;
        }
        out << "    " << std::left << std::setw(28) << flags << " " << option.description;
        if (!option.default_value.empty()) {
            out << " (default: " << option.default_value << ")";
        }
        out << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::vector<std::string> order_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::pair<std::string, std::string>> examples_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    std::string last_error_;
    bool help_requested_ = false;
};

} // namespace mongocopy

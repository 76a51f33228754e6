/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for mongocopy
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "mongocopy.hpp"
#include "SimpleCommandLineParser.hpp"
#include "ConfigurationManager.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace mongocopy {

/**
 * @brief Builds TransferOptions from flags, JSON config, environment and .env
 *
 * Precedence: CLI flags > JSON config file > environment > .env file > defaults.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if a transfer should run; false if the program should
     *         exit now with exit_code() (help, version, parse error)
     */
    bool parse_arguments(int argc, char* argv[]);

    /**
     * @brief Exit code to use when parse_arguments() returned false
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Get the resolved options
     */
    const TransferOptions& get_options() const { return options_; }

    /**
     * @brief Ask the user to confirm the transfer unless --yes was given
     * @return true to proceed
     */
    bool confirm_transfer(std::istream& in = std::cin, std::ostream& out = std::cout) const;

    /**
     * @brief Print the resolved configuration (connection URIs are not shown)
     */
    void print_config(std::ostream& out = std::cout) const;

    /**
     * @brief Split a comma-separated collection list, trimming and dropping empties
     */
    static std::vector<std::string> parse_collections(const std::string& list);

    /**
     * @brief "About to operate on ALL collections (dry-run). Continue?"
     */
    static std::string confirmation_message(const TransferOptions& options);

    /**
     * @brief Yes/no prompt defaulting to "no"
     * @return true only for "y" or "yes" (case-insensitive)
     */
    static bool confirm_action(const std::string& message, std::istream& in, std::ostream& out);

private:
    TransferOptions options_;
    int exit_code_ = 0;

    void define_options(SimpleCommandLineParser& parser) const;

    // Sources applied lowest precedence first
    void apply_environment(const ConfigurationManager& config);
    bool load_config_file(const std::string& filename);
    bool parse_all_options(const SimpleCommandLineParser& parser);

    bool has_selection() const {
        return options_.all || !options_.collections.empty() ||
               options_.export_json || options_.import_json;
    }
};

} // namespace mongocopy

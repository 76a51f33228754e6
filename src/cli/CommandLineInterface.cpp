/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "ConfigurationManager.hpp"
#include "version.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace mongocopy {

namespace {

std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    const auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

} // namespace

void CommandLineInterface::define_options(SimpleCommandLineParser& parser) const {
    // Selection
    parser.add_flag("all", "a", "Copy all collections from the source database");
    parser.add_option("collections", "c", "Comma-separated list of collections to copy", "LIST");

    // Transfer behavior
    parser.add_flag("dry-run", "", "Preview the operations without writing to the target");
    parser.add_option("batch-size", "", "Documents per insert batch (default: BATCH_SIZE or 1000)", "N");
    parser.add_flag("yes", "", "Skip the confirmation prompt");

    // File modes
    parser.add_flag("export-json", "", "Export collections to JSON files in --output-dir");
    parser.add_flag("import-json", "", "Import collections from JSON files in --output-dir");
    parser.add_option("output-dir", "", "Directory for JSON export/import (default: ./backup)", "DIR");

    // Logging and configuration
    parser.add_option("log-path", "", "Append log output to this file", "PATH");
    parser.add_option("log-level", "", "1=ERROR .. 3=INFO (default) .. 6=TRACE, or \"3,Facility=5\"", "LEVELS");
    parser.add_option("env-file", "", "Environment file to load", "PATH", ".env");
    parser.add_option("config", "", "Load options from a JSON configuration file", "FILE");
    parser.add_flag("version", "", "Show version information");
    parser.add_flag("help", "h", "Show this help");

    parser.add_example("--all --yes", "Copy every collection without prompting");
    parser.add_example("-c users,orders --batch-size 500", "Copy two collections in batches of 500");
    parser.add_example("--export-json -c users --output-dir ./dump", "Export a collection to ./dump/users.json");
    parser.add_example("--import-json -c users --output-dir ./dump", "Load it back into the target database");
}

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("mongocopy",
        "Copy MongoDB collections or entire databases between clusters");
    define_options(parser);

    options_ = TransferOptions{};
    exit_code_ = 0;

    if (!parser.parse(argc, argv)) {
        if (parser.help_requested()) {
            parser.show_help();
            return false;
        }
        std::cerr << "Run 'mongocopy --help' for usage." << std::endl;
        exit_code_ = 1;
        return false;
    }

    // Handle version flag
    if (parser.get_flag("version")) {
        std::cout << "mongocopy v" << MONGOCOPY_VERSION_STRING << std::endl;
        std::cout << "Batched MongoDB collection transfer" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        return false;
    }

    // 1. .env file, then the process environment on top of it
    ConfigurationManager env_config;
    const std::string env_file = parser.get("env-file").value_or(".env");
    if (!env_config.load_env_file(env_file) && parser.was_given("env-file")) {
        std::cerr << "Warning: Could not read environment file: " << env_file << std::endl;
    }
    env_config.overlay_environment();
    apply_environment(env_config);

    // 2. JSON configuration file
    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
    }

    // 3. Command line flags
    if (!parse_all_options(parser)) {
        exit_code_ = 1;
        return false;
    }

    if (!has_selection()) {
        std::cout << "Please provide --all or --collections <list> or --export-json/--import-json\n\n";
        parser.show_help();
        return false;
    }

    return true;
}

void CommandLineInterface::apply_environment(const ConfigurationManager& config) {
    options_.connection = config.to_connection_settings();
    options_.batch_size = config.batch_size(DEFAULT_BATCH_SIZE);
    options_.log_path = config.log_path();
    options_.log_level = config.log_level(options_.log_level);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open config file: " << filename << std::endl;
            return false;
        }

        json config;
        file >> config;

        if (!config.is_object()) {
            std::cerr << "Error: Config file must contain a JSON object" << std::endl;
            return false;
        }

        if (config.contains("all")) options_.all = config["all"].get<bool>();
        if (config.contains("collections")) {
            const auto& value = config["collections"];
            if (value.is_string()) {
                options_.collections = parse_collections(value.get<std::string>());
            } else {
                options_.collections.clear();
                for (const auto& name : value) {
                    std::string trimmed = trim(name.get<std::string>());
                    if (!trimmed.empty()) {
                        options_.collections.push_back(trimmed);
                    }
                }
            }
        }
        if (config.contains("batch_size")) {
            int batch_size = config["batch_size"].get<int>();
            if (batch_size > 0) {
                options_.batch_size = batch_size;
            }
        }
        if (config.contains("dry_run")) options_.dry_run = config["dry_run"].get<bool>();
        if (config.contains("export_json")) options_.export_json = config["export_json"].get<bool>();
        if (config.contains("import_json")) options_.import_json = config["import_json"].get<bool>();
        if (config.contains("output_dir")) options_.output_dir = config["output_dir"].get<std::string>();
        if (config.contains("yes")) options_.yes = config["yes"].get<bool>();
        if (config.contains("log_path")) options_.log_path = config["log_path"].get<std::string>();
        if (config.contains("log_level")) {
            const auto& value = config["log_level"];
            options_.log_level = value.is_number() ? std::to_string(value.get<int>())
                                                   : value.get<std::string>();
        }

        // Connection settings
        if (config.contains("source_db_uri")) options_.connection.source_uri = config["source_db_uri"].get<std::string>();
        if (config.contains("target_db_uri")) options_.connection.target_uri = config["target_db_uri"].get<std::string>();
        if (config.contains("db_name")) options_.connection.database_name = config["db_name"].get<std::string>();

        return true;

    } catch (const json::exception& e) {
        std::cerr << "Error: Invalid config file " << filename << ": " << e.what() << std::endl;
        return false;
    }
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    if (parser.get_flag("all")) options_.all = true;
    if (auto value = parser.get("collections")) {
        options_.collections = parse_collections(value.value());
    }

    if (parser.get_flag("dry-run")) options_.dry_run = true;
    if (parser.get_flag("yes")) options_.yes = true;
    if (parser.get_flag("export-json")) options_.export_json = true;
    if (parser.get_flag("import-json")) options_.import_json = true;
    if (auto value = parser.get("output-dir")) options_.output_dir = value.value();

    // A non-positive CLI batch size falls back to the environment value
    if (parser.was_given("batch-size")) {
        auto batch_size = parser.get_as<int>("batch-size");
        if (!batch_size.has_value()) {
            std::cerr << "Invalid --batch-size: " << parser.get("batch-size").value_or("") << std::endl;
            return false;
        }
        if (*batch_size > 0) {
            options_.batch_size = *batch_size;
        }
    }

    if (auto value = parser.get("log-path")) options_.log_path = value.value();
    if (auto value = parser.get("log-level")) options_.log_level = value.value();

    return true;
}

std::vector<std::string> CommandLineInterface::parse_collections(const std::string& list) {
    std::vector<std::string> names;
    std::istringstream iss(list);
    std::string name;

    while (std::getline(iss, name, ',')) {
        name = trim(name);
        if (!name.empty()) {
            names.push_back(name);
        }
    }
    return names;
}

std::string CommandLineInterface::confirmation_message(const TransferOptions& options) {
    std::string display;
    if (options.all) {
        display = "ALL collections";
    } else {
        display = "collections: ";
        for (size_t i = 0; i < options.collections.size(); ++i) {
            if (i > 0) display += ", ";
            display += options.collections[i];
        }
    }
    return "About to operate on " + display + (options.dry_run ? " (dry-run)" : "") + ". Continue?";
}

bool CommandLineInterface::confirm_action(const std::string& message, std::istream& in, std::ostream& out) {
    out << message << " (y/N) " << std::flush;

    std::string answer;
    if (!std::getline(in, answer)) {
        out << std::endl;
        return false;
    }

    answer = trim(answer);
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "y" || answer == "yes";
}

bool CommandLineInterface::confirm_transfer(std::istream& in, std::ostream& out) const {
    if (options_.yes) {
        return true;
    }
    return confirm_action(confirmation_message(options_), in, out);
}

void CommandLineInterface::print_config(std::ostream& out) const {
    out << "\n=== mongocopy Configuration ===\n";
    out << "Mode: " << (options_.export_json ? "export-json" : options_.import_json ? "import-json" : "live") << "\n";
    out << "Collections: ";
    if (options_.all || options_.collections.empty()) {
        out << "(all)";
    } else {
        for (size_t i = 0; i < options_.collections.size(); ++i) {
            out << options_.collections[i];
            if (i < options_.collections.size() - 1) out << ", ";
        }
    }
    out << "\n";
    out << "Database: " << options_.connection.database_name << "\n";
    out << "Batch size: " << options_.batch_size << "\n";
    out << "Dry run: " << (options_.dry_run ? "yes" : "no") << "\n";
    if (options_.export_json || options_.import_json) {
        out << "Output directory: " << options_.output_dir << "\n";
    }
    if (options_.log_path) {
        out << "Log file: " << *options_.log_path << "\n";
    }
    out << "===============================\n\n";
}

} // namespace mongocopy

/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "InputValidator.hpp"
#include <sstream>

namespace mongocopy {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid transfer options detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nNo connection was opened.\n";
    return oss.str();
}

ValidationResult InputValidator::validate(const TransferOptions& options) const {
    ValidationResult result;

    if (auto conflict = check_mode_exclusivity(options)) {
        result.add(*conflict);
    }
    if (auto conflict = check_batch_size(options)) {
        result.add(*conflict);
    }
    if (auto conflict = check_endpoints(options)) {
        result.add(*conflict);
    }
    if (auto conflict = check_output_dir(options)) {
        result.add(*conflict);
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_mode_exclusivity(
    const TransferOptions& options) const {
    if (!(options.export_json && options.import_json)) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Cannot use --export-json and --import-json together";
    conflict.involved_params = {"--export-json", "--import-json"};
    conflict.suggestions = {
        "Use --export-json to write collections to " + options.output_dir,
        "Use --import-json to load collections from " + options.output_dir,
        "Use neither to copy directly between databases"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_batch_size(
    const TransferOptions& options) const {
    if (options.batch_size > 0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Batch size must be a positive integer (got " +
                           std::to_string(options.batch_size) + ")";
    conflict.involved_params = {"--batch-size = " + std::to_string(options.batch_size)};
    conflict.suggestions = {
        "Omit --batch-size to use the default of " + std::to_string(DEFAULT_BATCH_SIZE),
        "Set BATCH_SIZE in the environment to a positive value"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_endpoints(
    const TransferOptions& options) const {
    const auto& connection = options.connection;
    const bool needs_target = !options.export_json;

    std::vector<std::string> missing;
    if (connection.source_uri.empty()) missing.push_back("SOURCE_DB_URI");
    if (needs_target && connection.target_uri.empty()) missing.push_back("TARGET_DB_URI");
    if (connection.database_name.empty()) missing.push_back("DB_NAME");

    if (missing.empty()) {
        return std::nullopt;
    }

    std::string joined;
    for (const auto& name : missing) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }

    ParameterConflict conflict;
    conflict.description = "Missing required connection settings: " + joined;
    conflict.involved_params = missing;
    conflict.suggestions = {
        "Export the variables in the environment",
        "Add them to the .env file (or the file given with --env-file)",
        "Set source_db_uri/target_db_uri/db_name in the --config JSON file"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_output_dir(
    const TransferOptions& options) const {
    const bool uses_files = options.export_json || options.import_json;
    if (!uses_files || !options.output_dir.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "JSON export/import requires an output directory";
    conflict.involved_params = {"--output-dir"};
    conflict.suggestions = {
        std::string("Omit --output-dir to use ") + DEFAULT_OUTPUT_DIR,
        "Pass a non-empty directory path"
    };
    return conflict;
}

} // namespace mongocopy

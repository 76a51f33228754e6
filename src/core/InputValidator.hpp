/**
 * @file InputValidator.hpp
 * @brief Input validation for contradictory or incomplete transfer options
 *
 * Validates user inputs before any connection is opened and provides clear
 * error messages with suggested solutions when conflicts are detected.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "mongocopy.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mongocopy {

/**
 * @brief Represents a parameter conflict detected in user inputs
 */
struct ParameterConflict {
    std::string description;                   // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    void add(const ParameterConflict& conflict) {
        conflicts.push_back(conflict);
        is_valid = false;
    }

    std::string format_error_message() const;
};

/**
 * @brief Validates transfer options for contradictions and missing values
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all transfer options
     * @param options Options to validate
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const TransferOptions& options) const;

private:
    /**
     * @brief --export-json and --import-json are mutually exclusive
     */
    std::optional<ParameterConflict> check_mode_exclusivity(const TransferOptions& options) const;

    std::optional<ParameterConflict> check_batch_size(const TransferOptions& options) const;

    /**
     * @brief Source is always required; target unless exporting; database name always
     */
    std::optional<ParameterConflict> check_endpoints(const TransferOptions& options) const;

    std::optional<ParameterConflict> check_output_dir(const TransferOptions& options) const;
};

} // namespace mongocopy

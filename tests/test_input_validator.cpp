/**
 * @file test_input_validator.cpp
 * @brief Option validation before any connection is opened
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "core/InputValidator.hpp"

using namespace mongocopy;

namespace {

TransferOptions complete_options() {
    TransferOptions options;
    options.all = true;
    options.connection.source_uri = "mongodb://source:27017";
    options.connection.target_uri = "mongodb://target:27017";
    options.connection.database_name = "app";
    return options;
}

} // namespace

TEST_CASE("complete options are valid") {
    InputValidator validator;
    ValidationResult result = validator.validate(complete_options());
    CHECK(result.is_valid);
    CHECK_FALSE(result.has_errors());
    CHECK(result.format_error_message().empty());
}

TEST_CASE("export and import together is a conflict") {
    TransferOptions options = complete_options();
    options.export_json = true;
    options.import_json = true;

    ValidationResult result = InputValidator().validate(options);
    REQUIRE(result.has_errors());
    REQUIRE(result.conflicts.size() == 1);
    CHECK(result.conflicts[0].description == "Cannot use --export-json and --import-json together");

    std::string message = result.format_error_message();
    CHECK(message.find("Conflict 1:") != std::string::npos);
    CHECK(message.find("Suggested solutions:") != std::string::npos);
    CHECK(message.find("No connection was opened.") != std::string::npos);
}

TEST_CASE("missing endpoints are listed together") {
    TransferOptions options = complete_options();
    options.connection.source_uri.clear();
    options.connection.database_name.clear();

    ValidationResult result = InputValidator().validate(options);
    REQUIRE(result.conflicts.size() == 1);
    CHECK(result.conflicts[0].involved_params == std::vector<std::string>{"SOURCE_DB_URI", "DB_NAME"});
}

TEST_CASE("export does not need a target endpoint") {
    TransferOptions options = complete_options();
    options.connection.target_uri.clear();

    CHECK(InputValidator().validate(options).has_errors());

    options.export_json = true;
    CHECK_FALSE(InputValidator().validate(options).has_errors());
}

TEST_CASE("non-positive batch size and empty output directory are reported") {
    TransferOptions options = complete_options();
    options.batch_size = 0;
    options.import_json = true;
    options.output_dir = "";

    ValidationResult result = InputValidator().validate(options);
    CHECK(result.conflicts.size() == 2);
    CHECK(result.format_error_message().find("Conflict 2:") != std::string::npos);
}

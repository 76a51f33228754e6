/**
 * @file test_transfer_job.cpp
 * @brief Job construction and mode resolution
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "mongocopy.hpp"
#include "TransferErrors.hpp"

using namespace mongocopy;

TEST_CASE("resolve_mode picks the sink from the file-mode flags") {
    CHECK(resolve_mode(false, false) == TransferMode::LIVE);
    CHECK(resolve_mode(true, false) == TransferMode::EXPORT_JSON);
    CHECK(resolve_mode(false, true) == TransferMode::IMPORT_JSON);
    CHECK_THROWS_AS(resolve_mode(true, true), ConfigurationError);
}

TEST_CASE("job keeps the requested collections in order") {
    TransferOptions options;
    options.collections = {"users", "orders"};
    options.batch_size = 250;
    options.dry_run = true;

    TransferJob job = TransferJob::from_options(options);
    CHECK(job.collection_names() == std::vector<std::string>{"users", "orders"});
    CHECK(job.batch_size() == 250);
    CHECK(job.mode() == TransferMode::LIVE);
    CHECK(job.dry_run());
    CHECK(job.output_dir() == std::filesystem::path(DEFAULT_OUTPUT_DIR));
}

TEST_CASE("--all overrides an explicit collection list") {
    TransferOptions options;
    options.all = true;
    options.collections = {"users"};

    TransferJob job = TransferJob::from_options(options);
    CHECK(job.collection_names().empty());
}

TEST_CASE("job construction rejects invalid settings before any I/O") {
    TransferOptions options;

    SUBCASE("zero batch size") {
        options.batch_size = 0;
        CHECK_THROWS_AS(TransferJob::from_options(options), ConfigurationError);
    }
    SUBCASE("negative batch size") {
        options.batch_size = -5;
        CHECK_THROWS_AS(TransferJob::from_options(options), ConfigurationError);
    }
    SUBCASE("both file modes") {
        options.export_json = true;
        options.import_json = true;
        CHECK_THROWS_WITH_AS(TransferJob::from_options(options),
                             doctest::Contains("cannot be used together"), ConfigurationError);
    }
    SUBCASE("file mode without output directory") {
        options.export_json = true;
        options.output_dir = "";
        CHECK_THROWS_AS(TransferJob::from_options(options), ConfigurationError);
    }
}

TEST_CASE("configuration errors carry the configuration phase") {
    try {
        resolve_mode(true, true);
        FAIL("expected ConfigurationError");
    } catch (const ConfigurationError& e) {
        CHECK(e.phase() == TransferPhase::CONFIGURATION);
        CHECK(std::string(e.what()).rfind("Configuration error: ", 0) == 0);
    }
}

TEST_CASE("event and state names") {
    CHECK(to_string(TransferEventType::START) == "start");
    CHECK(to_string(TransferEventType::COLLECTION_DONE) == "collectionDone");
    CHECK(to_string(TransferEventType::ALL_DONE) == "allDone");
    CHECK(to_string(JobState::DRY_RUN_SKIP) == "dry-run-skip");
    CHECK(to_string(JobState::ABORTED) == "aborted");
    CHECK(to_string(TransferMode::IMPORT_JSON) == "import-json");
}

TEST_CASE("documents keep field order and extended JSON values through parse and dump") {
    const std::string text =
        R"({"_id":{"$oid":"65a1f0c2e4b0a1b2c3d4e5f6"},"zeta":1,"alpha":{"y":2,"x":3},"n":{"$numberLong":"5"}})";

    Document document = Document::parse(text);
    CHECK(document.dump() == text);
    CHECK(document.begin().key() == "_id");
    CHECK(document["alpha"].begin().key() == "y");
    CHECK(document["n"]["$numberLong"] == "5");
}

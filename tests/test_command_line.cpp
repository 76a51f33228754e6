/**
 * @file test_command_line.cpp
 * @brief Argument parsing, option precedence and confirmation prompt
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <doctest/doctest.h>

#include "cli/CommandLineInterface.hpp"
#include "cli/ConfigurationManager.hpp"
#include "support/TempDirectory.hpp"

#include <cstdlib>
#include <sstream>

using namespace mongocopy;
using mongocopy::test::TempDirectory;

namespace {

class Argv {
public:
    explicit Argv(std::vector<std::string> args) : storage_(std::move(args)) {
        storage_.insert(storage_.begin(), "mongocopy");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

// Isolates parsing from the developer's shell and working directory
struct CommandLineFixture {
    TempDirectory dir;
    std::string env_file;

    CommandLineFixture() {
        for (const auto& key : ConfigurationManager::known_keys()) {
            ::unsetenv(key.c_str());
        }
        env_file = dir.write_file("test.env",
            "SOURCE_DB_URI=mongodb://source:27017\n"
            "TARGET_DB_URI=mongodb://target:27017\n"
            "DB_NAME=from_file\n"
            "BATCH_SIZE=50\n").string();
    }

    bool parse(CommandLineInterface& cli, std::vector<std::string> args) {
        args.push_back("--env-file");
        args.push_back(env_file);
        Argv argv(std::move(args));
        return cli.parse_arguments(argv.argc(), argv.argv());
    }
};

} // namespace

TEST_CASE_FIXTURE(CommandLineFixture, "flags build transfer options") {
    CommandLineInterface cli;
    REQUIRE(parse(cli, {"-c", "users, orders,,", "--dry-run", "--yes", "--batch-size", "20"}));

    const TransferOptions& options = cli.get_options();
    CHECK(options.collections == std::vector<std::string>{"users", "orders"});
    CHECK_FALSE(options.all);
    CHECK(options.dry_run);
    CHECK(options.yes);
    CHECK(options.batch_size == 20);
    CHECK(options.output_dir == DEFAULT_OUTPUT_DIR);
    CHECK(options.connection.source_uri == "mongodb://source:27017");
    CHECK(options.connection.database_name == "from_file");
}

TEST_CASE_FIXTURE(CommandLineFixture, "batch size falls back to the environment, then the default") {
    CommandLineInterface cli;
    REQUIRE(parse(cli, {"--all", "--batch-size", "0"}));
    CHECK(cli.get_options().batch_size == 50);

    dir.write_file("test.env", "DB_NAME=app\n");
    CommandLineInterface defaults;
    REQUIRE(parse(defaults, {"--all"}));
    CHECK(defaults.get_options().batch_size == DEFAULT_BATCH_SIZE);
}

TEST_CASE_FIXTURE(CommandLineFixture, "precedence is CLI, JSON config, environment, env file") {
    ::setenv("DB_NAME", "from_env", 1);
    ::setenv("BATCH_SIZE", "60", 1);
    auto config = dir.write_file("config.json",
        R"({"db_name": "from_json", "batch_size": 70, "collections": ["a", " b "], "output_dir": "dump"})");

    CommandLineInterface cli;
    REQUIRE(parse(cli, {"--config", config.string(), "--batch-size", "90"}));
    const TransferOptions& options = cli.get_options();
    CHECK(options.connection.database_name == "from_json");
    CHECK(options.batch_size == 90);
    CHECK(options.collections == std::vector<std::string>{"a", "b"});
    CHECK(options.output_dir == "dump");

    ::unsetenv("DB_NAME");
    ::unsetenv("BATCH_SIZE");
}

TEST_CASE_FIXTURE(CommandLineFixture, "environment beats the env file") {
    ::setenv("DB_NAME", "from_env", 1);
    CommandLineInterface cli;
    REQUIRE(parse(cli, {"--all"}));
    CHECK(cli.get_options().connection.database_name == "from_env");
    ::unsetenv("DB_NAME");
}

TEST_CASE_FIXTURE(CommandLineFixture, "file modes and logging options") {
    CommandLineInterface cli;
    REQUIRE(parse(cli, {"--export-json", "--output-dir", "./dump", "--log-path", "copy.log",
                        "--log-level", "4,LiveInsertSink=6"}));
    const TransferOptions& options = cli.get_options();
    CHECK(options.export_json);
    CHECK_FALSE(options.import_json);
    CHECK(options.output_dir == "./dump");
    REQUIRE(options.log_path.has_value());
    CHECK(*options.log_path == "copy.log");
    CHECK(options.log_level == "4,LiveInsertSink=6");
}

TEST_CASE_FIXTURE(CommandLineFixture, "export and import together still parse for the validator to reject") {
    CommandLineInterface cli;
    REQUIRE(parse(cli, {"--export-json", "--import-json"}));
    CHECK(cli.get_options().export_json);
    CHECK(cli.get_options().import_json);
}

TEST_CASE_FIXTURE(CommandLineFixture, "no selection shows help and exits cleanly") {
    CommandLineInterface cli;
    CHECK_FALSE(parse(cli, {"--dry-run"}));
    CHECK(cli.exit_code() == 0);
}

TEST_CASE_FIXTURE(CommandLineFixture, "help and version exit with status 0") {
    CommandLineInterface help;
    CHECK_FALSE(parse(help, {"--help"}));
    CHECK(help.exit_code() == 0);

    CommandLineInterface version;
    CHECK_FALSE(parse(version, {"--version"}));
    CHECK(version.exit_code() == 0);
}

TEST_CASE_FIXTURE(CommandLineFixture, "parse errors exit with status 1") {
    CommandLineInterface unknown;
    CHECK_FALSE(parse(unknown, {"--everything"}));
    CHECK(unknown.exit_code() == 1);

    CommandLineInterface missing_value;
    CHECK_FALSE(parse(missing_value, {"--all", "--batch-size"}));
    CHECK(missing_value.exit_code() == 1);

    CommandLineInterface bad_number;
    CHECK_FALSE(parse(bad_number, {"--all", "--batch-size", "ten"}));
    CHECK(bad_number.exit_code() == 1);

    CommandLineInterface bad_config;
    CHECK_FALSE(parse(bad_config, {"--all", "--config", (dir.path() / "none.json").string()}));
    CHECK(bad_config.exit_code() == 1);
}

TEST_CASE("collection lists are trimmed and empties dropped") {
    CHECK(CommandLineInterface::parse_collections(" users , ,orders,") ==
          std::vector<std::string>{"users", "orders"});
    CHECK(CommandLineInterface::parse_collections("").empty());
}

TEST_CASE("confirmation message names the selection") {
    TransferOptions options;
    options.all = true;
    CHECK(CommandLineInterface::confirmation_message(options) ==
          "About to operate on ALL collections. Continue?");

    options.all = false;
    options.collections = {"users", "orders"};
    options.dry_run = true;
    CHECK(CommandLineInterface::confirmation_message(options) ==
          "About to operate on collections: users, orders (dry-run). Continue?");
}

TEST_CASE("confirmation accepts only y or yes") {
    auto answer = [](const std::string& input) {
        std::istringstream in(input);
        std::ostringstream out;
        bool accepted = CommandLineInterface::confirm_action("Continue?", in, out);
        CHECK(out.str().find("Continue? (y/N)") == 0);
        return accepted;
    };

    CHECK(answer("y\n"));
    CHECK(answer("YES\n"));
    CHECK(answer("  yes  \n"));
    CHECK_FALSE(answer("n\n"));
    CHECK_FALSE(answer("\n"));
    CHECK_FALSE(answer("sure\n"));
    CHECK_FALSE(answer(""));
}

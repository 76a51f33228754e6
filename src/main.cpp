/**
 * @file main.cpp
 * @brief Main entry point for mongocopy
 *
 * Copies MongoDB collections or entire databases between clusters, or
 * exports/imports them as JSON files, in bounded batches.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "mongocopy.hpp"
#include "TransferErrors.hpp"
#include "core/ConnectionManager.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include "core/ProgressTracker.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/TransferOrchestrator.hpp"
#include "store/MongoStore.hpp"
#include <iostream>

using namespace mongocopy;

/**
 * @brief Apply log level and log file settings
 * @return false if the log file could not be opened
 */
bool configure_logging(const TransferOptions& options) {
    Logger::resetConfiguration();
    Logger::parseLogConfig(options.log_level);
    return Logger::setSharedLogFile(options.log_path);
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version or parse error
        }

        const TransferOptions& options = cli.get_options();

        Logger logger("mongocopy");
        if (!configure_logging(options)) {
            logger.warning("Could not open log file " + options.log_path.value_or("") +
                           ", logging to console only");
        }

        if (logger.shouldOutput(LogLevel::DEBUG)) {
            cli.print_config();
        }

        // Reject contradictory options before any connection is made
        InputValidator validator;
        auto validation = validator.validate(options);
        if (validation.has_errors()) {
            logger.error(validation.format_error_message());
            return 1;
        }

        if (options.yes) {
            logger.info("Confirmation skipped (--yes).");
        } else if (!cli.confirm_transfer()) {
            logger.warning("Operation cancelled by user.");
            return 0;
        }

        TransferJob job = TransferJob::from_options(options);

        MongoStoreConnector connector;
        ConnectionManager connections(connector);
        ProgressTracker progress;
        TransferOrchestrator orchestrator(connections, progress);

        TransferOutcome outcome = orchestrator.run(job, options.connection);

        if (logger.shouldOutput(LogLevel::DETAILED)) {
            progress.printSummary();
        }

        if (!outcome.succeeded()) {
            logger.error("Operation failed: " + outcome.error_message.value_or("unknown error"));
            logger.flush();
            return 1;
        }

        logger.success("Operation finished.");
        logger.flush();
        return 0;

    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

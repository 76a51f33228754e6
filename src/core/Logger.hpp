/**
 * @file Logger.hpp
 * @brief Centralized component logging with verbosity control
 *
 * Every component owns a Logger named after itself. Verbosity is decided in
 * one place (outputMessage) using the component's facility level when one is
 * configured and the process-wide default otherwise. An optional log file is
 * shared by all loggers in the process.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mongocopy {

/**
 * @brief Log levels
 *
 * Level 1: Errors (abort the transfer)
 * Level 2: Warnings (skipped work, best-effort failures)
 * Level 3: Information (high-level progress, default)
 * Level 4: Detailed information (per-batch progress, codepath execution)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Component logger with a single point of output control
 */
class Logger {
public:
    /**
     * @brief Logger without a component name (uses the default level)
     */
    Logger();

    /**
     * @brief Logger for a named component (facility)
     * @param component_name Name used for facility-level lookup and message prefix
     */
    explicit Logger(const std::string& component_name);

    ~Logger();

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * THIS IS THE SINGLE POINT OF LOGGING CONTROL
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    /**
     * @brief Override the level for this instance only
     */
    void setLogLevel(LogLevel level) { instance_level_ = level; }

    /**
     * @brief Check if a message level would be output
     */
    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    /**
     * @brief Informational message marking a completed step
     */
    void success(const std::string& message) const {
        outputMessage(LogLevel::INFO, "✔ " + message);
    }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();  // Flush after highest debug level messages
    }

    /**
     * @brief Flush console and shared file output
     */
    void flush() const;

    // ========================================================================
    // Process-wide configuration
    // ========================================================================

    /**
     * @brief Set log level for a specific facility (component)
     *
     * Enables fine-grained control like "level 5 for the orchestrator but
     * level 3 for everything else".
     */
    static void setFacilityLevel(const std::string& facility, LogLevel level);

    /**
     * @brief Set the fallback level for facilities without a specific level
     */
    static void setDefaultLevel(LogLevel level);

    static LogLevel getDefaultLevel();

    /**
     * @brief Get log level for a facility, falling back to the default level
     */
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply log configuration from string
     *
     * Supports:
     * - Simple level: "5" sets default to DEBUG
     * - Facility-specific: "TransferOrchestrator=5,JsonExportSink=6"
     * - Mixed: "4,LiveInsertSink=6"
     * - "default=N" is the same as a bare level
     *
     * Levels are clamped to 1..6. Invalid tokens are reported on stderr and skipped.
     *
     * @return false if any token was invalid
     */
    static bool parseLogConfig(const std::string& config);

    /**
     * @brief Clear facility-specific levels and reset the default to INFO
     */
    static void resetConfiguration();

    /**
     * @brief Append all log output to a file, or stop file logging with nullopt
     * @return false if the file could not be opened
     */
    static bool setSharedLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Effective level: instance override, then facility, then default
     */
    LogLevel getEffectiveLevel() const;

private:
    std::string component_name_;
    std::optional<LogLevel> instance_level_;

    // Process-wide registry
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::shared_ptr<std::ofstream> shared_file_;
    static std::mutex registry_mutex_;
    static std::mutex output_mutex_;

    /**
     * @brief Perform the actual output to console and file
     */
    void doOutput(LogLevel level, const std::string& message) const;
};

/**
 * @brief Short tag printed in front of messages ("ERROR", "WARN", ...)
 */
const char* level_tag(LogLevel level);

} // namespace mongocopy

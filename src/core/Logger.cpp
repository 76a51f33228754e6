/**
 * @file Logger.cpp
 * @brief Implementation of centralized component logging
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace mongocopy {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::shared_ptr<std::ofstream> Logger::shared_file_;
std::mutex Logger::registry_mutex_;
std::mutex Logger::output_mutex_;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\n\r");
    return value.substr(first, last - first + 1);
}

std::optional<LogLevel> parse_level(const std::string& text) {
    try {
        size_t consumed = 0;
        int level_int = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<LogLevel>(std::clamp(level_int, 1, 6));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "LOG";
}

Logger::Logger() = default;

Logger::Logger(const std::string& component_name)
    : component_name_(component_name) {
}

Logger::~Logger() {
    flush();
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    // Single verbosity check using facility-aware effective level
    if (!shouldOutput(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    doOutput(level, message);
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    // Format timestamp as HH:MM:SS.mmm
    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] " << level_tag(level) << " ";
    if (!component_name_.empty()) {
        line << "[" << component_name_ << "] ";
    }
    line << message;

    // Errors and warnings go to stderr so stdout stays usable for progress
    std::ostream& console = (level <= LogLevel::WARNING) ? std::cerr : std::cout;
    console << line.str() << std::endl;

    if (shared_file_ && shared_file_->is_open()) {
        *shared_file_ << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout.flush();
    std::cerr.flush();
    if (shared_file_ && shared_file_->is_open()) {
        shared_file_->flush();
    }
}

// ============================================================================
// Process-wide configuration
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getDefaultLevel() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return default_level_;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }

    return default_level_;
}

bool Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return true;

    std::lock_guard<std::mutex> lock(registry_mutex_);
    bool all_valid = true;

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        if (equals_pos != std::string::npos) {
            std::string facility = trim(token.substr(0, equals_pos));
            std::string level_str = trim(token.substr(equals_pos + 1));

            auto level = parse_level(level_str);
            if (!level || facility.empty()) {
                std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '"
                          << facility << "'" << std::endl;
                all_valid = false;
                continue;
            }

            if (facility == "default") {
                default_level_ = *level;
            } else {
                facility_levels_[facility] = *level;
            }
        } else {
            auto level = parse_level(token);
            if (!level) {
                std::cerr << "Warning: Invalid default log level '" << token << "'" << std::endl;
                all_valid = false;
                continue;
            }
            default_level_ = *level;
        }
    }

    return all_valid;
}

void Logger::resetConfiguration() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
    default_level_ = LogLevel::INFO;
}

bool Logger::setSharedLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (shared_file_) {
        shared_file_->close();
        shared_file_.reset();
    }

    if (!log_file.has_value()) {
        return true;
    }

    try {
        std::filesystem::path log_path(log_file.value());
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        // Append mode: repeated runs accumulate in one file
        auto stream = std::make_shared<std::ofstream>(log_file.value(), std::ios::app);
        if (!stream->is_open()) {
            // Don't log through the logger here to avoid recursion
            std::cerr << "Warning: Failed to open log file: " << log_file.value() << std::endl;
            return false;
        }
        shared_file_ = std::move(stream);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        return false;
    }
}

LogLevel Logger::getEffectiveLevel() const {
    if (instance_level_.has_value()) {
        return *instance_level_;
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }
    return default_level_;
}

} // namespace mongocopy

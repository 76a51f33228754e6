/**
 * @file ConfigurationManager.hpp
 * @brief Environment and .env configuration for mongocopy
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "mongocopy.hpp"
#include <string>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace mongocopy {

/**
 * @brief Key/value configuration loaded from .env files and the environment
 *
 * Values set later win, so load the .env file first and overlay the
 * process environment afterwards.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load KEY=VALUE lines from a .env file
     *
     * Blank lines and '#' comments are skipped, an "export " prefix is
     * accepted and matching surrounding quotes are stripped from values.
     *
     * @param filename Path to the .env file
     * @return true if the file was read, false if it could not be opened
     */
    bool load_env_file(const std::string& filename);

    /**
     * @brief Copy the known keys that are set in the process environment
     * @return Number of keys taken from the environment
     */
    int overlay_environment();

    /**
     * @brief Keys read from the environment
     */
    static const std::vector<std::string>& known_keys();

    /**
     * @brief Split one .env line into key and value
     * @return nullopt for blank, comment and malformed lines
     */
    static std::optional<std::pair<std::string, std::string>> parse_env_line(const std::string& line);

    /**
     * @brief SOURCE_DB_URI, TARGET_DB_URI and DB_NAME as connection settings
     */
    ConnectionSettings to_connection_settings() const;

    /**
     * @brief BATCH_SIZE if set to a positive integer, else the fallback
     */
    int batch_size(int fallback = DEFAULT_BATCH_SIZE) const;

    /**
     * @brief LOG_PATH when LOG_TO_FILE is enabled
     */
    std::optional<std::string> log_path() const;

    /**
     * @brief Log configuration string for Logger::parseLogConfig
     *
     * LOG_LEVEL wins (numeric, or error/warn/info/debug/trace), then
     * DEBUG=true selects level 5, else the fallback.
     */
    std::string log_level(const std::string& fallback = "3") const;

    void set_value(const std::string& key, const std::string& value) {
        config_values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return config_values_.find(key) != config_values_.end();
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const {
        auto it = config_values_.find(key);
        return (it != config_values_.end()) ? it->second : default_value;
    }

    int get_int(const std::string& key, int default_value = 0) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            try {
                size_t consumed = 0;
                int value = std::stoi(it->second, &consumed);
                if (consumed == it->second.size()) {
                    return value;
                }
            } catch (const std::exception&) {
                // Fall through to default
            }
        }
        return default_value;
    }

    bool get_bool(const std::string& key, bool default_value = false) const {
        auto it = config_values_.find(key);
        if (it != config_values_.end()) {
            const std::string& value = it->second;
            return value == "true" || value == "1" || value == "yes";
        }
        return default_value;
    }

private:
    std::map<std::string, std::string> config_values_;
};

} // namespace mongocopy

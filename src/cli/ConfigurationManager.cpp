/**
 * @file ConfigurationManager.cpp
 * @brief Environment and .env configuration for mongocopy
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ConfigurationManager.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace mongocopy {

namespace {

std::string trim(const std::string& str) {
    const auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    const auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

const std::vector<std::string>& ConfigurationManager::known_keys() {
    static const std::vector<std::string> keys = {
        "SOURCE_DB_URI", "TARGET_DB_URI", "DB_NAME", "BATCH_SIZE",
        "LOG_TO_FILE", "LOG_PATH", "LOG_LEVEL", "DEBUG"
    };
    return keys;
}

std::optional<std::pair<std::string, std::string>> ConfigurationManager::parse_env_line(const std::string& line) {
    std::string text = trim(line);
    if (text.empty() || text[0] == '#') {
        return std::nullopt;
    }

    if (text.starts_with("export ")) {
        text = trim(text.substr(7));
    }

    size_t eq_pos = text.find('=');
    if (eq_pos == std::string::npos) {
        return std::nullopt;
    }

    std::string key = trim(text.substr(0, eq_pos));
    std::string value = trim(text.substr(eq_pos + 1));
    if (key.empty()) {
        return std::nullopt;
    }

    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }

    return std::make_pair(key, value);
}

bool ConfigurationManager::load_env_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (auto entry = parse_env_line(line)) {
            config_values_[entry->first] = entry->second;
        }
    }

    return true;
}

int ConfigurationManager::overlay_environment() {
    int taken = 0;
    for (const auto& key : known_keys()) {
        if (const char* value = std::getenv(key.c_str())) {
            config_values_[key] = value;
            taken++;
        }
    }
    return taken;
}

ConnectionSettings ConfigurationManager::to_connection_settings() const {
    ConnectionSettings settings;
    settings.source_uri = get_string("SOURCE_DB_URI");
    settings.target_uri = get_string("TARGET_DB_URI");
    settings.database_name = get_string("DB_NAME");
    return settings;
}

int ConfigurationManager::batch_size(int fallback) const {
    int value = get_int("BATCH_SIZE", 0);
    return value > 0 ? value : fallback;
}

std::optional<std::string> ConfigurationManager::log_path() const {
    if (!get_bool("LOG_TO_FILE")) {
        return std::nullopt;
    }
    std::string path = get_string("LOG_PATH");
    if (path.empty()) {
        return std::nullopt;
    }
    return path;
}

std::string ConfigurationManager::log_level(const std::string& fallback) const {
    std::string level = trim(get_string("LOG_LEVEL"));
    if (!level.empty()) {
        const std::string name = to_lower(level);
        if (name == "error") return "1";
        if (name == "warn" || name == "warning") return "2";
        if (name == "info") return "3";
        if (name == "verbose" || name == "detailed") return "4";
        if (name == "debug") return "5";
        if (name == "trace" || name == "silly") return "6";
        return level;
    }

    if (get_bool("DEBUG")) {
        return "5";
    }
    return fallback;
}

} // namespace mongocopy

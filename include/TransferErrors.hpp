#pragma once

/**
 * @file TransferErrors.hpp
 * @brief Exception taxonomy for the transfer engine
 *
 * Every failure the engine can raise derives from TransferError and carries
 * the phase it happened in and, where known, the collection involved.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mongocopy {

/**
 * @brief Job phase a failure is attributed to
 */
enum class TransferPhase {
    CONFIGURATION,
    CONNECTING,
    ENUMERATING,
    STREAMING,
    CLEANUP
};

inline std::string to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::CONFIGURATION: return "configuration";
        case TransferPhase::CONNECTING: return "connecting";
        case TransferPhase::ENUMERATING: return "enumerating";
        case TransferPhase::STREAMING: return "streaming";
        case TransferPhase::CLEANUP: return "cleanup";
    }
    return "unknown";
}

/**
 * @brief Base class for all transfer failures
 */
class TransferError : public std::runtime_error {
public:
    TransferError(TransferPhase phase, const std::string& collection, const std::string& message)
        : std::runtime_error(message), phase_(phase), collection_(collection) {}

    TransferPhase phase() const { return phase_; }
    const std::string& collection() const { return collection_; }

private:
    TransferPhase phase_;
    std::string collection_;
};

/**
 * @brief Invalid or contradictory options, rejected before any I/O
 */
class ConfigurationError : public TransferError {
public:
    explicit ConfigurationError(const std::string& message)
        : TransferError(TransferPhase::CONFIGURATION, "", "Configuration error: " + message) {}
};

/**
 * @brief A store endpoint could not be reached
 */
class ConnectionError : public TransferError {
public:
    ConnectionError(const std::string& endpoint, const std::string& message)
        : TransferError(TransferPhase::CONNECTING, "",
                        "Connection error (" + endpoint + "): " + message),
          endpoint_(endpoint) {}

    const std::string& endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
};

/**
 * @brief Listing the source collections failed
 */
class EnumerationError : public TransferError {
public:
    explicit EnumerationError(const std::string& message)
        : TransferError(TransferPhase::ENUMERATING, "", "Enumeration error: " + message) {}
};

/**
 * @brief Opening, counting or advancing a source cursor failed
 */
class BatchReadError : public TransferError {
public:
    BatchReadError(const std::string& collection, const std::string& message)
        : TransferError(TransferPhase::STREAMING, collection,
                        "Batch read error in '" + collection + "': " + message) {}
};

/**
 * @brief Destination write failed, fully or partially
 */
class InsertError : public TransferError {
public:
    InsertError(const std::string& collection, std::size_t inserted, std::size_t failed,
                const std::string& message)
        : TransferError(TransferPhase::STREAMING, collection,
                        "Insert error in '" + collection + "': " + std::to_string(inserted) +
                        " inserted, " + std::to_string(failed) + " failed: " + message),
          inserted_(inserted), failed_(failed) {}

    std::size_t inserted_count() const { return inserted_; }
    std::size_t failed_count() const { return failed_; }

private:
    std::size_t inserted_;
    std::size_t failed_;
};

/**
 * @brief Export/import file access or parse failure
 */
class FileIOError : public TransferError {
public:
    FileIOError(const std::string& collection, const std::string& path, const std::string& message)
        : TransferError(TransferPhase::STREAMING, collection,
                        "File error (" + path + "): " + message),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace mongocopy

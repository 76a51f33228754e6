#pragma once

/**
 * @file mongocopy.hpp
 * @brief Main header for the mongocopy collection-transfer engine
 *
 * Core value types shared by the transfer engine, the sinks and the
 * command-line front end: documents, batches, job configuration,
 * per-collection results and the progress event interface.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mongocopy {

// ============================================================================
// Documents and batches
// ============================================================================

/**
 * @brief A schema-less document (JSON object, canonical Extended JSON for BSON types)
 *
 * Field order is preserved; MongoDB compares embedded documents field by
 * field, so reordering keys would change the data.
 */
using Document = nlohmann::ordered_json;

/**
 * @brief Bounded, ordered group of documents moved together in one write
 *
 * An empty batch is never yielded by a reader; exhaustion is signalled
 * by the absence of a batch instead.
 */
using Batch = std::vector<Document>;

inline constexpr int DEFAULT_BATCH_SIZE = 1000;
inline constexpr const char* DEFAULT_OUTPUT_DIR = "./backup";
inline constexpr const char* JSON_FILE_EXTENSION = ".json";

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Write target selected once per job
 */
enum class TransferMode {
    LIVE,          // Insert into the destination store
    EXPORT_JSON,   // Append to {output_dir}/{collection}.json
    IMPORT_JSON    // Load {output_dir}/{collection}.json into the destination store
};

inline std::string to_string(TransferMode mode) {
    switch (mode) {
        case TransferMode::LIVE: return "live";
        case TransferMode::EXPORT_JSON: return "export-json";
        case TransferMode::IMPORT_JSON: return "import-json";
    }
    return "unknown";
}

/**
 * @brief Endpoints of a transfer
 */
struct ConnectionSettings {
    std::string source_uri;
    std::string target_uri;     // Optional in EXPORT_JSON mode
    std::string database_name;  // Empty means "use the database named in the URI"
};

/**
 * @brief Resolved configuration produced by the command-line/config layer
 *
 * Mirrors the raw user input: both file-mode flags are kept so that a
 * contradictory combination can be reported instead of silently resolved.
 */
struct TransferOptions {
    bool all = false;
    std::vector<std::string> collections;
    int batch_size = DEFAULT_BATCH_SIZE;
    bool dry_run = false;
    bool export_json = false;
    bool import_json = false;
    std::string output_dir = DEFAULT_OUTPUT_DIR;
    bool yes = false;

    // Logging
    std::optional<std::string> log_path;
    std::string log_level = "3";

    ConnectionSettings connection;
};

/**
 * @brief Immutable description of one transfer run
 *
 * Built from TransferOptions; construction rejects contradictory or
 * invalid settings with ConfigurationError before any I/O happens.
 */
class TransferJob {
public:
    /**
     * @brief Build a job from user options
     * @throws ConfigurationError if both file modes are set or batch_size <= 0
     */
    static TransferJob from_options(const TransferOptions& options);

    const std::vector<std::string>& collection_names() const { return collection_names_; }
    std::size_t batch_size() const { return batch_size_; }
    TransferMode mode() const { return mode_; }
    bool dry_run() const { return dry_run_; }
    const std::filesystem::path& output_dir() const { return output_dir_; }

private:
    TransferJob(std::vector<std::string> collection_names, std::size_t batch_size,
                TransferMode mode, bool dry_run, std::filesystem::path output_dir);

    std::vector<std::string> collection_names_;  // Empty means "all collections"
    std::size_t batch_size_;
    TransferMode mode_;
    bool dry_run_;
    std::filesystem::path output_dir_;
};

/**
 * @brief Resolve the sink mode from the two file-mode flags
 * @throws ConfigurationError if both flags are set
 */
TransferMode resolve_mode(bool export_json, bool import_json);

// ============================================================================
// Planning and results
// ============================================================================

/**
 * @brief Ordered collections to process, derived once per job
 */
struct CollectionPlan {
    std::vector<std::string> names;
    std::vector<std::string> missing;  // Requested but absent from the source

    bool empty() const { return names.empty(); }
    std::size_t size() const { return names.size(); }
};

/**
 * @brief Per-collection transfer counters
 *
 * total_docs is a point-in-time snapshot taken before streaming; concurrent
 * source writes may make processed_docs differ from it.
 */
struct TransferResult {
    std::string name;
    std::int64_t total_docs = 0;
    std::int64_t processed_docs = 0;
    std::size_t batches = 0;
};

/**
 * @brief Orchestrator states
 */
enum class JobState {
    IDLE,
    ENUMERATING,
    PER_COLLECTION_LOOP,
    DRY_RUN_SKIP,
    STREAMING,
    COMPLETED,
    ABORTED
};

std::string to_string(JobState state);

/**
 * @brief Final status of a run, returned to the caller after cleanup
 */
struct TransferOutcome {
    JobState final_state = JobState::IDLE;
    std::vector<TransferResult> results;
    std::optional<std::string> error_message;
    std::string failed_phase;
    std::string failed_collection;

    bool succeeded() const { return final_state == JobState::COMPLETED; }

    std::int64_t total_processed() const {
        std::int64_t total = 0;
        for (const auto& result : results) {
            total += result.processed_docs;
        }
        return total;
    }
};

// ============================================================================
// Progress reporting
// ============================================================================

enum class TransferEventType {
    START,
    PROGRESS,
    COLLECTION_DONE,
    ALL_DONE,
    ERROR
};

std::string to_string(TransferEventType type);

/**
 * @brief Event emitted by the orchestrator to its progress sink
 */
struct TransferEvent {
    TransferEventType type;
    std::string collection;       // Empty for job-level events
    std::int64_t processed = 0;
    std::int64_t total = 0;
    std::string message;
};

/**
 * @brief Receiver for orchestrator events
 *
 * The engine never formats terminal output itself; implementations decide
 * how events are presented.
 */
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void on_event(const TransferEvent& event) = 0;
};

} // namespace mongocopy

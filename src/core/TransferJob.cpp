/**
 * @file TransferJob.cpp
 * @brief Job construction and enum helpers for the main header
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "mongocopy.hpp"
#include "TransferErrors.hpp"
#include <utility>

namespace mongocopy {

TransferMode resolve_mode(bool export_json, bool import_json) {
    if (export_json && import_json) {
        throw ConfigurationError("--export-json and --import-json cannot be used together");
    }
    if (export_json) return TransferMode::EXPORT_JSON;
    if (import_json) return TransferMode::IMPORT_JSON;
    return TransferMode::LIVE;
}

TransferJob::TransferJob(std::vector<std::string> collection_names, std::size_t batch_size,
                         TransferMode mode, bool dry_run, std::filesystem::path output_dir)
    : collection_names_(std::move(collection_names)),
      batch_size_(batch_size),
      mode_(mode),
      dry_run_(dry_run),
      output_dir_(std::move(output_dir)) {
}

TransferJob TransferJob::from_options(const TransferOptions& options) {
    TransferMode mode = resolve_mode(options.export_json, options.import_json);

    if (options.batch_size <= 0) {
        throw ConfigurationError("batch size must be a positive integer, got " +
                                 std::to_string(options.batch_size));
    }

    if (mode != TransferMode::LIVE && options.output_dir.empty()) {
        throw ConfigurationError("an output directory is required for " + to_string(mode));
    }

    // --all overrides any explicit list
    std::vector<std::string> names;
    if (!options.all) {
        names = options.collections;
    }

    return TransferJob(std::move(names), static_cast<std::size_t>(options.batch_size), mode,
                       options.dry_run, std::filesystem::path(options.output_dir));
}

std::string to_string(JobState state) {
    switch (state) {
        case JobState::IDLE: return "idle";
        case JobState::ENUMERATING: return "enumerating";
        case JobState::PER_COLLECTION_LOOP: return "per-collection-loop";
        case JobState::DRY_RUN_SKIP: return "dry-run-skip";
        case JobState::STREAMING: return "streaming";
        case JobState::COMPLETED: return "completed";
        case JobState::ABORTED: return "aborted";
    }
    return "unknown";
}

std::string to_string(TransferEventType type) {
    switch (type) {
        case TransferEventType::START: return "start";
        case TransferEventType::PROGRESS: return "progress";
        case TransferEventType::COLLECTION_DONE: return "collectionDone";
        case TransferEventType::ALL_DONE: return "allDone";
        case TransferEventType::ERROR: return "error";
    }
    return "unknown";
}

} // namespace mongocopy

/**
 * @file ProgressTracker.hpp
 * @brief Default progress sink: logs transfer events and tracks per-collection stages
 *
 * Each collection is tracked as a stage with its own timing, document
 * counters and failure state, so a run can be summarized once it ends.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "mongocopy.hpp"
#include "Logger.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mongocopy {

/**
 * @brief Tracking state for one collection
 */
struct CollectionStage {
    std::string collection;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;
    bool successful = false;
    std::int64_t processed = 0;
    std::int64_t total = 0;
    std::size_t progress_updates = 0;
    std::string error_message;

    explicit CollectionStage(const std::string& name)
        : collection(name), start_time(std::chrono::steady_clock::now()) {}

    void complete(bool success = true, const std::string& error = "") {
        end_time = std::chrono::steady_clock::now();
        completed = true;
        successful = success;
        error_message = error;
    }

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

/**
 * @brief Logs orchestrator events and keeps a per-collection record
 *
 * Progress updates are logged at DETAILED level so that INFO output stays
 * at one line per collection.
 */
class ProgressTracker : public ProgressSink {
public:
    ProgressTracker();

    void on_event(const TransferEvent& event) override;

    // Object state queries for logging
    std::string getSummary() const;
    std::string getTimingReport() const;
    std::string getCurrentStage() const;

    void printSummary() const;

    // Statistics
    std::size_t getCompletedCollectionCount() const;
    std::int64_t getTotalProcessed() const;
    bool hasFailed() const { return failed_; }
    bool isFinished() const { return finished_; }

    const std::vector<CollectionStage>& getStages() const { return stages_; }

    void clear();

private:
    std::vector<CollectionStage> stages_;
    std::chrono::steady_clock::time_point tracking_start_time_;
    bool finished_ = false;
    bool failed_ = false;
    std::string failure_message_;
    mutable Logger logger_;

    CollectionStage& stageFor(const std::string& collection);
    CollectionStage* findStage(const std::string& collection);

    std::string formatDuration(std::chrono::milliseconds duration) const;
};

} // namespace mongocopy

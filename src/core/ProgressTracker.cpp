/**
 * @file ProgressTracker.cpp
 * @brief Implementation of the default progress sink
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ProgressTracker.hpp"
#include <iomanip>
#include <sstream>

namespace mongocopy {

ProgressTracker::ProgressTracker()
    : tracking_start_time_(std::chrono::steady_clock::now()), logger_("Progress") {
}

void ProgressTracker::on_event(const TransferEvent& event) {
    switch (event.type) {
        case TransferEventType::START:
            tracking_start_time_ = std::chrono::steady_clock::now();
            logger_.info(event.message.empty() ? "Starting copy..." : event.message);
            break;

        case TransferEventType::PROGRESS: {
            CollectionStage& stage = stageFor(event.collection);
            stage.processed = event.processed;
            stage.total = event.total;
            stage.progress_updates++;
            logger_.detailed("Collection " + event.collection + ": " +
                             std::to_string(event.processed) + "/" +
                             std::to_string(event.total) + " documents");
            break;
        }

        case TransferEventType::COLLECTION_DONE: {
            CollectionStage& stage = stageFor(event.collection);
            stage.processed = event.processed;
            stage.total = event.total;
            stage.complete(true);
            if (event.message.empty()) {
                logger_.success("Finished collection " + event.collection + " (" +
                                std::to_string(event.total) + " docs) in " +
                                formatDuration(stage.duration()));
            } else {
                logger_.detailed(event.message);
            }
            break;
        }

        case TransferEventType::ALL_DONE:
            finished_ = true;
            logger_.success(event.message.empty() ? "Copy completed successfully." : event.message);
            break;

        case TransferEventType::ERROR: {
            finished_ = true;
            failed_ = true;
            failure_message_ = event.message;
            if (!event.collection.empty()) {
                CollectionStage& stage = stageFor(event.collection);
                stage.processed = event.processed;
                stage.total = event.total;
                stage.complete(false, event.message);
            }
            // The orchestrator has already logged the failure with its context
            logger_.detailed("Copy failed: " + event.message);
            break;
        }
    }
}

CollectionStage& ProgressTracker::stageFor(const std::string& collection) {
    if (CollectionStage* stage = findStage(collection)) {
        return *stage;
    }
    stages_.emplace_back(collection);
    return stages_.back();
}

CollectionStage* ProgressTracker::findStage(const std::string& collection) {
    for (auto& stage : stages_) {
        if (stage.collection == collection) {
            return &stage;
        }
    }
    return nullptr;
}

std::size_t ProgressTracker::getCompletedCollectionCount() const {
    std::size_t count = 0;
    for (const auto& stage : stages_) {
        if (stage.completed && stage.successful) {
            count++;
        }
    }
    return count;
}

std::int64_t ProgressTracker::getTotalProcessed() const {
    std::int64_t total = 0;
    for (const auto& stage : stages_) {
        total += stage.processed;
    }
    return total;
}

std::string ProgressTracker::getSummary() const {
    std::ostringstream oss;
    oss << "Collections: " << getCompletedCollectionCount() << "/" << stages_.size()
        << " completed, " << getTotalProcessed() << " documents processed";
    if (failed_) {
        oss << " [FAILED: " << failure_message_ << "]";
    }
    return oss.str();
}

std::string ProgressTracker::getTimingReport() const {
    std::ostringstream oss;
    auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - tracking_start_time_);

    oss << "Total time: " << formatDuration(total_time);

    if (!stages_.empty()) {
        std::chrono::milliseconds stage_time(0);
        for (const auto& stage : stages_) {
            if (stage.completed) {
                stage_time += stage.duration();
            }
        }
        oss << ", Collection time: " << formatDuration(stage_time);
    }

    return oss.str();
}

std::string ProgressTracker::getCurrentStage() const {
    if (stages_.empty()) {
        return "No collections";
    }

    const auto& current = stages_.back();
    if (current.completed) {
        return "All collections completed";
    }
    return "Current collection: " + current.collection;
}

void ProgressTracker::printSummary() const {
    std::ostringstream summary;
    summary << "\n=== Transfer Summary ===\n";
    for (const auto& stage : stages_) {
        summary << "  " << stage.collection << ": " << stage.processed << "/" << stage.total;
        if (stage.completed) {
            summary << " [" << formatDuration(stage.duration()) << "]";
            if (!stage.successful) {
                summary << " FAILED: " << stage.error_message;
            }
        } else {
            summary << " [INCOMPLETE]";
        }
        summary << "\n";
    }
    summary << getSummary() << "\n";
    summary << getTimingReport() << "\n";
    summary << "========================";
    logger_.info(summary.str());
}

void ProgressTracker::clear() {
    stages_.clear();
    finished_ = false;
    failed_ = false;
    failure_message_.clear();
    tracking_start_time_ = std::chrono::steady_clock::now();
}

std::string ProgressTracker::formatDuration(std::chrono::milliseconds duration) const {
    auto ms = duration.count();
    std::ostringstream oss;
    if (ms < 1000) {
        oss << ms << "ms";
    } else if (ms < 60000) {
        oss << std::fixed << std::setprecision(1) << (ms / 1000.0) << "s";
    } else {
        oss << (ms / 60000) << "m " << ((ms % 60000) / 1000) << "s";
    }
    return oss.str();
}

} // namespace mongocopy

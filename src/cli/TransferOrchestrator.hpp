/**
 * @file TransferOrchestrator.hpp
 * @brief Drives a transfer job from connection to cleanup
 *
 * This class coordinates one run: it opens the store session, resolves the
 * collection plan, streams each collection through the job's sink and
 * reports progress. The first failure aborts the whole job; the session is
 * closed exactly once whichever way the run ends.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "mongocopy.hpp"
#include "../core/BatchCursorReader.hpp"
#include "../core/ConnectionManager.hpp"
#include "../core/Logger.hpp"
#include "../sink/TransferSink.hpp"
#include <string>

namespace mongocopy {

/**
 * @brief Orchestrates a transfer job
 *
 * State machine:
 *   IDLE -> ENUMERATING -> PER_COLLECTION_LOOP
 *        -> (per collection: DRY_RUN_SKIP | STREAMING)
 *        -> COMPLETED | ABORTED
 *
 * Responsibilities:
 * - Open the store session and guarantee its cleanup
 * - Resolve the collection plan
 * - Wire the batch reader to the job's sink
 * - Emit start/progress/collectionDone/allDone/error events
 */
class TransferOrchestrator {
public:
    /**
     * @brief Constructor
     * @param connections Connection manager used to open and close the session
     * @param progress Receiver for transfer events
     */
    TransferOrchestrator(ConnectionManager& connections, ProgressSink& progress);

    ~TransferOrchestrator();

    /**
     * @brief Run a job to completion or first failure
     *
     * Never throws for transfer failures; they are reported in the outcome
     * after the session has been closed.
     */
    TransferOutcome run(const TransferJob& job, const ConnectionSettings& settings);

    /**
     * @brief Current (or final) state of the last run
     */
    JobState state() const { return state_; }

private:
    TransferResult transfer_collection(StoreHandle& source, const std::string& name,
                                       TransferSink& sink, const BatchCursorReader& reader);

    void abort_job(TransferOutcome& outcome, const std::string& phase,
                   const std::string& message);

    void emit(TransferEventType type, const std::string& collection = "",
              std::int64_t processed = 0, std::int64_t total = 0,
              const std::string& message = "");

    ConnectionManager& connections_;
    ProgressSink& progress_;
    Logger logger_;
    JobState state_ = JobState::IDLE;

    // Collection in flight, for error context
    std::string current_collection_;
    TransferResult current_result_;

    // Disable copy/move since we hold references
    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;
    TransferOrchestrator(TransferOrchestrator&&) = delete;
    TransferOrchestrator& operator=(TransferOrchestrator&&) = delete;
};

} // namespace mongocopy

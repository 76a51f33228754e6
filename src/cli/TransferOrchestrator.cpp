/**
 * @file TransferOrchestrator.cpp
 * @brief Implementation of transfer orchestration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "TransferOrchestrator.hpp"
#include "TransferErrors.hpp"
#include "../core/CollectionEnumerator.hpp"
#include <memory>

namespace mongocopy {

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ", ";
        joined += name;
    }
    return joined;
}

TransferPhase phase_for_state(JobState state) {
    switch (state) {
        case JobState::IDLE: return TransferPhase::CONNECTING;
        case JobState::ENUMERATING: return TransferPhase::ENUMERATING;
        default: return TransferPhase::STREAMING;
    }
}

} // namespace

TransferOrchestrator::TransferOrchestrator(ConnectionManager& connections, ProgressSink& progress)
    : connections_(connections)
    , progress_(progress)
    , logger_("TransferOrchestrator")
{
    logger_.debug("Transfer orchestrator initialized");
}

TransferOrchestrator::~TransferOrchestrator() = default;

TransferOutcome TransferOrchestrator::run(const TransferJob& job, const ConnectionSettings& settings) {
    TransferOutcome outcome;
    state_ = JobState::IDLE;
    current_collection_.clear();
    current_result_ = TransferResult{};

    logger_.detailed("Starting " + to_string(job.mode()) + " transfer, batch size " +
                     std::to_string(job.batch_size()) + (job.dry_run() ? " (dry-run)" : ""));

    StoreSession session;
    try {
        session = connections_.open(settings, job.mode());
    } catch (const TransferError& e) {
        abort_job(outcome, to_string(e.phase()), e.what());
        return outcome;
    } catch (const std::exception& e) {
        abort_job(outcome, to_string(TransferPhase::CONNECTING), e.what());
        return outcome;
    }

    SessionGuard guard(connections_, session);

    try {
        state_ = JobState::ENUMERATING;
        CollectionEnumerator enumerator;
        CollectionPlan plan = enumerator.resolve(*session.source, job.collection_names());

        for (const auto& name : plan.missing) {
            logger_.warning("Collection not found in source, skipping: " + name);
        }

        emit(TransferEventType::START, "", 0, static_cast<std::int64_t>(plan.size()),
             "Copy " + std::to_string(plan.size()) + " collection(s): " + join_names(plan.names));

        // The sink is destroyed before the session guard releases the handles
        std::unique_ptr<TransferSink> sink;
        if (!job.dry_run()) {
            sink = make_sink(job.mode(), job.output_dir(), session.destination.get());
        }
        BatchCursorReader reader(job.batch_size());

        state_ = JobState::PER_COLLECTION_LOOP;
        for (const auto& name : plan.names) {
            current_collection_ = name;
            logger_.detailed("Processing collection: " + name);

            if (job.dry_run()) {
                state_ = JobState::DRY_RUN_SKIP;
                logger_.info("[DRY-RUN] Would copy collection: " + name);
                emit(TransferEventType::COLLECTION_DONE, name, 0, 0,
                     "Skipped collection " + name + " (dry-run)");
                state_ = JobState::PER_COLLECTION_LOOP;
                continue;
            }

            state_ = JobState::STREAMING;
            TransferResult result = transfer_collection(*session.source, name, *sink, reader);
            outcome.results.push_back(result);
            emit(TransferEventType::COLLECTION_DONE, name, result.processed_docs, result.total_docs);
            state_ = JobState::PER_COLLECTION_LOOP;
        }

        current_collection_.clear();
        state_ = JobState::COMPLETED;
        outcome.final_state = JobState::COMPLETED;
        emit(TransferEventType::ALL_DONE, "", outcome.total_processed(), outcome.total_processed(),
             "Copy completed successfully.");
    } catch (const TransferError& e) {
        if (state_ == JobState::STREAMING) {
            outcome.results.push_back(current_result_);
        }
        abort_job(outcome, to_string(e.phase()), e.what());
    } catch (const std::exception& e) {
        if (state_ == JobState::STREAMING) {
            outcome.results.push_back(current_result_);
        }
        abort_job(outcome, to_string(phase_for_state(state_)), e.what());
    }

    guard.release();
    return outcome;
}

TransferResult TransferOrchestrator::transfer_collection(StoreHandle& source, const std::string& name,
                                                         TransferSink& sink,
                                                         const BatchCursorReader& reader) {
    current_result_ = TransferResult{};
    current_result_.name = name;

    sink.begin_collection(name);

    if (!sink.consumes_batches()) {
        // One-shot sinks do their work in the finish step
        std::size_t written = sink.finish_collection(name);
        current_result_.total_docs = static_cast<std::int64_t>(written);
        current_result_.processed_docs = static_cast<std::int64_t>(written);
        emit(TransferEventType::PROGRESS, name, current_result_.processed_docs, current_result_.total_docs);
        return current_result_;
    }

    auto collection = source.collection(name);

    try {
        current_result_.total_docs = collection->count_documents();
    } catch (const TransferError&) {
        throw;
    } catch (const std::exception& e) {
        throw BatchReadError(name, std::string("cannot count documents: ") + e.what());
    }
    logger_.debug("Collection " + name + " holds " + std::to_string(current_result_.total_docs) +
                  " documents");

    BatchStream stream = reader.stream(*collection);
    while (auto batch = stream.next()) {
        sink.write(*batch, name);
        current_result_.processed_docs += static_cast<std::int64_t>(batch->size());
        current_result_.batches++;
        emit(TransferEventType::PROGRESS, name, current_result_.processed_docs, current_result_.total_docs);
    }

    sink.finish_collection(name);

    logger_.debug("Streamed " + std::to_string(current_result_.batches) + " batches from " + name);
    return current_result_;
}

void TransferOrchestrator::abort_job(TransferOutcome& outcome, const std::string& phase,
                                     const std::string& message) {
    state_ = JobState::ABORTED;
    outcome.final_state = JobState::ABORTED;
    outcome.error_message = message;
    outcome.failed_phase = phase;
    outcome.failed_collection = current_collection_;

    std::string context = "Copy failed during " + phase;
    if (!current_collection_.empty()) {
        context += " of collection '" + current_collection_ + "'";
    }
    logger_.error(context + ": " + message);

    emit(TransferEventType::ERROR, current_collection_, current_result_.processed_docs,
         current_result_.total_docs, message);
}

void TransferOrchestrator::emit(TransferEventType type, const std::string& collection,
                                std::int64_t processed, std::int64_t total,
                                const std::string& message) {
    TransferEvent event;
    event.type = type;
    event.collection = collection;
    event.processed = processed;
    event.total = total;
    event.message = message;
    progress_.on_event(event);
}

} // namespace mongocopy

/**
 * @file LiveInsertSink.cpp
 * @brief Implementation of the live destination sink
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "LiveInsertSink.hpp"
#include "TransferErrors.hpp"

namespace mongocopy {

LiveInsertSink::LiveInsertSink(StoreHandle& destination)
    : destination_(destination)
    , logger_("LiveInsertSink")
{
}

void LiveInsertSink::begin_collection(const std::string& collection) {
    current_ = destination_.collection(collection);
}

CollectionHandle& LiveInsertSink::target_for(const std::string& collection) {
    if (!current_ || current_->name() != collection) {
        current_ = destination_.collection(collection);
    }
    return *current_;
}

void LiveInsertSink::write(const Batch& batch, const std::string& collection) {
    if (batch.empty()) {
        return;
    }

    InsertOutcome outcome = target_for(collection).insert_many_unordered(batch);
    inserted_total_ += outcome.inserted;

    logger_.debug("Inserted " + std::to_string(outcome.inserted) + "/" +
                  std::to_string(batch.size()) + " documents into " + collection);

    if (!outcome.complete()) {
        throw InsertError(collection, outcome.inserted, outcome.failed,
                          outcome.first_error.empty() ? "store reported partial failure"
                                                      : outcome.first_error);
    }
}

std::size_t LiveInsertSink::finish_collection(const std::string& collection) {
    (void)collection;
    current_.reset();
    return 0;
}

} // namespace mongocopy

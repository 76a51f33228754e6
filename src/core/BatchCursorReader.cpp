/**
 * @file BatchCursorReader.cpp
 * @brief Implementation of batch pagination
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "BatchCursorReader.hpp"
#include "TransferErrors.hpp"
#include <algorithm>
#include <utility>

namespace mongocopy {

namespace {

// Upper bound for the up-front reservation of a batch vector
constexpr std::size_t MAX_BATCH_RESERVE = 4096;

} // namespace

BatchStream::BatchStream(std::unique_ptr<DocumentCursor> cursor, std::string collection,
                         std::size_t batch_size)
    : cursor_(std::move(cursor)),
      collection_(std::move(collection)),
      batch_size_(batch_size) {
}

std::optional<Batch> BatchStream::next() {
    if (exhausted_ || !cursor_) {
        return std::nullopt;
    }

    Batch batch;
    batch.reserve(std::min(batch_size_, MAX_BATCH_RESERVE));

    try {
        while (batch.size() < batch_size_ && cursor_->has_next()) {
            batch.push_back(cursor_->next());
        }
    } catch (const TransferError&) {
        throw;
    } catch (const std::exception& e) {
        throw BatchReadError(collection_, e.what());
    }

    // A short batch means the cursor ran dry; skip the extra round trip next time
    if (batch.size() < batch_size_) {
        exhausted_ = true;
        cursor_.reset();
    }

    if (batch.empty()) {
        return std::nullopt;
    }

    ++batches_read_;
    documents_read_ += batch.size();
    return batch;
}

BatchCursorReader::BatchCursorReader(std::size_t batch_size)
    : batch_size_(batch_size) {
    if (batch_size_ == 0) {
        throw ConfigurationError("batch size must be greater than zero");
    }
}

BatchStream BatchCursorReader::stream(CollectionHandle& collection) const {
    std::unique_ptr<DocumentCursor> cursor;
    try {
        cursor = collection.find_all();
    } catch (const TransferError&) {
        throw;
    } catch (const std::exception& e) {
        throw BatchReadError(collection.name(), std::string("cannot open cursor: ") + e.what());
    }

    return BatchStream(std::move(cursor), collection.name(), batch_size_);
}

} // namespace mongocopy

/**
 * @file BatchCursorReader.hpp
 * @brief Fixed-size batch pagination over a full-scan collection cursor
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "mongocopy.hpp"
#include "DocumentStore.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace mongocopy {

/**
 * @brief Lazy, finite, single-pass sequence of batches over one collection
 *
 * Each call to next() pulls up to batch_size documents from the cursor.
 * The last batch may be short; an empty collection yields no batch at all.
 * Once exhausted the stream stays exhausted; open a new stream to rescan.
 */
class BatchStream {
public:
    BatchStream(std::unique_ptr<DocumentCursor> cursor, std::string collection,
                std::size_t batch_size);

    BatchStream(BatchStream&&) noexcept = default;
    BatchStream& operator=(BatchStream&&) noexcept = default;
    BatchStream(const BatchStream&) = delete;
    BatchStream& operator=(const BatchStream&) = delete;

    /**
     * @brief Pull the next batch
     * @return The batch, or nullopt once the cursor is exhausted
     * @throws BatchReadError if the cursor fails while advancing
     */
    std::optional<Batch> next();

    bool exhausted() const { return exhausted_; }
    std::size_t batches_read() const { return batches_read_; }
    std::size_t documents_read() const { return documents_read_; }
    const std::string& collection() const { return collection_; }

private:
    std::unique_ptr<DocumentCursor> cursor_;
    std::string collection_;
    std::size_t batch_size_;
    bool exhausted_ = false;
    std::size_t batches_read_ = 0;
    std::size_t documents_read_ = 0;
};

/**
 * @brief Opens batch streams with a fixed page size
 */
class BatchCursorReader {
public:
    /**
     * @throws ConfigurationError if batch_size is 0
     */
    explicit BatchCursorReader(std::size_t batch_size);

    /**
     * @brief Open a fresh full-scan cursor and wrap it in a batch stream
     * @throws BatchReadError if the cursor cannot be opened
     */
    BatchStream stream(CollectionHandle& collection) const;

    std::size_t batch_size() const { return batch_size_; }

private:
    std::size_t batch_size_;
};

} // namespace mongocopy

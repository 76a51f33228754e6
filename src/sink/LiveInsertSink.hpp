/**
 * @file LiveInsertSink.hpp
 * @brief Sink that inserts batches into the destination store
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "TransferSink.hpp"
#include "../core/Logger.hpp"
#include <memory>
#include <string>

namespace mongocopy {

/**
 * @brief Unordered bulk insert into the same-named destination collection
 *
 * One document's failure does not stop the rest of its batch; any partial
 * failure is raised as InsertError with both counts once the batch is done.
 */
class LiveInsertSink : public TransferSink {
public:
    explicit LiveInsertSink(StoreHandle& destination);

    std::string name() const override { return "live"; }

    void begin_collection(const std::string& collection) override;
    void write(const Batch& batch, const std::string& collection) override;
    std::size_t finish_collection(const std::string& collection) override;

    std::size_t inserted_total() const { return inserted_total_; }

private:
    CollectionHandle& target_for(const std::string& collection);

    StoreHandle& destination_;
    std::unique_ptr<CollectionHandle> current_;
    std::size_t inserted_total_ = 0;
    Logger logger_;
};

} // namespace mongocopy

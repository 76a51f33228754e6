/**
 * @file DocumentStore.hpp
 * @brief Abstract document store interface consumed by the transfer engine
 *
 * The engine only needs a handful of capabilities from a store: list
 * collection names, open a collection, count its documents, scan it with a
 * has-next/next cursor and insert many documents unordered. Backends
 * (MongoDB, the in-memory test store) implement these seams.
 *
 * Error contract for implementations:
 * - StoreConnector::connect throws ConnectionError
 * - StoreHandle::list_collection_names throws EnumerationError
 * - count_documents, find_all and cursor methods throw BatchReadError
 * - insert_many_unordered reports per-document failures in InsertOutcome
 *   and throws InsertError only when the whole call failed
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "mongocopy.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mongocopy {

/**
 * @brief Result of an unordered bulk insert
 */
struct InsertOutcome {
    std::size_t inserted = 0;
    std::size_t failed = 0;
    std::string first_error;

    bool complete() const { return failed == 0; }
};

/**
 * @brief Single-pass full-scan cursor over one collection
 */
class DocumentCursor {
public:
    virtual ~DocumentCursor() = default;

    virtual bool has_next() = 0;

    /**
     * @brief Return the current document and advance
     *
     * Only valid after has_next() returned true.
     */
    virtual Document next() = 0;
};

/**
 * @brief Handle to one named collection
 */
class CollectionHandle {
public:
    virtual ~CollectionHandle() = default;

    virtual const std::string& name() const = 0;
    virtual std::int64_t count_documents() = 0;
    virtual std::unique_ptr<DocumentCursor> find_all() = 0;
    virtual InsertOutcome insert_many_unordered(const std::vector<Document>& documents) = 0;
};

/**
 * @brief Open connection to one database of a store
 *
 * Collection handles and cursors must not outlive the store handle that
 * produced them.
 */
class StoreHandle {
public:
    virtual ~StoreHandle() = default;

    virtual std::vector<std::string> list_collection_names() = 0;
    virtual std::unique_ptr<CollectionHandle> collection(const std::string& name) = 0;

    /**
     * @brief Release the connection; calling it on a closed handle is a no-op
     */
    virtual void close() = 0;
    virtual bool is_open() const = 0;

    /**
     * @brief Short human-readable endpoint description (credentials redacted)
     */
    virtual std::string describe() const = 0;
};

/**
 * @brief Factory for store handles
 */
class StoreConnector {
public:
    virtual ~StoreConnector() = default;

    /**
     * @brief Connect and verify the endpoint is reachable
     * @param uri Connection string
     * @param database Database name, empty to use the one named in the URI
     * @throws ConnectionError if the endpoint cannot be reached
     */
    virtual std::unique_ptr<StoreHandle> connect(const std::string& uri,
                                                 const std::string& database) = 0;
};

} // namespace mongocopy

/**
 * @file MongoStore.hpp
 * @brief MongoDB backend for the document store interface
 *
 * Documents cross the store seam as canonical Extended JSON with their field
 * order kept, so ObjectIds, dates, Int64 and other BSON types are written
 * back exactly as they were read.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "DocumentStore.hpp"
#include "../core/Logger.hpp"
#include <memory>
#include <string>

namespace mongocopy {

/**
 * @brief Connects to MongoDB deployments through mongocxx
 *
 * The driver instance is created on first use and shared by every client
 * in the process.
 */
class MongoStoreConnector : public StoreConnector {
public:
    MongoStoreConnector();

    /**
     * @brief Open a client and run "ping" against the database
     * @param uri MongoDB connection string
     * @param database Database name, empty to use the one named in the URI
     * @throws ConnectionError if the URI is invalid, no database is named
     *         or the deployment does not answer
     */
    std::unique_ptr<StoreHandle> connect(const std::string& uri,
                                         const std::string& database) override;

private:
    Logger logger_;
};

} // namespace mongocopy

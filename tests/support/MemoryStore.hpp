/**
 * @file MemoryStore.hpp
 * @brief In-memory document store with call counting and failure injection
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "DocumentStore.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace mongocopy::test {

/**
 * @brief Contents and counters of one in-memory database
 *
 * Shared between the connector and every handle opened on it so tests can
 * inspect what a run did after the handles are gone.
 */
struct MemoryDatabase {
    // Collection names in creation order
    std::vector<std::string> order;
    std::map<std::string, std::vector<Document>> collections;

    // Counters
    int close_calls = 0;
    int list_calls = 0;
    int find_calls = 0;
    std::map<std::string, std::vector<std::size_t>> insert_batches;

    // Failure injection
    bool fail_list = false;
    bool fail_close = false;
    std::set<std::string> fail_count;
    std::set<std::string> fail_insert;
    std::map<std::string, std::size_t> fail_read_after;

    void add_collection(const std::string& name, std::vector<Document> documents = {});
    const std::vector<Document>& documents(const std::string& name) const;
    bool has_collection(const std::string& name) const;
    std::size_t insert_calls() const;
};

/**
 * @brief Connector resolving URIs to registered in-memory databases
 *
 * Unknown URIs fail with ConnectionError, like an unreachable server.
 */
class MemoryStoreConnector : public StoreConnector {
public:
    std::shared_ptr<MemoryDatabase> add_endpoint(const std::string& uri);

    std::unique_ptr<StoreHandle> connect(const std::string& uri,
                                         const std::string& database) override;

    int connect_calls() const { return connect_calls_; }

private:
    std::map<std::string, std::shared_ptr<MemoryDatabase>> endpoints_;
    int connect_calls_ = 0;
};

/**
 * @brief Documents {"_id": first_id + i, "name": prefix + i} for i in [0, count)
 */
std::vector<Document> make_documents(std::size_t count, const std::string& prefix = "doc",
                                     int first_id = 1);

} // namespace mongocopy::test

/**
 * @file MongoStore.cpp
 * @brief MongoDB backend implementation using mongocxx
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "MongoStore.hpp"
#include "TransferErrors.hpp"
#include "../core/ConnectionManager.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/cursor.hpp>
#include <mongocxx/exception/bulk_write_exception.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/options/insert.hpp>
#include <mongocxx/uri.hpp>

#include <algorithm>
#include <utility>
#include <vector>

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

namespace mongocopy {

namespace {

Document to_document(bsoncxx::document::view view) {
    // Canonical mode keeps Int64, Decimal128 and Double distinct on the way back
    return Document::parse(bsoncxx::to_json(view, bsoncxx::ExtendedJsonMode::k_canonical));
}

bsoncxx::document::value to_bson(const Document& document) {
    return bsoncxx::from_json(document.dump());
}

template <typename StringView>
std::string to_std_string(const StringView& view) {
    return std::string(view.data(), view.size());
}

/**
 * @brief Read nInserted and writeErrors from a bulk write server reply
 */
void read_bulk_reply(bsoncxx::document::view reply, InsertOutcome& outcome) {
    auto inserted = reply["nInserted"];
    if (inserted) {
        if (inserted.type() == bsoncxx::type::k_int32) {
            outcome.inserted = static_cast<std::size_t>(inserted.get_int32().value);
        } else if (inserted.type() == bsoncxx::type::k_int64) {
            outcome.inserted = static_cast<std::size_t>(inserted.get_int64().value);
        }
    }

    auto errors = reply["writeErrors"];
    if (errors && errors.type() == bsoncxx::type::k_array) {
        for (auto&& error : errors.get_array().value) {
            outcome.failed++;
            if (outcome.first_error.empty()) {
                auto message = error["errmsg"];
                if (message && message.type() == bsoncxx::type::k_string) {
                    outcome.first_error = to_std_string(message.get_string().value);
                }
            }
        }
    }
}

// ============================================================================
// Cursor
// ============================================================================

class MongoDocumentCursor : public DocumentCursor {
public:
    MongoDocumentCursor(mongocxx::cursor cursor, std::string collection)
        : cursor_(std::move(cursor))
        , it_(cursor_.begin())
        , collection_(std::move(collection))
    {
    }

    bool has_next() override {
        try {
            return it_ != cursor_.end();
        } catch (const mongocxx::exception& e) {
            throw BatchReadError(collection_, e.what());
        }
    }

    Document next() override {
        try {
            Document document = to_document(*it_);
            ++it_;
            return document;
        } catch (const mongocxx::exception& e) {
            throw BatchReadError(collection_, e.what());
        } catch (const nlohmann::json::exception& e) {
            throw BatchReadError(collection_, std::string("cannot convert document: ") + e.what());
        }
    }

private:
    // Declaration order matters: the iterator refers to the cursor
    mongocxx::cursor cursor_;
    mongocxx::cursor::iterator it_;
    std::string collection_;
};

// ============================================================================
// Collection
// ============================================================================

class MongoCollectionHandle : public CollectionHandle {
public:
    explicit MongoCollectionHandle(mongocxx::collection collection)
        : collection_(std::move(collection))
        , name_(to_std_string(collection_.name()))
    {
    }

    const std::string& name() const override { return name_; }

    std::int64_t count_documents() override {
        try {
            return collection_.count_documents(make_document());
        } catch (const mongocxx::exception& e) {
            throw BatchReadError(name_, std::string("cannot count documents: ") + e.what());
        }
    }

    std::unique_ptr<DocumentCursor> find_all() override {
        try {
            return std::make_unique<MongoDocumentCursor>(collection_.find(make_document()), name_);
        } catch (const mongocxx::exception& e) {
            throw BatchReadError(name_, std::string("cannot open cursor: ") + e.what());
        }
    }

    InsertOutcome insert_many_unordered(const std::vector<Document>& documents) override {
        InsertOutcome outcome;
        if (documents.empty()) {
            return outcome;
        }

        std::vector<bsoncxx::document::value> values;
        values.reserve(documents.size());
        try {
            for (const auto& document : documents) {
                values.push_back(to_bson(document));
            }
        } catch (const bsoncxx::exception& e) {
            throw InsertError(name_, 0, documents.size(),
                              std::string("document is not valid Extended JSON: ") + e.what());
        }

        mongocxx::options::insert options;
        options.ordered(false);

        try {
            auto result = collection_.insert_many(values, options);
            outcome.inserted = result ? static_cast<std::size_t>(result->inserted_count())
                                      : documents.size();
        } catch (const mongocxx::bulk_write_exception& e) {
            if (e.raw_server_error()) {
                read_bulk_reply(e.raw_server_error()->view(), outcome);
            }
            if (outcome.first_error.empty()) {
                outcome.first_error = e.what();
            }
            if (outcome.failed == 0) {
                outcome.failed = documents.size() - std::min(outcome.inserted, documents.size());
            }
        } catch (const mongocxx::exception& e) {
            throw InsertError(name_, 0, documents.size(), e.what());
        }

        return outcome;
    }

private:
    mongocxx::collection collection_;
    std::string name_;
};

// ============================================================================
// Store handle
// ============================================================================

class MongoStoreHandle : public StoreHandle {
public:
    MongoStoreHandle(std::unique_ptr<mongocxx::client> client, std::string database, std::string endpoint)
        : client_(std::move(client))
        , database_name_(std::move(database))
        , endpoint_(std::move(endpoint))
    {
    }

    std::vector<std::string> list_collection_names() override {
        ensure_open();
        try {
            return (*client_)[database_name_].list_collection_names();
        } catch (const mongocxx::exception& e) {
            throw EnumerationError(e.what());
        }
    }

    std::unique_ptr<CollectionHandle> collection(const std::string& name) override {
        ensure_open();
        return std::make_unique<MongoCollectionHandle>((*client_)[database_name_][name]);
    }

    void close() override {
        client_.reset();
    }

    bool is_open() const override { return client_ != nullptr; }

    std::string describe() const override {
        return endpoint_ + " (database " + database_name_ + ")";
    }

private:
    void ensure_open() const {
        if (!client_) {
            throw TransferError(TransferPhase::STREAMING, "", "store handle is closed: " + endpoint_);
        }
    }

    std::unique_ptr<mongocxx::client> client_;
    std::string database_name_;
    std::string endpoint_;
};

} // namespace

// ============================================================================
// Connector
// ============================================================================

MongoStoreConnector::MongoStoreConnector()
    : logger_("MongoStore")
{
    mongocxx::instance::current();
}

std::unique_ptr<StoreHandle> MongoStoreConnector::connect(const std::string& uri,
                                                          const std::string& database) {
    const std::string endpoint = redact_uri(uri);
    if (uri.empty()) {
        throw ConnectionError(endpoint, "no connection string given");
    }

    try {
        mongocxx::uri parsed{uri};

        std::string database_name = database.empty() ? parsed.database() : database;
        if (database_name.empty()) {
            throw ConnectionError(endpoint, "no database name given and none in the connection string");
        }

        auto client = std::make_unique<mongocxx::client>(parsed);

        logger_.debug("Pinging " + endpoint);
        (*client)[database_name].run_command(make_document(kvp("ping", 1)));
        logger_.detailed("Connected to " + endpoint);

        return std::make_unique<MongoStoreHandle>(std::move(client), database_name, endpoint);

    } catch (const mongocxx::exception& e) {
        throw ConnectionError(endpoint, e.what());
    }
}

} // namespace mongocopy

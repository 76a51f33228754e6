/**
 * @file JsonImportSink.cpp
 * @brief Implementation of JSON file import
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "JsonImportSink.hpp"
#include "TransferErrors.hpp"
#include <fstream>
#include <system_error>

namespace mongocopy {

JsonImportSink::JsonImportSink(StoreHandle& destination, const std::filesystem::path& output_dir)
    : destination_(destination)
    , output_dir_(output_dir)
    , logger_("JsonImportSink")
{
}

void JsonImportSink::write(const Batch& batch, const std::string& collection) {
    logger_.trace("Ignoring " + std::to_string(batch.size()) + " source documents of " + collection);
}

Batch JsonImportSink::read_file(const std::filesystem::path& path, const std::string& collection) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw FileIOError(collection, path.string(), "cannot open file for reading");
    }

    Document content;
    try {
        file >> content;
    } catch (const nlohmann::json::parse_error& e) {
        throw FileIOError(collection, path.string(), std::string("invalid JSON: ") + e.what());
    }

    if (!content.is_array()) {
        throw FileIOError(collection, path.string(),
                          std::string("expected a JSON array of documents, found ") + content.type_name());
    }

    Batch documents;
    documents.reserve(content.size());
    for (auto& element : content) {
        if (!element.is_object()) {
            throw FileIOError(collection, path.string(),
                              std::string("array element is not a document: ") + element.type_name());
        }
        documents.push_back(std::move(element));
    }
    return documents;
}

std::size_t JsonImportSink::finish_collection(const std::string& collection) {
    const auto path = collection_file_path(output_dir_, collection);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        missing_files_++;
        logger_.warning("File not found: " + path.string());
        return 0;
    }

    Batch documents = read_file(path, collection);
    if (documents.empty()) {
        logger_.info("Nothing to import for " + collection + " (" + path.string() + " is empty)");
        return 0;
    }

    auto target = destination_.collection(collection);
    InsertOutcome outcome = target->insert_many_unordered(documents);
    if (!outcome.complete()) {
        throw InsertError(collection, outcome.inserted, outcome.failed,
                          outcome.first_error.empty() ? "store reported partial failure"
                                                      : outcome.first_error);
    }

    logger_.success("Imported " + std::to_string(outcome.inserted) + " docs into " + collection);
    return outcome.inserted;
}

} // namespace mongocopy

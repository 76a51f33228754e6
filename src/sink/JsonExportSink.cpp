/**
 * @file JsonExportSink.cpp
 * @brief Implementation of streaming JSON array export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "JsonExportSink.hpp"
#include "TransferErrors.hpp"
#include <system_error>

namespace mongocopy {

JsonExportSink::JsonExportSink(const std::filesystem::path& output_dir)
    : JsonExportSink(output_dir, Options()) {
}

JsonExportSink::JsonExportSink(const std::filesystem::path& output_dir, const Options& options)
    : output_dir_(output_dir)
    , options_(options)
    , logger_("JsonExportSink")
{
}

void JsonExportSink::begin_collection(const std::string& collection) {
    if (file_.is_open()) {
        // Previous collection never finished; leave its array unterminated
        logger_.warning("Export of " + current_collection_ + " was not finished: " +
                        current_path_.string());
        file_.close();
    }
    current_collection_ = collection;
    current_path_ = collection_file_path(output_dir_, collection);
    first_document_ = true;
}

void JsonExportSink::open_file(const std::string& collection) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        throw FileIOError(collection, output_dir_.string(),
                          "cannot create output directory: " + ec.message());
    }

    current_collection_ = collection;
    current_path_ = collection_file_path(output_dir_, collection);
    file_.open(current_path_, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        throw FileIOError(collection, current_path_.string(), "cannot open file for writing");
    }

    logger_.detailed("Writing " + current_path_.string());
    file_ << "[";
    first_document_ = true;
}

std::string JsonExportSink::serialize(const Document& document, const std::string& collection) const {
    std::string text;
    try {
        text = document.dump(options_.indent);
    } catch (const nlohmann::json::exception& e) {
        throw FileIOError(collection, current_path_.string(),
                          std::string("cannot serialize document: ") + e.what());
    }

    if (options_.indent <= 0) {
        return text;
    }

    // Nest the document one level inside the array
    const std::string pad(static_cast<std::size_t>(options_.indent), ' ');
    std::string nested = pad;
    nested.reserve(text.size() + text.size() / 8);
    for (char c : text) {
        nested += c;
        if (c == '\n') {
            nested += pad;
        }
    }
    return nested;
}

void JsonExportSink::write(const Batch& batch, const std::string& collection) {
    if (batch.empty()) {
        return;
    }

    if (!file_.is_open() || collection != current_collection_) {
        if (file_.is_open()) {
            begin_collection(collection);
        }
        open_file(collection);
    }

    for (const auto& document : batch) {
        if (!first_document_) {
            file_ << ",";
        }
        file_ << "\n" << serialize(document, collection);
        first_document_ = false;
    }

    check_stream(collection, "write");
    documents_written_ += batch.size();
    logger_.debug("Appended " + std::to_string(batch.size()) + " documents to " +
                  current_path_.string());
}

std::size_t JsonExportSink::finish_collection(const std::string& collection) {
    if (!file_.is_open()) {
        // An empty array replaces whatever an earlier export left behind
        logger_.detailed("No documents exported for " + collection);
        open_file(collection);
    }

    file_ << (first_document_ ? "]\n" : "\n]\n");
    check_stream(collection, "finish");
    file_.close();

    logger_.info("Exported " + collection + " to " + current_path_.string());
    return 0;
}

void JsonExportSink::check_stream(const std::string& collection, const std::string& action) const {
    if (!file_.good()) {
        throw FileIOError(collection, current_path_.string(), "failed to " + action + " export file");
    }
}

} // namespace mongocopy

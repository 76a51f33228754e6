/**
 * @file JsonExportSink.hpp
 * @brief Sink that writes each collection to {output_dir}/{collection}.json
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "TransferSink.hpp"
#include "../core/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <string>

namespace mongocopy {

/**
 * @brief Streams a collection into one JSON array file across batches
 *
 * The file is opened (truncated) when the first batch of a collection
 * arrives and receives "[" followed by the documents of each batch,
 * comma-separated, as they arrive. finish_collection() writes the closing
 * "]". Nothing already in the file is read back. A collection without
 * batches is written as "[]". An aborted collection leaves an unterminated
 * array behind, which a later import rejects.
 */
class JsonExportSink : public TransferSink {
public:
    struct Options {
        int indent;  // Pretty-print indent, negative for compact output

        Options() : indent(2) {}
    };

    explicit JsonExportSink(const std::filesystem::path& output_dir);
    JsonExportSink(const std::filesystem::path& output_dir, const Options& options);

    std::string name() const override { return "export-json"; }

    void begin_collection(const std::string& collection) override;
    void write(const Batch& batch, const std::string& collection) override;
    std::size_t finish_collection(const std::string& collection) override;

    std::size_t documents_written() const { return documents_written_; }

private:
    void open_file(const std::string& collection);
    std::string serialize(const Document& document, const std::string& collection) const;
    void check_stream(const std::string& collection, const std::string& action) const;

    std::filesystem::path output_dir_;
    Options options_;
    std::ofstream file_;
    std::filesystem::path current_path_;
    std::string current_collection_;
    bool first_document_ = true;
    std::size_t documents_written_ = 0;
    Logger logger_;
};

} // namespace mongocopy

/**
 * @file JsonImportSink.hpp
 * @brief Sink that loads {output_dir}/{collection}.json into the destination store
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "TransferSink.hpp"
#include "../core/Logger.hpp"
#include <filesystem>
#include <string>

namespace mongocopy {

/**
 * @brief One-shot per-collection import from a JSON array file
 *
 * The file, not the source cursor, is the import source, so this sink does
 * not consume source batches: the whole file is read and inserted
 * (unordered) once, in finish_collection(). A missing file is reported as a
 * warning and imports nothing.
 */
class JsonImportSink : public TransferSink {
public:
    JsonImportSink(StoreHandle& destination, const std::filesystem::path& output_dir);

    std::string name() const override { return "import-json"; }

    bool consumes_batches() const override { return false; }

    /**
     * @brief Source batches are ignored
     */
    void write(const Batch& batch, const std::string& collection) override;

    /**
     * @brief Import the collection file
     * @return Number of documents inserted
     * @throws FileIOError if the file cannot be read or is not a JSON array
     * @throws InsertError if any document fails to insert
     */
    std::size_t finish_collection(const std::string& collection) override;

    std::size_t missing_files() const { return missing_files_; }

private:
    Batch read_file(const std::filesystem::path& path, const std::string& collection) const;

    StoreHandle& destination_;
    std::filesystem::path output_dir_;
    std::size_t missing_files_ = 0;
    Logger logger_;
};

} // namespace mongocopy

/**
 * @file SinkFactory.cpp
 * @brief Sink selection by transfer mode
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "TransferSink.hpp"
#include "LiveInsertSink.hpp"
#include "JsonExportSink.hpp"
#include "JsonImportSink.hpp"
#include "TransferErrors.hpp"

namespace mongocopy {

std::filesystem::path collection_file_path(const std::filesystem::path& output_dir,
                                           const std::string& collection) {
    return output_dir / (collection + JSON_FILE_EXTENSION);
}

std::unique_ptr<TransferSink> make_sink(TransferMode mode,
                                        const std::filesystem::path& output_dir,
                                        StoreHandle* destination) {
    switch (mode) {
        case TransferMode::EXPORT_JSON:
            return std::make_unique<JsonExportSink>(output_dir);

        case TransferMode::LIVE:
            if (!destination) {
                throw ConfigurationError("live copy requires a destination store");
            }
            return std::make_unique<LiveInsertSink>(*destination);

        case TransferMode::IMPORT_JSON:
            if (!destination) {
                throw ConfigurationError("JSON import requires a destination store");
            }
            return std::make_unique<JsonImportSink>(*destination, output_dir);
    }

    throw ConfigurationError("unknown transfer mode");
}

} // namespace mongocopy

/**
 * @file TransferSink.hpp
 * @brief Write-target strategy interface and factory
 *
 * A sink is selected once per job from the transfer mode. The orchestrator
 * calls begin_collection(), then write() for every source batch (only when
 * consumes_batches() is true), then finish_collection().
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "mongocopy.hpp"
#include "DocumentStore.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace mongocopy {

class TransferSink {
public:
    virtual ~TransferSink() = default;

    /**
     * @brief Short name used in log messages
     */
    virtual std::string name() const = 0;

    /**
     * @brief Whether the sink wants the source collection streamed into write()
     */
    virtual bool consumes_batches() const { return true; }

    virtual void begin_collection(const std::string& collection) { (void)collection; }

    /**
     * @brief Write one batch of a collection
     * @throws InsertError or FileIOError on failure
     */
    virtual void write(const Batch& batch, const std::string& collection) = 0;

    /**
     * @brief Complete a collection
     * @return Documents written by the finish step itself (import), 0 otherwise
     */
    virtual std::size_t finish_collection(const std::string& collection) {
        (void)collection;
        return 0;
    }
};

/**
 * @brief Path of the JSON file holding one collection
 */
std::filesystem::path collection_file_path(const std::filesystem::path& output_dir,
                                           const std::string& collection);

/**
 * @brief Create the sink for a transfer mode
 * @param mode Job mode
 * @param output_dir Directory for JSON files
 * @param destination Destination store; required for LIVE and IMPORT_JSON
 * @throws ConfigurationError if the mode needs a destination and none is given
 */
std::unique_ptr<TransferSink> make_sink(TransferMode mode,
                                        const std::filesystem::path& output_dir,
                                        StoreHandle* destination);

} // namespace mongocopy

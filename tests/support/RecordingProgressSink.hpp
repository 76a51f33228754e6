/**
 * @file RecordingProgressSink.hpp
 * @brief Progress sink that keeps every event for inspection
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "mongocopy.hpp"
#include <cstddef>
#include <vector>

namespace mongocopy::test {

class RecordingProgressSink : public ProgressSink {
public:
    void on_event(const TransferEvent& event) override { events.push_back(event); }

    std::size_t count(TransferEventType type) const {
        std::size_t n = 0;
        for (const auto& event : events) {
            if (event.type == type) n++;
        }
        return n;
    }

    std::vector<TransferEvent> of_type(TransferEventType type) const {
        std::vector<TransferEvent> matching;
        for (const auto& event : events) {
            if (event.type == type) matching.push_back(event);
        }
        return matching;
    }

    std::vector<TransferEvent> events;
};

} // namespace mongocopy::test

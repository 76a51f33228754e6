/**
 * @file CollectionEnumerator.cpp
 * @brief Implementation of collection plan resolution
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "CollectionEnumerator.hpp"
#include "TransferErrors.hpp"
#include <unordered_set>
#include <utility>

namespace mongocopy {

CollectionPlan CollectionEnumerator::resolve(StoreHandle& source,
                                             const std::vector<std::string>& requested) const {
    std::vector<std::string> actual;
    try {
        actual = source.list_collection_names();
    } catch (const TransferError&) {
        throw;
    } catch (const std::exception& e) {
        throw EnumerationError(e.what());
    }

    CollectionPlan plan;
    if (requested.empty()) {
        plan.names = std::move(actual);
        return plan;
    }

    const std::unordered_set<std::string> available(actual.begin(), actual.end());
    std::unordered_set<std::string> seen;

    for (const auto& name : requested) {
        if (!seen.insert(name).second) {
            continue;
        }
        if (available.count(name) > 0) {
            plan.names.push_back(name);
        } else {
            plan.missing.push_back(name);
        }
    }

    return plan;
}

} // namespace mongocopy

/**
 * @file CollectionEnumerator.hpp
 * @brief Resolves the effective set of collections to transfer
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "mongocopy.hpp"
#include "DocumentStore.hpp"
#include <string>
#include <vector>

namespace mongocopy {

class CollectionEnumerator {
public:
    CollectionEnumerator() = default;

    /**
     * @brief Build the collection plan for a job
     *
     * Empty request: every collection in the store, in store order.
     * Otherwise the requested names that exist, in requested order, each
     * once; the rest are listed in CollectionPlan::missing.
     *
     * @throws EnumerationError if the store cannot list its collections
     */
    CollectionPlan resolve(StoreHandle& source, const std::vector<std::string>& requested) const;
};

} // namespace mongocopy

/**
 * @file ConnectionManager.cpp
 * @brief Implementation of the store connection lifecycle
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ConnectionManager.hpp"
#include "TransferErrors.hpp"

namespace mongocopy {

std::string redact_uri(const std::string& uri) {
    const auto scheme_end = uri.find("://");
    const auto authority_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    const auto host_start = uri.find('/', authority_start);
    const auto at_pos = uri.rfind('@', host_start == std::string::npos ? std::string::npos : host_start);

    if (at_pos == std::string::npos || at_pos < authority_start) {
        return uri;
    }
    return uri.substr(0, authority_start) + "***" + uri.substr(at_pos);
}

ConnectionManager::ConnectionManager(StoreConnector& connector)
    : connector_(connector)
    , logger_("ConnectionManager")
{
}

StoreSession ConnectionManager::open(const ConnectionSettings& settings, TransferMode mode) {
    StoreSession session;

    logger_.detailed("Connecting to source store");
    session.source = connector_.connect(settings.source_uri, settings.database_name);
    logger_.debug("Source connected: " + session.source->describe());

    if (mode == TransferMode::EXPORT_JSON) {
        logger_.detailed("Export mode - destination store not required");
        return session;
    }

    try {
        logger_.detailed("Connecting to destination store");
        session.destination = connector_.connect(settings.target_uri, settings.database_name);
        logger_.debug("Destination connected: " + session.destination->describe());
    } catch (const std::exception&) {
        close_all(session);
        throw;
    }

    return session;
}

void ConnectionManager::close_all(StoreSession& session) noexcept {
    close_handle(session.source, "source");
    close_handle(session.destination, "destination");
}

void ConnectionManager::close_handle(std::unique_ptr<StoreHandle>& handle, const char* role) noexcept {
    if (!handle) {
        return;
    }

    try {
        if (handle->is_open()) {
            handle->close();
            logger_.detailed(std::string("Closed ") + role + " connection");
        }
    } catch (const std::exception& e) {
        logger_.warning(std::string("Failed to close ") + role + " connection: " + e.what());
    }

    handle.reset();
}

} // namespace mongocopy

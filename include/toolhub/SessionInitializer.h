//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionInitializer.h
// Purpose: initialize -> tools/list handshake that makes a connection ready
//==========================================================================================================

#pragma once

#include <memory>

#include "toolhub/Config.h"
#include "toolhub/Connection.h"
#include "toolhub/ConnectionRegistry.h"

namespace toolhub {

//==========================================================================================================
// SessionInitializer
// Purpose: Runs the handshake through the connection's correlator:
//   1. initialize {protocolVersion, capabilities, clientInfo}; result only checked for absence of error
//   2. notifications/initialized
//   3. tools/list; the catalog replaces the registry entry's catalog
//   4. mark the entry ready
// Notes:
//   - Any failure abandons the handshake: the connection stays not ready and the reason is recorded.
//   - No retry; callers may call Run() again (re-initialization), which first clears readiness.
//==========================================================================================================
class SessionInitializer {
public:
    SessionInitializer(ConnectionRegistry& registry, const HubConfig& config);

    // Returns true when the connection became ready.
    bool Run(const std::shared_ptr<Connection>& connection);

    JSONValue InitializeParams() const;

    //==========================================================================================================
    // ParseToolCatalog
    // Purpose: Converts a tools/list result ({tools:[{name, description, inputSchema?}]}) to a catalog.
    //          Entries without a name are skipped; duplicate names keep the first entry.
    // Throws:
    //   errors::HubError(ToolProtocolError) when the result has no tools array.
    //==========================================================================================================
    static ToolCatalog ParseToolCatalog(const JSONValue& listResult);

private:
    ConnectionRegistry& registry;
    const HubConfig& config;
};

} // namespace toolhub

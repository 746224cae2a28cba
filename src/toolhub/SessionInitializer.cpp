//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionInitializer.cpp
// Purpose: Handshake implementation and tools/list parsing
//==========================================================================================================

#include <unordered_set>

#include "logging/Logger.h"
#include "toolhub/SessionInitializer.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {

using errors::ErrorCategory;
using errors::HubError;

SessionInitializer::SessionInitializer(ConnectionRegistry& reg, const HubConfig& cfg)
    : registry(reg), config(cfg) {}

JSONValue SessionInitializer::InitializeParams() const {
    const Implementation info = config.clientInfo();
    return MakeObject({
        {"protocolVersion", JSONValue(config.protocolVersion)},
        {"capabilities", MakeObject({{"tools", JSONValue(JSONValue::Object{})}})},
        {"clientInfo", MakeObject({{"name", JSONValue(info.name)}, {"version", JSONValue(info.version)}})},
    });
}

ToolCatalog SessionInitializer::ParseToolCatalog(const JSONValue& listResult) {
    const JSONValue* tools = listResult.find("tools");
    if (!tools || !tools->isArray()) {
        throw HubError(ErrorCategory::ToolProtocolError, "tools/list result has no tools array");
    }
    ToolCatalog catalog;
    std::unordered_set<std::string> seen;
    for (const auto& item : std::get<JSONValue::Array>(tools->value)) {
        if (!item || !item->isObject()) {
            continue;
        }
        std::string name = item->getString("name");
        if (name.empty()) {
            LOG_WARN("tools/list entry without a name skipped");
            continue;
        }
        if (!seen.insert(name).second) {
            LOG_WARN("Duplicate tool '{}' in tools/list; keeping the first entry", name);
            continue;
        }
        std::optional<JSONValue> schema;
        if (const JSONValue* s = item->find("inputSchema")) {
            schema = *s;
        }
        catalog.emplace_back(std::move(name), item->getString("description"), std::move(schema));
    }
    return catalog;
}

bool SessionInitializer::Run(const std::shared_ptr<Connection>& connection) {
    FUNC_SCOPE();
    const std::string identity = connection->Identity();
    connection->SetReady(false);
    try {
        RequestCorrelator& rpc = connection->Correlator();
        (void)rpc.Send(Methods::Initialize, InitializeParams());
        LOG_INFO("Initialized session with {}", identity);

        try {
            rpc.Notify(Methods::Initialized);
        } catch (const HubError& e) {
            LOG_WARN("Could not send {} to {}: {}", Methods::Initialized, identity, e.what());
        }

        ToolCatalog catalog = ParseToolCatalog(rpc.Send(Methods::ListTools));
        std::string names;
        for (const auto& t : catalog) {
            if (!names.empty()) names += ", ";
            names += t.name;
        }
        const std::size_t count = catalog.size();
        if (!registry.SetToolCatalog(identity, std::move(catalog), connection.get()) ||
            !registry.MarkReady(identity, connection.get())) {
            LOG_WARN("Connection {} was replaced or removed during the handshake", identity);
            connection->SetLastError(std::string("connection superseded during handshake"));
            return false;
        }
        connection->SetLastError(std::nullopt);
        LOG_INFO("Connection {} ready with {} tool(s): [{}]", identity, count, names);
        return true;
    } catch (const HubError& e) {
        LOG_ERROR("Handshake with {} failed ({}): {}", identity, errors::categoryName(e.category()), e.what());
        connection->SetLastError(std::string(e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("Handshake with {} failed: {}", identity, e.what());
        connection->SetLastError(std::string(e.what()));
    }
    return false;
}

} // namespace toolhub

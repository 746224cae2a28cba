//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionRegistry.cpp
// Purpose: Connection registry implementation
//==========================================================================================================

#include "logging/Logger.h"
#include "toolhub/ConnectionRegistry.h"

namespace toolhub {

ConnectionRegistry::Registration ConnectionRegistry::Register(const std::string& identity,
                                                               std::unique_ptr<ITransport> transport,
                                                               std::chrono::milliseconds requestTimeout) {
    FUNC_SCOPE();
    Registration reg;
    reg.connection = std::make_shared<Connection>(identity, std::move(transport), requestTimeout);
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = connections.find(identity);
        if (it != connections.end()) {
            reg.displaced = std::move(it->second);
            it->second = reg.connection;
        } else {
            connections.emplace(identity, reg.connection);
        }
    }
    if (reg.displaced) {
        LOG_WARN("Connection {} re-registered; previous connection displaced", identity);
    } else {
        LOG_INFO("Connection {} registered", identity);
    }
    return reg;
}

std::shared_ptr<Connection> ConnectionRegistry::findLocked(const std::string& identity, const Connection* expected) const {
    auto it = connections.find(identity);
    if (it == connections.end()) {
        return nullptr;
    }
    if (expected && it->second.get() != expected) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<Connection> ConnectionRegistry::Lookup(const std::string& identity) const {
    std::lock_guard<std::mutex> lock(mutex);
    return findLocked(identity, nullptr);
}

std::shared_ptr<Connection> ConnectionRegistry::Unregister(const std::string& identity, const Connection* expected) {
    FUNC_SCOPE();
    std::shared_ptr<Connection> removed;
    {
        std::lock_guard<std::mutex> lock(mutex);
        removed = findLocked(identity, expected);
        if (removed) {
            connections.erase(identity);
        }
    }
    if (removed) {
        LOG_INFO("Connection {} unregistered", identity);
    }
    return removed;
}

bool ConnectionRegistry::SetToolCatalog(const std::string& identity, ToolCatalog catalog, const Connection* expected) {
    std::lock_guard<std::mutex> lock(mutex);
    auto conn = findLocked(identity, expected);
    if (!conn) {
        return false;
    }
    conn->ReplaceCatalog(std::move(catalog));
    return true;
}

bool ConnectionRegistry::MarkReady(const std::string& identity, const Connection* expected) {
    std::lock_guard<std::mutex> lock(mutex);
    auto conn = findLocked(identity, expected);
    if (!conn) {
        return false;
    }
    conn->SetReady(true);
    return true;
}

std::map<std::string, ConnectionStatus> ConnectionRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::map<std::string, ConnectionStatus> out;
    for (const auto& [identity, conn] : connections) {
        out.emplace(identity, conn->Status());
    }
    return out;
}

std::size_t ConnectionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return connections.size();
}

std::vector<std::shared_ptr<Connection>> ConnectionRegistry::Clear() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::shared_ptr<Connection>> out;
    out.reserve(connections.size());
    for (auto& [identity, conn] : connections) {
        out.push_back(std::move(conn));
    }
    connections.clear();
    return out;
}

} // namespace toolhub

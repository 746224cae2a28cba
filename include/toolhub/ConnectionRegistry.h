//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionRegistry.h
// Purpose: Identity-keyed set of live provider connections
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolhub/Connection.h"

namespace toolhub {

//==========================================================================================================
// ConnectionRegistry
// Purpose: In-memory mapping identity -> Connection. Performs no I/O: a displaced or removed connection is
//          handed back to the caller, which decides when to close it.
// Notes:
//   - The optional `expected` argument restricts a mutation to the entry that currently holds that exact
//     connection, so work started for a superseded connection cannot touch its replacement.
//==========================================================================================================
class ConnectionRegistry {
public:
    struct Registration {
        std::shared_ptr<Connection> connection;
        std::shared_ptr<Connection> displaced;  // previous entry for the same identity, if any
    };

    //==========================================================================================================
    // Register
    // Purpose: Creates a fresh, not-ready connection for identity, overwriting any prior entry.
    //==========================================================================================================
    Registration Register(const std::string& identity, std::unique_ptr<ITransport> transport,
                          std::chrono::milliseconds requestTimeout);

    // Returns nullptr when the identity is unknown.
    std::shared_ptr<Connection> Lookup(const std::string& identity) const;

    // Removes the entry; no-op when absent (or when it no longer holds `expected`). Returns the removed entry.
    std::shared_ptr<Connection> Unregister(const std::string& identity, const Connection* expected = nullptr);

    // Replace the catalog / mark ready on an existing entry. Return false (and create nothing) otherwise.
    bool SetToolCatalog(const std::string& identity, ToolCatalog catalog, const Connection* expected = nullptr);
    bool MarkReady(const std::string& identity, const Connection* expected = nullptr);

    // Status of every entry ordered by identity.
    std::map<std::string, ConnectionStatus> Snapshot() const;

    std::size_t Size() const;

    // Removes every entry and returns them.
    std::vector<std::shared_ptr<Connection>> Clear();

private:
    // Caller holds mutex.
    std::shared_ptr<Connection> findLocked(const std::string& identity, const Connection* expected) const;

    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections;
};

} // namespace toolhub

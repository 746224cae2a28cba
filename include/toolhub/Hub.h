//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Hub.h
// Purpose: Top-level composition of registry, dispatchers, handshake and chat loop
//==========================================================================================================

#pragma once

#include <future>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "toolhub/Config.h"
#include "toolhub/DecisionEngine.h"
#include "toolhub/InboundDispatcher.h"
#include "toolhub/Transport.h"

namespace toolhub {

//==========================================================================================================
// HealthReport
// Purpose: Snapshot for /health: number of live connections and the status of each.
//==========================================================================================================
struct HealthReport {
    std::size_t activeConnections = 0;
    std::map<std::string, ConnectionStatus> connections;
};

//==========================================================================================================
// Hub
// Purpose: Owns the ConnectionRegistry, one InboundDispatcher per live connection, the SessionInitializer
//          and the ChatService. The decision engine and configuration are injected and must outlive the Hub.
//==========================================================================================================
class Hub {
public:
    Hub(const HubConfig& config, IDecisionEngine& engine);
    ~Hub();

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    //==========================================================================================================
    // RegisterConnection
    // Purpose: Registers transport under identity (replacing and closing any previous connection), starts the
    //          transport and its dispatcher, then runs the handshake asynchronously.
    // Returns:
    //   Future resolving to true when the connection became ready.
    //==========================================================================================================
    std::future<bool> RegisterConnection(const std::string& identity, std::unique_ptr<ITransport> transport);

    //==========================================================================================================
    // Chat
    // Purpose: Runs the orchestration loop for the connection registered under identity.
    // Throws:
    //   errors::HubError; see ChatService.
    //==========================================================================================================
    ChatResult Chat(const std::string& identity, const std::string& query, const std::vector<ChatMessage>& history);

    // std::nullopt when identity is not registered.
    std::optional<ConnectionStatus> GetConnectionStatus(const std::string& identity) const;

    HealthReport Health() const;

    // Re-runs the handshake, replacing the catalog wholesale. false when unknown or the handshake failed.
    bool Reinitialize(const std::string& identity);

    // Closes and unregisters the connection. Idempotent; false when identity was not registered.
    bool Disconnect(const std::string& identity);

    // Closes every connection and joins all dispatchers. Further registrations are refused.
    void Shutdown();

    // Observer for unsolicited provider notifications. Set before registering connections.
    void SetNotificationObserver(InboundDispatcher::NotificationObserver observer);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhub

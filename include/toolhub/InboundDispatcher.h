//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InboundDispatcher.h
// Purpose: Per-connection read loop routing inbound frames to the correlator or the notification observer
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "toolhub/Connection.h"
#include "toolhub/ConnectionRegistry.h"

namespace toolhub {

//==========================================================================================================
// InboundDispatcher
// Purpose: Runs one read loop on a dedicated thread for the connection's lifetime.
//   - Responses go to the connection's RequestCorrelator.
//   - Notifications are logged and passed to the optional observer.
//   - Requests from the provider are answered with MethodNotFound.
//   - Malformed frames are logged and skipped; the connection stays open.
//   When the transport closes, pending requests are rejected and the identity is unregistered (only if the
//   registry still holds this connection).
//==========================================================================================================
class InboundDispatcher {
public:
    using NotificationObserver = std::function<void(const std::string& identity, const std::string& method,
                                                    const std::optional<JSONValue>& params)>;

    InboundDispatcher(std::shared_ptr<Connection> connection, ConnectionRegistry& registry,
                      NotificationObserver observer = {});

    // Closes the connection's transport and joins the read loop. Must not run on the loop's own thread.
    ~InboundDispatcher();

    InboundDispatcher(const InboundDispatcher&) = delete;
    InboundDispatcher& operator=(const InboundDispatcher&) = delete;

    void Start();

    // Handles one raw frame. Returns false when the frame could not be decoded.
    bool Dispatch(const std::string& frame);

    bool IsFinished() const { return finished.load(); }
    const std::shared_ptr<Connection>& GetConnection() const { return connection; }

private:
    void run(std::stop_token st);
    void replyMethodNotFound(const JSONRPCRequest& request);

    std::shared_ptr<Connection> connection;
    ConnectionRegistry& registry;
    NotificationObserver observer;
    std::atomic<bool> finished{false};
    std::jthread readThread;
};

} // namespace toolhub

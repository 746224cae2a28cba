//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Frame transport interface - COM-style abstraction over one tool-provider connection
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <future>

namespace toolhub {

//==========================================================================================================
// Transport interface
// Purpose: Bidirectional, message-framed channel to one remote tool provider. Frames are complete JSON
//          texts; framing itself (WebSocket messages, in-process queues) belongs to the implementation.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport can send and receive.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases resources. Idempotent. A blocked ReadFrame() returns std::nullopt.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected.
    // Args:
    //   (none)
    // Returns:
    //   true if connected; false otherwise.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    // Args:
    //   (none)
    // Returns:
    //   A string identifying the current session.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Frame I/O ///////////////////////////////////////////
    //==========================================================================================================
    // Sends one frame to the peer.
    // Args:
    //   frame: Serialized JSON-RPC envelope.
    // Returns:
    //   Future completing when the frame has been handed to the peer. Fails with
    //   errors::HubError(TransportError) when the transport is closed or the write fails.
    //==========================================================================================================
    virtual std::future<void> Send(std::string frame) = 0;

    //==========================================================================================================
    // Blocks until the next inbound frame arrives.
    // Args:
    //   (none)
    // Returns:
    //   The frame, or std::nullopt once the transport has closed (no further frames will arrive).
    //==========================================================================================================
    virtual std::optional<std::string> ReadFrame() = 0;
};

// Concrete transports are declared in their respective headers:
//  - toolhub/InMemoryTransport.hpp
//  - toolhub/WebSocketTransport.hpp

} // namespace toolhub

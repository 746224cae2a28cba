//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport for tests and embedding
//==========================================================================================================
#pragma once

#include "toolhub/Transport.h"
#include <memory>
#include <utility>

namespace toolhub {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport used for tests and embedding. Implements ITransport and delivers frames
//          to a paired transport instance without networking or I/O. The pair shares its queues, so either
//          side may be destroyed first.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    virtual ~InMemoryTransport();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the in-memory transport (no wiring work; marks the side as started).
    // Returns:
    //   Future that completes when ready to send/receive.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes both directions of the pair. Frames already queued are still readable by each side; afterwards
    // ReadFrame() returns std::nullopt and Send() fails on both sides.
    // Returns:
    //   Future that completes when closed.
    //==========================================================================================================
    std::future<void> Close() override;

    //==========================================================================================================
    // Indicates whether this transport is started and neither side has closed.
    //==========================================================================================================
    bool IsConnected() const override;

    //==========================================================================================================
    // Returns a diagnostic session identifier.
    //==========================================================================================================
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Queues a frame for the paired transport.
    //==========================================================================================================
    std::future<void> Send(std::string frame) override;

    //==========================================================================================================
    // Blocks until the paired transport sends a frame or the pair closes.
    //==========================================================================================================
    std::optional<std::string> ReadFrame() override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhub

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <future>
#include <memory>
#include <random>
#include <string>

#include "logging/Logger.h"
#include "toolhub/InMemoryTransport.hpp"
#include "toolhub/async/FrameQueue.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {

class InMemoryTransport::Impl {
public:
    std::atomic<bool> started{false};
    std::string sessionId;
    // inbox: frames for this side. outbox: the peer's inbox.
    std::shared_ptr<async::FrameQueue> inbox;
    std::shared_ptr<async::FrameQueue> outbox;

    Impl() : inbox(std::make_shared<async::FrameQueue>()) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    void closeQueues() {
        inbox->close();
        if (outbox) {
            outbox->close();
        }
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    pImpl->closeQueues();
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto transport1 = std::make_unique<InMemoryTransport>();
    auto transport2 = std::make_unique<InMemoryTransport>();
    transport1->pImpl->outbox = transport2->pImpl->inbox;
    transport2->pImpl->outbox = transport1->pImpl->inbox;
    auto ret = std::make_pair(std::move(transport1), std::move(transport2));
    return ret;
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    LOG_DEBUG("Starting InMemoryTransport {}", pImpl->sessionId);
    pImpl->started = true;
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    LOG_DEBUG("Closing InMemoryTransport {}", pImpl->sessionId);
    pImpl->closeQueues();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const {
    FUNC_SCOPE();
    return pImpl->started && pImpl->outbox && !pImpl->inbox->isClosed() && !pImpl->outbox->isClosed();
}

std::string InMemoryTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

std::future<void> InMemoryTransport::Send(std::string frame) {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    LOG_DEBUG("Sending in-memory frame: {}", frame);
    if (!pImpl->outbox || pImpl->inbox->isClosed() || !pImpl->outbox->push(std::move(frame))) {
        promise.set_exception(std::make_exception_ptr(
            errors::HubError(errors::ErrorCategory::TransportError, "InMemoryTransport: peer not connected")));
        return fut;
    }
    promise.set_value();
    return fut;
}

std::optional<std::string> InMemoryTransport::ReadFrame() {
    FUNC_SCOPE();
    return pImpl->inbox->pop();
}

} // namespace toolhub

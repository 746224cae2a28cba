//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InboundDispatcher.cpp
// Purpose: Inbound read loop and message routing
//==========================================================================================================

#include <future>

#include "logging/Logger.h"
#include "toolhub/InboundDispatcher.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {

InboundDispatcher::InboundDispatcher(std::shared_ptr<Connection> conn, ConnectionRegistry& reg,
                                     NotificationObserver obs)
    : connection(std::move(conn)), registry(reg), observer(std::move(obs)) {}

InboundDispatcher::~InboundDispatcher() {
    FUNC_SCOPE();
    if (readThread.joinable()) {
        readThread.request_stop();
        connection->Close();
        readThread.join();
    }
}

void InboundDispatcher::Start() {
    FUNC_SCOPE();
    readThread = std::jthread([this](std::stop_token st) { run(st); });
}

void InboundDispatcher::run(std::stop_token st) {
    const std::string& identity = connection->Identity();
    LOG_DEBUG("Dispatcher for {} started", identity);
    while (!st.stop_requested()) {
        std::optional<std::string> frame = connection->Transport().ReadFrame();
        if (!frame.has_value()) {
            break;
        }
        (void)Dispatch(*frame);
    }
    LOG_INFO("Transport for {} closed", identity);
    connection->Correlator().RejectAll("transport closed");
    (void)registry.Unregister(identity, connection.get());
    finished.store(true);
}

bool InboundDispatcher::Dispatch(const std::string& frame) {
    FUNC_SCOPE();
    const std::string& identity = connection->Identity();
    std::string why;
    auto message = DecodeInboundMessage(frame, &why);
    if (!message.has_value()) {
        LOG_WARN("Malformed frame from {} ignored: {}", identity, why);
        return false;
    }

    std::visit([&](auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SuccessResponse> || std::is_same_v<T, ErrorResponse>) {
            (void)connection->Correlator().HandleResponse(m.response);
        } else if constexpr (std::is_same_v<T, JSONRPCNotification>) {
            LOG_INFO("Notification from {}: {}", identity, m.method);
            if (observer) {
                try {
                    observer(identity, m.method, m.params);
                } catch (const std::exception& e) {
                    LOG_ERROR("Notification observer failed for {}: {}", m.method, e.what());
                }
            }
        } else {
            replyMethodNotFound(m);
        }
    }, *message);
    return true;
}

void InboundDispatcher::replyMethodNotFound(const JSONRPCRequest& request) {
    LOG_WARN("Unsupported request '{}' from {}; replying MethodNotFound", request.method, connection->Identity());
    auto resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + request.method);
    try {
        std::future<void> written = connection->Transport().Send(resp->Serialize());
        if (written.wait_for(connection->Correlator().Timeout()) != std::future_status::ready) {
            LOG_WARN("Reply to {} not written in time", connection->Identity());
            return;
        }
        written.get();
    } catch (const std::exception& e) {
        LOG_WARN("Failed to reply to {}: {}", connection->Identity(), e.what());
    }
}

} // namespace toolhub

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketTransport.cpp
// Purpose: WebSocket transport implementation
//==========================================================================================================

#include <atomic>
#include <deque>
#include <future>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "logging/Logger.h"
#include "toolhub/WebSocketTransport.hpp"
#include "toolhub/async/FrameQueue.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {
namespace net = boost::asio;
namespace websocket = boost::beast::websocket;

using errors::ErrorCategory;
using errors::HubError;

class WebSocketTransport::Impl {
public:
    Stream ws;
    std::string sessionId;
    async::FrameQueue inbox;
    std::atomic<bool> open{true};

    // Touched only on the stream's executor.
    std::deque<std::pair<std::string, std::promise<void>>> outgoing;
    bool writing = false;
    bool closing = false;

    Impl(Stream s, std::string id) : ws(std::move(s)), sessionId(std::move(id)) {
        ws.text(true);
    }

    void failOutgoing(const std::string& why) {
        while (!outgoing.empty()) {
            outgoing.front().second.set_exception(
                std::make_exception_ptr(HubError(ErrorCategory::TransportError, why)));
            outgoing.pop_front();
        }
    }
};

WebSocketTransport::WebSocketTransport(Stream ws, std::string sessionId)
    : pImpl(std::make_shared<Impl>(std::move(ws), std::move(sessionId))) {}

WebSocketTransport::~WebSocketTransport() {
    FUNC_SCOPE();
    Close();
}

std::future<void> WebSocketTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> WebSocketTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    const bool wasOpen = pImpl->open.exchange(false);
    pImpl->inbox.close();
    if (wasOpen) {
        LOG_DEBUG("Closing WebSocketTransport {}", pImpl->sessionId);
        net::post(pImpl->ws.get_executor(), [impl = pImpl]() {
            if (impl->closing || !impl->ws.is_open()) {
                return;
            }
            impl->closing = true;
            net::co_spawn(impl->ws.get_executor(), closeStream(impl), net::detached);
        });
    }
    promise.set_value();
    return fut;
}

bool WebSocketTransport::IsConnected() const { return pImpl->open.load(); }

std::string WebSocketTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<void> WebSocketTransport::Send(std::string frame) {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    if (!pImpl->open.load()) {
        promise.set_exception(std::make_exception_ptr(
            HubError(ErrorCategory::TransportError, "WebSocketTransport: connection closed")));
        return fut;
    }
    net::post(pImpl->ws.get_executor(),
              [impl = pImpl, frame = std::move(frame), pr = std::move(promise)]() mutable {
        impl->outgoing.emplace_back(std::move(frame), std::move(pr));
        if (!impl->writing) {
            impl->writing = true;
            net::co_spawn(impl->ws.get_executor(), writeLoop(impl), net::detached);
        }
    });
    return fut;
}

std::optional<std::string> WebSocketTransport::ReadFrame() {
    FUNC_SCOPE();
    return pImpl->inbox.pop();
}

net::awaitable<void> WebSocketTransport::ReadLoop() {
    return readLoop(pImpl);
}

net::awaitable<void> WebSocketTransport::readLoop(std::shared_ptr<Impl> impl) {
    try {
        for (;;) {
            boost::beast::flat_buffer buffer;
            co_await impl->ws.async_read(buffer, net::use_awaitable);
            if (!impl->inbox.push(boost::beast::buffers_to_string(buffer.data()))) {
                break;
            }
        }
    } catch (const boost::system::system_error& e) {
        if (e.code() == websocket::error::closed || e.code() == net::error::operation_aborted) {
            LOG_DEBUG("WebSocket {} closed: {}", impl->sessionId, e.what());
        } else {
            LOG_WARN("WebSocket {} read error: {}", impl->sessionId, e.what());
        }
    }
    impl->open.store(false);
    impl->inbox.close();
    co_return;
}

net::awaitable<void> WebSocketTransport::writeLoop(std::shared_ptr<Impl> impl) {
    while (!impl->outgoing.empty()) {
        auto& item = impl->outgoing.front();
        try {
            co_await impl->ws.async_write(net::buffer(item.first), net::use_awaitable);
            item.second.set_value();
            impl->outgoing.pop_front();
        } catch (const boost::system::system_error& e) {
            LOG_WARN("WebSocket {} write failed: {}", impl->sessionId, e.what());
            impl->failOutgoing(std::string("WebSocket write failed: ") + e.what());
        }
    }
    impl->writing = false;
    co_return;
}

net::awaitable<void> WebSocketTransport::closeStream(std::shared_ptr<Impl> impl) {
    try {
        co_await impl->ws.async_close(websocket::close_code::normal, net::use_awaitable);
    } catch (const boost::system::system_error& e) {
        LOG_DEBUG("WebSocket {} close: {}", impl->sessionId, e.what());
    }
    co_return;
}

} // namespace toolhub

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketTransport.hpp
// Purpose: Server-side WebSocket transport for one tool provider (Boost.Beast)
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "toolhub/Transport.h"

namespace toolhub {

//==========================================================================================================
// WebSocketTransport
// Purpose: Wraps an accepted WebSocket. Each text message is one frame.
// Notes:
//   - Inbound messages are read by ReadLoop(), which the accepting session co_awaits on the stream's
//     executor; they are queued until ReadFrame() consumes them.
//   - Send() and Close() may be called from any thread; writes are serialized on the stream's executor.
//   - State shared with pending handlers is reference counted, so the transport may be destroyed while
//     the read loop is still suspended.
//==========================================================================================================
class WebSocketTransport : public ITransport {
public:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    WebSocketTransport(Stream ws, std::string sessionId);
    ~WebSocketTransport() override;

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    std::future<void> Send(std::string frame) override;
    std::optional<std::string> ReadFrame() override;

    //==========================================================================================================
    // ReadLoop
    // Purpose: Reads messages until the peer closes or Close() is called, then ends the frame stream.
    //==========================================================================================================
    boost::asio::awaitable<void> ReadLoop();

private:
    class Impl;
    static boost::asio::awaitable<void> readLoop(std::shared_ptr<Impl> impl);
    static boost::asio::awaitable<void> writeLoop(std::shared_ptr<Impl> impl);
    static boost::asio::awaitable<void> closeStream(std::shared_ptr<Impl> impl);

    std::shared_ptr<Impl> pImpl;
};

} // namespace toolhub

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HubServer.cpp
// Purpose: HTTP routes, WebSocket upgrade handling and the Beast accept loop
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <format>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "logging/Logger.h"
#include "toolhub/HubServer.hpp"
#include "toolhub/WebSocketTransport.hpp"
#include "toolhub/errors/Errors.h"
#include "toolhub/version.h"

namespace toolhub {
namespace net = boost::asio;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

using errors::HubError;

namespace {

HttpReply detailReply(int status, const std::string& detail) {
    return HttpReply{status, SerializeJSON(MakeObject({{"detail", JSONValue(detail)}}))};
}

JSONValue stringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    for (const auto& s : items) {
        arr.push_back(std::make_shared<JSONValue>(s));
    }
    return JSONValue(std::move(arr));
}

std::string stripQuery(const std::string& target) {
    auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

} // namespace

std::string DecodePathSegment(const std::string& segment) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };
    std::string out;
    out.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '%' && i + 2 < segment.size()) {
            int hi = hexValue(segment[i + 1]);
            int lo = hexValue(segment[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(segment[i]);
    }
    return out;
}

////////////////////////////////////////// HubRoutes //////////////////////////////////////////

HubRoutes::HubRoutes(Hub& h) : hub(h) {}

JSONValue HubRoutes::ChatResultToJson(const ChatResult& result) {
    JSONValue::Array toolResults;
    for (const auto& r : result.toolResults) {
        JSONValue::Object o;
        o["tool_name"] = std::make_shared<JSONValue>(r.toolName);
        o["result"] = std::make_shared<JSONValue>(r.result);
        o["reasoning"] = std::make_shared<JSONValue>(r.reasoning);
        o["failed"] = std::make_shared<JSONValue>(r.failed());
        if (r.failed()) {
            o["error"] = std::make_shared<JSONValue>(r.error.value());
        }
        toolResults.push_back(std::make_shared<JSONValue>(std::move(o)));
    }
    return MakeObject({
        {"response", JSONValue(result.answer)},
        {"tools_used", stringArray(result.toolsUsed)},
        {"tool_results", JSONValue(std::move(toolResults))},
        {"failed_tools", stringArray(result.failedTools)},
    });
}

JSONValue HubRoutes::HealthToJson(const HealthReport& report) {
    JSONValue::Object connections;
    for (const auto& [identity, status] : report.connections) {
        connections[identity] = std::make_shared<JSONValue>(MakeObject({
            {"initialized", JSONValue(status.ready)},
            {"tools_count", JSONValue(static_cast<int64_t>(status.toolCount))},
        }));
    }
    return MakeObject({
        {"status", JSONValue("healthy")},
        {"active_connections", JSONValue(static_cast<int64_t>(report.activeConnections))},
        {"connections", JSONValue(std::move(connections))},
    });
}

HttpReply HubRoutes::Handle(const std::string& method, const std::string& rawTarget, const std::string& body) {
    const std::string target = stripQuery(rawTarget);
    if (target == "/chat") {
        if (method != "POST") return detailReply(405, "Method Not Allowed");
        return chat(body);
    }
    if (target == "/health") {
        if (method != "GET") return detailReply(405, "Method Not Allowed");
        return health();
    }
    const std::string statusPrefix = "/status/";
    if (target.rfind(statusPrefix, 0) == 0 && target.size() > statusPrefix.size()) {
        if (method != "GET") return detailReply(405, "Method Not Allowed");
        return status(DecodePathSegment(target.substr(statusPrefix.size())));
    }
    return detailReply(404, "Not Found");
}

HttpReply HubRoutes::chat(const std::string& body) {
    JSONValue doc;
    try {
        doc = ParseJSON(body);
    } catch (const std::exception& e) {
        return detailReply(400, std::string("Invalid JSON body: ") + e.what());
    }
    const JSONValue* userId = doc.find("user_id");
    const JSONValue* query = doc.find("query");
    if (!userId || !userId->isString() || !query || !query->isString()) {
        return detailReply(400, "Fields 'user_id' and 'query' are required strings");
    }

    std::vector<ChatMessage> history;
    if (const JSONValue* h = doc.find("conversation_history")) {
        if (!h->isArray()) {
            return detailReply(400, "Field 'conversation_history' must be an array");
        }
        for (const auto& item : std::get<JSONValue::Array>(h->value)) {
            if (item && item->isObject()) {
                history.push_back(ChatMessage{item->getString("role", "user"), item->getString("content")});
            }
        }
    }

    try {
        ChatResult result = hub.Chat(std::get<std::string>(userId->value), std::get<std::string>(query->value), history);
        return HttpReply{200, SerializeJSON(ChatResultToJson(result))};
    } catch (const HubError& e) {
        LOG_WARN("Chat failed ({}): {}", errors::categoryName(e.category()), e.what());
        return detailReply(errors::httpStatusFor(e.category()), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Chat failed: {}", e.what());
        return detailReply(500, e.what());
    }
}

HttpReply HubRoutes::health() {
    return HttpReply{200, SerializeJSON(HealthToJson(hub.Health()))};
}

HttpReply HubRoutes::status(const std::string& identity) {
    auto s = hub.GetConnectionStatus(identity);
    if (!s.has_value()) {
        return detailReply(404, "Tool provider connection not found: " + identity);
    }
    return HttpReply{200, SerializeJSON(MakeObject({
        {"ready", JSONValue(s->ready)},
        {"tool_count", JSONValue(static_cast<int64_t>(s->toolCount))},
    }))};
}

////////////////////////////////////////// HubServer //////////////////////////////////////////

class HubServer::Impl {
public:
    HubServer::Options opts;
    Hub& hub;
    HubRoutes routes;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> boundPort{0};
    std::atomic<unsigned long> sessionCounter{0};

    net::io_context ioc;
    net::thread_pool workers;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;

    HubServer::ErrorHandler errorHandler;

    Impl(const HubServer::Options& o, Hub& h)
        : opts(o), hub(h), routes(h), workers(std::max(1u, o.workerThreads)) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
        workers.stop();
        workers.join();
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void bind() {
        if (opts.port.empty() ||
            !std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; }) ||
            std::stoul(opts.port) > 65535ul) {
            throw std::invalid_argument("HubServer invalid port: '" + opts.port + "'");
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    void reportSessionError(const char* what, const std::exception& e) {
        if (!running.load()) {
            // Suppress shutdown-related errors; log at DEBUG only in debug builds
#ifdef _DEBUG
            LOG_DEBUG("HubServer {} suppressed during shutdown: {}", what, e.what());
#endif
        } else {
            setError(std::string("HubServer ") + what + " error: " + e.what());
        }
    }

    net::awaitable<void> serveProvider(boost::beast::tcp_stream stream, http::request<http::string_body> req,
                                       std::string identity) {
        WebSocketTransport::Stream ws(std::move(stream));
        boost::beast::get_lowest_layer(ws).expires_never();
        websocket::stream_base::timeout timeouts{};
        timeouts.handshake_timeout = std::chrono::seconds(30);
        timeouts.idle_timeout = std::chrono::seconds(120);
        timeouts.keep_alive_pings = true;
        ws.set_option(timeouts);
        ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, "toolhub/" + getVersionString());
        }));
        co_await ws.async_accept(req, net::use_awaitable);

        const std::string sessionId = std::format("ws-{}", ++sessionCounter);
        auto transport = std::make_unique<WebSocketTransport>(std::move(ws), sessionId);
        auto loop = transport->ReadLoop();
        LOG_INFO("Tool provider {} connected ({})", identity, sessionId);
        (void)hub.RegisterConnection(identity, std::move(transport));
        co_await std::move(loop);
        LOG_INFO("Tool provider {} disconnected ({})", identity, sessionId);
    }

    net::awaitable<void> session(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            stream.expires_after(std::chrono::seconds(30));
            co_await http::async_read(stream, buffer, req, net::use_awaitable);
            const std::string target = std::string(req.target());

            if (websocket::is_upgrade(req)) {
                const std::string path = stripQuery(target);
                if (path.rfind(opts.wsPathPrefix, 0) == 0 && path.size() > opts.wsPathPrefix.size()) {
                    co_await serveProvider(std::move(stream), std::move(req),
                                           DecodePathSegment(path.substr(opts.wsPathPrefix.size())));
                    co_return;
                }
            }

            // Route handlers may block (chat waits on tool providers); run them off the I/O thread.
            HttpReply reply = co_await net::co_spawn(
                workers,
                [this, method = std::string(req.method_string()), target, body = req.body()]() -> net::awaitable<HttpReply> {
                    co_return routes.Handle(method, target, body);
                },
                net::use_awaitable);

            http::response<http::string_body> res{static_cast<http::status>(reply.status), req.version()};
            res.set(http::field::server, "toolhub/" + getVersionString());
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = std::move(reply.body);
            res.prepare_payload();
            stream.expires_after(std::chrono::seconds(30));
            co_await http::async_write(stream, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            reportSessionError("session", e);
        } catch (const std::exception& e) {
            reportSessionError("session", e);
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(ioc, session(std::move(socket)), net::detached);
            }
        } catch (const boost::system::system_error& e) {
            reportSessionError("accept", e);
        } catch (const std::exception& e) {
            reportSessionError("accept", e);
        }
        co_return;
    }
};

HubServer::HubServer(const Options& opts, Hub& hub)
    : pImpl(std::make_unique<Impl>(opts, hub)) {}

HubServer::~HubServer() {
    Stop();
}

std::future<void> HubServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        pImpl->setError(std::string("HubServer bind failed: ") + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    LOG_INFO("HubServer listening on {}:{}", pImpl->opts.address, pImpl->boundPort.load());
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("HubServer I/O loop failed: ") + e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> HubServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec; pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

unsigned short HubServer::BoundPort() const { return pImpl->boundPort.load(); }

void HubServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace toolhub

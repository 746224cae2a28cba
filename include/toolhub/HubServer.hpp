//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HubServer.hpp
// Purpose: Coroutine-based HTTP + WebSocket front end for the hub using Boost.Beast
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include "toolhub/Hub.h"

namespace toolhub {

//==========================================================================================================
// HttpReply
// Purpose: Status and JSON body produced by HubRoutes.
//==========================================================================================================
struct HttpReply {
    int status = 200;
    std::string body;
};

//==========================================================================================================
// HubRoutes
// Purpose: Plain HTTP endpoints of the hub, independent of the socket layer.
//   POST /chat            {user_id, query, conversation_history?}
//                         -> {response, tools_used, tool_results, failed_tools}
//   GET  /health          -> {status, active_connections, connections:{id:{initialized, tools_count}}}
//   GET  /status/{id}     -> {ready, tool_count}
//   Errors are {detail} with the status mapped from the error category.
//==========================================================================================================
class HubRoutes {
public:
    explicit HubRoutes(Hub& hub);

    HttpReply Handle(const std::string& method, const std::string& target, const std::string& body);

    static JSONValue ChatResultToJson(const ChatResult& result);
    static JSONValue HealthToJson(const HealthReport& report);

private:
    HttpReply chat(const std::string& body);
    HttpReply health();
    HttpReply status(const std::string& identity);

    Hub& hub;
};

// Percent-decodes a path segment. Malformed escapes are kept verbatim.
std::string DecodePathSegment(const std::string& segment);

class HubServer {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address/port: Bind endpoint (port "0" picks an ephemeral port).
    //   wsPathPrefix: Upgrade requests on <prefix><identity> become provider connections.
    //   workerThreads: Threads running blocking route handlers (chat).
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8000"};
        std::string wsPathPrefix{"/ws/"};
        unsigned int workerThreads{4};
    };

    HubServer(const Options& opts, Hub& hub);
    ~HubServer();

    //==========================================================================================================
    // Starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the listener is bound (or failed to bind; see SetErrorHandler).
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops accepting, stops the I/O context and joins the I/O and worker threads.
    //==========================================================================================================
    std::future<void> Stop();

    // Port the listener is bound to; 0 before Start() completes.
    unsigned short BoundPort() const;

    using ErrorHandler = std::function<void(const std::string& error)>;
    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhub

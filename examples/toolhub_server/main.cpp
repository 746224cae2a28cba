//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Tool hub server: WebSocket tool providers on /ws/{id}, chat and health over HTTP
//==========================================================================================================

#include <csignal>
#include <cstdlib>
#include <exception>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhub/Config.h"
#include "toolhub/Hub.h"
#include "toolhub/HubServer.hpp"
#include "toolhub/LlmDecisionEngine.hpp"
#include "toolhub/version.h"

using namespace toolhub;

int main(int argc, char** argv) {
    Logger::configureFromEnv();
    HubConfig config = HubConfig::Load(argc, argv);
    Logger::setLogLevel(Logger::levelFromString(config.logLevel));
    LOG_INFO("toolhub {} starting", getVersionString());

    if (config.llmApiKey.empty()) {
        LOG_WARN("No LLM API key configured (TOOLHUB_LLM_API_KEY / GEMINI_API_KEY); chat will use fallback answers");
    }

    LlmDecisionEngine::Options llmOpts;
    llmOpts.url = config.llmUrl;
    llmOpts.apiKey = config.llmApiKey;
    llmOpts.timeoutMs = config.llmTimeoutMs;
    llmOpts.caFile = GetEnvOrDefault("TOOLHUB_LLM_CA_FILE", "");
    LlmDecisionEngine engine(llmOpts);

    Hub hub(config, engine);
    hub.SetNotificationObserver([](const std::string& identity, const std::string& method, const std::optional<JSONValue>&) {
        LOG_INFO("Notification from {}: {}", identity, method);
    });

    HubServer::Options serverOpts;
    serverOpts.address = config.listenAddress;
    serverOpts.port = config.listenPort;
    HubServer server(serverOpts, hub);
    server.SetErrorHandler([](const std::string& e) {
        LOG_ERROR("HubServer error: {}", e);
    });

    try {
        server.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start: {}", e.what());
        return EXIT_FAILURE;
    }

    boost::asio::io_context signals;
    boost::asio::signal_set stopSignals(signals, SIGINT, SIGTERM);
    stopSignals.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}; shutting down", signo);
        }
    });
    signals.run();

    // Shut the hub down first so blocked chat handlers are released before the worker pool joins.
    hub.Shutdown();
    server.Stop().get();
    LOG_INFO("toolhub stopped");
    return EXIT_SUCCESS;
}

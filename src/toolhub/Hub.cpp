//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Hub.cpp
// Purpose: Hub composition and connection lifecycle
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <iterator>
#include <mutex>
#include <thread>

#include "logging/Logger.h"
#include "toolhub/ChatService.h"
#include "toolhub/ConnectionRegistry.h"
#include "toolhub/Hub.h"
#include "toolhub/SessionInitializer.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {

class Hub::Impl {
public:
    struct HandshakeWorker {
        std::shared_ptr<std::atomic<bool>> done;
        std::jthread thread;
    };

    const HubConfig config;
    ConnectionRegistry registry;
    SessionInitializer initializer;
    ChatService chat;

    std::mutex mutex;
    bool shutDown = false;
    InboundDispatcher::NotificationObserver observer;
    std::vector<std::unique_ptr<InboundDispatcher>> dispatchers;
    std::vector<HandshakeWorker> handshakes;

    Impl(const HubConfig& cfg, IDecisionEngine& engine)
        : config(cfg), initializer(registry, config), chat(registry, engine, config) {}

    // Moves finished dispatchers and handshakes out under the lock; the caller destroys them unlocked.
    void collectFinished(std::vector<std::unique_ptr<InboundDispatcher>>& doneDispatchers,
                         std::vector<HandshakeWorker>& doneHandshakes) {
        std::lock_guard<std::mutex> lock(mutex);
        auto dIt = std::partition(dispatchers.begin(), dispatchers.end(),
                                  [](const std::unique_ptr<InboundDispatcher>& d) { return !d->IsFinished(); });
        std::move(dIt, dispatchers.end(), std::back_inserter(doneDispatchers));
        dispatchers.erase(dIt, dispatchers.end());

        auto hIt = std::partition(handshakes.begin(), handshakes.end(),
                                  [](const HandshakeWorker& w) { return !w.done->load(); });
        std::move(hIt, handshakes.end(), std::back_inserter(doneHandshakes));
        handshakes.erase(hIt, handshakes.end());
    }

    void reap() {
        std::vector<std::unique_ptr<InboundDispatcher>> doneDispatchers;
        std::vector<HandshakeWorker> doneHandshakes;
        collectFinished(doneDispatchers, doneHandshakes);
    }
};

Hub::Hub(const HubConfig& config, IDecisionEngine& engine) : pImpl(std::make_unique<Impl>(config, engine)) {
    LOG_INFO("Hub created (request timeout {} ms, tool failure policy {})", config.requestTimeoutMs,
             ToolFailurePolicyName(config.toolFailurePolicy));
}

Hub::~Hub() {
    Shutdown();
}

void Hub::SetNotificationObserver(InboundDispatcher::NotificationObserver observer) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->observer = std::move(observer);
}

std::future<bool> Hub::RegisterConnection(const std::string& identity, std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    std::promise<bool> ready;
    auto fut = ready.get_future();
    pImpl->reap();

    InboundDispatcher::NotificationObserver observer;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->shutDown) {
            LOG_WARN("Hub is shut down; refusing connection {}", identity);
            transport->Close().get();
            ready.set_value(false);
            return fut;
        }
        observer = pImpl->observer;
    }

    try {
        transport->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start transport for {}: {}", identity, e.what());
        ready.set_value(false);
        return fut;
    }

    auto reg = pImpl->registry.Register(identity, std::move(transport), pImpl->config.requestTimeout());
    if (reg.displaced) {
        reg.displaced->Close();
    }

    auto dispatcher = std::make_unique<InboundDispatcher>(reg.connection, pImpl->registry, std::move(observer));
    dispatcher->Start();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::jthread worker([this, conn = reg.connection, done, pr = std::move(ready)]() mutable {
        bool ok = false;
        try {
            ok = pImpl->initializer.Run(conn);
        } catch (const std::exception& e) {
            LOG_ERROR("Handshake worker for {} failed: {}", conn->Identity(), e.what());
        }
        pr.set_value(ok);
        done->store(true);
    });

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->shutDown) {
            pImpl->dispatchers.push_back(std::move(dispatcher));
            pImpl->handshakes.push_back(Impl::HandshakeWorker{done, std::move(worker)});
            return fut;
        }
    }
    // Shutdown raced with this registration: tear the connection down here.
    LOG_WARN("Hub shut down while registering {}; closing it", identity);
    reg.connection->Correlator().RejectAll("hub shutting down");
    reg.connection->Close();
    return fut;
}

ChatResult Hub::Chat(const std::string& identity, const std::string& query, const std::vector<ChatMessage>& history) {
    FUNC_SCOPE();
    return pImpl->chat.Chat(identity, query, history);
}

std::optional<ConnectionStatus> Hub::GetConnectionStatus(const std::string& identity) const {
    auto conn = pImpl->registry.Lookup(identity);
    if (!conn) {
        return std::nullopt;
    }
    return conn->Status();
}

HealthReport Hub::Health() const {
    HealthReport report;
    report.connections = pImpl->registry.Snapshot();
    report.activeConnections = report.connections.size();
    return report;
}

bool Hub::Reinitialize(const std::string& identity) {
    FUNC_SCOPE();
    auto conn = pImpl->registry.Lookup(identity);
    if (!conn) {
        LOG_WARN("Reinitialize: no connection {}", identity);
        return false;
    }
    LOG_INFO("Re-initializing connection {}", identity);
    return pImpl->initializer.Run(conn);
}

bool Hub::Disconnect(const std::string& identity) {
    FUNC_SCOPE();
    auto removed = pImpl->registry.Unregister(identity);
    if (!removed) {
        return false;
    }
    removed->Correlator().RejectAll("disconnected");
    removed->Close();
    pImpl->reap();
    return true;
}

void Hub::Shutdown() {
    FUNC_SCOPE();
    std::vector<std::unique_ptr<InboundDispatcher>> dispatchers;
    std::vector<Impl::HandshakeWorker> handshakes;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->shutDown) {
            return;
        }
        pImpl->shutDown = true;
        dispatchers = std::move(pImpl->dispatchers);
        handshakes = std::move(pImpl->handshakes);
        pImpl->dispatchers.clear();
        pImpl->handshakes.clear();
    }
    auto connections = pImpl->registry.Clear();
    LOG_INFO("Hub shutting down: closing {} connection(s)", connections.size());
    for (auto& conn : connections) {
        conn->Correlator().RejectAll("hub shutting down");
        conn->Close();
    }
    // Dispatcher destructors close any displaced connections still running and join their loops.
    dispatchers.clear();
    handshakes.clear();
}

} // namespace toolhub

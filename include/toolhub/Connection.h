//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.h
// Purpose: Logical connection to one tool provider: transport, correlator, catalog and readiness
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "toolhub/Protocol.h"
#include "toolhub/RequestCorrelator.h"
#include "toolhub/Transport.h"

namespace toolhub {

//==========================================================================================================
// Connection
// Purpose: Sole owner of a provider's transport. The transport is closed when the connection is closed or
//          destroyed. Catalog and readiness are guarded by one mutex; the catalog is only ever replaced.
//==========================================================================================================
class Connection {
public:
    Connection(std::string identity, std::unique_ptr<ITransport> transport, std::chrono::milliseconds requestTimeout)
        : identity_(std::move(identity)),
          transport_(std::move(transport)),
          correlator_(*transport_, requestTimeout) {}

    ~Connection() {
        correlator_.RejectAll("Connection destroyed");
        Close();
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const std::string& Identity() const { return identity_; }
    ITransport& Transport() { return *transport_; }
    RequestCorrelator& Correlator() { return correlator_; }

    ToolCatalog Catalog() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return catalog_;
    }

    void ReplaceCatalog(ToolCatalog catalog) {
        std::lock_guard<std::mutex> lock(mutex_);
        catalog_ = std::move(catalog);
    }

    bool IsReady() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ready_;
    }

    void SetReady(bool ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = ready;
    }

    ConnectionStatus Status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        ConnectionStatus s;
        s.ready = ready_;
        s.toolCount = catalog_.size();
        return s;
    }

    // Last handshake failure, kept for status reporting.
    std::optional<std::string> LastError() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastError_;
    }

    void SetLastError(std::optional<std::string> error) {
        std::lock_guard<std::mutex> lock(mutex_);
        lastError_ = std::move(error);
    }

    // Closes the transport; the dispatcher's ReadFrame() then returns and the loop ends. Idempotent.
    void Close() {
        if (transport_) {
            transport_->Close().get();
        }
    }

private:
    const std::string identity_;
    std::unique_ptr<ITransport> transport_;
    RequestCorrelator correlator_;

    mutable std::mutex mutex_;
    ToolCatalog catalog_;
    bool ready_ = false;
    std::optional<std::string> lastError_;
};

} // namespace toolhub

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.cpp
// Purpose: Pending-request tracking, deadlines and response matching
//==========================================================================================================

#include <chrono>
#include <exception>
#include <future>
#include <vector>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"
#include "toolhub/RequestCorrelator.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {

using errors::ErrorCategory;
using errors::HubError;

namespace {

constexpr std::chrono::milliseconds kWritePollInterval{10};

// Consumes a finished write; a failed write rejects the request's slot.
void failSlotOnWriteError(std::future<void>& written, async::OneShotSlot<JSONValue>& slot) {
    try {
        written.get();
    } catch (const HubError&) {
        (void)slot.reject(std::current_exception());
    } catch (const std::exception& e) {
        (void)slot.reject(std::make_exception_ptr(
            HubError(ErrorCategory::TransportError, std::string("Send failed: ") + e.what())));
    }
}

} // namespace

RequestCorrelator::RequestCorrelator(ITransport& t, std::chrono::milliseconds requestTimeout)
    : transport(t), timeout(requestTimeout) {}

RequestCorrelator::~RequestCorrelator() {
    RejectAll("Connection destroyed");
}

std::string RequestCorrelator::nextCorrelationId() {
    std::string id;
    do {
        id = boost::uuids::to_string(idGenerator());
    } while (pending.count(id) != 0);
    return id;
}

void RequestCorrelator::erase(const std::string& id, const std::shared_ptr<Slot>& slot) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = pending.find(id);
    if (it != pending.end() && it->second == slot) {
        pending.erase(it);
    }
}

JSONValue RequestCorrelator::Send(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    auto slot = std::make_shared<Slot>();
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            throw HubError(ErrorCategory::Disconnected, "Connection closed: " + closeReason);
        }
        id = nextCorrelationId();
        pending.emplace(id, slot);
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    JSONRPCRequest request(id, method, std::move(params));
    const std::string frame = request.Serialize();
    LOG_DEBUG("Correlator send {} id={}", method, id);
    std::future<void> written;
    try {
        written = transport.Send(frame);
    } catch (const HubError&) {
        erase(id, slot);
        throw;
    } catch (const std::exception& e) {
        erase(id, slot);
        throw HubError(ErrorCategory::TransportError, std::string("Send failed: ") + e.what());
    }

    // Only the slot is waited on. A stalled write still ends at the deadline; a failed one rejects the slot.
    async::SlotState state = async::SlotState::Pending;
    while (state == async::SlotState::Pending) {
        if (written.valid() && written.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            failSlotOnWriteError(written, *slot);
        }
        const auto now = std::chrono::steady_clock::now();
        if (!written.valid() || now + kWritePollInterval >= deadline) {
            state = slot->waitUntil(deadline);
        } else if (slot->waitSettled(now + kWritePollInterval)) {
            state = slot->current();
        }
    }
    erase(id, slot);
    if (state == async::SlotState::Expired) {
        LOG_WARN("Request {} (id={}) timed out after {} ms", method, id, timeout.count());
        throw HubError(ErrorCategory::RequestTimeout,
                       std::format("Request {} timed out after {} ms", method, timeout.count()));
    }
    return slot->take();
}

void RequestCorrelator::Notify(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) {
            throw HubError(ErrorCategory::Disconnected, "Connection closed: " + closeReason);
        }
    }
    JSONRPCNotification note(method, std::move(params));
    try {
        std::future<void> written = transport.Send(note.Serialize());
        if (written.wait_for(timeout) != std::future_status::ready) {
            throw HubError(ErrorCategory::TransportError,
                           std::format("Notify {} not written within {} ms", method, timeout.count()));
        }
        written.get();
    } catch (const HubError&) {
        throw;
    } catch (const std::exception& e) {
        throw HubError(ErrorCategory::TransportError, std::string("Notify failed: ") + e.what());
    }
}

bool RequestCorrelator::HandleResponse(const JSONRPCResponse& response) {
    FUNC_SCOPE();
    const std::string id = IdToString(response.id);
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = pending.find(id);
        if (it == pending.end()) {
            LOG_DEBUG("Discarding response for unknown or completed id={}", id);
            return false;
        }
        slot = it->second;
        pending.erase(it);
    }
    bool completed = false;
    if (response.IsError()) {
        completed = slot->reject(std::make_exception_ptr(errors::protocolErrorFrom(response.error.value())));
    } else {
        completed = slot->resolve(response.result.value_or(JSONValue()));
    }
    if (!completed) {
        LOG_DEBUG("Response id={} arrived after its request completed", id);
    }
    return completed;
}

std::size_t RequestCorrelator::RejectAll(const std::string& reason) {
    FUNC_SCOPE();
    std::vector<std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!closed) {
            closed = true;
            closeReason = reason;
        }
        slots.reserve(pending.size());
        for (auto& [id, slot] : pending) {
            slots.push_back(slot);
        }
        pending.clear();
    }
    std::size_t rejected = 0;
    for (auto& slot : slots) {
        if (slot->reject(std::make_exception_ptr(HubError(ErrorCategory::Disconnected, "Connection closed: " + reason)))) {
            ++rejected;
        }
    }
    if (rejected > 0) {
        LOG_WARN("Rejected {} pending request(s): {}", rejected, reason);
    }
    return rejected;
}

std::size_t RequestCorrelator::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending.size();
}

} // namespace toolhub

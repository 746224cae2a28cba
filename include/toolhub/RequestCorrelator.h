//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.h
// Purpose: Correlated request/response exchange over one connection's transport
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/uuid/random_generator.hpp>

#include "toolhub/JSONRPCTypes.h"
#include "toolhub/Transport.h"
#include "toolhub/async/OneShotSlot.h"

namespace toolhub {

//==========================================================================================================
// RequestCorrelator
// Purpose: Issues uniquely identified requests on a transport and parks each caller until the matching
//          response is handed in through HandleResponse(), the deadline passes, or RejectAll() runs.
// Notes:
//   - Any number of Send() calls may be in flight; HandleResponse() may run concurrently with all of them.
//   - A pending entry is removed exactly once: on response, on expiry, or on RejectAll().
//   - Responses for unknown or already completed ids are discarded.
//==========================================================================================================
class RequestCorrelator {
public:
    RequestCorrelator(ITransport& transport, std::chrono::milliseconds timeout);
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    //==========================================================================================================
    // Send
    // Purpose: Sends method/params as a request and blocks until its response arrives.
    // Returns:
    //   The result member of the response (null when absent).
    // Throws:
    //   errors::HubError with RequestTimeout, ToolProtocolError (remote error object), Disconnected
    //   (RejectAll while waiting, or called after it) or TransportError (write failed).
    //==========================================================================================================
    JSONValue Send(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    // Writes a notification (no id, no response). Throws errors::HubError(TransportError) on write failure.
    void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    //==========================================================================================================
    // HandleResponse
    // Purpose: Completes the pending request whose id matches response.id.
    // Returns:
    //   true when a pending request consumed the response; false when it was discarded.
    //==========================================================================================================
    bool HandleResponse(const JSONRPCResponse& response);

    //==========================================================================================================
    // RejectAll
    // Purpose: Rejects every pending request with errors::HubError(Disconnected) and refuses later Send()s.
    // Returns:
    //   Number of requests rejected.
    //==========================================================================================================
    std::size_t RejectAll(const std::string& reason);

    std::size_t PendingCount() const;
    std::chrono::milliseconds Timeout() const { return timeout; }

private:
    using Slot = async::OneShotSlot<JSONValue>;

    // Caller holds mutex.
    std::string nextCorrelationId();
    void erase(const std::string& id, const std::shared_ptr<Slot>& slot);

    ITransport& transport;
    const std::chrono::milliseconds timeout;

    mutable std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<Slot>> pending;
    boost::uuids::random_generator idGenerator;
    bool closed = false;
    std::string closeReason;
};

} // namespace toolhub

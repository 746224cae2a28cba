//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Hub error taxonomy, typed JSON-RPC error objects and HTTP status mapping
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "toolhub/JSONRPCTypes.h"

namespace toolhub {
namespace errors {

// Failure classes surfaced by the hub.
enum class ErrorCategory {
    ConnectionNotFound,
    SessionNotReady,
    RequestTimeout,
    ToolProtocolError,
    DecodeError,
    ToolExecutionError,
    Disconnected,
    TransportError,
    DecisionError
};

inline const char* categoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ConnectionNotFound: return "ConnectionNotFound";
        case ErrorCategory::SessionNotReady: return "SessionNotReady";
        case ErrorCategory::RequestTimeout: return "RequestTimeout";
        case ErrorCategory::ToolProtocolError: return "ToolProtocolError";
        case ErrorCategory::DecodeError: return "DecodeError";
        case ErrorCategory::ToolExecutionError: return "ToolExecutionError";
        case ErrorCategory::Disconnected: return "Disconnected";
        case ErrorCategory::TransportError: return "TransportError";
        case ErrorCategory::DecisionError: return "DecisionError";
    }
    return "Unknown";
}

// Typed representation of a JSON-RPC error object returned by a provider.
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RpcError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<RpcError> populated when shape is valid.
inline std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = errVal.find("code");
    const JSONValue* message = errVal.find("message");
    if (!code || !message) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) || !message->isString()) {
        return std::nullopt;
    }
    RpcError e;
    e.code = static_cast<int>(std::get<int64_t>(code->value));
    e.message = std::get<std::string>(message->value);
    if (const JSONValue* data = errVal.find("data")) {
        e.data = *data;
    }
    return e;
}

//==========================================================================================================
// HubError
// Purpose: Exception carrying an ErrorCategory, and for ToolProtocolError the remote error object.
//==========================================================================================================
class HubError : public std::runtime_error {
public:
    HubError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    explicit HubError(const RpcError& rpc)
        : std::runtime_error(rpc.message), category_(ErrorCategory::ToolProtocolError), rpc_(rpc) {}

    ErrorCategory category() const { return category_; }
    const std::optional<RpcError>& rpcError() const { return rpc_; }

private:
    ErrorCategory category_;
    std::optional<RpcError> rpc_;
};

// Build a ToolProtocolError from an error member; malformed objects keep their serialized text as message.
inline HubError protocolErrorFrom(const JSONValue& errVal) {
    if (auto rpc = rpcErrorFromErrorValue(errVal)) {
        return HubError(*rpc);
    }
    return HubError(ErrorCategory::ToolProtocolError, SerializeJSON(errVal));
}

// HTTP status used when a category escapes to a client-facing response.
inline int httpStatusFor(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ConnectionNotFound: return 404;
        case ErrorCategory::SessionNotReady: return 400;
        case ErrorCategory::DecodeError: return 400;
        case ErrorCategory::RequestTimeout: return 504;
        case ErrorCategory::ToolProtocolError:
        case ErrorCategory::ToolExecutionError:
        case ErrorCategory::Disconnected:
        case ErrorCategory::TransportError: return 502;
        case ErrorCategory::DecisionError: return 500;
    }
    return 500;
}

} // namespace errors
} // namespace toolhub

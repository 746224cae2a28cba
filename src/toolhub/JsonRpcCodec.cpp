//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcCodec.cpp
// Purpose: Envelope validation and classification of inbound JSON-RPC frames
//==========================================================================================================

#include <stdexcept>
#include <string>

#include "toolhub/JSONRPCTypes.h"

namespace toolhub {

namespace {

bool setError(std::string* error, const std::string& what) {
    if (error) { *error = what; }
    return false;
}

// Reads the id member into out. Only strings and integers are valid correlation ids.
bool readId(const JSONValue& id, JSONRPCId& out) {
    if (std::holds_alternative<std::string>(id.value)) {
        out = std::get<std::string>(id.value);
        return true;
    }
    if (std::holds_alternative<int64_t>(id.value)) {
        out = std::get<int64_t>(id.value);
        return true;
    }
    return false;
}

std::optional<JSONValue> optionalMember(const JSONValue& obj, const char* key) {
    const JSONValue* v = obj.find(key);
    if (!v) { return std::nullopt; }
    return *v;
}

} // namespace

std::optional<InboundMessage> DecodeInboundMessage(const std::string& text, std::string* error) {
    JSONValue doc;
    try {
        doc = ParseJSON(text);
    } catch (const std::exception& e) {
        setError(error, std::string("malformed JSON: ") + e.what());
        return std::nullopt;
    }
    if (!doc.isObject()) {
        setError(error, "top-level value is not an object");
        return std::nullopt;
    }

    if (const JSONValue* version = doc.find("jsonrpc")) {
        if (!version->isString() || std::get<std::string>(version->value) != "2.0") {
            setError(error, "unsupported jsonrpc version");
            return std::nullopt;
        }
    }

    const JSONValue* idVal = doc.find("id");
    const JSONValue* methodVal = doc.find("method");
    const bool hasResult = doc.find("result") != nullptr;
    const bool hasError = doc.find("error") != nullptr;

    JSONRPCId id = nullptr;
    if (idVal && !idVal->isNull() && !readId(*idVal, id)) {
        setError(error, "id must be a string or an integer");
        return std::nullopt;
    }
    const bool hasId = idVal && !idVal->isNull();

    if (hasResult && hasError) {
        setError(error, "response carries both result and error");
        return std::nullopt;
    }

    if (hasResult || hasError) {
        if (methodVal) {
            setError(error, "response must not carry a method");
            return std::nullopt;
        }
        if (!hasId) {
            setError(error, "response without id");
            return std::nullopt;
        }
        JSONRPCResponse response;
        response.id = id;
        if (hasError) {
            response.error = optionalMember(doc, "error");
            if (!response.error->isObject()) {
                setError(error, "error member is not an object");
                return std::nullopt;
            }
            return InboundMessage{ErrorResponse{std::move(response)}};
        }
        response.result = optionalMember(doc, "result");
        return InboundMessage{SuccessResponse{std::move(response)}};
    }

    if (methodVal) {
        if (!methodVal->isString() || std::get<std::string>(methodVal->value).empty()) {
            setError(error, "method must be a non-empty string");
            return std::nullopt;
        }
        const std::string& method = std::get<std::string>(methodVal->value);
        auto params = optionalMember(doc, "params");
        if (hasId) {
            return InboundMessage{JSONRPCRequest(id, method, std::move(params))};
        }
        if (idVal) {
            // "id": null with a method is neither a request we can answer nor a notification
            setError(error, "request with null id");
            return std::nullopt;
        }
        return InboundMessage{JSONRPCNotification(method, std::move(params))};
    }

    setError(error, hasId ? "id without method, result or error" : "unrecognized message shape");
    return std::nullopt;
}

std::optional<std::string> CorrelationIdOf(const InboundMessage& message) {
    return std::visit([](const auto& m) -> std::optional<std::string> {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, JSONRPCNotification>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, JSONRPCRequest>) {
            return IdToString(m.id);
        } else {
            return IdToString(m.response.id);
        }
    }, message);
}

} // namespace toolhub

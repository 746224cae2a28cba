//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool-provider protocol constants and the data structures shared by the hub components
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <cstddef>
#include <string>
#include <vector>
#include <optional>

namespace toolhub {
//==========================================================================================================
// Protocol types and constants
// Purpose: Method names, handshake defaults, tool descriptors, decisions and chat results.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version offered in the initialize handshake unless configured otherwise
constexpr const char* DEFAULT_PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo in the handshake)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool advertised by a provider in tools/list. Immutable once received.
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::optional<JSONValue> inputSchema;

    ToolDescriptor() = default;
    ToolDescriptor(std::string name, std::string description, std::optional<JSONValue> inputSchema = std::nullopt)
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}
};

using ToolCatalog = std::vector<ToolDescriptor>;

// One invocation requested by the decision engine.
struct ToolCall {
    std::string toolName;
    JSONValue toolArgs;
    std::string reasoning;
};

//==========================================================================================================
// ToolResult
// Purpose: Outcome of one executed tool call.
// Fields:
//   toolName: Tool that was invoked.
//   result: content of the tools/call result (or the whole result when it carries no content).
//   reasoning: Carried through from the originating ToolCall.
//   error: Set when the call failed; result is then null.
//==========================================================================================================
struct ToolResult {
    std::string toolName;
    JSONValue result;
    std::string reasoning;
    std::optional<std::string> error;

    bool failed() const { return error.has_value(); }
};

///////////////////////////////////////// Decisions ///////////////////////////////////////////
// Conversation turn supplied by the caller ("user", "assistant", ...).
struct ChatMessage {
    std::string role;
    std::string content;
};

//==========================================================================================================
// Decision
// Purpose: Output of the decision engine: a direct answer, or an ordered list of tool calls.
//==========================================================================================================
struct Decision {
    bool needsTools = false;
    std::string content;
    std::vector<ToolCall> toolCalls;

    static Decision Answer(std::string text) {
        Decision d;
        d.content = std::move(text);
        return d;
    }

    static Decision Tools(std::vector<ToolCall> calls) {
        Decision d;
        d.needsTools = true;
        d.toolCalls = std::move(calls);
        return d;
    }
};

///////////////////////////////////////// Results ///////////////////////////////////////////
// Final outcome of one chat request with its audit trail.
struct ChatResult {
    std::string answer;
    std::vector<std::string> toolsUsed;
    std::vector<ToolResult> toolResults;
    std::vector<std::string> failedTools;
};

// Health view of one connection.
struct ConnectionStatus {
    bool ready = false;
    std::size_t toolCount = 0;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Hub to provider
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
}

} // namespace toolhub

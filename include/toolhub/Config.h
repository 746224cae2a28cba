//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Hub configuration loaded from environment variables and --key=value command-line options
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "toolhub/Protocol.h"

namespace toolhub {

// What the chat loop does when one tool call of a multi-call decision fails.
enum class ToolFailurePolicy {
    ContinueOnError,  // record the failure and run the remaining calls
    FailFast          // abort the chat request on the first failed call
};

// "continue" | "failfast" (case-insensitive); std::nullopt otherwise.
std::optional<ToolFailurePolicy> ParseToolFailurePolicy(const std::string& text);
const char* ToolFailurePolicyName(ToolFailurePolicy policy);

//==========================================================================================================
// HubConfig
// Purpose: Process-wide settings for the hub, its HTTP front end and the LLM decision engine.
// Fields:
//   requestTimeoutMs: Deadline for every correlated request (initialize, tools/list, tools/call).
//   toolFailurePolicy: Partial-failure handling in the chat loop.
//   protocolVersion/clientName/clientVersion: Values offered in the initialize handshake.
//   listenAddress/listenPort: HubServer bind endpoint.
//   llmUrl/llmApiKey/llmTimeoutMs: generateContent endpoint used by LlmDecisionEngine.
//   logLevel: Minimum Logger level name.
//==========================================================================================================
struct HubConfig {
    uint64_t requestTimeoutMs{30000};
    ToolFailurePolicy toolFailurePolicy{ToolFailurePolicy::ContinueOnError};
    std::string protocolVersion{DEFAULT_PROTOCOL_VERSION};
    std::string clientName{"backend-server"};
    std::string clientVersion{"1.0.0"};
    std::string listenAddress{"0.0.0.0"};
    std::string listenPort{"8000"};
    std::string llmUrl{"https://generativelanguage.googleapis.com/v1beta/models/gemini-2.0-flash:generateContent"};
    std::string llmApiKey;
    uint64_t llmTimeoutMs{30000};
    std::string logLevel{"INFO"};

    std::chrono::milliseconds requestTimeout() const { return std::chrono::milliseconds(requestTimeoutMs); }
    Implementation clientInfo() const { return Implementation(clientName, clientVersion); }

    //======================================================================================================
    // ApplyOption
    // Purpose: Sets one option by its command-line key (without leading dashes), e.g. "request-timeout-ms".
    // Returns:
    //   false when the key is unknown or the value is invalid; the field keeps its previous value.
    //======================================================================================================
    bool ApplyOption(const std::string& key, const std::string& value);

    // Applies every TOOLHUB_* variable (and GEMINI_API_KEY) that is set.
    void ApplyEnvironment();

    // Applies --key=value arguments; other arguments are ignored.
    void ApplyCommandLine(int argc, const char* const* argv);

    // Defaults, then environment, then command line.
    static HubConfig Load(int argc, const char* const* argv);
};

} // namespace toolhub

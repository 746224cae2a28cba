//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChatService.h
// Purpose: Decide -> execute tools -> synthesize orchestration for one chat request
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "toolhub/Config.h"
#include "toolhub/ConnectionRegistry.h"
#include "toolhub/DecisionEngine.h"

namespace toolhub {

//==========================================================================================================
// ChatService
// Purpose: Runs the chat state machine against one ready connection. Holds no state between requests.
//   Start:      ConnectionNotFound / SessionNotReady preconditions.
//   Decide:     direct answer ends the request with no tool usage.
//   Execute:    tool calls run sequentially in the order received through tools/call.
//               ContinueOnError records a failed call and goes on; FailFast aborts with ToolExecutionError.
//   Synthesize: second decision with every ToolResult and the history extended by reasoning and results.
// Throws:
//   errors::HubError (ConnectionNotFound, SessionNotReady, DecisionError, ToolExecutionError under FailFast).
//==========================================================================================================
class ChatService {
public:
    ChatService(ConnectionRegistry& registry, IDecisionEngine& engine, const HubConfig& config);

    ChatResult Chat(const std::string& identity, const std::string& query, const std::vector<ChatMessage>& history);

    // Executes one call; failures are returned as an errored ToolResult, never thrown.
    static ToolResult ExecuteTool(Connection& connection, const ToolCatalog& catalog, const ToolCall& call);

    // Plain-text digest of results used when the synthesis step cannot produce an answer.
    static std::string SummarizeResults(const std::vector<ToolResult>& results);

private:
    Decision decide(const std::string& query, const ToolCatalog& catalog, const std::vector<ChatMessage>& history,
                    const std::optional<std::vector<ToolResult>>& priorResults);

    ConnectionRegistry& registry;
    IDecisionEngine& engine;
    const HubConfig& config;
};

} // namespace toolhub

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DecisionEngine.h
// Purpose: Interface of the external decision function consulted by the chat loop
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "toolhub/Protocol.h"

namespace toolhub {

//==========================================================================================================
// IDecisionEngine
// Purpose: Maps a query and the available tools to a direct answer or a list of tool calls.
//==========================================================================================================
class IDecisionEngine {
public:
    virtual ~IDecisionEngine() = default;

    //==========================================================================================================
    // Decide
    // Args:
    //   query: The user's question.
    //   catalog: Tools advertised by the target connection.
    //   history: Prior conversation turns.
    //   priorResults: Set on the synthesis call; the engine should answer from these results.
    // Returns:
    //   A Decision. Implementations should degrade to a fallback answer rather than throw; an exception
    //   escaping Decide() fails the chat request with DecisionError.
    //==========================================================================================================
    virtual Decision Decide(const std::string& query,
                            const ToolCatalog& catalog,
                            const std::vector<ChatMessage>& history,
                            const std::optional<std::vector<ToolResult>>& priorResults) = 0;
};

} // namespace toolhub

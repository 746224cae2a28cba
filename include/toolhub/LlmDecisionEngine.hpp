//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LlmDecisionEngine.hpp
// Purpose: Decision engine backed by a hosted generateContent endpoint (HTTPS via Boost.Beast/OpenSSL)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolhub/DecisionEngine.h"

namespace toolhub {

//==========================================================================================================
// LlmDecisionEngine
// Purpose: Builds a tool-aware prompt, posts it to the language model and parses the reply into a Decision.
// Notes:
//   - Never throws from Decide(): an unreachable endpoint, a missing API key or an unparsable reply
//     produces a fallback answer and an ERROR log entry.
//   - Decide() may be called concurrently; each call runs its own I/O context.
//==========================================================================================================
class LlmDecisionEngine : public IDecisionEngine {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   url: generateContent endpoint (https://host[:port]/path).
    //   apiKey: Sent as x-goog-api-key.
    //   timeoutMs: Connect and read deadline per request.
    //   caFile: Optional PEM bundle; system verify paths are used otherwise.
    //==========================================================================================================
    struct Options {
        std::string url;
        std::string apiKey;
        uint64_t timeoutMs{30000};
        std::string caFile;
    };

    explicit LlmDecisionEngine(const Options& opts);
    ~LlmDecisionEngine() override;

    Decision Decide(const std::string& query,
                    const ToolCatalog& catalog,
                    const std::vector<ChatMessage>& history,
                    const std::optional<std::vector<ToolResult>>& priorResults) override;

    ////////////////////////////////////////// Prompt and reply helpers //////////////////////////////////////////
    // Final user turn: tool list and JSON reply contract, or the collected results on the synthesis call.
    static std::string BuildPrompt(const std::string& query,
                                   const ToolCatalog& catalog,
                                   const std::optional<std::vector<ToolResult>>& priorResults);

    // generateContent body: {"contents":[{"role", "parts":[{"text"}]}...]} with history then the prompt.
    static JSONValue BuildRequestBody(const std::vector<ChatMessage>& history, const std::string& prompt);

    // Text of the first candidate, or std::nullopt when the body has none.
    static std::optional<std::string> ExtractText(const std::string& responseBody);

    //==========================================================================================================
    // ParseReply
    // Purpose: Interprets model text. Accepted tool forms (optionally inside ``` fences):
    //   {"needs_tool":true,"tool_calls":[{"tool_name","tool_args","reasoning"}...]}
    //   {"needs_tool":true,"tool_name","tool_args","reasoning"}
    // Anything else is a direct answer (a "content"/"response" string member when present, else the text).
    //==========================================================================================================
    static Decision ParseReply(const std::string& text);

    // Degraded answer used when the model cannot be consulted.
    static std::string FallbackAnswer(const std::optional<std::vector<ToolResult>>& priorResults,
                                      const std::string& reason);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhub

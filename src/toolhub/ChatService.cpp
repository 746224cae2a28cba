//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChatService.cpp
// Purpose: Tool-orchestration chat loop
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "toolhub/ChatService.h"
#include "toolhub/errors/Errors.h"

namespace toolhub {

using errors::ErrorCategory;
using errors::HubError;

namespace {

// First text item of a content array, for error messages reported through isError results.
std::string firstText(const JSONValue& content) {
    if (!content.isArray()) {
        return std::string();
    }
    for (const auto& item : std::get<JSONValue::Array>(content.value)) {
        if (item && item->isObject()) {
            std::string t = item->getString("text");
            if (!t.empty()) return t;
        }
    }
    return std::string();
}

} // namespace

ChatService::ChatService(ConnectionRegistry& reg, IDecisionEngine& eng, const HubConfig& cfg)
    : registry(reg), engine(eng), config(cfg) {}

Decision ChatService::decide(const std::string& query, const ToolCatalog& catalog,
                             const std::vector<ChatMessage>& history,
                             const std::optional<std::vector<ToolResult>>& priorResults) {
    try {
        return engine.Decide(query, catalog, history, priorResults);
    } catch (const HubError& e) {
        if (e.category() == ErrorCategory::DecisionError) throw;
        throw HubError(ErrorCategory::DecisionError, std::string("LLM error: ") + e.what());
    } catch (const std::exception& e) {
        throw HubError(ErrorCategory::DecisionError, std::string("LLM error: ") + e.what());
    }
}

ToolResult ChatService::ExecuteTool(Connection& connection, const ToolCatalog& catalog, const ToolCall& call) {
    FUNC_SCOPE();
    ToolResult out;
    out.toolName = call.toolName;
    out.reasoning = call.reasoning;

    const bool known = std::any_of(catalog.begin(), catalog.end(),
                                   [&call](const ToolDescriptor& t) { return t.name == call.toolName; });
    if (!known) {
        // The provider stays the authority on its tools; it answers unknown names with an error.
        LOG_WARN("Tool '{}' is not advertised by {}; calling it anyway", call.toolName, connection.Identity());
    }

    JSONValue params = MakeObject({{"name", JSONValue(call.toolName)}, {"arguments", call.toolArgs}});
    try {
        JSONValue result = connection.Correlator().Send(Methods::CallTool, std::move(params));
        const JSONValue* content = result.find("content");
        out.result = content ? *content : result;
        const JSONValue* isError = result.find("isError");
        if (isError && std::holds_alternative<bool>(isError->value) && std::get<bool>(isError->value)) {
            std::string text = firstText(out.result);
            out.error = text.empty() ? std::string("tool reported an error") : text;
        }
    } catch (const HubError& e) {
        out.error = std::string(errors::categoryName(e.category())) + ": " + e.what();
    } catch (const std::exception& e) {
        out.error = e.what();
    }

    if (out.failed()) {
        LOG_WARN("Tool '{}' on {} failed: {}", call.toolName, connection.Identity(), out.error.value());
    } else {
        LOG_INFO("Tool '{}' on {} succeeded", call.toolName, connection.Identity());
    }
    return out;
}

std::string ChatService::SummarizeResults(const std::vector<ToolResult>& results) {
    std::string out = "Tool results:";
    for (const auto& r : results) {
        if (r.failed()) {
            out += "\n- " + r.toolName + " failed: " + r.error.value();
        } else {
            out += "\n- " + r.toolName + ": " + SerializeJSON(r.result);
        }
    }
    return out;
}

ChatResult ChatService::Chat(const std::string& identity, const std::string& query,
                             const std::vector<ChatMessage>& history) {
    FUNC_SCOPE();
    std::shared_ptr<Connection> connection = registry.Lookup(identity);
    if (!connection) {
        throw HubError(ErrorCategory::ConnectionNotFound, "Tool provider connection not found: " + identity);
    }
    if (!connection->IsReady()) {
        throw HubError(ErrorCategory::SessionNotReady, "Tool provider session not initialized: " + identity);
    }
    const ToolCatalog catalog = connection->Catalog();

    ChatResult chat;
    Decision first = decide(query, catalog, history, std::nullopt);
    if (!first.needsTools || first.toolCalls.empty()) {
        LOG_INFO("Chat for {} answered directly", identity);
        chat.answer = std::move(first.content);
        return chat;
    }

    std::vector<ChatMessage> extended = history;
    for (const auto& call : first.toolCalls) {
        LOG_INFO("Chat for {} executing tool '{}'", identity, call.toolName);
        ToolResult r = ExecuteTool(*connection, catalog, call);
        chat.toolsUsed.push_back(call.toolName);
        if (r.failed()) {
            chat.failedTools.push_back(call.toolName);
            if (config.toolFailurePolicy == ToolFailurePolicy::FailFast) {
                throw HubError(ErrorCategory::ToolExecutionError,
                               "Tool execution failed: " + call.toolName + ": " + r.error.value());
            }
        }
        if (!call.reasoning.empty()) {
            extended.push_back(ChatMessage{"assistant", call.reasoning});
        }
        extended.push_back(ChatMessage{"system", r.failed()
            ? "Tool " + r.toolName + " failed: " + r.error.value()
            : "Tool " + r.toolName + " result: " + SerializeJSON(r.result)});
        chat.toolResults.push_back(std::move(r));
    }

    Decision second = decide(query, catalog, extended, chat.toolResults);
    if (second.needsTools) {
        LOG_WARN("Synthesis for {} requested more tools; answering from collected results", identity);
        chat.answer = SummarizeResults(chat.toolResults);
    } else {
        chat.answer = std::move(second.content);
    }
    LOG_INFO("Chat for {} completed with {} tool call(s), {} failed", identity, chat.toolsUsed.size(),
             chat.failedTools.size());
    return chat;
}

} // namespace toolhub

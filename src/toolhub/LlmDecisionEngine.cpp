//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LlmDecisionEngine.cpp
// Purpose: generateContent client, prompt construction and reply parsing
//==========================================================================================================

#include <chrono>
#include <sstream>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "toolhub/LlmDecisionEngine.hpp"
#include "toolhub/errors/Errors.h"

namespace toolhub {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

using errors::ErrorCategory;
using errors::HubError;

namespace {

// ----------------------------------------------------------------------------------------------------------
// URL parsing (adequate for https://host[:port]/path?query)
// ----------------------------------------------------------------------------------------------------------
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = "https";
    }
    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
    }
    std::size_t colon = hostPort.find(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = parts.scheme == "https" ? "443" : "80";
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    return parts;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Removes a surrounding ```lang ... ``` fence.
std::string stripCodeFence(const std::string& text) {
    std::string t = trim(text);
    if (t.rfind("```", 0) != 0) {
        return t;
    }
    auto firstNl = t.find('\n');
    if (firstNl == std::string::npos) {
        return t;
    }
    std::string body = t.substr(firstNl + 1);
    auto close = body.rfind("```");
    if (close != std::string::npos) {
        body = body.substr(0, close);
    }
    return trim(body);
}

std::optional<JSONValue> parseObjectLoose(const std::string& text) {
    const std::string t = stripCodeFence(text);
    try {
        JSONValue v = ParseJSON(t);
        if (v.isObject()) return v;
    } catch (const std::exception&) {
        // fall through to the embedded-object attempt
    }
    auto b = t.find('{');
    auto e = t.rfind('}');
    if (b == std::string::npos || e == std::string::npos || e <= b) {
        return std::nullopt;
    }
    try {
        JSONValue v = ParseJSON(t.substr(b, e - b + 1));
        if (v.isObject()) return v;
    } catch (const std::exception&) {
    }
    return std::nullopt;
}

bool isTrue(const JSONValue* v) {
    return v && std::holds_alternative<bool>(v->value) && std::get<bool>(v->value);
}

std::optional<ToolCall> toolCallFrom(const JSONValue& obj) {
    ToolCall call;
    call.toolName = obj.getString("tool_name");
    if (call.toolName.empty()) {
        return std::nullopt;
    }
    const JSONValue* args = obj.find("tool_args");
    call.toolArgs = (args && args->isObject()) ? *args : JSONValue(JSONValue::Object{});
    call.reasoning = obj.getString("reasoning");
    return call;
}

std::string describeResult(const ToolResult& r) {
    if (r.failed()) {
        return std::format("{} failed: {}", r.toolName, r.error.value());
    }
    return std::format("{} returned: {}", r.toolName, SerializeJSON(r.result));
}

template <typename Stream>
net::awaitable<http::response<http::string_body>> exchange(Stream& stream, http::request<http::string_body>& req) {
    co_await http::async_write(stream, req, net::use_awaitable);
    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, net::use_awaitable);
    co_return res;
}

} // namespace

class LlmDecisionEngine::Impl {
public:
    LlmDecisionEngine::Options opts;
    UrlParts url;
    std::unique_ptr<ssl::context> sslCtx; // present when https

    explicit Impl(const LlmDecisionEngine::Options& o) : opts(o), url(parseUrl(o.url)) {
        if (url.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                if (!opts.caFile.empty()) {
                    sslCtx->load_verify_file(opts.caFile);
                } else {
                    sslCtx->set_default_verify_paths();
                }
            } catch (const std::exception& e) {
                LOG_WARN("LLM client: failed to load CA certificates: {}", e.what());
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }
    }

    http::request<http::string_body> makeRequest(const std::string& body) const {
        http::request<http::string_body> req{http::verb::post, url.path, 11};
        req.set(http::field::host, url.host);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.set("x-goog-api-key", opts.apiKey);
        req.body() = body;
        req.prepare_payload();
        return req;
    }

    // Coroutine: POST body to the endpoint and return the response body; non-2xx statuses throw.
    net::awaitable<std::string> coPost(std::string body) {
        auto executor = co_await net::this_coro::executor;
        const auto deadline = std::chrono::milliseconds(opts.timeoutMs);
        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);
        auto req = makeRequest(body);
        http::response<http::string_body> res;

        if (sslCtx) {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                throw HubError(ErrorCategory::DecisionError, "LLM client: failed to set SNI hostname");
            }
            (void)::SSL_set1_host(stream.native_handle(), url.host.c_str());
            boost::beast::get_lowest_layer(stream).expires_after(deadline);
            co_await boost::beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            boost::beast::get_lowest_layer(stream).expires_after(deadline);
            res = co_await exchange(stream, req);
            boost::system::error_code ec;
            stream.shutdown(ec);
        } else {
            boost::beast::tcp_stream stream(executor);
            stream.expires_after(deadline);
            co_await stream.async_connect(results, net::use_awaitable);
            stream.expires_after(deadline);
            res = co_await exchange(stream, req);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }

        const unsigned status = res.result_int();
        if (status < 200 || status >= 300) {
            std::string detail = res.body().substr(0, 512);
            throw HubError(ErrorCategory::DecisionError, std::format("LLM endpoint returned HTTP {}: {}", status, detail));
        }
        co_return res.body();
    }

    std::string post(const std::string& body) {
        net::io_context ioc;
        auto fut = net::co_spawn(ioc, coPost(body), net::use_future);
        ioc.run();
        return fut.get();
    }
};

LlmDecisionEngine::LlmDecisionEngine(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

LlmDecisionEngine::~LlmDecisionEngine() = default;

std::string LlmDecisionEngine::BuildPrompt(const std::string& query,
                                           const ToolCatalog& catalog,
                                           const std::optional<std::vector<ToolResult>>& priorResults) {
    std::ostringstream oss;
    if (priorResults.has_value()) {
        oss << "The following tools were executed to answer the user's query:\n";
        for (const auto& r : *priorResults) {
            oss << "- " << describeResult(r);
            if (!r.reasoning.empty()) {
                oss << " (reason: " << r.reasoning << ")";
            }
            oss << "\n";
        }
        oss << "\nUsing these results, give the user a natural language answer. Mention any tool that failed. "
               "Do not request further tools.\n\nUser query: " << query;
        return oss.str();
    }

    oss << "You are an AI assistant with access to the following tools:\n";
    for (const auto& t : catalog) {
        oss << "- " << t.name << ": " << (t.description.empty() ? std::string("No description") : t.description) << "\n";
    }
    oss << "\nWhen you need tools, respond only with a JSON object:\n"
           "{\"needs_tool\": true, \"tool_calls\": [{\"tool_name\": \"name_of_tool\", \"tool_args\": {}, "
           "\"reasoning\": \"why you need this tool\"}]}\n"
           "List the calls in the order they must run.\n"
           "If you don't need tools, answer the user directly in plain text.\n\nUser query: " << query;
    return oss.str();
}

JSONValue LlmDecisionEngine::BuildRequestBody(const std::vector<ChatMessage>& history, const std::string& prompt) {
    auto turn = [](const std::string& role, const std::string& text) {
        JSONValue::Array parts;
        parts.push_back(std::make_shared<JSONValue>(MakeObject({{"text", JSONValue(text)}})));
        return std::make_shared<JSONValue>(MakeObject({
            {"role", JSONValue(role)},
            {"parts", JSONValue(std::move(parts))},
        }));
    };
    JSONValue::Array contents;
    for (const auto& m : history) {
        if (m.content.empty()) continue;
        contents.push_back(turn(m.role == "assistant" || m.role == "model" ? "model" : "user", m.content));
    }
    contents.push_back(turn("user", prompt));
    return MakeObject({{"contents", JSONValue(std::move(contents))}});
}

std::optional<std::string> LlmDecisionEngine::ExtractText(const std::string& responseBody) {
    JSONValue doc;
    try {
        doc = ParseJSON(responseBody);
    } catch (const std::exception& e) {
        LOG_WARN("LLM response is not JSON: {}", e.what());
        return std::nullopt;
    }
    const JSONValue* candidates = doc.find("candidates");
    if (!candidates || !candidates->isArray()) {
        return std::nullopt;
    }
    const auto& arr = std::get<JSONValue::Array>(candidates->value);
    if (arr.empty() || !arr.front()) {
        return std::nullopt;
    }
    const JSONValue* content = arr.front()->find("content");
    const JSONValue* parts = content ? content->find("parts") : nullptr;
    if (!parts || !parts->isArray()) {
        return std::nullopt;
    }
    std::string text;
    for (const auto& p : std::get<JSONValue::Array>(parts->value)) {
        if (p) text += p->getString("text");
    }
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

Decision LlmDecisionEngine::ParseReply(const std::string& text) {
    auto obj = parseObjectLoose(text);
    if (!obj.has_value()) {
        return Decision::Answer(trim(text));
    }
    if (isTrue(obj->find("needs_tool"))) {
        std::vector<ToolCall> calls;
        const JSONValue* list = obj->find("tool_calls");
        if (list && list->isArray()) {
            for (const auto& item : std::get<JSONValue::Array>(list->value)) {
                if (!item) continue;
                if (auto call = toolCallFrom(*item)) {
                    calls.push_back(std::move(*call));
                }
            }
        } else if (auto call = toolCallFrom(*obj)) {
            calls.push_back(std::move(*call));
        }
        if (!calls.empty()) {
            return Decision::Tools(std::move(calls));
        }
        LOG_WARN("LLM asked for tools without a usable tool call; treating reply as an answer");
    }
    for (const char* key : {"content", "response", "answer"}) {
        std::string s = obj->getString(key);
        if (!s.empty()) {
            return Decision::Answer(std::move(s));
        }
    }
    return Decision::Answer(trim(text));
}

std::string LlmDecisionEngine::FallbackAnswer(const std::optional<std::vector<ToolResult>>& priorResults,
                                              const std::string& reason) {
    if (!priorResults.has_value() || priorResults->empty()) {
        return "I'm sorry, I could not consult the language model (" + reason + ").";
    }
    std::string out = "The language model is unavailable (" + reason + "). Raw tool results:";
    for (const auto& r : *priorResults) {
        out += "\n- " + describeResult(r);
    }
    return out;
}

Decision LlmDecisionEngine::Decide(const std::string& query,
                                   const ToolCatalog& catalog,
                                   const std::vector<ChatMessage>& history,
                                   const std::optional<std::vector<ToolResult>>& priorResults) {
    FUNC_SCOPE();
    if (pImpl->opts.apiKey.empty()) {
        LOG_ERROR("LLM API key is not configured (GEMINI_API_KEY / TOOLHUB_LLM_API_KEY)");
        return Decision::Answer(FallbackAnswer(priorResults, "no API key configured"));
    }
    const std::string body = SerializeJSON(BuildRequestBody(history, BuildPrompt(query, catalog, priorResults)));
    std::string responseBody;
    try {
        responseBody = pImpl->post(body);
    } catch (const std::exception& e) {
        LOG_ERROR("LLM request failed: {}", e.what());
        return Decision::Answer(FallbackAnswer(priorResults, e.what()));
    }
    auto text = ExtractText(responseBody);
    if (!text.has_value()) {
        LOG_ERROR("LLM response carried no candidate text");
        return Decision::Answer(FallbackAnswer(priorResults, "empty model response"));
    }
    LOG_DEBUG("LLM reply: {}", *text);
    Decision d = ParseReply(*text);
    if (d.needsTools) {
        LOG_INFO("LLM requested {} tool call(s)", d.toolCalls.size());
    }
    return d;
}

} // namespace toolhub

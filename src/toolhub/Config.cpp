//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: HubConfig parsing from environment and command line
//==========================================================================================================

#include <array>
#include <cctype>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhub/Config.h"

namespace toolhub {

namespace {

std::string toLower(const std::string& s) {
    std::string out; out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    return out;
}

bool parsePositiveMs(const std::string& key, const std::string& value, uint64_t& out) {
    auto v = ParseUint64(value);
    if (!v.has_value() || v.value() == 0u) {
        LOG_WARN("Config: invalid value for {}: '{}' (expected positive integer milliseconds); keeping {}", key, value, out);
        return false;
    }
    out = v.value();
    return true;
}

struct EnvBinding {
    const char* envName;
    const char* optionKey;
};

// Later entries win when several are set (TOOLHUB_LLM_API_KEY overrides GEMINI_API_KEY).
constexpr std::array<EnvBinding, 10> kEnvBindings{{
    {"TOOLHUB_REQUEST_TIMEOUT_MS", "request-timeout-ms"},
    {"TOOLHUB_TOOL_FAILURE_POLICY", "tool-failure-policy"},
    {"TOOLHUB_PROTOCOL_VERSION", "protocol-version"},
    {"TOOLHUB_LISTEN_ADDRESS", "listen-address"},
    {"TOOLHUB_LISTEN_PORT", "listen-port"},
    {"TOOLHUB_LLM_URL", "llm-url"},
    {"GEMINI_API_KEY", "llm-api-key"},
    {"TOOLHUB_LLM_API_KEY", "llm-api-key"},
    {"TOOLHUB_LLM_TIMEOUT_MS", "llm-timeout-ms"},
    {"TOOLHUB_LOG_LEVEL", "log-level"},
}};

} // namespace

std::optional<ToolFailurePolicy> ParseToolFailurePolicy(const std::string& text) {
    const std::string s = toLower(text);
    if (s == "continue") return ToolFailurePolicy::ContinueOnError;
    if (s == "failfast" || s == "fail-fast") return ToolFailurePolicy::FailFast;
    return std::nullopt;
}

const char* ToolFailurePolicyName(ToolFailurePolicy policy) {
    return policy == ToolFailurePolicy::FailFast ? "failfast" : "continue";
}

bool HubConfig::ApplyOption(const std::string& key, const std::string& value) {
    if (key == "request-timeout-ms") {
        return parsePositiveMs(key, value, requestTimeoutMs);
    }
    if (key == "llm-timeout-ms") {
        return parsePositiveMs(key, value, llmTimeoutMs);
    }
    if (key == "tool-failure-policy") {
        auto p = ParseToolFailurePolicy(value);
        if (!p) {
            LOG_WARN("Config: invalid tool failure policy '{}'; keeping {}", value, ToolFailurePolicyName(toolFailurePolicy));
            return false;
        }
        toolFailurePolicy = *p;
        return true;
    }
    if (key == "listen-port") {
        auto v = ParseUint64(value);
        if (!v.has_value() || v.value() > 65535u) {
            LOG_WARN("Config: invalid listen port '{}'; keeping {}", value, listenPort);
            return false;
        }
        listenPort = value;
        return true;
    }
    if (key == "protocol-version" || key == "listen-address" || key == "llm-url") {
        if (value.empty()) {
            LOG_WARN("Config: empty value for {} ignored", key);
            return false;
        }
        if (key == "protocol-version") protocolVersion = value;
        else if (key == "listen-address") listenAddress = value;
        else llmUrl = value;
        return true;
    }
    if (key == "llm-api-key") {
        llmApiKey = value;
        return true;
    }
    if (key == "log-level") {
        logLevel = value;
        return true;
    }
    LOG_WARN("Config: unknown option '{}'", key);
    return false;
}

void HubConfig::ApplyEnvironment() {
    for (const auto& binding : kEnvBindings) {
        const std::string v = GetEnvOrDefault(binding.envName, "");
        if (!v.empty()) {
            (void)ApplyOption(binding.optionKey, v);
        }
    }
}

void HubConfig::ApplyCommandLine(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind("--", 0) != 0) {
            continue;
        }
        auto eq = a.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        (void)ApplyOption(a.substr(2, eq - 2), a.substr(eq + 1));
    }
}

HubConfig HubConfig::Load(int argc, const char* const* argv) {
    HubConfig cfg;
    cfg.ApplyEnvironment();
    cfg.ApplyCommandLine(argc, argv);
    return cfg;
}

} // namespace toolhub

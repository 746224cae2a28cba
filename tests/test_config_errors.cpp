//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config_errors.cpp
// Purpose: HubConfig option parsing and error category mapping
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include "env/EnvVars.h"
#include "toolhub/Config.h"
#include "toolhub/errors/Errors.h"

using namespace toolhub;
using namespace toolhub::errors;

TEST(HubConfig, DefaultsMatchDocumentedValues) {
    HubConfig cfg;
    EXPECT_EQ(cfg.requestTimeoutMs, 30000u);
    EXPECT_EQ(cfg.requestTimeout(), std::chrono::milliseconds(30000));
    EXPECT_EQ(cfg.toolFailurePolicy, ToolFailurePolicy::ContinueOnError);
    EXPECT_EQ(cfg.protocolVersion, DEFAULT_PROTOCOL_VERSION);
    EXPECT_EQ(cfg.clientInfo().name, "backend-server");
    EXPECT_EQ(cfg.clientInfo().version, "1.0.0");
    EXPECT_EQ(cfg.listenPort, "8000");
}

TEST(HubConfig, CommandLineOverridesAndInvalidValuesKeepPrevious) {
    HubConfig cfg;
    const char* argv[] = {
        "toolhub_server",
        "--request-timeout-ms=500",
        "--tool-failure-policy=Fail-Fast",
        "--listen-port=99999",
        "--llm-timeout-ms=abc",
        "positional",
        "--flag-without-value",
    };
    cfg.ApplyCommandLine(static_cast<int>(sizeof(argv) / sizeof(argv[0])), argv);
    EXPECT_EQ(cfg.requestTimeoutMs, 500u);
    EXPECT_EQ(cfg.toolFailurePolicy, ToolFailurePolicy::FailFast);
    EXPECT_EQ(cfg.listenPort, "8000");
    EXPECT_EQ(cfg.llmTimeoutMs, 30000u);
}

TEST(HubConfig, ApplyOptionRejectsBadInput) {
    HubConfig cfg;
    EXPECT_FALSE(cfg.ApplyOption("request-timeout-ms", "0"));
    EXPECT_FALSE(cfg.ApplyOption("request-timeout-ms", "-5"));
    EXPECT_FALSE(cfg.ApplyOption("tool-failure-policy", "sometimes"));
    EXPECT_FALSE(cfg.ApplyOption("protocol-version", ""));
    EXPECT_FALSE(cfg.ApplyOption("no-such-option", "x"));
    EXPECT_EQ(cfg.requestTimeoutMs, 30000u);
    EXPECT_TRUE(cfg.ApplyOption("listen-port", "0"));
    EXPECT_EQ(cfg.listenPort, "0");
}

TEST(HubConfig, EnvironmentIsAppliedAndProjectKeyWins) {
    ::setenv("TOOLHUB_REQUEST_TIMEOUT_MS", "1234", 1);
    ::setenv("GEMINI_API_KEY", "generic-key", 1);
    ::setenv("TOOLHUB_LLM_API_KEY", "project-key", 1);
    HubConfig cfg;
    cfg.ApplyEnvironment();
    ::unsetenv("TOOLHUB_REQUEST_TIMEOUT_MS");
    ::unsetenv("GEMINI_API_KEY");
    ::unsetenv("TOOLHUB_LLM_API_KEY");
    EXPECT_EQ(cfg.requestTimeoutMs, 1234u);
    EXPECT_EQ(cfg.llmApiKey, "project-key");
}

TEST(ToolFailurePolicy, NamesRoundTrip) {
    EXPECT_EQ(ParseToolFailurePolicy(ToolFailurePolicyName(ToolFailurePolicy::FailFast)), ToolFailurePolicy::FailFast);
    EXPECT_EQ(ParseToolFailurePolicy("continue"), ToolFailurePolicy::ContinueOnError);
    EXPECT_FALSE(ParseToolFailurePolicy("").has_value());
}

TEST(EnvVars, ParseUint64IsStrict) {
    EXPECT_EQ(ParseUint64("42").value(), 42u);
    EXPECT_FALSE(ParseUint64("").has_value());
    EXPECT_FALSE(ParseUint64("4x").has_value());
    EXPECT_FALSE(ParseUint64("+4").has_value());
}

TEST(Errors, HttpStatusFollowsCategory) {
    EXPECT_EQ(httpStatusFor(ErrorCategory::ConnectionNotFound), 404);
    EXPECT_EQ(httpStatusFor(ErrorCategory::SessionNotReady), 400);
    EXPECT_EQ(httpStatusFor(ErrorCategory::RequestTimeout), 504);
    EXPECT_EQ(httpStatusFor(ErrorCategory::ToolExecutionError), 502);
    EXPECT_EQ(httpStatusFor(ErrorCategory::DecisionError), 500);
}

TEST(Errors, ProtocolErrorKeepsRemoteDetails) {
    JSONValue err = CreateErrorObject(-32000, "tool exploded", JSONValue("trace"));
    HubError e = protocolErrorFrom(err);
    EXPECT_EQ(e.category(), ErrorCategory::ToolProtocolError);
    EXPECT_STREQ(e.what(), "tool exploded");
    ASSERT_TRUE(e.rpcError().has_value());
    EXPECT_EQ(e.rpcError()->code, -32000);
    ASSERT_TRUE(e.rpcError()->data.has_value());

    HubError odd = protocolErrorFrom(MakeObject({{"unexpected", JSONValue(true)}}));
    EXPECT_EQ(odd.category(), ErrorCategory::ToolProtocolError);
    EXPECT_FALSE(odd.rpcError().has_value());
}

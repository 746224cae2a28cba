//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_hub_chat.cpp
// Purpose: End-to-end chat orchestration through the Hub against scripted providers
//==========================================================================================================

#include <gtest/gtest.h>
#include <future>
#include "support/HubRig.h"
#include "toolhub/ChatService.h"
#include "toolhub/errors/Errors.h"

using namespace toolhub;
using toolhub::test::CallResult;
using toolhub::test::FakeToolProvider;
using toolhub::test::HubRig;
using toolhub::test::MakeCall;
using toolhub::test::ProviderReply;
using errors::ErrorCategory;
using errors::HubError;

namespace {

std::string firstText(const JSONValue& content) {
    if (!content.isArray()) return std::string();
    const auto& arr = std::get<JSONValue::Array>(content.value);
    return arr.empty() ? std::string() : arr.front()->getString("text");
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void failOnName(FakeToolProvider& p, const std::string& failing) {
    p.On(Methods::CallTool, [failing](const JSONRPCRequest& req) {
        std::string name = req.params->getString("name");
        if (name == failing) {
            return ProviderReply::Error(JSONRPCErrorCodes::InternalError, "tool crashed");
        }
        return ProviderReply::Result(CallResult("ok:" + name));
    });
}

} // namespace

using HubChat = HubRig;

TEST_F(HubChat, DirectAnswerWithoutTools) {
    connect("alice", {"echo"});
    engine.Push(Decision::Answer("Hello there"));

    ChatResult result = hub->Chat("alice", "hi", {});
    EXPECT_EQ(result.answer, "Hello there");
    EXPECT_TRUE(result.toolsUsed.empty());
    EXPECT_TRUE(result.toolResults.empty());
    EXPECT_TRUE(result.failedTools.empty());

    auto calls = engine.Calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].query, "hi");
    EXPECT_EQ(calls[0].catalogSize, 1u);
    EXPECT_FALSE(calls[0].priorResults.has_value());
}

TEST_F(HubChat, SingleToolCallThenSynthesis) {
    connect("alice", {"echo"});
    engine.Push(Decision::Tools({MakeCall("echo", "need an echo")}));
    engine.Push(Decision::Answer("The echo said ok"));

    std::vector<ChatMessage> history{{"user", "earlier"}, {"assistant", "reply"}};
    ChatResult result = hub->Chat("alice", "echo please", history);
    EXPECT_EQ(result.answer, "The echo said ok");
    ASSERT_EQ(result.toolsUsed, std::vector<std::string>{"echo"});
    ASSERT_EQ(result.toolResults.size(), 1u);
    EXPECT_FALSE(result.toolResults[0].failed());
    EXPECT_EQ(firstText(result.toolResults[0].result), "ok:echo");
    EXPECT_EQ(result.toolResults[0].reasoning, "need an echo");
    EXPECT_TRUE(result.failedTools.empty());

    auto calls = engine.Calls();
    ASSERT_EQ(calls.size(), 2u);
    ASSERT_TRUE(calls[1].priorResults.has_value());
    EXPECT_EQ(calls[1].priorResults->size(), 1u);
    // The synthesis history extends the caller's history with the reasoning and the tool outcome.
    ASSERT_EQ(calls[1].history.size(), 4u);
    EXPECT_EQ(calls[1].history[0].content, "earlier");
    EXPECT_EQ(calls[1].history[2].role, "assistant");
    EXPECT_EQ(calls[1].history[2].content, "need an echo");
    EXPECT_EQ(calls[1].history[3].role, "system");
    EXPECT_TRUE(contains(calls[1].history[3].content, "echo"));

    auto sent = providers.front()->Requests(Methods::CallTool);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].params->getString("name"), "echo");
}

TEST_F(HubChat, ContinueOnErrorRecordsFailureAndRunsRemainingCalls) {
    connect("alice", {"good", "bad"}, [](FakeToolProvider& p) { failOnName(p, "bad"); });
    engine.Push(Decision::Tools({MakeCall("bad"), MakeCall("good")}));
    engine.Push(Decision::Answer("partial answer"));

    ChatResult result = hub->Chat("alice", "do both", {});
    EXPECT_EQ(result.answer, "partial answer");
    EXPECT_EQ(result.toolsUsed, (std::vector<std::string>{"bad", "good"}));
    EXPECT_EQ(result.failedTools, std::vector<std::string>{"bad"});
    ASSERT_EQ(result.toolResults.size(), 2u);
    ASSERT_TRUE(result.toolResults[0].failed());
    EXPECT_TRUE(contains(result.toolResults[0].error.value(), "tool crashed"));
    EXPECT_FALSE(result.toolResults[1].failed());
    EXPECT_EQ(firstText(result.toolResults[1].result), "ok:good");
}

TEST_F(HubChat, FailFastAbortsOnFirstFailure) {
    config.toolFailurePolicy = ToolFailurePolicy::FailFast;
    connect("alice", {"good", "bad"}, [](FakeToolProvider& p) { failOnName(p, "bad"); });
    engine.Push(Decision::Tools({MakeCall("bad"), MakeCall("good")}));

    try {
        hub->Chat("alice", "do both", {});
        FAIL() << "expected ToolExecutionError";
    } catch (const HubError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::ToolExecutionError);
        EXPECT_TRUE(contains(e.what(), "bad"));
    }
    EXPECT_EQ(providers.front()->Requests(Methods::CallTool).size(), 1u);
    EXPECT_EQ(engine.Calls().size(), 1u);
}

TEST_F(HubChat, ToolReportedErrorCountsAsFailure) {
    connect("alice", {"flaky"}, [](FakeToolProvider& p) {
        p.On(Methods::CallTool, [](const JSONRPCRequest&) {
            return ProviderReply::Result(CallResult("disk full", true));
        });
    });
    engine.Push(Decision::Tools({MakeCall("flaky")}));
    engine.Push(Decision::Answer("sorry"));

    ChatResult result = hub->Chat("alice", "go", {});
    EXPECT_EQ(result.failedTools, std::vector<std::string>{"flaky"});
    ASSERT_EQ(result.toolResults.size(), 1u);
    EXPECT_EQ(result.toolResults[0].error.value(), "disk full");
}

TEST_F(HubChat, UnadvertisedToolIsStillSentAndProviderErrorRecorded) {
    connect("alice", {"echo"}, [](FakeToolProvider& p) {
        p.On(Methods::CallTool, [](const JSONRPCRequest& req) {
            std::string name = req.params->getString("name");
            if (name != "echo") {
                return ProviderReply::Error(JSONRPCErrorCodes::InvalidParams, "Unknown tool: " + name);
            }
            return ProviderReply::Result(CallResult("ok:echo"));
        });
    });
    engine.Push(Decision::Tools({MakeCall("missing")}));
    engine.Push(Decision::Answer("could not"));

    ChatResult result = hub->Chat("alice", "go", {});
    EXPECT_EQ(result.failedTools, std::vector<std::string>{"missing"});
    ASSERT_EQ(result.toolResults.size(), 1u);
    EXPECT_TRUE(contains(result.toolResults[0].error.value(), "Unknown tool: missing"));
    auto sent = providers.front()->Requests(Methods::CallTool);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].params->getString("name"), "missing");
}

TEST_F(HubChat, SynthesisAskingForMoreToolsFallsBackToSummary) {
    connect("alice", {"echo"});
    engine.Push(Decision::Tools({MakeCall("echo")}));
    engine.Push(Decision::Tools({MakeCall("echo")}));

    ChatResult result = hub->Chat("alice", "go", {});
    EXPECT_EQ(result.answer, ChatService::SummarizeResults(result.toolResults));
    EXPECT_TRUE(contains(result.answer, "echo"));
    EXPECT_EQ(providers.front()->Requests(Methods::CallTool).size(), 1u);
}

TEST_F(HubChat, DecisionEngineFailureIsDecisionError) {
    connect("alice", {"echo"});
    engine.FailNext("quota exceeded");
    try {
        hub->Chat("alice", "go", {});
        FAIL() << "expected DecisionError";
    } catch (const HubError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::DecisionError);
        EXPECT_EQ(std::string(e.what()), "LLM error: quota exceeded");
    }
}

TEST_F(HubChat, UnknownIdentityIsConnectionNotFound) {
    hubRef();
    try {
        hub->Chat("nobody", "go", {});
        FAIL() << "expected ConnectionNotFound";
    } catch (const HubError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::ConnectionNotFound);
        EXPECT_TRUE(contains(e.what(), "nobody"));
    }
    EXPECT_TRUE(engine.Calls().empty());
}

TEST_F(HubChat, ChatBeforeHandshakeCompletesIsSessionNotReady) {
    connect("alice", {"echo"}, [](FakeToolProvider& p) {
        p.On(Methods::Initialize, [](const JSONRPCRequest&) { return ProviderReply::None(); });
    }, false);
    ASSERT_TRUE(providers.front()->WaitFor(Methods::Initialize, 1));
    try {
        hub->Chat("alice", "go", {});
        FAIL() << "expected SessionNotReady";
    } catch (const HubError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::SessionNotReady);
    }
    auto status = hub->GetConnectionStatus("alice");
    ASSERT_TRUE(status.has_value());
    EXPECT_FALSE(status->ready);
}

TEST_F(HubChat, ToolCallTimeoutIsRecordedAsFailure) {
    config.requestTimeoutMs = 150;
    connect("alice", {"slow"}, [](FakeToolProvider& p) {
        p.On(Methods::CallTool, [](const JSONRPCRequest&) { return ProviderReply::None(); });
    });
    engine.Push(Decision::Tools({MakeCall("slow")}));
    engine.Push(Decision::Answer("timed out"));

    ChatResult result = hub->Chat("alice", "go", {});
    EXPECT_EQ(result.failedTools, std::vector<std::string>{"slow"});
    EXPECT_TRUE(contains(result.toolResults[0].error.value(), "RequestTimeout"));
    EXPECT_TRUE(hub->GetConnectionStatus("alice").has_value());
}

TEST_F(HubChat, ProviderDisconnectDuringCallFailsItPromptly) {
    FakeToolProvider& provider = connect("alice", {"slow"}, [](FakeToolProvider& p) {
        p.On(Methods::CallTool, [](const JSONRPCRequest&) { return ProviderReply::None(); });
    });
    engine.Push(Decision::Tools({MakeCall("slow")}));
    engine.Push(Decision::Answer("provider left"));

    auto chat = std::async(std::launch::async, [this]() { return hub->Chat("alice", "go", {}); });
    ASSERT_TRUE(provider.WaitFor(Methods::CallTool, 1));
    provider.Stop();

    ASSERT_EQ(chat.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ChatResult result = chat.get();
    EXPECT_EQ(result.failedTools, std::vector<std::string>{"slow"});
    EXPECT_TRUE(contains(result.toolResults[0].error.value(), "Disconnected"));
    EXPECT_TRUE(eventually([this]() { return !hub->GetConnectionStatus("alice").has_value(); }));
}

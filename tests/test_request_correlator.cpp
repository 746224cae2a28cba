//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_request_correlator.cpp
// Purpose: Request/response matching, deadlines, remote errors and disconnect rejection
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include "support/FakeToolProvider.h"
#include "toolhub/RequestCorrelator.h"
#include "toolhub/errors/Errors.h"

using namespace toolhub;
using toolhub::test::CallResult;
using toolhub::test::FakeToolProvider;
using toolhub::test::ProviderReply;
using errors::ErrorCategory;
using errors::HubError;

namespace {

JSONValue callParams(const std::string& name) {
    return MakeObject({{"name", JSONValue(name)}, {"arguments", JSONValue(JSONValue::Object{})}});
}

std::string firstText(const JSONValue& result) {
    const JSONValue* content = result.find("content");
    if (!content || !content->isArray()) return std::string();
    const auto& arr = std::get<JSONValue::Array>(content->value);
    return arr.empty() ? std::string() : arr.front()->getString("text");
}

ErrorCategory categoryOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const HubError& e) {
        return e.category();
    }
    ADD_FAILURE() << "expected HubError";
    return ErrorCategory::DecodeError;
}

class RequestCorrelatorTest : public ::testing::Test {
protected:
    void start(std::chrono::milliseconds timeout) {
        auto pair = InMemoryTransport::CreatePair();
        hubSide = std::move(pair.first);
        hubSide->Start().get();
        provider = std::make_unique<FakeToolProvider>(std::move(pair.second));
        correlator = std::make_unique<RequestCorrelator>(*hubSide, timeout);
        // Routes responses to the correlator the way the inbound dispatcher does.
        pump = std::thread([this]() {
            while (auto frame = hubSide->ReadFrame()) {
                auto msg = DecodeInboundMessage(*frame);
                if (!msg) continue;
                if (auto* ok = std::get_if<SuccessResponse>(&*msg)) {
                    lastHandled = correlator->HandleResponse(ok->response);
                } else if (auto* err = std::get_if<ErrorResponse>(&*msg)) {
                    lastHandled = correlator->HandleResponse(err->response);
                }
                ++handled;
            }
        });
    }

    void TearDown() override {
        if (hubSide) hubSide->Close().get();
        if (pump.joinable()) pump.join();
        correlator.reset();
        provider.reset();
    }

    std::unique_ptr<InMemoryTransport> hubSide;
    std::unique_ptr<FakeToolProvider> provider;
    std::unique_ptr<RequestCorrelator> correlator;
    std::thread pump;
    std::atomic<int> handled{0};
    std::atomic<bool> lastHandled{false};
};

// Accepts every write but never completes it, like a peer that stopped reading.
class StalledTransport : public ITransport {
public:
    std::future<void> Start() override {
        std::promise<void> p;
        p.set_value();
        return p.get_future();
    }
    std::future<void> Close() override { return Start(); }
    bool IsConnected() const override { return true; }
    std::string GetSessionId() const override { return "stalled"; }
    std::future<void> Send(std::string) override {
        std::lock_guard<std::mutex> lock(mutex);
        writes.emplace_back();
        return writes.back().get_future();
    }
    std::optional<std::string> ReadFrame() override { return std::nullopt; }

private:
    std::mutex mutex;
    std::deque<std::promise<void>> writes;
};

} // namespace

TEST_F(RequestCorrelatorTest, ResultIsReturnedToCaller) {
    start(std::chrono::milliseconds(2000));
    provider->Start();
    JSONValue result = correlator->Send(Methods::CallTool, callParams("echo"));
    EXPECT_EQ(firstText(result), "ok:echo");
    EXPECT_EQ(correlator->PendingCount(), 0u);
}

TEST_F(RequestCorrelatorTest, OutOfOrderResponsesReachTheirCallers) {
    start(std::chrono::milliseconds(5000));
    provider->On(Methods::CallTool, [](const JSONRPCRequest&) { return ProviderReply::None(); });
    provider->Start();

    auto a = std::async(std::launch::async, [this]() { return correlator->Send(Methods::CallTool, callParams("a")); });
    auto b = std::async(std::launch::async, [this]() { return correlator->Send(Methods::CallTool, callParams("b")); });
    ASSERT_TRUE(provider->WaitFor(Methods::CallTool, 2));
    EXPECT_EQ(correlator->PendingCount(), 2u);

    auto held = provider->Held();
    ASSERT_EQ(held.size(), 2u);
    // Answer in reverse arrival order; each reply echoes the tool name it was asked for.
    for (auto it = held.rbegin(); it != held.rend(); ++it) {
        provider->Reply(it->id, CallResult("reply:" + it->params->getString("name")));
    }
    EXPECT_EQ(firstText(a.get()), "reply:a");
    EXPECT_EQ(firstText(b.get()), "reply:b");
    EXPECT_EQ(correlator->PendingCount(), 0u);
}

TEST_F(RequestCorrelatorTest, CorrelationIdsAreUniqueAcrossRequests) {
    start(std::chrono::milliseconds(5000));
    provider->On(Methods::CallTool, [](const JSONRPCRequest&) { return ProviderReply::None(); });
    provider->Start();

    std::vector<std::future<JSONValue>> calls;
    for (int i = 0; i < 5; ++i) {
        calls.push_back(std::async(std::launch::async, [this, i]() {
            return correlator->Send(Methods::CallTool, callParams("t" + std::to_string(i)));
        }));
    }
    ASSERT_TRUE(provider->WaitFor(Methods::CallTool, 5));
    std::set<std::string> ids;
    for (const auto& r : provider->Held()) {
        ids.insert(IdToString(r.id));
    }
    EXPECT_EQ(ids.size(), 5u);
    for (const auto& r : provider->Held()) {
        provider->Reply(r.id, CallResult("x"));
    }
    for (auto& c : calls) {
        EXPECT_EQ(firstText(c.get()), "x");
    }
}

TEST_F(RequestCorrelatorTest, TimeoutLeavesNoResidueAndLateResponseIsDiscarded) {
    start(std::chrono::milliseconds(50));
    provider->On(Methods::CallTool, [](const JSONRPCRequest&) { return ProviderReply::None(); });
    provider->Start();

    EXPECT_EQ(categoryOf([this]() { correlator->Send(Methods::CallTool, callParams("slow")); }),
              ErrorCategory::RequestTimeout);
    EXPECT_EQ(correlator->PendingCount(), 0u);

    ASSERT_TRUE(provider->WaitFor(Methods::CallTool, 1));
    auto held = provider->Held();
    ASSERT_EQ(held.size(), 1u);
    provider->Reply(held.front().id, CallResult("too late"));
    for (int i = 0; i < 200 && handled.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(handled.load(), 1);
    EXPECT_FALSE(lastHandled.load());
    EXPECT_EQ(correlator->PendingCount(), 0u);
}

TEST_F(RequestCorrelatorTest, RemoteErrorBecomesProtocolError) {
    start(std::chrono::milliseconds(2000));
    provider->On(Methods::CallTool, [](const JSONRPCRequest&) {
        return ProviderReply::Error(JSONRPCErrorCodes::InvalidParams, "bad arguments");
    });
    provider->Start();
    try {
        correlator->Send(Methods::CallTool, callParams("x"));
        FAIL() << "expected a protocol error";
    } catch (const HubError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::ToolProtocolError);
        ASSERT_TRUE(e.rpcError().has_value());
        EXPECT_EQ(e.rpcError()->code, JSONRPCErrorCodes::InvalidParams);
        EXPECT_EQ(e.rpcError()->message, "bad arguments");
    }
    EXPECT_EQ(correlator->PendingCount(), 0u);
}

TEST_F(RequestCorrelatorTest, RejectAllFailsEveryWaiterAndRefusesLaterSends) {
    start(std::chrono::milliseconds(5000));
    provider->On(Methods::CallTool, [](const JSONRPCRequest&) { return ProviderReply::None(); });
    provider->Start();

    constexpr std::size_t kWaiters = 4;
    std::vector<std::future<ErrorCategory>> waiting;
    for (std::size_t i = 0; i < kWaiters; ++i) {
        waiting.push_back(std::async(std::launch::async, [this, i]() {
            return categoryOf([this, i]() { correlator->Send(Methods::CallTool, callParams("t" + std::to_string(i))); });
        }));
    }
    ASSERT_TRUE(provider->WaitFor(Methods::CallTool, kWaiters));
    EXPECT_EQ(correlator->PendingCount(), kWaiters);
    EXPECT_EQ(correlator->RejectAll("peer went away"), kWaiters);
    for (auto& w : waiting) {
        ASSERT_EQ(w.wait_for(std::chrono::seconds(2)), std::future_status::ready);
        EXPECT_EQ(w.get(), ErrorCategory::Disconnected);
    }
    EXPECT_EQ(correlator->PendingCount(), 0u);

    EXPECT_EQ(categoryOf([this]() { correlator->Send(Methods::CallTool, callParams("y")); }),
              ErrorCategory::Disconnected);
}

TEST_F(RequestCorrelatorTest, WriteFailureIsTransportError) {
    start(std::chrono::milliseconds(2000));
    hubSide->Close().get();
    EXPECT_EQ(categoryOf([this]() { correlator->Send(Methods::ListTools); }), ErrorCategory::TransportError);
    EXPECT_EQ(correlator->PendingCount(), 0u);
    EXPECT_EQ(categoryOf([this]() { correlator->Notify(Methods::Initialized); }), ErrorCategory::TransportError);
}

TEST_F(RequestCorrelatorTest, ConcurrentSendsEachGetTheirOwnResult) {
    start(std::chrono::milliseconds(5000));
    provider->Start();
    std::vector<std::future<std::string>> calls;
    for (int i = 0; i < 16; ++i) {
        calls.push_back(std::async(std::launch::async, [this, i]() {
            return firstText(correlator->Send(Methods::CallTool, callParams("tool" + std::to_string(i))));
        }));
    }
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(calls[static_cast<std::size_t>(i)].get(), "ok:tool" + std::to_string(i));
    }
    EXPECT_EQ(correlator->PendingCount(), 0u);
}

TEST(RequestCorrelatorStalledWrite, DeadlineStillAppliesWhileWriteIsStuck) {
    StalledTransport transport;
    RequestCorrelator correlator(transport, std::chrono::milliseconds(100));

    auto call = std::async(std::launch::async, [&correlator]() {
        return categoryOf([&correlator]() { correlator.Send(Methods::CallTool, callParams("x")); });
    });
    ASSERT_EQ(call.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(call.get(), ErrorCategory::RequestTimeout);
    EXPECT_EQ(correlator.PendingCount(), 0u);
}

TEST(RequestCorrelatorStalledWrite, RejectAllReleasesCallerBlockedOnWrite) {
    StalledTransport transport;
    RequestCorrelator correlator(transport, std::chrono::milliseconds(30000));

    auto call = std::async(std::launch::async, [&correlator]() {
        return categoryOf([&correlator]() { correlator.Send(Methods::CallTool, callParams("x")); });
    });
    for (int i = 0; i < 200 && correlator.PendingCount() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(correlator.PendingCount(), 1u);
    EXPECT_EQ(correlator.RejectAll("provider stopped reading"), 1u);
    ASSERT_EQ(call.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    EXPECT_EQ(call.get(), ErrorCategory::Disconnected);
}

TEST(RequestCorrelatorStalledWrite, NotifyGivesUpAfterTimeout) {
    StalledTransport transport;
    RequestCorrelator correlator(transport, std::chrono::milliseconds(100));
    auto note = std::async(std::launch::async, [&correlator]() {
        return categoryOf([&correlator]() { correlator.Notify(Methods::Initialized); });
    });
    ASSERT_EQ(note.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(note.get(), ErrorCategory::TransportError);
}

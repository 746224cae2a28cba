//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_one_shot_slot.cpp
// Purpose: OneShotSlot single-completion semantics and frame queue draining
//==========================================================================================================

#include <gtest/gtest.h>
#include <thread>
#include "toolhub/async/FrameQueue.h"
#include "toolhub/async/OneShotSlot.h"

using namespace toolhub;
using namespace std::chrono_literals;

TEST(OneShotSlot, FirstCompletionWins) {
    async::OneShotSlot<int> slot;
    EXPECT_TRUE(slot.resolve(1));
    EXPECT_FALSE(slot.resolve(2));
    EXPECT_FALSE(slot.reject(std::make_exception_ptr(std::runtime_error("late"))));
    EXPECT_EQ(slot.waitUntil(std::chrono::steady_clock::now()), async::SlotState::Resolved);
    EXPECT_EQ(slot.take(), 1);
}

TEST(OneShotSlot, RejectedSlotRethrows) {
    async::OneShotSlot<int> slot;
    EXPECT_TRUE(slot.reject(std::make_exception_ptr(std::runtime_error("boom"))));
    EXPECT_EQ(slot.current(), async::SlotState::Rejected);
    EXPECT_THROW(slot.take(), std::runtime_error);
}

TEST(OneShotSlot, ExpiredSlotRefusesLateResolution) {
    async::OneShotSlot<int> slot;
    EXPECT_EQ(slot.waitUntil(std::chrono::steady_clock::now() + 20ms), async::SlotState::Expired);
    EXPECT_FALSE(slot.resolve(5));
    EXPECT_EQ(slot.current(), async::SlotState::Expired);
}

TEST(OneShotSlot, WaiterWakesOnResolveFromAnotherThread) {
    async::OneShotSlot<std::string> slot;
    std::thread t([&slot]() {
        std::this_thread::sleep_for(10ms);
        slot.resolve("done");
    });
    EXPECT_EQ(slot.waitUntil(std::chrono::steady_clock::now() + 2s), async::SlotState::Resolved);
    EXPECT_EQ(slot.take(), "done");
    t.join();
}

TEST(FrameQueue, DrainsQueuedFramesAfterClose) {
    async::FrameQueue q;
    EXPECT_TRUE(q.push("a"));
    EXPECT_TRUE(q.push("b"));
    q.close();
    EXPECT_FALSE(q.push("c"));
    EXPECT_EQ(q.pop().value(), "a");
    EXPECT_EQ(q.pop().value(), "b");
    EXPECT_FALSE(q.pop().has_value());
}

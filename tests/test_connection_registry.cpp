//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_connection_registry.cpp
// Purpose: ConnectionRegistry registration, replacement and identity-guarded updates
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhub/ConnectionRegistry.h"
#include "toolhub/InMemoryTransport.hpp"

using namespace toolhub;

namespace {

std::unique_ptr<ITransport> makeTransport() {
    auto pair = InMemoryTransport::CreatePair();
    return std::move(pair.first);
}

const std::chrono::milliseconds kTimeout{1000};

} // namespace

TEST(ConnectionRegistry, RegisterCreatesNotReadyEmptyEntry) {
    ConnectionRegistry registry;
    auto reg = registry.Register("alice", makeTransport(), kTimeout);
    ASSERT_NE(reg.connection, nullptr);
    EXPECT_EQ(reg.displaced, nullptr);
    EXPECT_EQ(registry.Lookup("alice"), reg.connection);
    EXPECT_FALSE(reg.connection->IsReady());
    EXPECT_TRUE(reg.connection->Catalog().empty());
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(ConnectionRegistry, ReRegisterDisplacesPreviousEntry) {
    ConnectionRegistry registry;
    auto first = registry.Register("alice", makeTransport(), kTimeout);
    ASSERT_TRUE(registry.SetToolCatalog("alice", ToolCatalog{ToolDescriptor("echo", "Echo")}));
    ASSERT_TRUE(registry.MarkReady("alice"));

    auto second = registry.Register("alice", makeTransport(), kTimeout);
    EXPECT_EQ(second.displaced, first.connection);
    EXPECT_EQ(registry.Lookup("alice"), second.connection);
    EXPECT_FALSE(second.connection->IsReady());
    EXPECT_TRUE(second.connection->Catalog().empty());
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(ConnectionRegistry, UpdatesOnUnknownIdentityCreateNothing) {
    ConnectionRegistry registry;
    EXPECT_FALSE(registry.SetToolCatalog("ghost", ToolCatalog{ToolDescriptor("echo", "Echo")}));
    EXPECT_FALSE(registry.MarkReady("ghost"));
    EXPECT_EQ(registry.Lookup("ghost"), nullptr);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ConnectionRegistry, GuardedUpdatesIgnoreSupersededConnection) {
    ConnectionRegistry registry;
    auto first = registry.Register("alice", makeTransport(), kTimeout);
    auto second = registry.Register("alice", makeTransport(), kTimeout);

    EXPECT_FALSE(registry.SetToolCatalog("alice", ToolCatalog{ToolDescriptor("old", "")}, first.connection.get()));
    EXPECT_FALSE(registry.MarkReady("alice", first.connection.get()));
    EXPECT_EQ(registry.Unregister("alice", first.connection.get()), nullptr);
    EXPECT_EQ(registry.Lookup("alice"), second.connection);
    EXPECT_FALSE(second.connection->IsReady());

    EXPECT_EQ(registry.Unregister("alice", second.connection.get()), second.connection);
    EXPECT_EQ(registry.Lookup("alice"), nullptr);
}

TEST(ConnectionRegistry, UnregisterAbsentIsNoOp) {
    ConnectionRegistry registry;
    EXPECT_EQ(registry.Unregister("nobody"), nullptr);
    registry.Register("bob", makeTransport(), kTimeout);
    EXPECT_NE(registry.Unregister("bob"), nullptr);
    EXPECT_EQ(registry.Unregister("bob"), nullptr);
}

TEST(ConnectionRegistry, SnapshotReportsReadinessAndToolCount) {
    ConnectionRegistry registry;
    registry.Register("b", makeTransport(), kTimeout);
    registry.Register("a", makeTransport(), kTimeout);
    registry.SetToolCatalog("a", ToolCatalog{ToolDescriptor("t1", ""), ToolDescriptor("t2", "")});
    registry.MarkReady("a");

    auto snap = registry.Snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap.begin()->first, "a");
    EXPECT_TRUE(snap["a"].ready);
    EXPECT_EQ(snap["a"].toolCount, 2u);
    EXPECT_FALSE(snap["b"].ready);
    EXPECT_EQ(snap["b"].toolCount, 0u);

    auto cleared = registry.Clear();
    EXPECT_EQ(cleared.size(), 2u);
    EXPECT_EQ(registry.Size(), 0u);
}

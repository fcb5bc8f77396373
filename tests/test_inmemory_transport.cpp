//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_transport.cpp
// Purpose: Tests for the paired in-memory transport and its acceptor
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "mcplink/InMemoryTransport.hpp"
#include "mcplink/errors/Errors.h"

using namespace mcplink;

TEST(InMemoryTransport, DeliversFramesInOrderBothWays) {
    auto [left, right] = InMemoryTransport::CreatePair();
    ASSERT_NO_THROW(left->Start().get());
    ASSERT_NO_THROW(right->Start().get());
    EXPECT_TRUE(left->IsConnected());
    EXPECT_NE(left->GetSessionId(), right->GetSessionId());

    left->Send("one");
    left->Send("two");
    right->Send("back");
    EXPECT_EQ(right->Receive(), "one");
    EXPECT_EQ(right->Receive(), "two");
    EXPECT_EQ(left->Receive(), "back");
}

TEST(InMemoryTransport, ReceiveBlocksUntilFrameArrives) {
    auto [left, right] = InMemoryTransport::CreatePair();
    left->Start().get();
    right->Start().get();

    auto pending = std::async(std::launch::async, [&r = right]() { return r->Receive(); });
    EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);
    left->Send("late");
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(pending.get(), "late");
}

TEST(InMemoryTransport, PeerCloseDrainsQueuedFramesThenFails) {
    auto [left, right] = InMemoryTransport::CreatePair();
    left->Start().get();
    right->Start().get();

    left->Send("last words");
    left->Close().get();
    EXPECT_FALSE(right->IsConnected());
    EXPECT_EQ(right->Receive(), "last words");
    EXPECT_THROW(right->Receive(), errors::TransportError);
    EXPECT_THROW(right->Send("x"), errors::TransportError);
}

TEST(InMemoryTransport, LocalCloseWakesBlockedReceiver) {
    auto [left, right] = InMemoryTransport::CreatePair();
    left->Start().get();
    right->Start().get();

    auto pending = std::async(std::launch::async, [&l = left]() {
        try {
            (void)l->Receive();
            return false;
        } catch (const errors::TransportError&) {
            return true;
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    left->Close().get();
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(pending.get());
    // Close is idempotent
    EXPECT_NO_THROW(left->Close().get());
}

TEST(InMemoryTransport, StartAfterCloseFails) {
    auto [left, right] = InMemoryTransport::CreatePair();
    left->Close().get();
    EXPECT_THROW(left->Start().get(), errors::TransportError);
}

TEST(InMemoryAcceptor, ConnectHandsServerEndToAcceptPeer) {
    InMemoryAcceptor acceptor;
    acceptor.Start().get();

    auto client = acceptor.Connect();
    ASSERT_NE(client, nullptr);
    client->Start().get();
    auto server = acceptor.AcceptPeer();
    ASSERT_NE(server, nullptr);
    EXPECT_TRUE(server->IsConnected());

    client->Send("hello");
    EXPECT_EQ(server->Receive(), "hello");
    server->Send("world");
    EXPECT_EQ(client->Receive(), "world");
}

TEST(InMemoryAcceptor, ProviderYieldsFreshTransports) {
    InMemoryAcceptor acceptor;
    acceptor.Start().get();
    TransportProvider provider = acceptor.MakeProvider();

    auto first = provider();
    auto second = provider();
    EXPECT_NE(first->GetSessionId(), second->GetSessionId());
    auto a = acceptor.AcceptPeer();
    auto b = acceptor.AcceptPeer();
    EXPECT_NE(a->GetSessionId(), b->GetSessionId());
}

TEST(InMemoryAcceptor, StopUnblocksAcceptAndRefusesConnect) {
    InMemoryAcceptor acceptor;
    acceptor.Start().get();

    auto pending = std::async(std::launch::async, [&acceptor]() {
        try {
            (void)acceptor.AcceptPeer();
            return false;
        } catch (const errors::TransportError&) {
            return true;
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    acceptor.Stop().get();
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(pending.get());
    EXPECT_THROW((void)acceptor.Connect(), errors::TransportError);
}

TEST(InMemoryAcceptor, StopClosesPeersNeverAccepted) {
    InMemoryAcceptor acceptor;
    acceptor.Start().get();
    auto client = acceptor.Connect();
    client->Start().get();
    acceptor.Stop().get();
    EXPECT_FALSE(client->IsConnected());
    EXPECT_THROW(client->Receive(), errors::TransportError);
}

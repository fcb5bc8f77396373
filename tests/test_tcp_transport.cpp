//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tcp_transport.cpp
// Purpose: Loopback tests for the TCP transport and acceptor
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "mcplink/TcpTransport.hpp"
#include "mcplink/errors/Errors.h"

using namespace mcplink;

namespace {

std::unique_ptr<TcpAcceptor> startAcceptor() {
    TcpAcceptor::Options opts;
    opts.address = "127.0.0.1";
    opts.port = "0";
    auto acceptor = std::make_unique<TcpAcceptor>(opts);
    acceptor->Start().get();
    return acceptor;
}

std::unique_ptr<TcpTransport> clientFor(const TcpAcceptor& acceptor) {
    TcpTransport::Options opts;
    opts.host = "127.0.0.1";
    opts.port = std::to_string(acceptor.GetBoundPort());
    opts.connectTimeout = std::chrono::milliseconds(2000);
    return std::make_unique<TcpTransport>(opts);
}

} // namespace

TEST(TcpTransport, LoopbackRoundTrip) {
    auto acceptor = startAcceptor();
    ASSERT_NE(acceptor->GetBoundPort(), 0);

    auto client = clientFor(*acceptor);
    auto started = client->Start();
    ASSERT_EQ(started.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_NO_THROW(started.get());
    EXPECT_TRUE(client->IsConnected());

    auto server = acceptor->AcceptPeer();
    ASSERT_NE(server, nullptr);
    EXPECT_TRUE(server->IsConnected());

    client->Send(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(server->Receive(), R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    server->Send(R"({"jsonrpc":"2.0","id":1,"result":{}})");
    EXPECT_EQ(client->Receive(), R"({"jsonrpc":"2.0","id":1,"result":{}})");

    client->Close().get();
    server->Close().get();
    acceptor->Stop().get();
}

TEST(TcpTransport, ManyFramesArriveInOrder) {
    auto acceptor = startAcceptor();
    auto client = clientFor(*acceptor);
    client->Start().get();
    auto server = acceptor->AcceptPeer();

    for (int i = 0; i < 50; ++i) {
        client->Send("[" + std::to_string(i) + "]");
    }
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(server->Receive(), "[" + std::to_string(i) + "]");
    }
}

TEST(TcpTransport, PeerCloseFailsReceive) {
    auto acceptor = startAcceptor();
    auto client = clientFor(*acceptor);
    client->Start().get();
    auto server = acceptor->AcceptPeer();

    server->Close().get();
    auto pending = std::async(std::launch::async, [&client]() {
        try {
            (void)client->Receive();
            return false;
        } catch (const errors::TransportError&) {
            return true;
        }
    });
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(pending.get());
    EXPECT_FALSE(client->IsConnected());
    EXPECT_THROW(client->Send("{}"), errors::TransportError);
}

TEST(TcpTransport, ConnectRefusedFailsStart) {
    std::string port;
    {
        auto acceptor = startAcceptor();
        port = std::to_string(acceptor->GetBoundPort());
        acceptor->Stop().get();
    }
    TcpTransport::Options opts;
    opts.host = "127.0.0.1";
    opts.port = port;
    TcpTransport client(opts);
    auto started = client.Start();
    ASSERT_EQ(started.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_THROW(started.get(), errors::TransportError);
    EXPECT_FALSE(client.IsConnected());
}

TEST(TcpTransport, ClosedTransportCannotRestart) {
    auto acceptor = startAcceptor();
    auto client = clientFor(*acceptor);
    client->Start().get();
    client->Close().get();
    EXPECT_THROW(client->Start().get(), errors::TransportError);
}

TEST(TcpAcceptor, StopUnblocksAcceptPeer) {
    auto acceptor = startAcceptor();
    auto pending = std::async(std::launch::async, [&acceptor]() {
        try {
            (void)acceptor->AcceptPeer();
            return false;
        } catch (const errors::TransportError&) {
            return true;
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    acceptor->Stop().get();
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(pending.get());
    EXPECT_EQ(acceptor->GetBoundPort(), 0);
}

TEST(TcpAcceptor, InvalidPortFailsStart) {
    TcpAcceptor::Options opts;
    opts.port = "not-a-port";
    TcpAcceptor acceptor(opts);
    auto started = acceptor.Start();
    ASSERT_EQ(started.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(started.get(), errors::TransportError);
}

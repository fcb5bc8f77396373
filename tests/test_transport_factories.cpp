//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_transport_factories.cpp
// Purpose: Endpoint parsing and configuration-driven transport/acceptor construction
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

#include "mcplink/HTTPServer.hpp"
#include "mcplink/TcpTransport.hpp"
#include "mcplink/TransportFactory.h"

using namespace mcplink;

TEST(ParseEndpoint, SplitsHostPortAndPath) {
    Endpoint ep = ParseEndpoint("http://example.com:8080/mcp/v1");
    EXPECT_EQ(ep.scheme, "http");
    EXPECT_EQ(ep.host, "example.com");
    EXPECT_EQ(ep.port, "8080");
    EXPECT_EQ(ep.path, "/mcp/v1");
}

TEST(ParseEndpoint, SchemeIsLowercasedAndWhitespaceTrimmed) {
    Endpoint ep = ParseEndpoint("  TCP://127.0.0.1:7000 ");
    EXPECT_EQ(ep.scheme, "tcp");
    EXPECT_EQ(ep.host, "127.0.0.1");
    EXPECT_EQ(ep.port, "7000");
    EXPECT_TRUE(ep.path.empty());
}

TEST(ParseEndpoint, BracketedIPv6) {
    Endpoint ep = ParseEndpoint("tcp://[::1]:9000");
    EXPECT_EQ(ep.host, "::1");
    EXPECT_EQ(ep.port, "9000");

    Endpoint noPort = ParseEndpoint("http://[fe80::1]/mcp");
    EXPECT_EQ(noPort.host, "fe80::1");
    EXPECT_TRUE(noPort.port.empty());
    EXPECT_EQ(noPort.path, "/mcp");
}

TEST(ParseEndpoint, RejectsMalformedEndpoints) {
    EXPECT_THROW(ParseEndpoint("127.0.0.1:7000"), std::invalid_argument);
    EXPECT_THROW(ParseEndpoint("tcp://:7000"), std::invalid_argument);
    EXPECT_THROW(ParseEndpoint("tcp://[::1:7000"), std::invalid_argument);
}

TEST(TransportFactory, BuildsEachTransportKind) {
    TransportFactory factory;
    auto stdio = factory.CreateTransport("stdio");
    ASSERT_NE(stdio, nullptr);
    EXPECT_FALSE(stdio->IsConnected());

    auto tcp = factory.CreateTransport("tcp://127.0.0.1:7000");
    EXPECT_NE(dynamic_cast<TcpTransport*>(tcp.get()), nullptr);

    auto http = factory.CreateTransport("http://127.0.0.1/mcp");
    ASSERT_NE(http, nullptr);
    EXPECT_FALSE(http->IsConnected());
}

TEST(TransportFactory, RejectsUnsupportedConfigurations) {
    TransportFactory factory;
    EXPECT_THROW(factory.CreateTransport("tcp://127.0.0.1"), std::invalid_argument);
    EXPECT_THROW(factory.CreateTransport("ws://127.0.0.1:80"), std::invalid_argument);
    EXPECT_THROW(factory.CreateTransport("stdio+carrier-pigeon"), std::invalid_argument);
    EXPECT_THROW(MakeTransportProvider("udp://127.0.0.1:53"), std::invalid_argument);
}

TEST(TransportAcceptorFactory, BuildsTcpAndHttpAcceptors) {
    TransportAcceptorFactory factory;
    auto tcp = factory.CreateTransportAcceptor("tcp://127.0.0.1");
    EXPECT_NE(dynamic_cast<TcpAcceptor*>(tcp.get()), nullptr);
    auto http = factory.CreateTransportAcceptor("http://127.0.0.1/rpc");
    EXPECT_NE(dynamic_cast<HTTPServer*>(http.get()), nullptr);
    EXPECT_THROW(factory.CreateTransportAcceptor("stdio://local"), std::invalid_argument);
}

TEST(TransportFactory, ProviderConnectsThroughConfiguredEndpoint) {
    TransportAcceptorFactory acceptorFactory;
    auto acceptor = acceptorFactory.CreateTransportAcceptor("tcp://127.0.0.1:0");
    acceptor->Start().get();
    auto* tcpAcceptor = dynamic_cast<TcpAcceptor*>(acceptor.get());
    ASSERT_NE(tcpAcceptor, nullptr);

    TransportProvider provider =
        MakeTransportProvider("tcp://127.0.0.1:" + std::to_string(tcpAcceptor->GetBoundPort()));
    auto first = provider();
    auto second = provider();
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(first.get(), second.get());

    auto started = first->Start();
    ASSERT_EQ(started.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_NO_THROW(started.get());
    auto peer = acceptor->AcceptPeer();
    first->Send("{}");
    EXPECT_EQ(peer->Receive(), "{}");

    first->Close().get();
    acceptor->Stop().get();
}

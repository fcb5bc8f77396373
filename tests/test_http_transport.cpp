//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_http_transport.cpp
// Purpose: Loopback tests for the HTTP + SSE transport pair
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "mcplink/HTTPServer.hpp"
#include "mcplink/HTTPTransport.hpp"
#include "mcplink/errors/Errors.h"

using namespace mcplink;

namespace {

std::unique_ptr<HTTPServer> startServer() {
    HTTPServer::Options opts;
    opts.address = "127.0.0.1";
    opts.port = "0";
    auto server = std::make_unique<HTTPServer>(opts);
    server->Start().get();
    return server;
}

std::unique_ptr<HTTPTransport> clientFor(const HTTPServer& server) {
    HTTPTransport::Options opts;
    opts.host = "127.0.0.1";
    opts.port = std::to_string(server.GetBoundPort());
    opts.connectTimeoutMs = 2000;
    opts.requestTimeoutMs = 2000;
    return std::make_unique<HTTPTransport>(opts);
}

// Plain synchronous request that hits the endpoint without the transport.
unsigned rawRequest(std::uint16_t port, boost::beast::http::verb verb, const std::string& target,
                    const std::string& sessionId, const std::string& body) {
    namespace http = boost::beast::http;
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver(ioc);
    boost::beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(port)));
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "application/json");
    if (!sessionId.empty()) {
        req.set("Mcp-Session-Id", sessionId);
    }
    req.body() = body;
    req.prepare_payload();
    http::write(stream, req);
    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return res.result_int();
}

} // namespace

TEST(HTTPTransport, PostAndEventStreamRoundTrip) {
    auto server = startServer();
    ASSERT_NE(server->GetBoundPort(), 0);

    auto client = clientFor(*server);
    auto started = client->Start();
    ASSERT_EQ(started.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    ASSERT_NO_THROW(started.get());
    EXPECT_TRUE(client->IsConnected());

    auto peer = server->AcceptPeer();
    ASSERT_NE(peer, nullptr);
    EXPECT_EQ(peer->GetSessionId(), client->GetSessionId());

    client->Send(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(peer->Receive(), R"({"jsonrpc":"2.0","id":1,"method":"ping"})");

    peer->Send(R"({"jsonrpc":"2.0","id":1,"result":{}})");
    peer->Send(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info","data":"x"}})");
    EXPECT_EQ(client->Receive(), R"({"jsonrpc":"2.0","id":1,"result":{}})");
    EXPECT_EQ(client->Receive(),
              R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info","data":"x"}})");

    client->Close().get();
    server->Stop().get();
}

TEST(HTTPTransport, ClientCloseEndsServerSession) {
    auto server = startServer();
    auto client = clientFor(*server);
    client->Start().get();
    auto peer = server->AcceptPeer();

    client->Close().get();
    auto pending = std::async(std::launch::async, [&peer]() {
        try {
            (void)peer->Receive();
            return false;
        } catch (const errors::TransportError&) {
            return true;
        }
    });
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_TRUE(pending.get());
    EXPECT_FALSE(peer->IsConnected());
}

TEST(HTTPTransport, ServerCloseEndsClientStream) {
    auto server = startServer();
    auto client = clientFor(*server);
    client->Start().get();
    auto peer = server->AcceptPeer();

    peer->Close().get();
    auto pending = std::async(std::launch::async, [&client]() {
        try {
            (void)client->Receive();
            return false;
        } catch (const errors::TransportError&) {
            return true;
        }
    });
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_TRUE(pending.get());
    EXPECT_THROW(client->Send("{}"), errors::TransportError);
}

TEST(HTTPServer, UnknownSessionIsNotFound) {
    auto server = startServer();
    unsigned status = rawRequest(server->GetBoundPort(), boost::beast::http::verb::post, "/mcp",
                                 "no-such-session", R"({"jsonrpc":"2.0","method":"x"})");
    EXPECT_EQ(status, 404u);
}

TEST(HTTPServer, MissingSessionHeaderIsBadRequest) {
    auto server = startServer();
    unsigned status = rawRequest(server->GetBoundPort(), boost::beast::http::verb::post, "/mcp", "",
                                 R"({"jsonrpc":"2.0","method":"x"})");
    EXPECT_EQ(status, 400u);
}

TEST(HTTPServer, OtherPathsAreNotFound) {
    auto server = startServer();
    unsigned status = rawRequest(server->GetBoundPort(), boost::beast::http::verb::post, "/elsewhere", "abc", "{}");
    EXPECT_EQ(status, 404u);
}

TEST(HTTPTransport, StartFailsWithoutServer) {
    std::string port;
    {
        auto server = startServer();
        port = std::to_string(server->GetBoundPort());
        server->Stop().get();
    }
    HTTPTransport::Options opts;
    opts.port = port;
    opts.connectTimeoutMs = 1000;
    HTTPTransport client(opts);
    auto started = client.Start();
    ASSERT_EQ(started.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_THROW(started.get(), errors::TransportError);
    EXPECT_FALSE(client.IsConnected());
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TcpTransport.hpp
// Purpose: Content-Length framed transport and acceptor over TCP (Boost.Asio)
//==========================================================================================================
#pragma once

#include "mcplink/Transport.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace mcplink {

//==========================================================================================================
// TcpTransport
// Purpose: One TCP connection carrying Content-Length framed payloads. Client instances connect in Start();
//          server instances are produced already connected by TcpAcceptor.
//==========================================================================================================
class TcpTransport : public ITransport {
public:
    struct Options {
        std::string host{"127.0.0.1"};
        std::string port{"0"};
        std::size_t maxContentLength{4 * 1024 * 1024};
        std::chrono::milliseconds connectTimeout{10000};
    };

    explicit TcpTransport(Options options);
    virtual ~TcpTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Resolves and connects to options.host:options.port.
    // Returns:
    //   Future that completes once connected; carries errors::TransportError on resolve/connect failure
    //   or when connectTimeout elapses.
    //==========================================================================================================
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const std::string& frame) override;
    std::string Receive() override;

private:
    friend class TcpAcceptor;
    class Impl;
    explicit TcpTransport(std::unique_ptr<Impl> impl);
    // Wraps an accepted connection; only the acceptor builds transports this way.
    static std::unique_ptr<TcpTransport> FromAccepted(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// TcpAcceptor
// Purpose: Listens on a TCP endpoint and yields one TcpTransport per accepted connection.
//==========================================================================================================
class TcpAcceptor : public ITransportAcceptor {
public:
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"0"}; // "0" selects an ephemeral port; see GetBoundPort()
        std::size_t maxContentLength{4 * 1024 * 1024};
    };

    explicit TcpAcceptor(Options options);
    virtual ~TcpAcceptor();

    std::future<void> Start() override;
    std::unique_ptr<ITransport> AcceptPeer() override;
    std::future<void> Stop() override;

    //==========================================================================================================
    // Returns the port actually bound (valid after Start() completed), 0 when not listening.
    //==========================================================================================================
    std::uint16_t GetBoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplink

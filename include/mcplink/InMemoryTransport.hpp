//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport and acceptor for tests and embedding
//==========================================================================================================
#pragma once

#include "mcplink/Transport.h"
#include <memory>
#include <utility>

namespace mcplink {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport delivering frames to a paired instance without networking or I/O.
//          Frames already queued are still delivered after the peer closes; Receive() then throws.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    virtual ~InMemoryTransport();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const std::string& frame) override;
    std::string Receive() override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

//==========================================================================================================
// InMemoryAcceptor
// Purpose: Acceptor whose peers are created by Connect(); lets a Server accept in-process clients.
//==========================================================================================================
class InMemoryAcceptor : public ITransportAcceptor {
public:
    InMemoryAcceptor();
    virtual ~InMemoryAcceptor();

    std::future<void> Start() override;
    std::unique_ptr<ITransport> AcceptPeer() override;
    std::future<void> Stop() override;

    //==========================================================================================================
    // Connect
    // Purpose: Creates a new transport pair, queues the server end for AcceptPeer(), and returns the client end.
    // Returns:
    //   The client-side transport (not yet started).
    // Throws:
    //   errors::TransportError when the acceptor is not listening.
    //==========================================================================================================
    std::unique_ptr<ITransport> Connect();

    //==========================================================================================================
    // MakeProvider
    // Purpose: TransportProvider bound to this acceptor (the acceptor must outlive the provider's use).
    //==========================================================================================================
    TransportProvider MakeProvider();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplink

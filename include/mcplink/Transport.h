//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces - COM-style abstractions over byte-stream carriers
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

namespace mcplink {

//==========================================================================================================
// ITransport
// Purpose: One bidirectional frame channel to a single peer. Transports never interpret frame contents;
//          frame boundaries (Content-Length, newline, SSE event, ...) are the carrier's concern.
// Notes:
//   - Send() may be called from many threads; implementations serialize writes so frames never interleave.
//   - Receive() is called by one reader at a time and blocks until a frame arrives or the carrier ends.
//   - Any errors::TransportError from Receive() is terminal: the instance must be torn down, not retried.
//   - Close() may be called from any thread and unblocks a pending Receive().
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport (connects, spawns carrier I/O).
    // Returns:
    //   A future that completes when the transport can send and receive; carries errors::TransportError
    //   when the carrier could not be established.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases carrier resources. Idempotent.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Frame I/O ///////////////////////////////////////////
    //==========================================================================================================
    // Writes one frame to the peer.
    // Args:
    //   frame: Complete encoded payload (one envelope or one batch).
    // Throws:
    //   errors::TransportError when the carrier is closed or the write fails.
    //==========================================================================================================
    virtual void Send(const std::string& frame) = 0;

    //==========================================================================================================
    // Blocks until the next frame is available.
    // Returns:
    //   The frame payload with carrier framing removed.
    // Throws:
    //   errors::TransportError once the carrier is closed (locally or by the peer) or has failed.
    //==========================================================================================================
    virtual std::string Receive() = 0;
};

// Concrete transports are declared in their respective headers:
//  - mcplink/InMemoryTransport.hpp
//  - mcplink/StdioTransport.hpp
//  - mcplink/TcpTransport.hpp
//  - mcplink/HTTPTransport.hpp / mcplink/HTTPServer.hpp

//==========================================================================================================
// TransportProvider
// Purpose: Builds a fresh, not-yet-started transport; used by client sessions to reconnect.
//==========================================================================================================
using TransportProvider = std::function<std::unique_ptr<ITransport>()>;

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific configuration string (e.g. "stdio", "tcp://127.0.0.1:7000").
    // Returns:
    //   A unique_ptr to a newly created, not yet started ITransport.
    // Throws:
    //   std::invalid_argument when the configuration is not understood.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

//==========================================================================================================
// ITransportAcceptor
// Purpose: Server-side listener producing one independent ITransport per accepted peer.
// Notes:
//   - Start() binds/listens; AcceptPeer() may then be called repeatedly until Stop().
//   - Stop() unblocks a pending AcceptPeer(), which throws errors::TransportError.
//==========================================================================================================
class ITransportAcceptor {
public:
    virtual ~ITransportAcceptor() = default;

    //==========================================================================================================
    // Starts the acceptor (binds/listens/spawns accept loop as needed).
    // Returns:
    //   Future that completes when the listener is ready; carries an error when binding failed.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Blocks until a new peer connects.
    // Returns:
    //   A started transport bound to the new peer.
    // Throws:
    //   errors::TransportError once the acceptor has stopped or failed.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> AcceptPeer() = 0;

    //==========================================================================================================
    // Stops the acceptor and releases the listener. Transports already handed out stay usable.
    // Returns:
    //   Future that completes when the acceptor has stopped.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;
};

//==========================================================================================================
// Transport acceptor factory interface
// Purpose: Factory for creating server-side acceptors from configuration strings.
//==========================================================================================================
class ITransportAcceptorFactory {
public:
    virtual ~ITransportAcceptorFactory() = default;

    //==========================================================================================================
    // Creates a server-side acceptor instance using the provided configuration.
    // Args:
    //   config: Listener configuration (e.g. "tcp://0.0.0.0:7000", "http://127.0.0.1:9443/mcp").
    // Returns:
    //   A unique_ptr to a newly created, not yet started ITransportAcceptor.
    //==========================================================================================================
    virtual std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) = 0;
};

} // namespace mcplink

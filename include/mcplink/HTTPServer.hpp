//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: HTTP acceptor with server-sent-event push channel using Boost.Beast
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <future>

#include "mcplink/Transport.h"

namespace mcplink {

//==========================================================================================================
// HTTPServer
// Purpose: ITransportAcceptor over HTTP/1.1. Each peer session is:
//   - GET <path>     opens a text/event-stream response; the new session id is returned in Mcp-Session-Id.
//                    Frames sent by the server are written as SSE "data:" events on this stream.
//   - POST <path>    with Mcp-Session-Id delivers one frame to the session (202 Accepted, 404 if unknown).
//   - DELETE <path>  with Mcp-Session-Id ends the session.
//==========================================================================================================
class HTTPServer : public ITransportAcceptor {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default 127.0.0.1)
    //   port: Bind port; "0" selects an ephemeral port (see GetBoundPort)
    //   path: Endpoint path serving GET/POST/DELETE (default /mcp)
    //   maxBodyBytes: Upper bound for POST bodies
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"0"};
        std::string path{"/mcp"};
        std::size_t maxBodyBytes{4 * 1024 * 1024};
    };

    explicit HTTPServer(const Options& opts);
    ~HTTPServer();

    //==========================================================================================================
    // Start
    // Purpose: Bind, listen, and launch the accept loop.
    // Returns:
    //   Future that completes when listening; carries errors::TransportError when binding failed.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // AcceptPeer
    // Purpose: Blocks until a client opens an event stream, returning the session's transport.
    //==========================================================================================================
    std::unique_ptr<ITransport> AcceptPeer() override;

    //==========================================================================================================
    // Stop
    // Purpose: Stop accepting, end every open event stream, and join the I/O thread.
    //==========================================================================================================
    std::future<void> Stop() override;

    // Port actually bound; 0 when not listening.
    std::uint16_t GetBoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplink

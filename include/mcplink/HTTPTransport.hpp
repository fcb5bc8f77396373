//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: Coroutine-based HTTP client transport with server-sent-event receive channel (Boost.Beast)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <future>

#include "mcplink/Transport.h"

namespace mcplink {

//==========================================================================================================
// HTTPTransport
// Purpose: Client side of HTTPServer. Start() opens the GET event stream and learns the session id;
//          Send() POSTs one frame per request; Close() ends the session with DELETE.
//==========================================================================================================
class HTTPTransport : public ITransport {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   host: Server hostname or IP (default: 127.0.0.1)
    //   port: Service port
    //   path: Endpoint path (default: /mcp)
    //   connectTimeoutMs: Connect timeout in milliseconds
    //   requestTimeoutMs: Timeout for one POST/DELETE exchange in milliseconds
    //==========================================================================================================
    struct Options {
        std::string host{"127.0.0.1"};
        std::string port{"80"};
        std::string path{"/mcp"};
        std::uint64_t connectTimeoutMs{10000};
        std::uint64_t requestTimeoutMs{30000};
    };

    explicit HTTPTransport(const Options& opts);
    ~HTTPTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;

    //==========================================================================================================
    // Returns the server-assigned Mcp-Session-Id once Start() has completed, "http-pending" before.
    //==========================================================================================================
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Send
    // Purpose: POST one frame; returns once the server answered 202.
    // Throws:
    //   errors::TransportError on connection failure, timeout, or a non-2xx status (404 is terminal).
    //==========================================================================================================
    void Send(const std::string& frame) override;

    //==========================================================================================================
    // Receive
    // Purpose: Next SSE data event from the server.
    //==========================================================================================================
    std::string Receive() override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplink

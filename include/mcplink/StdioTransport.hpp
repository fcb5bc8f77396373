//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Concrete stdio-based transport
//==========================================================================================================
#pragma once

#include "mcplink/Transport.h"
#include <cstddef>
#include <memory>
#include <utility>

namespace mcplink {

//==========================================================================================================
// StdioTransport
// Purpose: Frame transport over a pair of file descriptors (stdin/stdout by default) for local tool integrations.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    enum class Framing {
        ContentLength,
        Newline
    };

    struct Options {
        int readFd{0};
        int writeFd{1};
        Framing framing{Framing::ContentLength};
        std::size_t maxContentLength{4 * 1024 * 1024};
        // When true the descriptors are closed by the transport (write side on Close, read side on destruction).
        bool ownsDescriptors{false};
    };

    StdioTransport();
    explicit StdioTransport(Options options);
    virtual ~StdioTransport();

    //==========================================================================================================
    // CreatePipePair
    // Purpose: Two transports connected back-to-back through OS pipes; useful for tests and in-process hosting.
    // Args:
    //   framing: Framing used by both ends.
    // Throws:
    //   errors::TransportError when the pipes cannot be created.
    //==========================================================================================================
    static std::pair<std::unique_ptr<StdioTransport>, std::unique_ptr<StdioTransport>> CreatePipePair(
        Framing framing = Framing::ContentLength);

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the stdio transport.
    // Returns:
    //   Future that completes once the descriptors are ready.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes the transport; a blocked Receive() wakes and throws.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const std::string& frame) override;
    std::string Receive() override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Factory for creating stdio transports. Accepts "stdio" and "stdio+newline".
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

} // namespace mcplink

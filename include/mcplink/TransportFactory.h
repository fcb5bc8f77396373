//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportFactory.h
// Purpose: Configuration-string driven construction of transports and acceptors
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "mcplink/Transport.h"

namespace mcplink {

//==========================================================================================================
// Endpoint
// Purpose: Parsed form of "scheme://host[:port][/path]" (IPv6 hosts in [addr] form).
//==========================================================================================================
struct Endpoint {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

//==========================================================================================================
// ParseEndpoint
// Purpose: Splits a configuration URL into its parts.
// Throws:
//   std::invalid_argument when the scheme separator or host is missing.
//==========================================================================================================
Endpoint ParseEndpoint(const std::string& config);

//==========================================================================================================
// TransportFactory
// Purpose: Client-side factory. Accepts "stdio", "stdio+newline", "tcp://host:port", "http://host:port[/path]".
//==========================================================================================================
class TransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

//==========================================================================================================
// TransportAcceptorFactory
// Purpose: Server-side factory. Accepts "tcp://address:port" and "http://address:port[/path]".
//==========================================================================================================
class TransportAcceptorFactory : public ITransportAcceptorFactory {
public:
    std::unique_ptr<ITransportAcceptor> CreateTransportAcceptor(const std::string& config) override;
};

//==========================================================================================================
// MakeTransportProvider
// Purpose: TransportProvider that builds a fresh transport from config on each call (used for reconnects).
//==========================================================================================================
TransportProvider MakeTransportProvider(const std::string& config);

} // namespace mcplink

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportFactory.cpp
// Purpose: Configuration-string driven construction of transports and acceptors
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "mcplink/HTTPServer.hpp"
#include "mcplink/HTTPTransport.hpp"
#include "mcplink/StdioTransport.hpp"
#include "mcplink/TcpTransport.hpp"
#include "mcplink/TransportFactory.h"

namespace mcplink {

namespace {

void trim(std::string& s) {
    auto notSpace = [](unsigned char c){ return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

bool startsWith(const std::string& s, const char* pfx) {
    return s.rfind(pfx, 0) == 0;
}

} // namespace

Endpoint ParseEndpoint(const std::string& config) {
    std::string cfg = config;
    trim(cfg);
    auto sep = cfg.find("://");
    if (sep == std::string::npos) {
        throw std::invalid_argument("endpoint lacks scheme: " + config);
    }
    Endpoint ep;
    ep.scheme = cfg.substr(0, sep);
    std::transform(ep.scheme.begin(), ep.scheme.end(), ep.scheme.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    std::string rest = cfg.substr(sep + 3);

    std::string hostPort = rest;
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        hostPort = rest.substr(0, slash);
        ep.path = rest.substr(slash);
    }

    // host[:port] including IPv6 in [addr]:port form
    if (!hostPort.empty() && hostPort.front() == '[') {
        auto rb = hostPort.find(']');
        if (rb == std::string::npos) {
            throw std::invalid_argument("unterminated IPv6 address: " + config);
        }
        ep.host = hostPort.substr(1, rb - 1);
        if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
            ep.port = hostPort.substr(rb + 2);
        }
    } else {
        auto colon = hostPort.rfind(':');
        if (colon != std::string::npos) {
            ep.host = hostPort.substr(0, colon);
            ep.port = hostPort.substr(colon + 1);
        } else {
            ep.host = hostPort;
        }
    }
    if (ep.host.empty()) {
        throw std::invalid_argument("endpoint lacks host: " + config);
    }
    return ep;
}

std::unique_ptr<ITransport> TransportFactory::CreateTransport(const std::string& config) {
    if (startsWith(config, "stdio")) {
        StdioTransportFactory stdioFactory;
        return stdioFactory.CreateTransport(config);
    }
    Endpoint ep = ParseEndpoint(config);
    if (ep.scheme == "tcp") {
        if (ep.port.empty()) {
            throw std::invalid_argument("tcp endpoint requires a port: " + config);
        }
        TcpTransport::Options opts;
        opts.host = ep.host;
        opts.port = ep.port;
        return std::make_unique<TcpTransport>(opts);
    }
    if (ep.scheme == "http") {
        HTTPTransport::Options opts;
        opts.host = ep.host;
        opts.port = ep.port.empty() ? std::string("80") : ep.port;
        if (!ep.path.empty()) {
            opts.path = ep.path;
        }
        return std::make_unique<HTTPTransport>(opts);
    }
    throw std::invalid_argument("unsupported transport scheme: " + ep.scheme);
}

std::unique_ptr<ITransportAcceptor> TransportAcceptorFactory::CreateTransportAcceptor(const std::string& config) {
    Endpoint ep = ParseEndpoint(config);
    if (ep.scheme == "tcp") {
        TcpAcceptor::Options opts;
        opts.address = ep.host;
        opts.port = ep.port.empty() ? std::string("0") : ep.port;
        return std::make_unique<TcpAcceptor>(opts);
    }
    if (ep.scheme == "http") {
        HTTPServer::Options opts;
        opts.address = ep.host;
        opts.port = ep.port.empty() ? std::string("0") : ep.port;
        if (!ep.path.empty()) {
            opts.path = ep.path;
        }
        return std::make_unique<HTTPServer>(opts);
    }
    throw std::invalid_argument("unsupported acceptor scheme: " + ep.scheme);
}

TransportProvider MakeTransportProvider(const std::string& config) {
    // Rejects unknown configurations up front
    TransportFactory factory;
    (void)factory.CreateTransport(config);
    return [config]() {
        TransportFactory f;
        return f.CreateTransport(config);
    };
}

} // namespace mcplink

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Echo server example (stdio, TCP or HTTP+SSE)
//==========================================================================================================

#include <chrono>
#include <cstddef>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplink/Server.h"
#include "mcplink/StdioTransport.hpp"
#include "mcplink/TransportFactory.h"
#include "mcplink/errors/Errors.h"

using namespace mcplink;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--transport")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static JSONValue textContent(const std::string& text) {
    JSONValue item = MakeObject();
    item.Set("type", JSONValue("text"));
    item.Set("text", JSONValue(text));
    JSONValue result = MakeObject();
    result.Set("content", MakeArray({item}));
    return result;
}

static void registerCapabilities(Server& server) {
    JSONValue msgType = MakeObject();
    msgType.Set("type", JSONValue("string"));
    JSONValue props = MakeObject();
    props.Set("message", msgType);
    JSONValue schema = MakeObject();
    schema.Set("type", JSONValue("object"));
    schema.Set("properties", props);
    schema.Set("required", MakeArray({JSONValue("message")}));

    server.RegisterTool("echo", "Echo a message", schema, [](const JSONValue& args, const InvocationContext&) {
        auto message = args.GetString("message");
        if (!message.has_value()) {
            throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "echo requires a string 'message'");
        }
        return textContent(message.value());
    });

    // Sleeps for `ms` milliseconds unless cancelled first
    server.RegisterTool("sleep", "Wait, honouring cancellation", std::nullopt,
                        [](const JSONValue& args, const InvocationContext& ctx) {
        const auto total = std::chrono::milliseconds(args.GetInteger("ms").value_or(1000));
        const auto until = std::chrono::steady_clock::now() + total;
        while (std::chrono::steady_clock::now() < until) {
            if (ctx.stopToken.stop_requested()) {
                throw errors::ApplicationError("sleep cancelled");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return textContent("slept " + std::to_string(total.count()) + " ms");
    });

    server.RegisterResource("mem://readme", "readme", "About this server", std::string("text/plain"),
                            [](const JSONValue& params, const InvocationContext&) {
        JSONValue item = MakeObject();
        item.Set("uri", *params.Find("uri"));
        item.Set("mimeType", JSONValue("text/plain"));
        item.Set("text", JSONValue("mcplink echo server: call the 'echo' tool with {\"message\": \"...\"}"));
        JSONValue result = MakeObject();
        result.Set("contents", MakeArray({item}));
        return result;
    });

    server.RegisterPrompt("greet", "Greets someone by name", std::nullopt,
                          [](const JSONValue& args, const InvocationContext&) {
        std::string name = args.GetString("name").value_or("world");
        JSONValue message = MakeObject();
        message.Set("role", JSONValue("user"));
        message.Set("content", *textContent("Say hello to " + name).Find("content"));
        JSONValue result = MakeObject();
        result.Set("messages", MakeArray({message}));
        return result;
    });
}

int main(int argc, char** argv) {
    std::string transportKind = getArgValue(argc, argv, "--transport").value_or("stdio");
    if (transportKind == "stdio") {
        // stdout carries protocol frames
        ::setenv("MCPLINK_STDIO_MODE", "1", 1);
    }
    FUNC_SCOPE();
    Logger::setLogLevelFromString(GetEnvOrDefault("MCPLINK_LOG_LEVEL", "INFO"));

    ServerConfig config = ServerConfig::FromEnvironment();
    config.serverInfo = Implementation("mcplink echo server", getVersionString());
    config.instructions = "Tools: echo, sleep. Resource: mem://readme. Prompt: greet.";
    Server server(config);
    registerCapabilities(server);

    LOG_INFO("Echo server starting with transport={}", transportKind);
    try {
        if (transportKind == "stdio") {
            StdioTransport::Options opts;
            if (hasFlag(argc, argv, "--newline")) {
                opts.framing = StdioTransport::Framing::Newline;
            }
            std::string id = server.Serve(std::make_unique<StdioTransport>(opts));
            while (!server.WaitForDisconnect(id, std::chrono::seconds(1))) {
            }
            LOG_INFO("stdio peer disconnected");
        } else {
            TransportAcceptorFactory factory;
            server.Start(factory.CreateTransportAcceptor(transportKind)).get();
            LOG_INFO("Listening at {} (Ctrl+C to stop)", transportKind);

            boost::asio::io_context io;
            boost::asio::signal_set signals(io, SIGINT, SIGTERM);
            signals.async_wait([](const boost::system::error_code& ec, int signo) {
                if (!ec) {
                    LOG_INFO("Received signal {}", signo);
                }
            });
            io.run();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Echo server failed: {}", e.what());
        server.Stop().get();
        return EXIT_FAILURE;
    }

    server.Stop().get();
    LOG_INFO("Echo server stopped");
    return EXIT_SUCCESS;
}

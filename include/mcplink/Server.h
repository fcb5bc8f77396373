//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Server dispatcher - per-peer connection state machine routing requests to registered capabilities
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplink/CapabilityRegistry.h"
#include "mcplink/JSONRPCTypes.h"
#include "mcplink/Protocol.h"
#include "mcplink/RequestCorrelator.h"
#include "mcplink/Transport.h"
#include "mcplink/version.h"
#include "mcplink/errors/Errors.h"

namespace mcplink {

//==========================================================================================================
// ServerConfig
// Purpose: Dispatcher settings.
// Fields:
//   serverInfo: Identity reported in the initialize reply.
//   instructions: Optional free-form usage text reported in the initialize reply.
//   maxConcurrentRequests: Upper bound on handler workers running at once (across all connections).
//   requestTimeout: Default deadline for server-initiated requests.
//   shutdownGrace: How long Stop() waits for running handlers after signalling their stop tokens.
//==========================================================================================================
struct ServerConfig {
    Implementation serverInfo{"mcplink-server", getVersionString()};
    std::optional<std::string> instructions;
    std::size_t maxConcurrentRequests{100};
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds shutdownGrace{5000};

    // Defaults overlaid with MCPLINK_MAX_CONCURRENT_REQUESTS and MCPLINK_REQUEST_TIMEOUT_MS.
    static ServerConfig FromEnvironment();
};

//==========================================================================================================
// Server
// Purpose: Accepts peers, runs the handshake and serves tools, resources and prompts from one registry.
// Notes:
//   - Each peer gets its own connection: AwaitingHandshake -> Serving -> Closing.
//   - initialize and ping are answered on the connection's read loop; every other request runs on a worker,
//     so replies may leave in completion order.
//   - Handler failures become ErrorResponses; only a transport failure ends a connection.
//==========================================================================================================
class Server {
public:
    // Runs before capability dispatch; returning an error rejects the request with it.
    using RequestGuard = std::function<std::optional<errors::McpError>(const std::string& sessionId,
                                                                        const JSONRPCRequest& request)>;
    // Receives client notifications the dispatcher does not consume itself.
    using NotificationHandler = std::function<void(const std::string& sessionId,
                                                   const JSONRPCNotification& notification)>;

    explicit Server(ServerConfig config = ServerConfig{});
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Start
    // Purpose: Starts the acceptor and serves every peer it produces until Stop().
    // Args:
    //   acceptor: Not-yet-started acceptor; the server takes ownership.
    // Returns:
    //   Future completing once the acceptor listens; carries the acceptor's error when it could not start.
    //==========================================================================================================
    std::future<void> Start(std::unique_ptr<ITransportAcceptor> acceptor);

    //==========================================================================================================
    // Serve
    // Purpose: Attaches a single transport (e.g. stdio) as one connection.
    // Args:
    //   transport: Transport to serve. It is started here when not already connected.
    // Returns:
    //   The connection's session id.
    // Throws:
    //   errors::TransportError when the transport fails to start.
    //==========================================================================================================
    std::string Serve(std::unique_ptr<ITransport> transport);

    //==========================================================================================================
    // Stop
    // Purpose: Stops accepting, closes every connection, signals in-flight handlers and waits up to
    //          shutdownGrace for them. Idempotent.
    //==========================================================================================================
    std::future<void> Stop();

    bool IsRunning() const;
    std::size_t ConnectionCount() const;
    std::vector<std::string> SessionIds() const;

    // Blocks until a connection with this session id has finished (closed by either side).
    bool WaitForDisconnect(const std::string& sessionId, std::chrono::milliseconds timeout) const;

    /////////////////////////////////////////// Capabilities ///////////////////////////////////////////
    CapabilityRegistry& Registry();

    //==========================================================================================================
    // RegisterTool / RegisterResource / RegisterPrompt
    // Purpose: Convenience wrappers around Registry().Register().
    // Notes:
    //   - Tool handlers receive the call's `arguments` object and return the tools/call result verbatim.
    //   - Resource handlers receive the resources/read params ({uri}) and return the read result verbatim.
    //   - Prompt handlers receive the call's `arguments` object and return the prompts/get result verbatim.
    // Throws:
    //   errors::DuplicateNameError when the name is already registered in that namespace.
    //==========================================================================================================
    void RegisterTool(const std::string& name, const std::string& description,
                      std::optional<JSONValue> inputSchema, HandlerFunction handler);
    void RegisterResource(const std::string& uri, const std::string& name, const std::string& description,
                          std::optional<std::string> mimeType, HandlerFunction handler);
    void RegisterPrompt(const std::string& name, const std::string& description,
                        std::optional<JSONValue> arguments, HandlerFunction handler);

    /////////////////////////////////////////// Server-to-client ///////////////////////////////////////////
    // Sends notifications/resources/updated to every connection subscribed to uri.
    void NotifyResourceUpdated(const std::string& uri);

    // Sends notifications/message to every connection whose logging level admits level.
    void Log(ProtocolLogLevel level, const std::string& logger, const JSONValue& data);

    //==========================================================================================================
    // SendRequest
    // Purpose: Issues a server-initiated request on one connection.
    // Args:
    //   sessionId: Target connection.
    //   method/params: Request contents.
    //   timeout: Deadline; defaults to ServerConfig::requestTimeout.
    // Returns:
    //   Future resolved with the outcome; ConnectionLost when the session is unknown or not serving.
    // Throws:
    //   std::invalid_argument when the timeout is not positive.
    //==========================================================================================================
    std::future<CallOutcome> SendRequest(const std::string& sessionId, const std::string& method,
                                         std::optional<JSONValue> params = std::nullopt,
                                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /////////////////////////////////////////// Hooks ///////////////////////////////////////////
    void SetRequestGuard(RequestGuard guard);
    void SetNotificationHandler(NotificationHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplink

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientSession.h
// Purpose: Client session - connection lifecycle, handshake, call correlation, heartbeat and reconnection
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplink/JSONRPCTypes.h"
#include "mcplink/Protocol.h"
#include "mcplink/RequestCorrelator.h"
#include "mcplink/Transport.h"
#include "mcplink/version.h"

namespace mcplink {

//==========================================================================================================
// SessionState
// Purpose: Client-side lifecycle.
//   Disconnected -> Connecting -> Handshaking -> Ready -> (Degraded | Reconnecting) -> Ready | Disconnected
//==========================================================================================================
enum class SessionState {
    Disconnected,
    Connecting,
    Handshaking,
    Ready,
    Degraded,
    Reconnecting
};

const char* ToString(SessionState state);

//==========================================================================================================
// SessionConfig
// Purpose: Session tuning knobs.
// Fields:
//   autoReconnect: Rebuild the transport after an involuntary loss (requires a TransportProvider).
//   maxReconnectAttempts: Attempts per loss before the session gives up and goes terminal.
//   initialReconnectDelay/maxReconnectDelay/backoffMultiplier: Exponential backoff parameters.
//   connectionTimeout: Bound on transport start and on the initialize round trip.
//   heartbeatInterval: Period between pings; zero disables the heartbeat.
//   heartbeatTimeout: How long a ping may stay unanswered before it counts as missed.
//   maxMissedHeartbeats: Consecutive misses treated as connection loss.
//   requestTimeout: Default deadline for Invoke().
//   clientInfo: Identity sent in initialize.
//==========================================================================================================
struct SessionConfig {
    bool autoReconnect{true};
    unsigned int maxReconnectAttempts{5};
    std::chrono::milliseconds initialReconnectDelay{1000};
    std::chrono::milliseconds maxReconnectDelay{30000};
    double backoffMultiplier{2.0};
    std::chrono::milliseconds connectionTimeout{10000};
    std::chrono::milliseconds heartbeatInterval{30000};
    std::chrono::milliseconds heartbeatTimeout{5000};
    unsigned int maxMissedHeartbeats{1};
    std::chrono::milliseconds requestTimeout{30000};
    Implementation clientInfo{"mcplink-client", getVersionString()};

    // Defaults overlaid with the MCPLINK_* environment overrides; malformed values are logged and ignored.
    static SessionConfig FromEnvironment();
};

//==========================================================================================================
// SessionStats
// Purpose: Snapshot returned by ClientSession::GetStats().
// Fields:
//   state: Current state.
//   uptime: Time since the current link became Ready (zero when not connected).
//   reconnectAttempts: Attempts made in the current or most recent reconnection cycle.
//   totalReconnects: Successful reconnections over the session's lifetime.
//   connectedAt: Wall-clock time the current link became Ready.
//==========================================================================================================
struct SessionStats {
    SessionState state{SessionState::Disconnected};
    std::chrono::milliseconds uptime{0};
    unsigned int reconnectAttempts{0};
    unsigned int totalReconnects{0};
    std::optional<std::chrono::system_clock::time_point> connectedAt;
};

//==========================================================================================================
// ISessionObserver
// Purpose: Lifecycle callbacks. Invoked from session threads, never while session locks are held.
//==========================================================================================================
class ISessionObserver {
public:
    virtual ~ISessionObserver() = default;

    virtual void OnStateChanged(SessionState from, SessionState to) { (void)from; (void)to; }
    virtual void OnReconnectAttempt(unsigned int attempt, std::chrono::milliseconds delay) {
        (void)attempt;
        (void)delay;
    }
    virtual void OnReconnected(unsigned int attempt) { (void)attempt; }
    virtual void OnReconnectFailed(const std::string& reason) { (void)reason; }
};

//==========================================================================================================
// BatchCall
// Purpose: One member of ClientSession::InvokeBatch().
//==========================================================================================================
struct BatchCall {
    std::string method;
    std::optional<JSONValue> params;
};

//==========================================================================================================
// ClientSession
// Purpose: Owns one transport at a time, drives the handshake and exposes call-style operations whose
//          outcomes distinguish success, application error, timeout and connection loss.
// Notes:
//   - On involuntary loss every pending call resolves with ConnectionLost before reconnection starts.
//   - Reconnection repeats the full handshake on a fresh transport from the provider.
//   - Disconnect() is voluntary and never triggers reconnection.
//==========================================================================================================
class ClientSession {
public:
    // Answers a server-initiated request; throw errors::ApplicationError / errors::ProtocolError to fail it.
    using RequestHandler = std::function<JSONValue(const JSONValue& params)>;
    using NotificationHandler = std::function<void(const JSONRPCNotification& notification)>;

    // Throws std::invalid_argument when a request, connection or enabled heartbeat timeout is not positive.
    explicit ClientSession(SessionConfig config = SessionConfig{});
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Connect
    // Purpose: Builds a transport from provider, starts it and performs the initialize handshake.
    // Args:
    //   provider: Factory for fresh, unstarted transports; called again on every reconnection attempt.
    // Returns:
    //   Future resolving to the server's initialize result; carries errors::TransportError when the first
    //   connection or handshake fails (the session is then Disconnected).
    //==========================================================================================================
    std::future<JSONValue> Connect(TransportProvider provider);

    //==========================================================================================================
    // Connect
    // Purpose: Same as above over a single pre-built transport. Loss of that transport is terminal.
    //==========================================================================================================
    std::future<JSONValue> Connect(std::unique_ptr<ITransport> transport);

    //==========================================================================================================
    // Disconnect
    // Purpose: Voluntary shutdown: stops reconnection and heartbeat, fails pending calls, closes the transport.
    //==========================================================================================================
    std::future<void> Disconnect();

    SessionState GetState() const;
    SessionStats GetStats() const;

    // Blocks until the session reaches state or timeout elapses. Returns whether the state was reached.
    bool WaitForState(SessionState state, std::chrono::milliseconds timeout) const;

    // Handshake results of the current (or last) link.
    std::optional<Implementation> GetServerInfo() const;
    JSONValue GetServerCapabilities() const;
    std::string GetProtocolVersion() const;

    ////////////////////////////////////////// Calls ///////////////////////////////////////////
    //==========================================================================================================
    // Invoke
    // Purpose: Sends one request and returns its outcome.
    // Args:
    //   method/params: Request contents.
    //   timeout: Deadline; defaults to SessionConfig::requestTimeout. On expiry the server is sent
    //            notifications/cancelled for the request.
    // Returns:
    //   Future resolving exactly once; ConnectionLost immediately when the session is not connected.
    // Throws:
    //   std::invalid_argument when an explicit timeout is not positive.
    //==========================================================================================================
    std::future<CallOutcome> Invoke(const std::string& method, std::optional<JSONValue> params = std::nullopt,
                                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Sends all calls in one batch write; one future per call, in call order.
    std::vector<std::future<CallOutcome>> InvokeBatch(const std::vector<BatchCall>& calls,
                                                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    //==========================================================================================================
    // Notify
    // Purpose: Sends a notification.
    // Throws:
    //   errors::TransportError when the session is not connected or the write fails.
    //==========================================================================================================
    void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    std::future<CallOutcome> Ping();
    std::future<CallOutcome> ListTools();
    std::future<CallOutcome> CallTool(const std::string& name, const JSONValue& arguments,
                                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);
    std::future<CallOutcome> ListResources();
    std::future<CallOutcome> ReadResource(const std::string& uri);
    std::future<CallOutcome> SubscribeResource(const std::string& uri);
    std::future<CallOutcome> UnsubscribeResource(const std::string& uri);
    std::future<CallOutcome> ListPrompts();
    std::future<CallOutcome> GetPrompt(const std::string& name, const JSONValue& arguments);
    std::future<CallOutcome> SetLogLevel(ProtocolLogLevel level);

    ////////////////////////////////////////// Handlers ///////////////////////////////////////////
    // Answers server-initiated requests for method. ping is always answered.
    void SetRequestHandler(const std::string& method, RequestHandler handler);
    // Adds a per-method notification handler; several may be registered for one method.
    void AddNotificationHandler(const std::string& method, NotificationHandler handler);
    // Catch-all sink invoked for every notification after the per-method handlers.
    void SetNotificationHandler(NotificationHandler handler);
    void SetObserver(std::shared_ptr<ISessionObserver> observer);

    //==========================================================================================================
    // ComputeBackoffDelay
    // Purpose: Delay before reconnection attempt n (1-based):
    //          min(initialReconnectDelay * backoffMultiplier^(n-1), maxReconnectDelay).
    //==========================================================================================================
    static std::chrono::milliseconds ComputeBackoffDelay(const SessionConfig& config, unsigned int attempt);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcplink

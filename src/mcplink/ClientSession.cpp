//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientSession.cpp
// Purpose: Client session implementation (supervisor thread, per-link receive and heartbeat loops)
//==========================================================================================================
#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <unordered_map>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplink/ClientSession.h"
#include "mcplink/MessageCodec.h"
#include "mcplink/errors/Errors.h"

namespace mcplink {

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Handshaking: return "Handshaking";
        case SessionState::Ready: return "Ready";
        case SessionState::Degraded: return "Degraded";
        case SessionState::Reconnecting: return "Reconnecting";
    }
    return "Unknown";
}

namespace {

std::future<CallOutcome> readyOutcome(CallOutcome outcome) {
    std::promise<CallOutcome> p;
    p.set_value(std::move(outcome));
    return p.get_future();
}

std::string describe(const CallOutcome& outcome) {
    if (outcome.error.has_value()) {
        return std::string(ToString(outcome.status)) + ": " + outcome.error->message;
    }
    if (!outcome.detail.empty()) {
        return std::string(ToString(outcome.status)) + ": " + outcome.detail;
    }
    return ToString(outcome.status);
}

void overlayMs(const char* name, std::chrono::milliseconds& target) {
    try {
        if (auto v = GetEnvUnsigned(name)) {
            target = std::chrono::milliseconds(v.value());
        }
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring {}: {}", name, e.what());
    }
}

//==========================================================================================================
// Link
// Purpose: One transport generation: the carrier, its correlator and the threads reading and pinging it.
//          A link is replaced, never reused, on reconnection.
//==========================================================================================================
struct Link {
    uint64_t generation{0};
    std::unique_ptr<ITransport> transport;
    // Declared after transport: the correlator's deadline thread stops before the transport goes away.
    RequestCorrelator correlator;
    std::string handshakeKey;
    std::thread receiver;
    std::jthread heartbeat;
    std::atomic<bool> dead{false};
    std::atomic<bool> established{false};
    std::atomic<unsigned int> missedHeartbeats{0};

    void stopThreads() {
        heartbeat.request_stop();
        const auto self = std::this_thread::get_id();
        if (heartbeat.joinable()) {
            if (heartbeat.get_id() == self) {
                heartbeat.detach();
            } else {
                heartbeat.join();
            }
        }
        if (receiver.joinable()) {
            if (receiver.get_id() == self) {
                receiver.detach();
            } else {
                receiver.join();
            }
        }
    }

    ~Link() {
        stopThreads();
    }
};

} // namespace

//==========================================================================================================
// SessionConfig
//==========================================================================================================
SessionConfig SessionConfig::FromEnvironment() {
    SessionConfig cfg;
    overlayMs("MCPLINK_REQUEST_TIMEOUT_MS", cfg.requestTimeout);
    overlayMs("MCPLINK_HEARTBEAT_INTERVAL_MS", cfg.heartbeatInterval);
    overlayMs("MCPLINK_HEARTBEAT_TIMEOUT_MS", cfg.heartbeatTimeout);
    overlayMs("MCPLINK_RECONNECT_DELAY_MS", cfg.initialReconnectDelay);
    overlayMs("MCPLINK_MAX_RECONNECT_DELAY_MS", cfg.maxReconnectDelay);
    try {
        if (auto v = GetEnvUnsigned("MCPLINK_MAX_RECONNECT_ATTEMPTS")) {
            cfg.maxReconnectAttempts = static_cast<unsigned int>(v.value());
        }
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring MCPLINK_MAX_RECONNECT_ATTEMPTS: {}", e.what());
    }
    return cfg;
}

// Every outbound request carries a deadline, so each timeout the session applies must be positive.
static SessionConfig validated(SessionConfig cfg) {
    if (cfg.requestTimeout.count() <= 0) {
        throw std::invalid_argument("requestTimeout must be positive");
    }
    if (cfg.connectionTimeout.count() <= 0) {
        throw std::invalid_argument("connectionTimeout must be positive");
    }
    if (cfg.heartbeatInterval.count() > 0) {
        if (cfg.heartbeatTimeout.count() <= 0) {
            throw std::invalid_argument("heartbeatTimeout must be positive when the heartbeat is enabled");
        }
        if (cfg.maxMissedHeartbeats == 0) {
            throw std::invalid_argument("maxMissedHeartbeats must be at least 1 when the heartbeat is enabled");
        }
    }
    return cfg;
}

static void requirePositive(const std::optional<std::chrono::milliseconds>& timeout) {
    if (timeout.has_value() && timeout->count() <= 0) {
        throw std::invalid_argument("call timeout must be positive");
    }
}

//==========================================================================================================
// ClientSession::Impl
//==========================================================================================================
class ClientSession::Impl : public std::enable_shared_from_this<ClientSession::Impl> {
public:
    explicit Impl(SessionConfig cfg) : config(std::move(cfg)) {}

    /////////////////////////////////////////// State ///////////////////////////////////////////
    void setState(SessionState to) {
        changeState(std::nullopt, to);
    }

    // Moves to `to` only when the current state is `from`.
    bool transition(SessionState from, SessionState to) {
        return changeState(from, to);
    }

    bool changeState(std::optional<SessionState> expected, SessionState to) {
        SessionState from;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            from = state;
            if (from == to || (expected.has_value() && from != expected.value())) {
                return false;
            }
            state = to;
        }
        stateCv.notify_all();
        LOG_INFO("Client session: {} -> {}", ToString(from), ToString(to));
        notifyObserver("OnStateChanged", [&](ISessionObserver& o) { o.OnStateChanged(from, to); });
        return true;
    }

    SessionState getState() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        return state;
    }

    std::shared_ptr<ISessionObserver> currentObserver() const {
        std::lock_guard<std::mutex> lock(handlersMutex);
        return observer;
    }

    template <typename Fn>
    void notifyObserver(const char* what, Fn&& fn) {
        if (auto obs = currentObserver()) {
            try {
                fn(*obs);
            } catch (const std::exception& e) {
                LOG_ERROR("Session observer threw in {}: {}", what, e.what());
            }
        }
    }

    /////////////////////////////////////////// Connect ///////////////////////////////////////////
    std::future<JSONValue> connect(TransportProvider prov, std::unique_ptr<ITransport> single) {
        std::promise<JSONValue> ready;
        auto fut = ready.get_future();
        std::lock_guard<std::mutex> lock(lifecycleMutex);
        if (supervisor.joinable()) {
            if (getState() != SessionState::Disconnected) {
                ready.set_exception(std::make_exception_ptr(std::logic_error("session already connected")));
                return fut;
            }
            supervisor.request_stop();
            supervisor.join();
        }
        {
            std::lock_guard<std::mutex> linkLock(linkMutex);
            provider = std::move(prov);
            pendingTransport = std::move(single);
            closing = false;
        }
        auto self = shared_from_this();
        supervisor = std::jthread([self, p = std::move(ready)](std::stop_token st) mutable {
            self->supervise(st, std::move(p));
        });
        return fut;
    }

    std::unique_ptr<ITransport> takeTransport() {
        TransportProvider prov;
        {
            std::lock_guard<std::mutex> lock(linkMutex);
            if (pendingTransport) {
                return std::move(pendingTransport);
            }
            prov = provider;
        }
        if (!prov) {
            throw errors::TransportError("no transport available for reconnection");
        }
        auto t = prov();
        if (!t) {
            throw errors::TransportError("transport provider returned no transport");
        }
        return t;
    }

    bool canReconnect() const {
        std::lock_guard<std::mutex> lock(linkMutex);
        return config.autoReconnect && static_cast<bool>(provider);
    }

    JSONValue buildInitializeParams() const {
        JSONValue caps = MakeObject();
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            if (requestHandlers.count(Methods::CreateMessage) > 0) {
                caps.Set("sampling", MakeObject());
            }
            if (requestHandlers.count(Methods::ListRoots) > 0) {
                JSONValue roots = MakeObject();
                roots.Set("listChanged", JSONValue(false));
                caps.Set("roots", std::move(roots));
            }
        }
        JSONValue params = MakeObject();
        params.Set("protocolVersion", JSONValue(PROTOCOL_VERSION));
        params.Set("capabilities", std::move(caps));
        params.Set("clientInfo", config.clientInfo.ToJSONValue());
        return params;
    }

    //==========================================================================================================
    // connectOnce
    // Purpose: One full connection attempt: fresh transport, start, initialize round trip, initialized
    //          notification, heartbeat.
    // Returns:
    //   The server's initialize result.
    // Throws:
    //   errors::TransportError on any failure; the half-built link is torn down first.
    //==========================================================================================================
    JSONValue connectOnce() {
        FUNC_SCOPE();
        setState(SessionState::Connecting);
        std::unique_ptr<ITransport> transport = takeTransport();

        auto started = transport->Start();
        if (started.wait_for(config.connectionTimeout) != std::future_status::ready) {
            transport->Close().wait();
            throw errors::TransportError("transport start timed out");
        }
        started.get();

        auto link = std::make_shared<Link>();
        link->generation = ++generationCounter;
        link->transport = std::move(transport);
        Link* raw = link.get();
        std::weak_ptr<Impl> weak = weak_from_this();
        link->correlator.SetTimeoutHandler([weak, raw](const JSONRPCId& id) {
            if (auto self = weak.lock()) {
                self->sendCancelled(*raw, id);
            }
        });
        JSONRPCId id = nextId.fetch_add(1);
        link->handshakeKey = IdToString(id);
        link->receiver = std::thread([weak, link]() {
            if (auto self = weak.lock()) {
                self->receiveLoop(link);
            }
        });
        if (config.heartbeatInterval.count() > 0) {
            link->heartbeat = std::jthread([weak, link](std::stop_token st) {
                if (auto self = weak.lock()) {
                    self->heartbeatLoop(st, link);
                }
            });
        }

        bool aborted = false;
        {
            std::lock_guard<std::mutex> lock(linkMutex);
            aborted = closing;
            if (!aborted) {
                current = link;
            }
        }
        if (aborted) {
            retire(link, "session is closing");
            throw errors::TransportError("session is closing");
        }

        setState(SessionState::Handshaking);
        auto reply = link->correlator.Register(id, config.connectionTimeout);
        sendOn(link, MessageCodec::Encode(Envelope{JSONRPCRequest(id, Methods::Initialize, buildInitializeParams())}));
        CallOutcome outcome = reply.get();
        if (!outcome.Ok()) {
            retire(link, "handshake failed");
            throw errors::TransportError("initialize failed (" + describe(outcome) + ")");
        }

        auto version = outcome.result.GetString("protocolVersion");
        const auto& supported = SupportedProtocolVersions();
        if (!version.has_value() || std::find(supported.begin(), supported.end(), version.value()) == supported.end()) {
            retire(link, "unsupported protocol version");
            throw errors::TransportError("server negotiated unsupported protocol version " + version.value_or("<none>"));
        }

        bool lost = false;
        {
            std::lock_guard<std::mutex> lock(linkMutex);
            lost = link->dead.load();
            if (!lost) {
                link->established.store(true);
            }
        }
        if (lost) {
            retire(link, "connection lost during handshake");
            throw errors::TransportError("connection lost during handshake");
        }
        {
            std::lock_guard<std::mutex> lock(linkMutex);
            protocolVersion = version.value();
            serverInfo.reset();
            if (const JSONValue* info = outcome.result.Find("serverInfo")) {
                serverInfo = Implementation::FromJSONValue(*info);
            }
            const JSONValue* caps = outcome.result.Find("capabilities");
            serverCapabilities = caps ? *caps : MakeObject();
            connectedAt = std::chrono::system_clock::now();
            readySince = std::chrono::steady_clock::now();
        }

        sendOn(link, MessageCodec::Encode(Envelope{JSONRPCNotification(Methods::Initialized)}));
        setState(SessionState::Ready);
        LOG_INFO("Client session ready (server {}, protocol {})",
                 serverInfo ? serverInfo->name + " " + serverInfo->version : std::string("<unnamed>"),
                 version.value());
        return outcome.result;
    }

    /////////////////////////////////////////// Supervisor ///////////////////////////////////////////
    void supervise(std::stop_token st, std::promise<JSONValue> ready) {
        try {
            JSONValue result = connectOnce();
            ready.set_value(std::move(result));
        } catch (const std::exception& e) {
            LOG_ERROR("Client session failed to connect: {}", e.what());
            setState(SessionState::Disconnected);
            ready.set_exception(std::current_exception());
            return;
        }

        while (!st.stop_requested()) {
            std::shared_ptr<Link> lostLink;
            std::string reason;
            {
                std::unique_lock<std::mutex> lock(eventMutex);
                eventCv.wait(lock, st, [this] { return lostEvent != nullptr; });
                if (st.stop_requested()) {
                    return;
                }
                lostLink = std::move(lostEvent);
                reason = std::move(lostReason);
            }
            lostLink->stopThreads();
            lostLink.reset();

            if (!canReconnect()) {
                setState(SessionState::Disconnected);
                notifyObserver("OnReconnectFailed", [&](ISessionObserver& o) { o.OnReconnectFailed(reason); });
                return;
            }
            if (!reconnect(st, reason)) {
                return;
            }
        }
    }

    // Runs one reconnection cycle. Returns false when the session went terminal or was stopped.
    bool reconnect(std::stop_token st, const std::string& reason) {
        setState(SessionState::Reconnecting);
        {
            std::lock_guard<std::mutex> lock(statsMutex);
            reconnectAttempts = 0;
        }
        std::string lastError = reason;
        for (unsigned int attempt = 1; attempt <= config.maxReconnectAttempts; ++attempt) {
            auto delay = ClientSession::ComputeBackoffDelay(config, attempt);
            LOG_INFO("Reconnect attempt {}/{} in {} ms", attempt, config.maxReconnectAttempts, delay.count());
            notifyObserver("OnReconnectAttempt", [&](ISessionObserver& o) { o.OnReconnectAttempt(attempt, delay); });
            {
                std::unique_lock<std::mutex> lock(eventMutex);
                eventCv.wait_for(lock, st, delay, [] { return false; });
            }
            if (st.stop_requested()) {
                return false;
            }
            {
                std::lock_guard<std::mutex> lock(statsMutex);
                reconnectAttempts = attempt;
            }
            try {
                connectOnce();
                {
                    std::lock_guard<std::mutex> lock(statsMutex);
                    ++totalReconnects;
                }
                LOG_INFO("Reconnected after {} attempt(s)", attempt);
                notifyObserver("OnReconnected", [&](ISessionObserver& o) { o.OnReconnected(attempt); });
                return true;
            } catch (const std::exception& e) {
                lastError = e.what();
                LOG_WARN("Reconnect attempt {} failed: {}", attempt, lastError);
                if (st.stop_requested()) {
                    return false;
                }
                setState(SessionState::Reconnecting);
            }
        }
        std::string finalReason = "giving up after " + std::to_string(config.maxReconnectAttempts) +
                                  " reconnect attempt(s): " + lastError;
        LOG_ERROR("Client session {}", finalReason);
        setState(SessionState::Disconnected);
        notifyObserver("OnReconnectFailed", [&](ISessionObserver& o) { o.OnReconnectFailed(finalReason); });
        return false;
    }

    //==========================================================================================================
    // onLinkLost
    // Purpose: Involuntary loss of a link. Fails every pending call, closes the carrier and, when the link had
    //          completed its handshake, hands it to the supervisor for reconnection. Runs at most once per link.
    //==========================================================================================================
    void onLinkLost(const std::shared_ptr<Link>& link, const std::string& reason) {
        bool report = false;
        {
            std::lock_guard<std::mutex> lock(linkMutex);
            if (link->dead.exchange(true)) {
                return;
            }
            report = link->established.load() && !closing;
            if (current == link) {
                current.reset();
            }
        }
        std::size_t failed = link->correlator.FailAll(reason);
        LOG_WARN("Client link {} lost: {} ({} pending call(s) failed)", link->generation, reason, failed);
        link->heartbeat.request_stop();
        closeTransport(*link);
        if (!report) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(eventMutex);
            lostEvent = link;
            lostReason = reason;
        }
        eventCv.notify_all();
    }

    // Tears down a link that never completed its handshake (called on the supervisor thread).
    void retire(const std::shared_ptr<Link>& link, const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(linkMutex);
            link->dead.store(true);
            if (current == link) {
                current.reset();
            }
        }
        link->correlator.FailAll(reason);
        closeTransport(*link);
        link->stopThreads();
    }

    void closeTransport(Link& link) {
        try {
            link.transport->Close().wait();
        } catch (const std::exception& e) {
            LOG_WARN("Transport close failed: {}", e.what());
        }
    }

    /////////////////////////////////////////// Receive ///////////////////////////////////////////
    void receiveLoop(const std::shared_ptr<Link>& link) {
        for (;;) {
            std::string frame;
            try {
                frame = link->transport->Receive();
            } catch (const errors::TransportError& e) {
                onLinkLost(link, e.what());
                return;
            }
            try {
                handleFrame(link, frame);
            } catch (const std::exception& e) {
                LOG_ERROR("Client session failed to handle frame: {}", e.what());
            }
        }
    }

    void handleFrame(const std::shared_ptr<Link>& link, const std::string& frame) {
        DecodeResult decoded = MessageCodec::Decode(frame);
        if (!decoded.Ok()) {
            LOG_WARN("Client session dropping undecodable frame: {}", decoded.error.detail);
            return;
        }
        if (auto* envelope = std::get_if<Envelope>(&decoded.message.value())) {
            handleEnvelope(link, *envelope);
            return;
        }
        const Batch& batch = std::get<Batch>(decoded.message.value());
        for (const auto& err : batch.invalid) {
            LOG_WARN("Client session dropping invalid batch member: {}", err.detail);
        }
        for (const auto& member : batch.members) {
            handleEnvelope(link, member);
        }
    }

    void handleEnvelope(const std::shared_ptr<Link>& link, const Envelope& envelope) {
        if (const auto* response = std::get_if<JSONRPCResponse>(&envelope)) {
            link->correlator.Resolve(*response);
        } else if (const auto* request = std::get_if<JSONRPCRequest>(&envelope)) {
            handleServerRequest(link, *request);
        } else {
            dispatchNotification(std::get<JSONRPCNotification>(envelope));
        }
    }

    void handleServerRequest(const std::shared_ptr<Link>& link, const JSONRPCRequest& request) {
        if (request.method == Methods::Ping) {
            sendOn(link, MessageCodec::Encode(Envelope{JSONRPCResponse(request.id, MakeObject())}));
            return;
        }
        RequestHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            auto it = requestHandlers.find(request.method);
            if (it != requestHandlers.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            LOG_WARN("Client session: no handler for server request {}", request.method);
            sendOn(link, MessageCodec::Encode(Envelope{JSONRPCResponse(
                request.id, CreateErrorObject(JSONRPCErrorCodes::MethodNotFound, "method not found: " + request.method),
                true)}));
            return;
        }
        std::weak_ptr<Impl> weak = weak_from_this();
        std::thread([weak, link, request, handler]() {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            JSONRPCResponse reply;
            try {
                reply = JSONRPCResponse(request.id, handler(request.params.value_or(MakeObject())));
            } catch (const errors::ProtocolError& e) {
                reply = JSONRPCResponse(request.id, CreateErrorObject(e.code(), e.what(), e.data()), true);
            } catch (const errors::ApplicationError& e) {
                reply = JSONRPCResponse(request.id,
                                        CreateErrorObject(JSONRPCErrorCodes::ApplicationError, e.what(), e.data()), true);
            } catch (const std::exception& e) {
                LOG_ERROR("Client request handler for {} threw: {}", request.method, e.what());
                reply = JSONRPCResponse(request.id,
                                        CreateErrorObject(JSONRPCErrorCodes::ApplicationError, e.what()), true);
            }
            self->sendOn(link, MessageCodec::Encode(Envelope{std::move(reply)}));
        }).detach();
    }

    void dispatchNotification(const JSONRPCNotification& notification) {
        std::vector<NotificationHandler> handlers;
        NotificationHandler sink;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            auto it = notificationHandlers.find(notification.method);
            if (it != notificationHandlers.end()) {
                handlers = it->second;
            }
            sink = catchAllHandler;
        }
        if (sink) {
            handlers.push_back(std::move(sink));
        }
        if (handlers.empty()) {
            LOG_DEBUG("Client session: unhandled notification {}", notification.method);
        }
        for (auto& h : handlers) {
            try {
                h(notification);
            } catch (const std::exception& e) {
                LOG_ERROR("Notification handler for {} threw: {}", notification.method, e.what());
            }
        }
    }

    /////////////////////////////////////////// Send ///////////////////////////////////////////
    // Writes a frame on link; a write failure counts as loss of that link. Returns false when the write failed.
    bool sendOn(const std::shared_ptr<Link>& link, const std::string& frame) {
        try {
            link->transport->Send(frame);
            return true;
        } catch (const errors::TransportError& e) {
            onLinkLost(link, e.what());
            return false;
        }
    }

    void sendCancelled(Link& link, const JSONRPCId& id) {
        if (IdToString(id) == link.handshakeKey || link.dead.load()) {
            return;
        }
        JSONValue params = MakeObject();
        params.Set("requestId", IdToJSONValue(id));
        params.Set("reason", JSONValue("request timed out"));
        try {
            link.transport->Send(MessageCodec::Encode(Envelope{JSONRPCNotification(Methods::Cancelled, params)}));
        } catch (const errors::TransportError& e) {
            LOG_DEBUG("Could not send cancellation for {}: {}", IdToString(id), e.what());
        }
    }

    std::shared_ptr<Link> liveLink() const {
        std::lock_guard<std::mutex> lock(linkMutex);
        if (!current || !current->established.load() || current->dead.load()) {
            return nullptr;
        }
        return current;
    }

    std::future<CallOutcome> invokeOn(const std::shared_ptr<Link>& link, const std::string& method,
                                      std::optional<JSONValue> params, std::chrono::milliseconds timeout) {
        JSONRPCId id = nextId.fetch_add(1);
        auto fut = link->correlator.Register(id, timeout);
        if (!sendOn(link, MessageCodec::Encode(Envelope{JSONRPCRequest(id, method, std::move(params))}))) {
            link->correlator.Resolve(id, CallOutcome::Lost("send failed"));
        }
        return fut;
    }

    std::future<CallOutcome> invoke(const std::string& method, std::optional<JSONValue> params,
                                    std::optional<std::chrono::milliseconds> timeout) {
        requirePositive(timeout);
        auto link = liveLink();
        if (!link) {
            return readyOutcome(CallOutcome::Lost(std::string("session is ") + ToString(getState())));
        }
        return invokeOn(link, method, std::move(params), timeout.value_or(config.requestTimeout));
    }

    /////////////////////////////////////////// Heartbeat ///////////////////////////////////////////
    void heartbeatLoop(std::stop_token st, const std::shared_ptr<Link>& link) {
        std::mutex waitMutex;
        std::condition_variable_any waitCv;
        while (!st.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(waitMutex);
                waitCv.wait_for(lock, st, config.heartbeatInterval, [] { return false; });
            }
            if (st.stop_requested() || link->dead.load()) {
                return;
            }
            if (!link->established.load()) {
                continue;
            }
            CallOutcome pong = invokeOn(link, Methods::Ping, std::nullopt, config.heartbeatTimeout).get();
            if (pong.status == CallStatus::Success || pong.status == CallStatus::ApplicationError) {
                if (link->missedHeartbeats.exchange(0) > 0) {
                    LOG_INFO("Heartbeat recovered");
                }
                transition(SessionState::Degraded, SessionState::Ready);
                continue;
            }
            if (pong.status == CallStatus::ConnectionLost) {
                return;
            }
            unsigned int misses = link->missedHeartbeats.fetch_add(1) + 1;
            LOG_WARN("Heartbeat missed ({}/{})", misses, config.maxMissedHeartbeats);
            transition(SessionState::Ready, SessionState::Degraded);
            if (misses >= config.maxMissedHeartbeats) {
                onLinkLost(link, "heartbeat missed " + std::to_string(misses) + " time(s)");
                return;
            }
        }
    }

    /////////////////////////////////////////// Disconnect ///////////////////////////////////////////
    void disconnect() {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
        {
            std::lock_guard<std::mutex> lock(linkMutex);
            closing = true;
            pendingTransport.reset();
        }
        supervisor.request_stop();
        // Unblocks a handshake in progress on the supervisor thread.
        teardownCurrent("session disconnected");
        if (supervisor.joinable() && supervisor.get_id() != std::this_thread::get_id()) {
            supervisor.join();
        }
        // A connection attempt may have published a link before it observed the stop request.
        teardownCurrent("session disconnected");
        {
            std::lock_guard<std::mutex> lock(eventMutex);
            lostEvent.reset();
        }
        setState(SessionState::Disconnected);
    }

    void teardownCurrent(const std::string& reason) {
        std::shared_ptr<Link> link;
        {
            std::lock_guard<std::mutex> lock(linkMutex);
            link = std::move(current);
            current.reset();
            if (link) {
                link->dead.store(true);
            }
        }
        if (!link) {
            return;
        }
        std::size_t failed = link->correlator.FailAll(reason);
        if (failed > 0) {
            LOG_INFO("{}: failed {} pending call(s)", reason, failed);
        }
        closeTransport(*link);
        link->stopThreads();
    }

    SessionConfig config;

    mutable std::mutex stateMutex;
    mutable std::condition_variable stateCv;
    SessionState state{SessionState::Disconnected};

    std::mutex lifecycleMutex;
    std::jthread supervisor;

    mutable std::mutex linkMutex;
    TransportProvider provider;
    std::unique_ptr<ITransport> pendingTransport;
    std::shared_ptr<Link> current;
    bool closing{false};
    std::optional<Implementation> serverInfo;
    JSONValue serverCapabilities{MakeObject()};
    std::string protocolVersion;
    std::optional<std::chrono::system_clock::time_point> connectedAt;
    std::chrono::steady_clock::time_point readySince{};

    std::mutex eventMutex;
    std::condition_variable_any eventCv;
    std::shared_ptr<Link> lostEvent;
    std::string lostReason;

    mutable std::mutex statsMutex;
    unsigned int reconnectAttempts{0};
    unsigned int totalReconnects{0};

    std::atomic<int64_t> nextId{1};
    std::atomic<uint64_t> generationCounter{0};

    mutable std::mutex handlersMutex;
    std::unordered_map<std::string, RequestHandler> requestHandlers;
    std::unordered_map<std::string, std::vector<NotificationHandler>> notificationHandlers;
    NotificationHandler catchAllHandler;
    std::shared_ptr<ISessionObserver> observer;
};

ClientSession::ClientSession(SessionConfig config) : pImpl(std::make_shared<Impl>(validated(std::move(config)))) {}

ClientSession::~ClientSession() {
    pImpl->disconnect();
}

std::future<JSONValue> ClientSession::Connect(TransportProvider provider) {
    if (!provider) {
        std::promise<JSONValue> p;
        p.set_exception(std::make_exception_ptr(std::invalid_argument("transport provider must not be empty")));
        return p.get_future();
    }
    return pImpl->connect(std::move(provider), nullptr);
}

std::future<JSONValue> ClientSession::Connect(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        std::promise<JSONValue> p;
        p.set_exception(std::make_exception_ptr(std::invalid_argument("transport must not be null")));
        return p.get_future();
    }
    return pImpl->connect(nullptr, std::move(transport));
}

std::future<void> ClientSession::Disconnect() {
    pImpl->disconnect();
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

SessionState ClientSession::GetState() const {
    return pImpl->getState();
}

SessionStats ClientSession::GetStats() const {
    SessionStats stats;
    stats.state = pImpl->getState();
    {
        std::lock_guard<std::mutex> lock(pImpl->statsMutex);
        stats.reconnectAttempts = pImpl->reconnectAttempts;
        stats.totalReconnects = pImpl->totalReconnects;
    }
    std::lock_guard<std::mutex> lock(pImpl->linkMutex);
    if (pImpl->current && pImpl->current->established.load()) {
        stats.connectedAt = pImpl->connectedAt;
        stats.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                             pImpl->readySince);
    }
    return stats;
}

bool ClientSession::WaitForState(SessionState state, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(pImpl->stateMutex);
    return pImpl->stateCv.wait_for(lock, timeout, [&] { return pImpl->state == state; });
}

std::optional<Implementation> ClientSession::GetServerInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->linkMutex);
    return pImpl->serverInfo;
}

JSONValue ClientSession::GetServerCapabilities() const {
    std::lock_guard<std::mutex> lock(pImpl->linkMutex);
    return pImpl->serverCapabilities;
}

std::string ClientSession::GetProtocolVersion() const {
    std::lock_guard<std::mutex> lock(pImpl->linkMutex);
    return pImpl->protocolVersion;
}

std::future<CallOutcome> ClientSession::Invoke(const std::string& method, std::optional<JSONValue> params,
                                               std::optional<std::chrono::milliseconds> timeout) {
    return pImpl->invoke(method, std::move(params), timeout);
}

std::vector<std::future<CallOutcome>> ClientSession::InvokeBatch(const std::vector<BatchCall>& calls,
                                                                 std::optional<std::chrono::milliseconds> timeout) {
    requirePositive(timeout);
    std::vector<std::future<CallOutcome>> futures;
    futures.reserve(calls.size());
    auto link = pImpl->liveLink();
    if (!link) {
        for (std::size_t i = 0; i < calls.size(); ++i) {
            futures.push_back(readyOutcome(CallOutcome::Lost("session is not connected")));
        }
        return futures;
    }
    if (calls.empty()) {
        return futures;
    }
    const auto deadline = timeout.value_or(pImpl->config.requestTimeout);
    Batch batch;
    std::vector<JSONRPCId> ids;
    for (const auto& call : calls) {
        JSONRPCId id = pImpl->nextId.fetch_add(1);
        futures.push_back(link->correlator.Register(id, deadline));
        batch.members.emplace_back(JSONRPCRequest(id, call.method, call.params));
        ids.push_back(id);
    }
    if (!pImpl->sendOn(link, MessageCodec::Encode(batch))) {
        for (const auto& id : ids) {
            link->correlator.Resolve(id, CallOutcome::Lost("send failed"));
        }
    }
    return futures;
}

void ClientSession::Notify(const std::string& method, std::optional<JSONValue> params) {
    auto link = pImpl->liveLink();
    if (!link) {
        throw errors::TransportError("session is not connected");
    }
    if (!pImpl->sendOn(link, MessageCodec::Encode(Envelope{JSONRPCNotification(method, std::move(params))}))) {
        throw errors::TransportError("notification " + method + " could not be sent");
    }
}

std::future<CallOutcome> ClientSession::Ping() {
    return Invoke(Methods::Ping);
}

std::future<CallOutcome> ClientSession::ListTools() {
    return Invoke(Methods::ListTools);
}

std::future<CallOutcome> ClientSession::CallTool(const std::string& name, const JSONValue& arguments,
                                                 std::optional<std::chrono::milliseconds> timeout) {
    JSONValue params = MakeObject();
    params.Set("name", JSONValue(name));
    params.Set("arguments", arguments);
    return Invoke(Methods::CallTool, std::move(params), timeout);
}

std::future<CallOutcome> ClientSession::ListResources() {
    return Invoke(Methods::ListResources);
}

std::future<CallOutcome> ClientSession::ReadResource(const std::string& uri) {
    JSONValue params = MakeObject();
    params.Set("uri", JSONValue(uri));
    return Invoke(Methods::ReadResource, std::move(params));
}

std::future<CallOutcome> ClientSession::SubscribeResource(const std::string& uri) {
    JSONValue params = MakeObject();
    params.Set("uri", JSONValue(uri));
    return Invoke(Methods::Subscribe, std::move(params));
}

std::future<CallOutcome> ClientSession::UnsubscribeResource(const std::string& uri) {
    JSONValue params = MakeObject();
    params.Set("uri", JSONValue(uri));
    return Invoke(Methods::Unsubscribe, std::move(params));
}

std::future<CallOutcome> ClientSession::ListPrompts() {
    return Invoke(Methods::ListPrompts);
}

std::future<CallOutcome> ClientSession::GetPrompt(const std::string& name, const JSONValue& arguments) {
    JSONValue params = MakeObject();
    params.Set("name", JSONValue(name));
    params.Set("arguments", arguments);
    return Invoke(Methods::GetPrompt, std::move(params));
}

std::future<CallOutcome> ClientSession::SetLogLevel(ProtocolLogLevel level) {
    JSONValue params = MakeObject();
    params.Set("level", JSONValue(ToString(level)));
    return Invoke(Methods::SetLogLevel, std::move(params));
}

void ClientSession::SetRequestHandler(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    if (handler) {
        pImpl->requestHandlers[method] = std::move(handler);
    } else {
        pImpl->requestHandlers.erase(method);
    }
}

void ClientSession::AddNotificationHandler(const std::string& method, NotificationHandler handler) {
    if (!handler) {
        throw std::invalid_argument("notification handler must not be empty");
    }
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->notificationHandlers[method].push_back(std::move(handler));
}

void ClientSession::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->catchAllHandler = std::move(handler);
}

void ClientSession::SetObserver(std::shared_ptr<ISessionObserver> observer) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->observer = std::move(observer);
}

std::chrono::milliseconds ClientSession::ComputeBackoffDelay(const SessionConfig& config, unsigned int attempt) {
    const unsigned int n = attempt == 0 ? 1 : attempt;
    const double cap = static_cast<double>(config.maxReconnectDelay.count());
    double delay = static_cast<double>(config.initialReconnectDelay.count()) *
                   std::pow(config.backoffMultiplier, static_cast<double>(n - 1));
    if (!std::isfinite(delay) || delay > cap) {
        delay = cap;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

} // namespace mcplink

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Server dispatcher implementation (accept loop, per-connection read loop, worker dispatch)
//==========================================================================================================
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <stop_token>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include <fmt/format.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplink/MessageCodec.h"
#include "mcplink/Server.h"

namespace mcplink {

namespace {

enum class ConnectionState {
    AwaitingHandshake,
    Serving,
    Closing
};

JSONRPCResponse errorReply(const JSONRPCId& id, int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt) {
    return JSONRPCResponse(id, CreateErrorObject(code, message, data), true);
}

std::string requireString(const JSONValue& params, const char* key, const std::string& method) {
    auto v = params.GetString(key);
    if (!v.has_value() || v->empty()) {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams,
                                    method + " requires a string '" + key + "'");
    }
    return v.value();
}

JSONValue objectMember(const JSONValue& params, const char* key, const std::string& method) {
    const JSONValue* member = params.Find(key);
    if (!member || member->IsNull()) {
        return MakeObject();
    }
    if (!member->IsObject()) {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams,
                                    method + ": '" + key + "' must be an object");
    }
    return *member;
}

const char* listChangedMethod(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::Tool: return Methods::ToolListChanged;
        case CapabilityKind::Resource: return Methods::ResourceListChanged;
        case CapabilityKind::Prompt: return Methods::PromptListChanged;
    }
    return Methods::ToolListChanged;
}

class Connection;

//==========================================================================================================
// ServerCore
// Purpose: State shared by the Server facade and every connection. Connections and their workers hold it by
//          shared_ptr, so a handler finishing after Server destruction still sees valid state.
//==========================================================================================================
struct ServerCore {
    explicit ServerCore(ServerConfig cfg) : config(std::move(cfg)) {}

    ServerConfig config;
    CapabilityRegistry registry;

    mutable std::mutex hooksMutex;
    Server::RequestGuard guard;
    Server::NotificationHandler notificationHandler;

    // Worker slots
    std::mutex slotsMutex;
    std::condition_variable slotsCv;
    std::size_t activeWorkers{0};

    // Live connections keyed by session id
    mutable std::mutex connMutex;
    mutable std::condition_variable connCv;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections;
    std::atomic<uint64_t> collisionCounter{0};

    bool tryAcquireSlot() {
        std::lock_guard<std::mutex> lock(slotsMutex);
        if (activeWorkers >= config.maxConcurrentRequests) {
            return false;
        }
        ++activeWorkers;
        return true;
    }

    void releaseSlot() {
        {
            std::lock_guard<std::mutex> lock(slotsMutex);
            --activeWorkers;
        }
        slotsCv.notify_all();
    }

    bool waitIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(slotsMutex);
        return slotsCv.wait_for(lock, timeout, [this] { return activeWorkers == 0; });
    }

    Server::RequestGuard currentGuard() const {
        std::lock_guard<std::mutex> lock(hooksMutex);
        return guard;
    }

    Server::NotificationHandler currentNotificationHandler() const {
        std::lock_guard<std::mutex> lock(hooksMutex);
        return notificationHandler;
    }

    std::vector<std::shared_ptr<Connection>> snapshot() const {
        std::lock_guard<std::mutex> lock(connMutex);
        std::vector<std::shared_ptr<Connection>> out;
        out.reserve(connections.size());
        for (const auto& [id, conn] : connections) {
            out.push_back(conn);
        }
        return out;
    }

    std::shared_ptr<Connection> find(const std::string& sessionId) const {
        std::lock_guard<std::mutex> lock(connMutex);
        auto it = connections.find(sessionId);
        return it == connections.end() ? nullptr : it->second;
    }

    void remove(const std::string& sessionId) {
        {
            std::lock_guard<std::mutex> lock(connMutex);
            connections.erase(sessionId);
        }
        connCv.notify_all();
    }

    void broadcastListChanged(CapabilityKind kind);
};

//==========================================================================================================
// BatchCollector
// Purpose: Gathers replies for one inbound batch and writes them as a single batch once every request member
//          has produced its reply (or had it suppressed).
//==========================================================================================================
struct BatchCollector {
    std::mutex mutex;
    std::size_t remaining{0};
    Batch replies;
    std::function<void(const Batch&)> flush;

    void complete(std::optional<JSONRPCResponse> reply) {
        bool done = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (reply.has_value()) {
                replies.members.emplace_back(std::move(reply.value()));
            }
            done = (--remaining == 0);
        }
        if (done && !replies.members.empty()) {
            flush(replies);
        }
    }
};

using ReplySink = std::function<void(std::optional<JSONRPCResponse>)>;

//==========================================================================================================
// Connection
// Purpose: One accepted peer: owns its transport, read loop, handshake state, in-flight handler stop sources,
//          subscriptions, logging level and a correlator for server-initiated requests.
//==========================================================================================================
class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(std::shared_ptr<ServerCore> core, std::unique_ptr<ITransport> transport, std::string sessionId)
        : core(std::move(core)), transport(std::move(transport)), sessionId(std::move(sessionId)) {}

    ~Connection() {
        if (readThread.joinable()) {
            if (readThread.get_id() == std::this_thread::get_id()) {
                readThread.detach();
            } else {
                readThread.join();
            }
        }
    }

    const std::string& SessionId() const { return sessionId; }
    ConnectionState State() const { return state.load(); }

    void Start() {
        auto self = shared_from_this();
        readThread = std::thread([self]() { self->readLoop(); });
    }

    // Closes the carrier and signals every in-flight handler; the read loop finishes the teardown.
    void Close() {
        signalInflight();
        try {
            transport->Close().get();
        } catch (const std::exception& e) {
            LOG_WARN("Session {}: transport close failed: {}", sessionId, e.what());
        }
    }

    void Join() {
        std::thread::id self = std::this_thread::get_id();
        if (readThread.joinable() && readThread.get_id() != self) {
            readThread.join();
        }
    }

    void SendNotification(const JSONRPCNotification& notification) {
        if (state.load() != ConnectionState::Serving) {
            return;
        }
        sendFrame(MessageCodec::Encode(Envelope{notification}));
    }

    bool IsSubscribed(const std::string& uri) const {
        std::lock_guard<std::mutex> lock(subMutex);
        return subscriptions.count(uri) > 0;
    }

    bool Admits(ProtocolLogLevel level) const {
        return static_cast<int>(level) >= logLevel.load();
    }

    std::future<CallOutcome> SendRequest(const std::string& method, std::optional<JSONValue> params,
                                         std::chrono::milliseconds timeout) {
        if (state.load() != ConnectionState::Serving) {
            std::promise<CallOutcome> p;
            p.set_value(CallOutcome::Lost("session " + sessionId + " is not serving"));
            return p.get_future();
        }
        JSONRPCId id = nextServerId.fetch_add(1);
        auto fut = correlator.Register(id, timeout);
        try {
            transport->Send(MessageCodec::Encode(Envelope{JSONRPCRequest(id, method, std::move(params))}));
        } catch (const errors::TransportError& e) {
            correlator.Resolve(id, CallOutcome::Lost(e.what()));
        }
        return fut;
    }

private:
    void readLoop() {
        LOG_INFO("Session {} connected", sessionId);
        for (;;) {
            std::string frame;
            try {
                frame = transport->Receive();
            } catch (const errors::TransportError& e) {
                LOG_INFO("Session {} closed: {}", sessionId, e.what());
                break;
            }
            try {
                handleFrame(frame);
            } catch (const std::exception& e) {
                LOG_ERROR("Session {}: failed to handle frame: {}", sessionId, e.what());
            }
        }
        teardown("connection closed");
    }

    void teardown(const std::string& reason) {
        state.store(ConnectionState::Closing);
        std::size_t failed = correlator.FailAll(reason);
        if (failed > 0) {
            LOG_DEBUG("Session {}: failed {} server-initiated request(s)", sessionId, failed);
        }
        signalInflight();
        try {
            transport->Close().get();
        } catch (const std::exception& e) {
            LOG_WARN("Session {}: transport close failed: {}", sessionId, e.what());
        }
        core->remove(sessionId);
    }

    void signalInflight() {
        std::lock_guard<std::mutex> lock(inflightMutex);
        for (auto& [key, src] : inflight) {
            src->request_stop();
        }
    }

    void sendFrame(const std::string& frame) {
        try {
            transport->Send(frame);
        } catch (const errors::TransportError& e) {
            LOG_DEBUG("Session {}: dropping outbound frame: {}", sessionId, e.what());
        }
    }

    ReplySink directSink() {
        std::weak_ptr<Connection> weak = weak_from_this();
        return [weak](std::optional<JSONRPCResponse> reply) {
            auto self = weak.lock();
            if (self && reply.has_value()) {
                self->sendFrame(MessageCodec::Encode(Envelope{std::move(reply.value())}));
            }
        };
    }

    void handleFrame(const std::string& frame) {
        DecodeResult decoded = MessageCodec::Decode(frame);
        if (!decoded.Ok()) {
            LOG_WARN("Session {}: undecodable frame ({}): {}", sessionId,
                     decoded.status == DecodeStatus::ParseError ? "parse error" : "invalid envelope",
                     decoded.error.detail);
            sendFrame(MessageCodec::Encode(Envelope{MessageCodec::MakeErrorReply(decoded.error)}));
            return;
        }
        if (auto* envelope = std::get_if<Envelope>(&decoded.message.value())) {
            handleEnvelope(*envelope, directSink());
            return;
        }
        handleBatch(std::get<Batch>(decoded.message.value()));
    }

    void handleBatch(const Batch& batch) {
        std::size_t expected = batch.invalid.size();
        for (const auto& member : batch.members) {
            if (std::holds_alternative<JSONRPCRequest>(member)) {
                ++expected;
            }
        }

        auto collector = std::make_shared<BatchCollector>();
        collector->remaining = expected;
        std::weak_ptr<Connection> weak = weak_from_this();
        collector->flush = [weak](const Batch& replies) {
            if (auto self = weak.lock()) {
                self->sendFrame(MessageCodec::Encode(replies));
            }
        };
        ReplySink sink = [collector](std::optional<JSONRPCResponse> reply) {
            collector->complete(std::move(reply));
        };

        LOG_DEBUG("Session {}: batch of {} member(s), {} invalid", sessionId, batch.members.size(),
                  batch.invalid.size());
        for (const auto& err : batch.invalid) {
            sink(MessageCodec::MakeErrorReply(err));
        }
        for (const auto& member : batch.members) {
            handleEnvelope(member, sink);
        }
    }

    void handleEnvelope(const Envelope& envelope, const ReplySink& sink) {
        if (const auto* request = std::get_if<JSONRPCRequest>(&envelope)) {
            dispatchRequest(*request, sink);
        } else if (const auto* notification = std::get_if<JSONRPCNotification>(&envelope)) {
            handleNotification(*notification);
        } else {
            const auto& response = std::get<JSONRPCResponse>(envelope);
            correlator.Resolve(response);
        }
    }

    /////////////////////////////////////////// Requests ///////////////////////////////////////////
    void dispatchRequest(const JSONRPCRequest& request, const ReplySink& sink) {
        if (request.method == Methods::Initialize) {
            sink(handleInitialize(request));
            return;
        }
        if (state.load() != ConnectionState::Serving) {
            LOG_WARN("Session {}: {} before initialize", sessionId, request.method);
            sink(errorReply(request.id, JSONRPCErrorCodes::NotInitialized, "server not initialized"));
            return;
        }
        if (request.method == Methods::Ping) {
            sink(JSONRPCResponse(request.id, MakeObject()));
            return;
        }

        if (auto guard = core->currentGuard()) {
            std::optional<errors::McpError> rejection;
            try {
                rejection = guard(sessionId, request);
            } catch (const std::exception& e) {
                LOG_ERROR("Session {}: request guard threw: {}", sessionId, e.what());
                rejection = errors::makeError(JSONRPCErrorCodes::InternalError, "request guard failed");
            }
            if (rejection.has_value()) {
                LOG_INFO("Session {}: {} rejected by request guard ({})", sessionId, request.method,
                         rejection->message);
                sink(JSONRPCResponse(request.id, errors::makeErrorValue(rejection.value()), true));
                return;
            }
        }

        if (!core->tryAcquireSlot()) {
            LOG_WARN("Session {}: rejecting {} (server overloaded)", sessionId, request.method);
            sink(errorReply(request.id, JSONRPCErrorCodes::ServerOverloaded, "server overloaded"));
            return;
        }

        auto stopSource = registerInflight(request.id);
        if (!stopSource) {
            core->releaseSlot();
            sink(errorReply(request.id, JSONRPCErrorCodes::InvalidRequest,
                            "request id already in flight: " + IdToString(request.id)));
            return;
        }

        auto self = shared_from_this();
        try {
            std::thread([self, request, sink, stopSource]() {
                JSONRPCResponse reply = self->execute(request, stopSource->get_token());
                bool cancelled = self->unregisterInflight(request.id);
                self->core->releaseSlot();
                if (cancelled) {
                    LOG_DEBUG("Session {}: suppressing reply to cancelled request {}", self->sessionId,
                              IdToString(request.id));
                    sink(std::nullopt);
                    return;
                }
                sink(std::move(reply));
            }).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("Session {}: could not start worker: {}", sessionId, e.what());
            unregisterInflight(request.id);
            core->releaseSlot();
            sink(errorReply(request.id, JSONRPCErrorCodes::InternalError, "could not start worker"));
        }
    }

    JSONRPCResponse handleInitialize(const JSONRPCRequest& request) {
        if (state.load() != ConnectionState::AwaitingHandshake) {
            return errorReply(request.id, JSONRPCErrorCodes::InvalidRequest, "already initialized");
        }
        if (!request.params.has_value() || !request.params->IsObject()) {
            return errorReply(request.id, JSONRPCErrorCodes::InvalidParams, "initialize requires params");
        }
        const JSONValue& params = request.params.value();

        std::string negotiated = PROTOCOL_VERSION;
        if (auto requested = params.GetString("protocolVersion")) {
            const auto& supported = SupportedProtocolVersions();
            if (std::find(supported.begin(), supported.end(), requested.value()) != supported.end()) {
                negotiated = requested.value();
            } else {
                LOG_WARN("Session {}: client requested unsupported protocol {}, offering {}", sessionId,
                         requested.value(), negotiated);
            }
        }

        std::string client = "unknown client";
        if (const JSONValue* info = params.Find("clientInfo")) {
            if (auto impl = Implementation::FromJSONValue(*info)) {
                client = impl->name + " " + impl->version;
            }
        }

        JSONValue listChanged = MakeObject();
        listChanged.Set("listChanged", JSONValue(true));
        JSONValue resources = MakeObject();
        resources.Set("subscribe", JSONValue(true));
        resources.Set("listChanged", JSONValue(true));
        JSONValue capabilities = MakeObject();
        capabilities.Set("tools", listChanged);
        capabilities.Set("resources", std::move(resources));
        capabilities.Set("prompts", listChanged);
        capabilities.Set("logging", MakeObject());

        JSONValue result = MakeObject();
        result.Set("protocolVersion", JSONValue(negotiated));
        result.Set("capabilities", std::move(capabilities));
        result.Set("serverInfo", core->config.serverInfo.ToJSONValue());
        if (core->config.instructions.has_value()) {
            result.Set("instructions", JSONValue(core->config.instructions.value()));
        }

        state.store(ConnectionState::Serving);
        LOG_INFO("Session {} initialized by {} (protocol {})", sessionId, client, negotiated);
        return JSONRPCResponse(request.id, std::move(result));
    }

    //==========================================================================================================
    // execute
    // Purpose: Runs one request on a worker and converts every failure into an ErrorResponse.
    //==========================================================================================================
    JSONRPCResponse execute(const JSONRPCRequest& request, std::stop_token token) {
        InvocationContext ctx;
        ctx.requestId = request.id;
        ctx.sessionId = sessionId;
        ctx.stopToken = std::move(token);
        try {
            return JSONRPCResponse(request.id, route(request, ctx));
        } catch (const errors::ProtocolError& e) {
            LOG_DEBUG("Session {}: {} failed with code {}: {}", sessionId, request.method, e.code(), e.what());
            return errorReply(request.id, e.code(), e.what(), e.data());
        } catch (const errors::ApplicationError& e) {
            LOG_WARN("Session {}: handler for {} reported: {}", sessionId, request.method, e.what());
            return errorReply(request.id, JSONRPCErrorCodes::ApplicationError, e.what(), e.data());
        } catch (const std::exception& e) {
            LOG_ERROR("Session {}: handler for {} threw: {}", sessionId, request.method, e.what());
            return errorReply(request.id, JSONRPCErrorCodes::ApplicationError, e.what());
        } catch (...) {
            LOG_ERROR("Session {}: handler for {} threw a non-standard exception", sessionId, request.method);
            return errorReply(request.id, JSONRPCErrorCodes::InternalError, "internal error");
        }
    }

    JSONValue route(const JSONRPCRequest& request, const InvocationContext& ctx) {
        const std::string& method = request.method;
        const JSONValue params = request.params.value_or(MakeObject());
        CapabilityRegistry& registry = core->registry;

        if (method == Methods::ListTools) {
            return listResult("tools", CapabilityKind::Tool);
        }
        if (method == Methods::CallTool) {
            std::string name = requireString(params, "name", method);
            auto desc = invocable(CapabilityKind::Tool, name, JSONRPCErrorCodes::ToolNotFound);
            return desc.handler->Invoke(objectMember(params, "arguments", method), ctx);
        }
        if (method == Methods::ListResources) {
            return listResult("resources", CapabilityKind::Resource);
        }
        if (method == Methods::ReadResource) {
            std::string uri = requireString(params, "uri", method);
            auto desc = invocable(CapabilityKind::Resource, uri, JSONRPCErrorCodes::ResourceNotFound);
            return desc.handler->Invoke(params, ctx);
        }
        if (method == Methods::Subscribe || method == Methods::Unsubscribe) {
            std::string uri = requireString(params, "uri", method);
            std::lock_guard<std::mutex> lock(subMutex);
            if (method == Methods::Subscribe) {
                if (!registry.Get(CapabilityKind::Resource, uri).has_value()) {
                    throw errors::ProtocolError(JSONRPCErrorCodes::ResourceNotFound, "resource not found: " + uri);
                }
                subscriptions.insert(uri);
            } else {
                subscriptions.erase(uri);
            }
            return MakeObject();
        }
        if (method == Methods::ListPrompts) {
            return listResult("prompts", CapabilityKind::Prompt);
        }
        if (method == Methods::GetPrompt) {
            std::string name = requireString(params, "name", method);
            auto desc = invocable(CapabilityKind::Prompt, name, JSONRPCErrorCodes::PromptNotFound);
            return desc.handler->Invoke(objectMember(params, "arguments", method), ctx);
        }
        if (method == Methods::SetLogLevel) {
            std::string raw = requireString(params, "level", method);
            auto level = ProtocolLogLevelFromString(raw);
            if (!level.has_value()) {
                throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "unknown logging level: " + raw);
            }
            logLevel.store(static_cast<int>(level.value()));
            LOG_DEBUG("Session {}: client logging level set to {}", sessionId, raw);
            return MakeObject();
        }
        throw errors::ProtocolError(JSONRPCErrorCodes::MethodNotFound, "method not found: " + method);
    }

    // A disabled capability answers with the same code as a missing one.
    CapabilityDescriptor invocable(CapabilityKind kind, const std::string& name, int notFoundCode) const {
        auto desc = core->registry.Get(kind, name);
        if (!desc.has_value()) {
            throw errors::ProtocolError(notFoundCode, fmt::format("{} not found: {}", ToString(kind), name));
        }
        if (!desc->enabled) {
            throw errors::ProtocolError(notFoundCode, fmt::format("{} disabled: {}", ToString(kind), name));
        }
        return std::move(desc.value());
    }

    JSONValue listResult(const char* key, CapabilityKind kind) const {
        std::vector<JSONValue> items;
        for (const auto& desc : core->registry.List(kind)) {
            items.push_back(desc.ToJSONValue(kind));
        }
        JSONValue result = MakeObject();
        result.Set(key, MakeArray(std::move(items)));
        return result;
    }

    /////////////////////////////////////////// Notifications ///////////////////////////////////////////
    void handleNotification(const JSONRPCNotification& notification) {
        if (notification.method == Methods::Initialized || notification.method == Methods::InitializedLegacy) {
            LOG_DEBUG("Session {}: client confirmed initialization", sessionId);
            return;
        }
        if (notification.method == Methods::Cancelled) {
            handleCancelled(notification);
            return;
        }
        if (state.load() != ConnectionState::Serving) {
            LOG_WARN("Session {}: dropping notification {} before initialize", sessionId, notification.method);
            return;
        }
        auto handler = core->currentNotificationHandler();
        if (!handler) {
            LOG_DEBUG("Session {}: ignoring notification {}", sessionId, notification.method);
            return;
        }
        try {
            handler(sessionId, notification);
        } catch (const std::exception& e) {
            LOG_ERROR("Session {}: notification handler for {} threw: {}", sessionId, notification.method,
                      e.what());
        }
    }

    void handleCancelled(const JSONRPCNotification& notification) {
        const JSONValue* idVal = notification.params ? notification.params->Find("requestId") : nullptr;
        if (!idVal) {
            LOG_WARN("Session {}: cancellation without requestId", sessionId);
            return;
        }
        JSONRPCId id = nullptr;
        if (const auto* s = std::get_if<std::string>(&idVal->value)) {
            id = *s;
        } else if (const auto* n = std::get_if<int64_t>(&idVal->value)) {
            id = *n;
        } else {
            LOG_WARN("Session {}: cancellation with malformed requestId", sessionId);
            return;
        }
        std::string reason = notification.params->GetString("reason").value_or("unspecified");

        std::lock_guard<std::mutex> lock(inflightMutex);
        auto it = inflight.find(IdToString(id));
        if (it == inflight.end()) {
            LOG_DEBUG("Session {}: cancellation for unknown request {}", sessionId, IdToString(id));
            return;
        }
        cancelled.insert(it->first);
        it->second->request_stop();
        LOG_INFO("Session {}: request {} cancelled ({})", sessionId, IdToString(id), reason);
    }

    /////////////////////////////////////////// In-flight tracking ///////////////////////////////////////////
    // Returns nullptr when a request with the same id is still running.
    std::shared_ptr<std::stop_source> registerInflight(const JSONRPCId& id) {
        std::lock_guard<std::mutex> lock(inflightMutex);
        std::string key = IdToString(id);
        if (inflight.count(key) > 0) {
            return nullptr;
        }
        auto src = std::make_shared<std::stop_source>();
        if (state.load() == ConnectionState::Closing) {
            src->request_stop();
        }
        inflight.emplace(std::move(key), src);
        return src;
    }

    // Returns true when the request was cancelled by the peer.
    bool unregisterInflight(const JSONRPCId& id) {
        std::lock_guard<std::mutex> lock(inflightMutex);
        std::string key = IdToString(id);
        inflight.erase(key);
        return cancelled.erase(key) > 0;
    }

    std::shared_ptr<ServerCore> core;
    std::unique_ptr<ITransport> transport;
    std::string sessionId;
    std::atomic<ConnectionState> state{ConnectionState::AwaitingHandshake};
    std::thread readThread;

    RequestCorrelator correlator;
    std::atomic<int64_t> nextServerId{1};

    std::mutex inflightMutex;
    std::unordered_map<std::string, std::shared_ptr<std::stop_source>> inflight;
    std::unordered_set<std::string> cancelled;

    mutable std::mutex subMutex;
    std::set<std::string> subscriptions;
    std::atomic<int> logLevel{static_cast<int>(ProtocolLogLevel::Info)};
};

void ServerCore::broadcastListChanged(CapabilityKind kind) {
    JSONRPCNotification notification(listChangedMethod(kind));
    for (const auto& conn : snapshot()) {
        conn->SendNotification(notification);
    }
}

} // namespace

//==========================================================================================================
// ServerConfig
//==========================================================================================================
ServerConfig ServerConfig::FromEnvironment() {
    ServerConfig cfg;
    try {
        if (auto v = GetEnvUnsigned("MCPLINK_MAX_CONCURRENT_REQUESTS")) {
            if (v.value() > 0) {
                cfg.maxConcurrentRequests = static_cast<std::size_t>(v.value());
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring MCPLINK_MAX_CONCURRENT_REQUESTS: {}", e.what());
    }
    try {
        if (auto v = GetEnvUnsigned("MCPLINK_REQUEST_TIMEOUT_MS")) {
            cfg.requestTimeout = std::chrono::milliseconds(v.value());
        }
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring MCPLINK_REQUEST_TIMEOUT_MS: {}", e.what());
    }
    return cfg;
}

//==========================================================================================================
// Server::Impl
//==========================================================================================================
class Server::Impl {
public:
    explicit Impl(ServerConfig config) : core(std::make_shared<ServerCore>(std::move(config))) {
        std::weak_ptr<ServerCore> weak = core;
        core->registry.SetChangeListener([weak](CapabilityKind kind) {
            if (auto c = weak.lock()) {
                c->broadcastListChanged(kind);
            }
        });
    }

    std::string attach(std::unique_ptr<ITransport> transport) {
        std::string sessionId = transport->GetSessionId();
        std::shared_ptr<Connection> conn;
        {
            std::lock_guard<std::mutex> lock(core->connMutex);
            if (sessionId.empty() || core->connections.count(sessionId) > 0) {
                sessionId += "#" + std::to_string(core->collisionCounter.fetch_add(1) + 1);
            }
            conn = std::make_shared<Connection>(core, std::move(transport), sessionId);
            core->connections.emplace(sessionId, conn);
        }
        conn->Start();
        return sessionId;
    }

    void acceptLoop() {
        while (running.load()) {
            std::unique_ptr<ITransport> peer;
            try {
                peer = acceptor->AcceptPeer();
            } catch (const errors::TransportError& e) {
                if (running.load()) {
                    LOG_ERROR("Accept loop ended: {}", e.what());
                }
                break;
            }
            if (!running.load()) {
                peer->Close().wait();
                break;
            }
            std::string id = attach(std::move(peer));
            LOG_INFO("Accepted peer {}", id);
        }
    }

    void stop() {
        bool wasRunning = running.exchange(false);
        if (acceptor) {
            try {
                acceptor->Stop().get();
            } catch (const std::exception& e) {
                LOG_WARN("Acceptor stop failed: {}", e.what());
            }
        }
        if (acceptThread.joinable()) {
            acceptThread.join();
        }

        auto connections = core->snapshot();
        for (auto& conn : connections) {
            conn->Close();
        }
        for (auto& conn : connections) {
            conn->Join();
        }
        if (!core->waitIdle(core->config.shutdownGrace)) {
            LOG_WARN("Stop: handlers still running after {} ms grace", core->config.shutdownGrace.count());
        }
        if (wasRunning || !connections.empty()) {
            LOG_INFO("Server stopped ({} connection(s) closed)", connections.size());
        }
    }

    std::shared_ptr<ServerCore> core;
    std::unique_ptr<ITransportAcceptor> acceptor;
    std::thread acceptThread;
    std::atomic<bool> running{false};
    std::mutex lifecycleMutex;
};

Server::Server(ServerConfig config) : pImpl(std::make_unique<Impl>(std::move(config))) {}

Server::~Server() {
    Stop().wait();
}

std::future<void> Server::Start(std::unique_ptr<ITransportAcceptor> acceptor) {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    std::lock_guard<std::mutex> lock(pImpl->lifecycleMutex);
    if (!acceptor) {
        ready.set_exception(std::make_exception_ptr(std::invalid_argument("acceptor must not be null")));
        return fut;
    }
    if (pImpl->running.load()) {
        ready.set_exception(std::make_exception_ptr(std::logic_error("server already started")));
        return fut;
    }
    try {
        acceptor->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed to start acceptor: {}", e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->acceptor = std::move(acceptor);
    pImpl->running.store(true);
    pImpl->acceptThread = std::thread([impl = pImpl.get()]() { impl->acceptLoop(); });
    LOG_INFO("Server {} {} accepting peers", pImpl->core->config.serverInfo.name,
             pImpl->core->config.serverInfo.version);
    ready.set_value();
    return fut;
}

std::string Server::Serve(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    if (!transport) {
        throw std::invalid_argument("transport must not be null");
    }
    if (!transport->IsConnected()) {
        transport->Start().get();
    }
    std::string id = pImpl->attach(std::move(transport));
    LOG_INFO("Serving session {}", id);
    return id;
}

std::future<void> Server::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    {
        std::lock_guard<std::mutex> lock(pImpl->lifecycleMutex);
        pImpl->stop();
    }
    done.set_value();
    return done.get_future();
}

bool Server::IsRunning() const {
    return pImpl->running.load();
}

std::size_t Server::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->core->connMutex);
    return pImpl->core->connections.size();
}

std::vector<std::string> Server::SessionIds() const {
    std::vector<std::string> ids;
    for (const auto& conn : pImpl->core->snapshot()) {
        ids.push_back(conn->SessionId());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool Server::WaitForDisconnect(const std::string& sessionId, std::chrono::milliseconds timeout) const {
    auto& core = *pImpl->core;
    std::unique_lock<std::mutex> lock(core.connMutex);
    return core.connCv.wait_for(lock, timeout, [&] { return core.connections.count(sessionId) == 0; });
}

CapabilityRegistry& Server::Registry() {
    return pImpl->core->registry;
}

void Server::RegisterTool(const std::string& name, const std::string& description,
                          std::optional<JSONValue> inputSchema, HandlerFunction handler) {
    CapabilityDescriptor desc;
    desc.name = name;
    desc.description = description;
    desc.inputSchema = std::move(inputSchema);
    desc.handler = MakeHandler(std::move(handler));
    pImpl->core->registry.Register(CapabilityKind::Tool, std::move(desc));
}

void Server::RegisterResource(const std::string& uri, const std::string& name, const std::string& description,
                              std::optional<std::string> mimeType, HandlerFunction handler) {
    CapabilityDescriptor desc;
    desc.name = uri;
    desc.title = name;
    desc.description = description;
    desc.mimeType = std::move(mimeType);
    desc.handler = MakeHandler(std::move(handler));
    pImpl->core->registry.Register(CapabilityKind::Resource, std::move(desc));
}

void Server::RegisterPrompt(const std::string& name, const std::string& description,
                            std::optional<JSONValue> arguments, HandlerFunction handler) {
    CapabilityDescriptor desc;
    desc.name = name;
    desc.description = description;
    desc.inputSchema = std::move(arguments);
    desc.handler = MakeHandler(std::move(handler));
    pImpl->core->registry.Register(CapabilityKind::Prompt, std::move(desc));
}

void Server::NotifyResourceUpdated(const std::string& uri) {
    JSONValue params = MakeObject();
    params.Set("uri", JSONValue(uri));
    JSONRPCNotification notification(Methods::ResourceUpdated, std::move(params));
    for (const auto& conn : pImpl->core->snapshot()) {
        if (conn->IsSubscribed(uri)) {
            conn->SendNotification(notification);
        }
    }
}

void Server::Log(ProtocolLogLevel level, const std::string& logger, const JSONValue& data) {
    JSONValue params = MakeObject();
    params.Set("level", JSONValue(ToString(level)));
    if (!logger.empty()) {
        params.Set("logger", JSONValue(logger));
    }
    params.Set("data", data);
    JSONRPCNotification notification(Methods::Log, std::move(params));
    for (const auto& conn : pImpl->core->snapshot()) {
        if (conn->Admits(level)) {
            conn->SendNotification(notification);
        }
    }
}

std::future<CallOutcome> Server::SendRequest(const std::string& sessionId, const std::string& method,
                                             std::optional<JSONValue> params,
                                             std::optional<std::chrono::milliseconds> timeout) {
    const auto deadline = timeout.value_or(pImpl->core->config.requestTimeout);
    if (deadline.count() <= 0) {
        throw std::invalid_argument("server request timeout must be positive");
    }
    auto conn = pImpl->core->find(sessionId);
    if (!conn) {
        std::promise<CallOutcome> p;
        p.set_value(CallOutcome::Lost("unknown session: " + sessionId));
        return p.get_future();
    }
    return conn->SendRequest(method, std::move(params), deadline);
}

void Server::SetRequestGuard(RequestGuard guard) {
    std::lock_guard<std::mutex> lock(pImpl->core->hooksMutex);
    pImpl->core->guard = std::move(guard);
}

void Server::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->core->hooksMutex);
    pImpl->core->notificationHandler = std::move(handler);
}

} // namespace mcplink

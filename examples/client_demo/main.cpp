//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Client session example against the echo server (TCP or HTTP+SSE)
//==========================================================================================================

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplink/ClientSession.h"
#include "mcplink/TransportFactory.h"

using namespace mcplink;

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

// Logs lifecycle transitions and reconnection progress
class LoggingObserver : public ISessionObserver {
public:
    void OnStateChanged(SessionState from, SessionState to) override {
        LOG_INFO("Session state {} -> {}", ToString(from), ToString(to));
    }
    void OnReconnectAttempt(unsigned int attempt, std::chrono::milliseconds delay) override {
        LOG_INFO("Reconnect attempt {} after {} ms", attempt, delay.count());
    }
    void OnReconnected(unsigned int attempt) override {
        LOG_INFO("Reconnected on attempt {}", attempt);
    }
    void OnReconnectFailed(const std::string& reason) override {
        LOG_WARN("Reconnection abandoned: {}", reason);
    }
};

static void report(const char* what, const CallOutcome& outcome) {
    if (outcome.Ok()) {
        LOG_INFO("{} -> {}", what, SerializeJSONValue(outcome.result));
    } else if (outcome.error.has_value()) {
        LOG_WARN("{} failed ({}): {} [{}]", what, ToString(outcome.status), outcome.error->message,
                 outcome.error->code);
    } else {
        LOG_WARN("{} failed ({}): {}", what, ToString(outcome.status), outcome.detail);
    }
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevelFromString(GetEnvOrDefault("MCPLINK_LOG_LEVEL", "INFO"));

    std::string endpoint = getArgValue(argc, argv, "--connect").value_or("tcp://127.0.0.1:7000");
    std::string message = getArgValue(argc, argv, "--message").value_or("hello from mcplink");

    SessionConfig config = SessionConfig::FromEnvironment();
    config.clientInfo = Implementation("mcplink client demo", getVersionString());

    ClientSession session(config);
    session.SetObserver(std::make_shared<LoggingObserver>());
    session.AddNotificationHandler(Methods::Log, [](const JSONRPCNotification& n) {
        LOG_INFO("Server log: {}", n.params.has_value() ? SerializeJSONValue(n.params.value()) : std::string("{}"));
    });
    session.AddNotificationHandler(Methods::ResourceUpdated, [](const JSONRPCNotification& n) {
        LOG_INFO("Resource updated: {}", n.params.has_value() ? n.params->GetString("uri").value_or("?") : "?");
    });
    session.SetRequestHandler(Methods::ListRoots, [](const JSONValue&) {
        JSONValue root = MakeObject();
        root.Set("uri", JSONValue("file:///tmp"));
        root.Set("name", JSONValue("tmp"));
        JSONValue result = MakeObject();
        result.Set("roots", MakeArray({root}));
        return result;
    });

    try {
        JSONValue init = session.Connect(MakeTransportProvider(endpoint)).get();
        LOG_INFO("Connected to {} (protocol {})", endpoint, session.GetProtocolVersion());
        if (auto instructions = init.GetString("instructions")) {
            LOG_INFO("Server instructions: {}", instructions.value());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Could not connect to {}: {}", endpoint, e.what());
        return EXIT_FAILURE;
    }

    report("ping", session.Ping().get());
    report("tools/list", session.ListTools().get());

    JSONValue args = MakeObject();
    args.Set("message", JSONValue(message));
    report("tools/call echo", session.CallTool("echo", args).get());

    JSONValue sleepArgs = MakeObject();
    sleepArgs.Set("ms", JSONValue(2000));
    report("tools/call sleep (expected to time out)",
           session.CallTool("sleep", sleepArgs, std::chrono::milliseconds(200)).get());

    report("resources/read", session.ReadResource("mem://readme").get());
    report("resources/subscribe", session.SubscribeResource("mem://readme").get());

    JSONValue promptArgs = MakeObject();
    promptArgs.Set("name", JSONValue("mcplink"));
    report("prompts/get", session.GetPrompt("greet", promptArgs).get());
    report("logging/setLevel", session.SetLogLevel(ProtocolLogLevel::Debug).get());
    report("tools/call missing", session.CallTool("does-not-exist", MakeObject()).get());

    auto batch = session.InvokeBatch({{Methods::Ping, std::nullopt}, {Methods::ListPrompts, std::nullopt}});
    for (std::size_t i = 0; i < batch.size(); ++i) {
        report(i == 0 ? "batch ping" : "batch prompts/list", batch[i].get());
    }

    SessionStats stats = session.GetStats();
    LOG_INFO("Session {} for {} ms, {} reconnect(s)", ToString(stats.state), stats.uptime.count(),
             stats.totalReconnects);
    session.Disconnect().get();
    return EXIT_SUCCESS;
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol constants, peer identity, and method names
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcplink {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol version offered by this library during the handshake
constexpr const char* PROTOCOL_VERSION = "2025-03-26";

//==========================================================================================================
// SupportedProtocolVersions
// Purpose: Versions accepted from a peer during version negotiation (newest first).
//==========================================================================================================
const std::vector<std::string>& SupportedProtocolVersions();

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Peer identity exchanged in the handshake
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}

    JSONValue ToJSONValue() const {
        JSONValue obj = MakeObject();
        obj.Set("name", JSONValue(name));
        obj.Set("version", JSONValue(version));
        return obj;
    }

    static std::optional<Implementation> FromJSONValue(const JSONValue& v) {
        auto n = v.GetString("name");
        auto ver = v.GetString("version");
        if (!n.has_value() || !ver.has_value()) {
            return std::nullopt;
        }
        return Implementation{n.value(), ver.value()};
    }
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* Subscribe = "resources/subscribe";
    constexpr const char* Unsubscribe = "resources/unsubscribe";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
    constexpr const char* SetLogLevel = "logging/setLevel";

    // Server to client
    constexpr const char* CreateMessage = "sampling/createMessage";
    constexpr const char* ListRoots = "roots/list";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* InitializedLegacy = "initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* Log = "notifications/message";
    constexpr const char* ResourceUpdated = "notifications/resources/updated";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* PromptListChanged = "notifications/prompts/list_changed";
}

///////////////////////////////////////// Logging levels ///////////////////////////////////////////
// Severity ordering used by logging/setLevel and notifications/message (syslog order, lowest first)
enum class ProtocolLogLevel {
    Debug = 0,
    Info,
    Notice,
    Warning,
    Error,
    Critical,
    Alert,
    Emergency
};

std::optional<ProtocolLogLevel> ProtocolLogLevelFromString(const std::string& level);
const char* ToString(ProtocolLogLevel level);

} // namespace mcplink

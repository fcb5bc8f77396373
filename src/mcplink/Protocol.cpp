//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Protocol version list and logging level conversions
//==========================================================================================================

#include "mcplink/Protocol.h"

namespace mcplink {

const std::vector<std::string>& SupportedProtocolVersions() {
    static const std::vector<std::string> versions{"2025-03-26", "2024-11-05"};
    return versions;
}

std::optional<ProtocolLogLevel> ProtocolLogLevelFromString(const std::string& level) {
    static const struct { const char* name; ProtocolLogLevel level; } table[] = {
        {"debug", ProtocolLogLevel::Debug},
        {"info", ProtocolLogLevel::Info},
        {"notice", ProtocolLogLevel::Notice},
        {"warning", ProtocolLogLevel::Warning},
        {"error", ProtocolLogLevel::Error},
        {"critical", ProtocolLogLevel::Critical},
        {"alert", ProtocolLogLevel::Alert},
        {"emergency", ProtocolLogLevel::Emergency},
    };
    for (const auto& entry : table) {
        if (level == entry.name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

const char* ToString(ProtocolLogLevel level) {
    switch (level) {
        case ProtocolLogLevel::Debug: return "debug";
        case ProtocolLogLevel::Info: return "info";
        case ProtocolLogLevel::Notice: return "notice";
        case ProtocolLogLevel::Warning: return "warning";
        case ProtocolLogLevel::Error: return "error";
        case ProtocolLogLevel::Critical: return "critical";
        case ProtocolLogLevel::Alert: return "alert";
        case ProtocolLogLevel::Emergency: return "emergency";
    }
    return "info";
}

} // namespace mcplink

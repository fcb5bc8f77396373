//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely, including typed numeric overrides.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvUnsigned
// Purpose: Reads an unsigned integer override from the environment.
// Args:
//   name: Environment variable name.
// Returns:
//   The parsed value; std::nullopt when unset or empty.
// Throws:
//   std::invalid_argument / std::out_of_range when the value is not a valid unsigned integer.
//==========================================================================================================
inline std::optional<std::uint64_t> GetEnvUnsigned(const char* name) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return std::nullopt;
    }
    if (raw.front() == '-') {
        throw std::invalid_argument(std::string(name) + " must not be negative");
    }
    std::size_t used = 0;
    unsigned long long v = std::stoull(raw, &used);
    if (used != raw.size()) {
        throw std::invalid_argument(std::string(name) + " has trailing characters");
    }
    return static_cast<std::uint64_t>(v);
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, exception types, and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {
namespace errors {

// Categorization of JSON-RPC and protocol error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    ToolNotFound,
    ResourceNotFound,
    PromptNotFound,
    NotInitialized,
    Application,
    ServerOverloaded,
    Unknown
};

// Typed error representation of a wire ErrorResponse.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};

    // True for the three "capability not found" categories.
    bool IsCapabilityNotFound() const {
        return category == ErrorCategory::ToolNotFound || category == ErrorCategory::ResourceNotFound ||
               category == ErrorCategory::PromptNotFound;
    }
};

//==========================================================================================================
// TransportError
// Purpose: Carrier failure (closed, reset, I/O error). Terminal for the transport instance that raised it.
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// DuplicateNameError
// Purpose: Raised when a capability name is registered twice within one namespace.
//==========================================================================================================
class DuplicateNameError : public std::runtime_error {
public:
    DuplicateNameError(const std::string& kind, const std::string& name)
        : std::runtime_error(kind + " already registered: " + name), name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

//==========================================================================================================
// ApplicationError
// Purpose: Thrown by capability handlers to report a failure with optional structured detail.
//          The dispatcher converts it to an ErrorResponse with code ApplicationError.
//==========================================================================================================
class ApplicationError : public std::runtime_error {
public:
    explicit ApplicationError(const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), data_(std::move(data)) {}

    const std::optional<JSONValue>& data() const noexcept { return data_; }

private:
    std::optional<JSONValue> data_;
};

//==========================================================================================================
// ProtocolError
// Purpose: Thrown by handlers or the dispatcher to answer with a specific wire code (e.g. InvalidParams).
//==========================================================================================================
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    int code() const noexcept { return code_; }
    const std::optional<JSONValue>& data() const noexcept { return data_; }

private:
    int code_;
    std::optional<JSONValue> data_;
};

// Map a numeric error code to an ErrorCategory (Unknown when unmapped).
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::ToolNotFound;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::ResourceNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::PromptNotFound;
        case JSONRPCErrorCodes::NotInitialized: return ErrorCategory::NotInitialized;
        case JSONRPCErrorCodes::ApplicationError: return ErrorCategory::Application;
        case JSONRPCErrorCodes::ServerOverloaded: return ErrorCategory::ServerOverloaded;
        default: return ErrorCategory::Unknown;
    }
}

// Build a typed error from its parts, filling in the category.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    auto code = errVal.GetInteger("code");
    auto message = errVal.GetString("message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = errVal.Find("data")) {
        data = *d;
    }
    return makeError(static_cast<int>(code.value()), std::move(message.value()), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

} // namespace errors
} // namespace mcplink

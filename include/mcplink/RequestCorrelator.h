//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.h
// Purpose: Matches outstanding request ids to their replies, with per-request deadlines
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "mcplink/JSONRPCTypes.h"
#include "mcplink/errors/Errors.h"

namespace mcplink {

enum class CallStatus {
    Success,
    ApplicationError,
    Timeout,
    ConnectionLost
};

const char* ToString(CallStatus status);

//==========================================================================================================
// CallOutcome
// Purpose: Resolution of one outstanding request.
// Fields:
//   status: How the call ended.
//   result: The response result (Success only).
//   error: Typed wire error (ApplicationError only).
//   detail: Human-readable description for Timeout / ConnectionLost.
//==========================================================================================================
struct CallOutcome {
    CallStatus status{CallStatus::ConnectionLost};
    JSONValue result;
    std::optional<errors::McpError> error;
    std::string detail;

    bool Ok() const { return status == CallStatus::Success; }

    static CallOutcome Success(JSONValue value);
    static CallOutcome FromError(errors::McpError err);
    static CallOutcome TimedOut(std::string detail);
    static CallOutcome Lost(std::string reason);
};

//==========================================================================================================
// RequestCorrelator
// Purpose: Pending-request table for one connection. Each registered id resolves exactly once:
//          by Resolve(), by its deadline, or by FailAll(); later resolutions of the same id are no-ops.
//==========================================================================================================
class RequestCorrelator {
public:
    using TimeoutHandler = std::function<void(const JSONRPCId&)>;

    RequestCorrelator();
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator&) = delete;
    RequestCorrelator& operator=(const RequestCorrelator&) = delete;

    //==========================================================================================================
    // Register
    // Purpose: Creates the waiter for id. Call before the request is handed to the transport.
    // Args:
    //   id: Request identifier (unique among pending requests).
    //   timeout: Deadline relative to now; must be positive.
    // Returns:
    //   Future resolved with the call's outcome.
    // Throws:
    //   std::invalid_argument when id is already pending or timeout is not positive.
    //==========================================================================================================
    std::future<CallOutcome> Register(const JSONRPCId& id, std::chrono::milliseconds timeout);

    //==========================================================================================================
    // Resolve
    // Purpose: Delivers an outcome to the waiter for id and removes it.
    // Returns:
    //   false when no waiter for id exists (unknown, already resolved, or timed out).
    //==========================================================================================================
    bool Resolve(const JSONRPCId& id, CallOutcome outcome);

    // Converts a wire response (result or error) into an outcome and resolves it.
    bool Resolve(const JSONRPCResponse& response);

    //==========================================================================================================
    // FailAll
    // Purpose: Resolves every pending waiter with ConnectionLost.
    // Returns:
    //   Number of waiters failed.
    //==========================================================================================================
    std::size_t FailAll(const std::string& reason);

    std::size_t PendingCount() const;

    // Invoked (outside the table lock) for every id whose deadline fired.
    void SetTimeoutHandler(TimeoutHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplink

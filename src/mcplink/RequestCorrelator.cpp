//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestCorrelator.cpp
// Purpose: Pending-request table with a deadline thread
//==========================================================================================================

#include <condition_variable>
#include <map>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "mcplink/RequestCorrelator.h"

namespace mcplink {

const char* ToString(CallStatus status) {
    switch (status) {
        case CallStatus::Success: return "Success";
        case CallStatus::ApplicationError: return "ApplicationError";
        case CallStatus::Timeout: return "Timeout";
        case CallStatus::ConnectionLost: return "ConnectionLost";
    }
    return "Unknown";
}

CallOutcome CallOutcome::Success(JSONValue value) {
    CallOutcome o;
    o.status = CallStatus::Success;
    o.result = std::move(value);
    return o;
}

CallOutcome CallOutcome::FromError(errors::McpError err) {
    CallOutcome o;
    o.status = CallStatus::ApplicationError;
    o.detail = err.message;
    o.error = std::move(err);
    return o;
}

CallOutcome CallOutcome::TimedOut(std::string detail) {
    CallOutcome o;
    o.status = CallStatus::Timeout;
    o.detail = std::move(detail);
    return o;
}

CallOutcome CallOutcome::Lost(std::string reason) {
    CallOutcome o;
    o.status = CallStatus::ConnectionLost;
    o.detail = std::move(reason);
    return o;
}

class RequestCorrelator::Impl {
public:
    using Clock = std::chrono::steady_clock;
    using DeadlineMap = std::multimap<Clock::time_point, std::string>;

    struct Pending {
        JSONRPCId id;
        std::promise<CallOutcome> promise;
        std::optional<DeadlineMap::iterator> deadline;
    };

    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::unordered_map<std::string, Pending> pending;
    DeadlineMap deadlines;
    TimeoutHandler onTimeout;
    std::jthread deadlineThread; // last member: stopped and joined first

    Impl() {
        deadlineThread = std::jthread([this](std::stop_token st) { run(st); });
    }

    void run(std::stop_token st) {
        std::unique_lock<std::mutex> lk(mutex);
        while (!st.stop_requested()) {
            if (deadlines.empty()) {
                cv.wait(lk, st, [this]() { return !deadlines.empty(); });
                continue;
            }
            const auto next = deadlines.begin()->first;
            if (cv.wait_until(lk, st, next, [this, next]() { return deadlines.empty() || deadlines.begin()->first < next; })) {
                continue;
            }
            if (st.stop_requested()) {
                break;
            }

            std::vector<std::pair<JSONRPCId, std::promise<CallOutcome>>> expired;
            const auto now = Clock::now();
            while (!deadlines.empty() && deadlines.begin()->first <= now) {
                auto key = deadlines.begin()->second;
                deadlines.erase(deadlines.begin());
                auto it = pending.find(key);
                if (it != pending.end()) {
                    expired.emplace_back(it->second.id, std::move(it->second.promise));
                    pending.erase(it);
                }
            }
            if (expired.empty()) {
                continue;
            }
            TimeoutHandler handler = onTimeout;
            lk.unlock();
            for (auto& entry : expired) {
                LOG_WARN("Request {} timed out", IdToString(entry.first));
                entry.second.set_value(CallOutcome::TimedOut("request " + IdToString(entry.first) + " timed out"));
                if (handler) {
                    handler(entry.first);
                }
            }
            lk.lock();
        }
    }
};

RequestCorrelator::RequestCorrelator() : pImpl(std::make_unique<Impl>()) {}

RequestCorrelator::~RequestCorrelator() {
    (void)FailAll("request correlator destroyed");
}

std::future<CallOutcome> RequestCorrelator::Register(const JSONRPCId& id, std::chrono::milliseconds timeout) {
    const std::string key = IdToString(id);
    if (timeout.count() <= 0) {
        throw std::invalid_argument("request " + key + " needs a positive timeout");
    }
    std::future<CallOutcome> fut;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->pending.count(key) != 0) {
            throw std::invalid_argument("request id already pending: " + key);
        }
        Impl::Pending entry;
        entry.id = id;
        fut = entry.promise.get_future();
        entry.deadline = pImpl->deadlines.emplace(Impl::Clock::now() + timeout, key);
        pImpl->pending.emplace(key, std::move(entry));
    }
    pImpl->cv.notify_all();
    return fut;
}

bool RequestCorrelator::Resolve(const JSONRPCId& id, CallOutcome outcome) {
    const std::string key = IdToString(id);
    std::promise<CallOutcome> promise;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto it = pImpl->pending.find(key);
        if (it == pImpl->pending.end()) {
            LOG_WARN("Dropping reply for unknown request id {}", key);
            return false;
        }
        if (it->second.deadline.has_value()) {
            pImpl->deadlines.erase(it->second.deadline.value());
        }
        promise = std::move(it->second.promise);
        pImpl->pending.erase(it);
    }
    promise.set_value(std::move(outcome));
    return true;
}

bool RequestCorrelator::Resolve(const JSONRPCResponse& response) {
    if (response.IsError()) {
        auto err = errors::mcpErrorFromResponse(response);
        if (!err.has_value()) {
            err = errors::makeError(JSONRPCErrorCodes::InternalError, "malformed error response");
        }
        return Resolve(response.id, CallOutcome::FromError(std::move(err.value())));
    }
    return Resolve(response.id, CallOutcome::Success(response.result.has_value() ? response.result.value() : MakeObject()));
}

std::size_t RequestCorrelator::FailAll(const std::string& reason) {
    std::unordered_map<std::string, Impl::Pending> drained;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        drained.swap(pImpl->pending);
        pImpl->deadlines.clear();
    }
    for (auto& kv : drained) {
        kv.second.promise.set_value(CallOutcome::Lost(reason));
    }
    if (!drained.empty()) {
        LOG_INFO("Failed {} pending request(s): {}", drained.size(), reason);
    }
    return drained.size();
}

std::size_t RequestCorrelator::PendingCount() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->pending.size();
}

void RequestCorrelator::SetTimeoutHandler(TimeoutHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->onTimeout = std::move(handler);
}

} // namespace mcplink

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_request_correlator.cpp
// Purpose: Tests for pending-request bookkeeping, deadlines and bulk failure
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mcplink/RequestCorrelator.h"

using namespace mcplink;

TEST(RequestCorrelator, ResolvesSuccessByIntegerId) {
    RequestCorrelator correlator;
    auto fut = correlator.Register(JSONRPCId{static_cast<int64_t>(1)}, std::chrono::seconds(10));
    EXPECT_EQ(correlator.PendingCount(), 1u);

    JSONValue result = MakeObject();
    result.Set("ok", JSONValue(true));
    EXPECT_TRUE(correlator.Resolve(JSONRPCResponse(static_cast<int64_t>(1), result)));

    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    CallOutcome out = fut.get();
    EXPECT_TRUE(out.Ok());
    EXPECT_EQ(out.result, result);
    EXPECT_EQ(correlator.PendingCount(), 0u);
}

TEST(RequestCorrelator, ErrorResponseBecomesApplicationError) {
    RequestCorrelator correlator;
    auto fut = correlator.Register(JSONRPCId{std::string("abc")}, std::chrono::seconds(10));
    JSONRPCResponse err(std::string("abc"), CreateErrorObject(JSONRPCErrorCodes::ToolNotFound, "tool not found: x"), true);
    EXPECT_TRUE(correlator.Resolve(err));

    CallOutcome out = fut.get();
    EXPECT_EQ(out.status, CallStatus::ApplicationError);
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->code, JSONRPCErrorCodes::ToolNotFound);
    EXPECT_EQ(out.error->category, errors::ErrorCategory::ToolNotFound);
    EXPECT_TRUE(out.error->IsCapabilityNotFound());
    EXPECT_EQ(out.detail, "tool not found: x");
}

TEST(RequestCorrelator, StringAndIntegerIdsDoNotCollide) {
    RequestCorrelator correlator;
    auto byString = correlator.Register(JSONRPCId{std::string("7")}, std::chrono::seconds(10));
    auto byInt = correlator.Register(JSONRPCId{static_cast<int64_t>(7)}, std::chrono::seconds(10));
    EXPECT_EQ(correlator.PendingCount(), 2u);

    EXPECT_TRUE(correlator.Resolve(JSONRPCResponse(static_cast<int64_t>(7), JSONValue("int"))));
    ASSERT_EQ(byInt.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(byInt.get().result, JSONValue("int"));
    EXPECT_EQ(byString.wait_for(std::chrono::milliseconds(10)), std::future_status::timeout);
    EXPECT_EQ(correlator.PendingCount(), 1u);
}

TEST(RequestCorrelator, DuplicatePendingIdIsRejected) {
    RequestCorrelator correlator;
    auto fut = correlator.Register(JSONRPCId{static_cast<int64_t>(3)}, std::chrono::seconds(10));
    EXPECT_THROW(correlator.Register(JSONRPCId{static_cast<int64_t>(3)}, std::chrono::seconds(10)),
                 std::invalid_argument);
    EXPECT_EQ(correlator.PendingCount(), 1u);
}

TEST(RequestCorrelator, NonPositiveTimeoutIsRejected) {
    RequestCorrelator correlator;
    EXPECT_THROW(correlator.Register(JSONRPCId{static_cast<int64_t>(1)}, std::chrono::milliseconds(0)),
                 std::invalid_argument);
    EXPECT_THROW(correlator.Register(JSONRPCId{static_cast<int64_t>(2)}, std::chrono::milliseconds(-5)),
                 std::invalid_argument);
    EXPECT_EQ(correlator.PendingCount(), 0u);
}

TEST(RequestCorrelator, UnknownOrLateRepliesAreDropped) {
    RequestCorrelator correlator;
    EXPECT_FALSE(correlator.Resolve(JSONRPCResponse(static_cast<int64_t>(99), MakeObject())));

    auto fut = correlator.Register(JSONRPCId{static_cast<int64_t>(1)}, std::chrono::seconds(10));
    EXPECT_TRUE(correlator.Resolve(JSONRPCResponse(static_cast<int64_t>(1), MakeObject())));
    EXPECT_FALSE(correlator.Resolve(JSONRPCResponse(static_cast<int64_t>(1), MakeObject())));
    EXPECT_TRUE(fut.get().Ok());
}

TEST(RequestCorrelator, DeadlineResolvesWithTimeoutAndNotifiesHandler) {
    RequestCorrelator correlator;
    std::mutex m;
    std::vector<std::string> timedOut;
    correlator.SetTimeoutHandler([&](const JSONRPCId& id) {
        std::lock_guard<std::mutex> lk(m);
        timedOut.push_back(IdToString(id));
    });

    auto fut = correlator.Register(JSONRPCId{static_cast<int64_t>(5)}, std::chrono::milliseconds(50));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    CallOutcome out = fut.get();
    EXPECT_EQ(out.status, CallStatus::Timeout);
    EXPECT_EQ(correlator.PendingCount(), 0u);

    // A reply arriving after the deadline is ignored
    EXPECT_FALSE(correlator.Resolve(JSONRPCResponse(static_cast<int64_t>(5), MakeObject())));

    // The handler runs after the promise is fulfilled; give it a moment
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lk(m);
            if (!timedOut.empty()) break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::lock_guard<std::mutex> lk(m);
    ASSERT_EQ(timedOut.size(), 1u);
    EXPECT_EQ(timedOut.front(), IdToString(JSONRPCId{static_cast<int64_t>(5)}));
}

TEST(RequestCorrelator, EarlierDeadlineRegisteredLaterFiresFirst) {
    RequestCorrelator correlator;
    auto slow = correlator.Register(JSONRPCId{static_cast<int64_t>(1)}, std::chrono::milliseconds(5000));
    auto fast = correlator.Register(JSONRPCId{static_cast<int64_t>(2)}, std::chrono::milliseconds(30));
    ASSERT_EQ(fast.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(fast.get().status, CallStatus::Timeout);
    EXPECT_EQ(slow.wait_for(std::chrono::milliseconds(10)), std::future_status::timeout);
    EXPECT_TRUE(correlator.Resolve(JSONRPCResponse(static_cast<int64_t>(1), MakeObject())));
    EXPECT_TRUE(slow.get().Ok());
}

TEST(RequestCorrelator, ResolvedCallNeverTimesOut) {
    RequestCorrelator correlator;
    std::atomic<int> timeouts{0};
    correlator.SetTimeoutHandler([&](const JSONRPCId&) { ++timeouts; });
    auto fut = correlator.Register(JSONRPCId{static_cast<int64_t>(1)}, std::chrono::milliseconds(40));
    EXPECT_TRUE(correlator.Resolve(JSONRPCResponse(static_cast<int64_t>(1), MakeObject())));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_TRUE(fut.get().Ok());
    EXPECT_EQ(timeouts.load(), 0);
}

TEST(RequestCorrelator, FailAllResolvesEveryWaiterWithConnectionLost) {
    RequestCorrelator correlator;
    std::vector<std::future<CallOutcome>> futures;
    for (int64_t i = 0; i < 5; ++i) {
        futures.push_back(correlator.Register(JSONRPCId{i}, std::chrono::milliseconds(10000 + i)));
    }
    EXPECT_EQ(correlator.FailAll("peer closed"), 5u);
    for (auto& f : futures) {
        ASSERT_EQ(f.wait_for(std::chrono::seconds(2)), std::future_status::ready);
        CallOutcome out = f.get();
        EXPECT_EQ(out.status, CallStatus::ConnectionLost);
        EXPECT_EQ(out.detail, "peer closed");
    }
    EXPECT_EQ(correlator.PendingCount(), 0u);
    EXPECT_EQ(correlator.FailAll("again"), 0u);
}

TEST(RequestCorrelator, DestructionFailsOutstandingCalls) {
    std::future<CallOutcome> fut;
    {
        RequestCorrelator correlator;
        fut = correlator.Register(JSONRPCId{std::string("x")}, std::chrono::seconds(10));
    }
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(fut.get().status, CallStatus::ConnectionLost);
}

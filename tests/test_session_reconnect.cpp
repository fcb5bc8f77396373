//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_reconnect.cpp
// Purpose: Client session reconnection: loss detection, backoff attempts, giving up and voluntary shutdown
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mcplink/ClientSession.h"
#include "mcplink/InMemoryTransport.hpp"
#include "mcplink/Server.h"
#include "mcplink/errors/Errors.h"

using namespace mcplink;

namespace {

//==========================================================================================================
// SeverableTransport
// Purpose: Forwards to an inner transport; the test keeps a handle to the inner one so it can cut the link
//          out from under the session.
//==========================================================================================================
class SeverableTransport : public ITransport {
public:
    explicit SeverableTransport(std::shared_ptr<ITransport> inner) : inner(std::move(inner)) {}

    std::future<void> Start() override { return inner->Start(); }
    std::future<void> Close() override { return inner->Close(); }
    bool IsConnected() const override { return inner->IsConnected(); }
    std::string GetSessionId() const override { return inner->GetSessionId(); }
    void Send(const std::string& frame) override { inner->Send(frame); }
    std::string Receive() override { return inner->Receive(); }

private:
    std::shared_ptr<ITransport> inner;
};

//==========================================================================================================
// Dialer
// Purpose: Provider over a live server. failNext makes the next N dials throw; silentNext hands out N links
//          whose far end never answers; Sever() cuts the latest link to the server.
//==========================================================================================================
class Dialer {
public:
    explicit Dialer(Server& server) {
        auto acceptor = std::make_unique<InMemoryAcceptor>();
        dial = acceptor->MakeProvider();
        server.Start(std::move(acceptor)).get();
    }

    TransportProvider Provider() {
        return [this]() -> std::unique_ptr<ITransport> {
            dials.fetch_add(1);
            if (failNext.load() > 0) {
                failNext.fetch_sub(1);
                throw errors::TransportError("dial refused");
            }
            if (silentNext.load() > 0) {
                silentNext.fetch_sub(1);
                // The far end is held open but never read, so the handshake cannot complete
                auto [client, server] = InMemoryTransport::CreatePair();
                std::lock_guard<std::mutex> lk(mutex);
                silentPeers.push_back(std::move(server));
                return std::move(client);
            }
            std::shared_ptr<ITransport> inner = dial();
            {
                std::lock_guard<std::mutex> lk(mutex);
                latest = inner;
            }
            return std::make_unique<SeverableTransport>(inner);
        };
    }

    void Sever() {
        std::shared_ptr<ITransport> link;
        {
            std::lock_guard<std::mutex> lk(mutex);
            link = latest.lock();
        }
        ASSERT_TRUE(link);
        link->Close().get();
    }

    std::atomic<int> failNext{0};
    std::atomic<int> silentNext{0};
    std::atomic<int> dials{0};

private:
    TransportProvider dial;
    std::mutex mutex;
    std::weak_ptr<ITransport> latest;
    std::vector<std::unique_ptr<InMemoryTransport>> silentPeers;
};

class RecordingObserver : public ISessionObserver {
public:
    void OnReconnectAttempt(unsigned int attempt, std::chrono::milliseconds delay) override {
        std::lock_guard<std::mutex> lk(mutex);
        attempts.push_back(attempt);
        delays.push_back(delay);
    }
    void OnReconnected(unsigned int attempt) override {
        {
            std::lock_guard<std::mutex> lk(mutex);
            reconnectedAfter.push_back(attempt);
        }
        changed.notify_all();
    }
    void OnReconnectFailed(const std::string& reason) override {
        {
            std::lock_guard<std::mutex> lk(mutex);
            failures.push_back(reason);
        }
        changed.notify_all();
    }

    bool WaitForFailure(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mutex);
        return changed.wait_for(lk, timeout, [this]() { return !failures.empty(); });
    }

    bool WaitForReconnect(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mutex);
        return changed.wait_for(lk, timeout, [this]() { return !reconnectedAfter.empty(); });
    }

    std::mutex mutex;
    std::condition_variable changed;
    std::vector<unsigned int> attempts;
    std::vector<std::chrono::milliseconds> delays;
    std::vector<unsigned int> reconnectedAfter;
    std::vector<std::string> failures;
};

SessionConfig reconnectingConfig() {
    SessionConfig cfg;
    cfg.autoReconnect = true;
    cfg.maxReconnectAttempts = 4;
    cfg.initialReconnectDelay = std::chrono::milliseconds(20);
    cfg.backoffMultiplier = 2.0;
    cfg.maxReconnectDelay = std::chrono::milliseconds(200);
    cfg.heartbeatInterval = std::chrono::milliseconds(0);
    cfg.connectionTimeout = std::chrono::seconds(2);
    cfg.requestTimeout = std::chrono::seconds(2);
    return cfg;
}

} // namespace

TEST(SessionReconnect, LinkLossFailsPendingCallsThenReconnects) {
    Server server;
    std::promise<void> entered;
    std::atomic<bool> signalled{false};
    server.RegisterTool("hang", "", std::nullopt, [&](const JSONValue&, const InvocationContext& ctx) {
        if (!signalled.exchange(true)) {
            entered.set_value();
        }
        while (!ctx.stopToken.stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return MakeObject();
    });
    Dialer dialer(server);
    auto observer = std::make_shared<RecordingObserver>();
    ClientSession session(reconnectingConfig());
    session.SetObserver(observer);
    session.Connect(dialer.Provider()).get();
    auto firstIds = server.SessionIds();
    ASSERT_EQ(firstIds.size(), 1u);

    auto pending = session.CallTool("hang", MakeObject(), std::chrono::seconds(10));
    ASSERT_EQ(entered.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);
    dialer.Sever();

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(pending.get().status, CallStatus::ConnectionLost);

    ASSERT_TRUE(observer->WaitForReconnect(std::chrono::seconds(3)));
    EXPECT_EQ(session.GetState(), SessionState::Ready);
    EXPECT_TRUE(session.Ping().get().Ok());
    EXPECT_EQ(dialer.dials.load(), 2);

    SessionStats stats = session.GetStats();
    EXPECT_EQ(stats.totalReconnects, 1u);
    EXPECT_EQ(stats.reconnectAttempts, 1u);
    {
        std::lock_guard<std::mutex> lk(observer->mutex);
        ASSERT_EQ(observer->attempts.size(), 1u);
        EXPECT_EQ(observer->delays[0].count(), 20);
        ASSERT_EQ(observer->reconnectedAfter.size(), 1u);
        EXPECT_EQ(observer->reconnectedAfter[0], 1u);
    }
    EXPECT_TRUE(server.WaitForDisconnect(firstIds[0], std::chrono::seconds(2)));
}

TEST(SessionReconnect, RetriesWithGrowingBackoff) {
    Server server;
    Dialer dialer(server);
    auto observer = std::make_shared<RecordingObserver>();
    ClientSession session(reconnectingConfig());
    session.SetObserver(observer);
    session.Connect(dialer.Provider()).get();

    dialer.failNext = 2;
    dialer.Sever();
    // Two refused dials, then the third attempt succeeds
    ASSERT_TRUE(observer->WaitForReconnect(std::chrono::seconds(3)));
    ASSERT_EQ(session.GetStats().totalReconnects, 1u);
    EXPECT_EQ(session.GetState(), SessionState::Ready);
    EXPECT_EQ(session.GetStats().reconnectAttempts, 3u);

    std::lock_guard<std::mutex> lk(observer->mutex);
    ASSERT_EQ(observer->attempts.size(), 3u);
    EXPECT_EQ(observer->attempts[0], 1u);
    EXPECT_EQ(observer->attempts[2], 3u);
    EXPECT_EQ(observer->delays[0].count(), 20);
    EXPECT_EQ(observer->delays[1].count(), 40);
    EXPECT_EQ(observer->delays[2].count(), 80);
    ASSERT_EQ(observer->reconnectedAfter.size(), 1u);
    EXPECT_EQ(observer->reconnectedAfter[0], 3u);
}

TEST(SessionReconnect, FailedHandshakeMovesToNextBackoffStep) {
    Server server;
    Dialer dialer(server);
    auto observer = std::make_shared<RecordingObserver>();
    SessionConfig cfg = reconnectingConfig();
    cfg.connectionTimeout = std::chrono::milliseconds(150);
    ClientSession session(cfg);
    session.SetObserver(observer);
    session.Connect(dialer.Provider()).get();

    // Two attempts get a carrier that starts but never completes initialize
    dialer.silentNext = 2;
    dialer.Sever();
    ASSERT_TRUE(observer->WaitForReconnect(std::chrono::seconds(5)));
    EXPECT_EQ(session.GetState(), SessionState::Ready);
    EXPECT_TRUE(session.Ping().get().Ok());
    EXPECT_EQ(dialer.dials.load(), 4);
    EXPECT_EQ(session.GetStats().reconnectAttempts, 3u);

    std::lock_guard<std::mutex> lk(observer->mutex);
    EXPECT_TRUE(observer->failures.empty());
    ASSERT_EQ(observer->attempts.size(), 3u);
    EXPECT_EQ(observer->delays[0].count(), 20);
    EXPECT_EQ(observer->delays[1].count(), 40);
    EXPECT_EQ(observer->delays[2].count(), 80);
    ASSERT_EQ(observer->reconnectedAfter.size(), 1u);
    EXPECT_EQ(observer->reconnectedAfter[0], 3u);
}

TEST(SessionReconnect, GivesUpAfterMaxAttempts) {
    Server server;
    Dialer dialer(server);
    auto observer = std::make_shared<RecordingObserver>();
    SessionConfig cfg = reconnectingConfig();
    cfg.maxReconnectAttempts = 3;
    ClientSession session(cfg);
    session.SetObserver(observer);
    session.Connect(dialer.Provider()).get();

    dialer.failNext = 100;
    dialer.Sever();
    ASSERT_TRUE(observer->WaitForFailure(std::chrono::seconds(3)));
    EXPECT_EQ(session.GetState(), SessionState::Disconnected);
    EXPECT_EQ(session.Ping().get().status, CallStatus::ConnectionLost);

    std::lock_guard<std::mutex> lk(observer->mutex);
    EXPECT_EQ(observer->attempts.size(), 3u);
    EXPECT_TRUE(observer->reconnectedAfter.empty());
    ASSERT_EQ(observer->failures.size(), 1u);
    EXPECT_NE(observer->failures[0].find("giving up"), std::string::npos);
}

TEST(SessionReconnect, DisabledReconnectMakesLossTerminal) {
    Server server;
    Dialer dialer(server);
    auto observer = std::make_shared<RecordingObserver>();
    SessionConfig cfg = reconnectingConfig();
    cfg.autoReconnect = false;
    ClientSession session(cfg);
    session.SetObserver(observer);
    session.Connect(dialer.Provider()).get();

    dialer.Sever();
    ASSERT_TRUE(observer->WaitForFailure(std::chrono::seconds(2)));
    EXPECT_EQ(session.GetState(), SessionState::Disconnected);
    EXPECT_EQ(dialer.dials.load(), 1);
    std::lock_guard<std::mutex> lk(observer->mutex);
    EXPECT_TRUE(observer->attempts.empty());
}

TEST(SessionReconnect, DisconnectInterruptsBackoff) {
    Server server;
    Dialer dialer(server);
    auto observer = std::make_shared<RecordingObserver>();
    SessionConfig cfg = reconnectingConfig();
    cfg.initialReconnectDelay = std::chrono::seconds(30);
    cfg.maxReconnectDelay = std::chrono::seconds(30);
    ClientSession session(cfg);
    session.SetObserver(observer);
    session.Connect(dialer.Provider()).get();

    dialer.Sever();
    ASSERT_TRUE(session.WaitForState(SessionState::Reconnecting, std::chrono::seconds(2)));

    auto started = std::chrono::steady_clock::now();
    session.Disconnect().get();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_EQ(session.GetState(), SessionState::Disconnected);
    EXPECT_EQ(dialer.dials.load(), 1);
    std::lock_guard<std::mutex> lk(observer->mutex);
    EXPECT_TRUE(observer->reconnectedAfter.empty());
}

TEST(SessionReconnect, ServerShutdownTriggersReconnectCycle) {
    auto server = std::make_unique<Server>();
    Dialer dialer(*server);
    auto observer = std::make_shared<RecordingObserver>();
    SessionConfig cfg = reconnectingConfig();
    cfg.maxReconnectAttempts = 2;
    ClientSession session(cfg);
    session.SetObserver(observer);
    session.Connect(dialer.Provider()).get();

    // With the acceptor gone every dial fails, so the cycle runs out
    server->Stop().get();
    ASSERT_TRUE(observer->WaitForFailure(std::chrono::seconds(3)));
    EXPECT_EQ(session.GetState(), SessionState::Disconnected);
    std::lock_guard<std::mutex> lk(observer->mutex);
    EXPECT_EQ(observer->attempts.size(), 2u);
}

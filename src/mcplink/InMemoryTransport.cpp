//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <string>

#include "logging/Logger.h"
#include "mcplink/InMemoryTransport.hpp"
#include "mcplink/errors/Errors.h"

namespace mcplink {

namespace {
std::atomic<unsigned int> gMemorySessionCounter{0u};
}

class InMemoryTransport::Impl {
public:
    std::string sessionId;
    std::atomic<bool> started{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> peerClosed{false};
    std::weak_ptr<Impl> peer;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::deque<std::string> inbox;

    Impl() {
        sessionId = "memory-" + std::to_string(++gMemorySessionCounter);
    }

    void deliver(const std::string& frame) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            inbox.push_back(frame);
        }
        queueCondition.notify_one();
    }

    void onPeerClosed() {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            peerClosed = true;
        }
        queueCondition.notify_all();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (closed.exchange(true)) {
                return;
            }
        }
        queueCondition.notify_all();
        if (auto p = peer.lock()) {
            p->onPeerClosed();
        }
        LOG_DEBUG("InMemoryTransport {} closed", sessionId);
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_shared<Impl>()) { FUNC_SCOPE(); }

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    pImpl->close();
}

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto transport1 = std::make_unique<InMemoryTransport>();
    auto transport2 = std::make_unique<InMemoryTransport>();
    transport1->pImpl->peer = transport2->pImpl;
    transport2->pImpl->peer = transport1->pImpl;
    return std::make_pair(std::move(transport1), std::move(transport2));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (pImpl->closed.load()) {
        promise.set_exception(std::make_exception_ptr(errors::TransportError("InMemoryTransport: already closed")));
    } else {
        pImpl->started = true;
        LOG_DEBUG("Starting InMemoryTransport {}", pImpl->sessionId);
        promise.set_value();
    }
    return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    pImpl->close();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const {
    return pImpl->started.load() && !pImpl->closed.load() && !pImpl->peerClosed.load();
}

std::string InMemoryTransport::GetSessionId() const { return pImpl->sessionId; }

void InMemoryTransport::Send(const std::string& frame) {
    FUNC_SCOPE();
    if (pImpl->closed.load()) {
        throw errors::TransportError("InMemoryTransport: transport closed");
    }
    auto p = pImpl->peer.lock();
    if (!p || p->closed.load()) {
        throw errors::TransportError("InMemoryTransport: peer not connected");
    }
    LOG_DEBUG("InMemoryTransport {} -> {}: {}", pImpl->sessionId, p->sessionId, frame);
    p->deliver(frame);
}

std::string InMemoryTransport::Receive() {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    pImpl->queueCondition.wait(lock, [this]() {
        return !pImpl->inbox.empty() || pImpl->closed.load() || pImpl->peerClosed.load();
    });
    if (pImpl->closed.load()) {
        throw errors::TransportError("InMemoryTransport: transport closed");
    }
    if (pImpl->inbox.empty()) {
        throw errors::TransportError("InMemoryTransport: peer closed");
    }
    std::string frame = std::move(pImpl->inbox.front());
    pImpl->inbox.pop_front();
    return frame;
}

////////////////////////////////////////// InMemoryAcceptor //////////////////////////////////////////

class InMemoryAcceptor::Impl {
public:
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::unique_ptr<ITransport>> pending;
    bool listening{false};
    bool stopped{false};
};

InMemoryAcceptor::InMemoryAcceptor() : pImpl(std::make_unique<Impl>()) {}

InMemoryAcceptor::~InMemoryAcceptor() {
    (void)Stop();
}

std::future<void> InMemoryAcceptor::Start() {
    std::promise<void> promise;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->listening = true;
        pImpl->stopped = false;
    }
    promise.set_value();
    return promise.get_future();
}

std::unique_ptr<ITransport> InMemoryAcceptor::AcceptPeer() {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    pImpl->cv.wait(lock, [this]() { return pImpl->stopped || !pImpl->pending.empty(); });
    if (pImpl->stopped) {
        throw errors::TransportError("InMemoryAcceptor: stopped");
    }
    auto peer = std::move(pImpl->pending.front());
    pImpl->pending.pop_front();
    return peer;
}

std::future<void> InMemoryAcceptor::Stop() {
    std::deque<std::unique_ptr<ITransport>> orphaned;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->stopped = true;
        pImpl->listening = false;
        orphaned.swap(pImpl->pending);
    }
    pImpl->cv.notify_all();
    // Peers never accepted are closed so their client ends observe the loss
    for (auto& t : orphaned) {
        t->Close().get();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::unique_ptr<ITransport> InMemoryAcceptor::Connect() {
    auto [clientEnd, serverEnd] = InMemoryTransport::CreatePair();
    serverEnd->Start().get();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->listening || pImpl->stopped) {
            throw errors::TransportError("InMemoryAcceptor: not listening");
        }
        pImpl->pending.push_back(std::move(serverEnd));
    }
    pImpl->cv.notify_one();
    return std::move(clientEnd);
}

TransportProvider InMemoryAcceptor::MakeProvider() {
    return [this]() { return Connect(); };
}

} // namespace mcplink

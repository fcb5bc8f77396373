//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TcpTransport.cpp
// Purpose: TCP transport and acceptor using Boost.Asio coroutines
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "mcplink/ContentFramer.h"
#include "mcplink/TcpTransport.hpp"
#include "mcplink/errors/Errors.h"

namespace mcplink {
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::string endpointToString(const tcp::endpoint& ep) {
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

bool isValidPort(const std::string& port) {
    if (port.empty() || port.size() > 5) {
        return false;
    }
    if (!std::all_of(port.begin(), port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        return false;
    }
    return std::stoul(port) <= 65535ul;
}

} // namespace

class TcpTransport::Impl {
public:
    TcpTransport::Options opts;
    net::io_context ioc;
    net::executor_work_guard<net::io_context::executor_type> workGuard;
    std::optional<tcp::socket> socket;
    net::steady_timer connectTimer;
    std::thread ioThread;
    std::unique_ptr<IContentFramer> framer;
    std::string sessionId;

    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> failed{false};
    std::atomic<bool> ioExited{false};
    std::atomic<bool> connectTimedOut{false};

    std::mutex lifecycleMutex;
    std::mutex writeMutex;
    std::mutex queueMutex;
    std::condition_variable queueCv;
    std::deque<std::string> inbox;
    std::string failureReason;

    explicit Impl(TcpTransport::Options o)
        : opts(std::move(o)), workGuard(net::make_work_guard(ioc)), connectTimer(ioc) {
        framer = MakeContentLengthFramer(opts.maxContentLength);
        sessionId = "tcp-" + opts.host + ":" + opts.port;
    }

    ~Impl() {
        close();
    }

    void runIo() {
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("TcpTransport {} I/O loop error: {}", sessionId, e.what());
                fail(e.what());
            }
            {
                std::lock_guard<std::mutex> lk(queueMutex);
                ioExited = true;
            }
            queueCv.notify_all();
        });
    }

    void fail(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            if (failed.load()) {
                return;
            }
            failureReason = reason;
            failed = true;
        }
        connected = false;
        queueCv.notify_all();
    }

    // Server side: take ownership of an accepted socket and start reading.
    void adopt(tcp::socket accepted) {
        boost::system::error_code ec;
        auto remote = accepted.remote_endpoint(ec);
        if (!ec) {
            sessionId = "tcp-" + endpointToString(remote);
        }
        socket.emplace(std::move(accepted));
        connected = true;
        net::co_spawn(ioc, readLoop(), net::detached);
        runIo();
    }

    net::awaitable<void> connectAndRead(std::shared_ptr<std::promise<void>> ready) {
        bool ok = false;
        try {
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);
            connectTimer.expires_after(opts.connectTimeout);
            connectTimer.async_wait([this](const boost::system::error_code& ec) {
                if (!ec && !connected.load() && socket) {
                    connectTimedOut = true;
                    boost::system::error_code ignored;
                    socket->close(ignored);
                }
            });
            auto ep = co_await net::async_connect(*socket, results, net::use_awaitable);
            connectTimer.cancel();
            connected = true;
            sessionId = "tcp-" + endpointToString(ep);
            LOG_INFO("TcpTransport connected to {}", endpointToString(ep));
            ok = true;
        } catch (const std::exception& e) {
            std::string reason = connectTimedOut.load() ? std::string("connect timed out") : std::string(e.what());
            LOG_WARN("TcpTransport connect to {}:{} failed: {}", opts.host, opts.port, reason);
            fail(reason);
            ready->set_exception(std::make_exception_ptr(
                errors::TransportError("TcpTransport: connect to " + opts.host + ":" + opts.port + " failed: " + reason)));
        }
        if (ok) {
            ready->set_value();
            co_await readLoop();
        }
        co_return;
    }

    net::awaitable<void> readLoop() {
        std::string buffer;
        char tmp[4096];
        try {
            for (;;) {
                std::size_t n = co_await socket->async_read_some(net::buffer(tmp, sizeof(tmp)), net::use_awaitable);
                buffer.append(tmp, n);
                while (auto frame = framer->tryDecode(buffer)) {
                    {
                        std::lock_guard<std::mutex> lk(queueMutex);
                        inbox.push_back(std::move(frame.value()));
                    }
                    queueCv.notify_one();
                }
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::eof) {
                LOG_DEBUG("TcpTransport {}: peer closed", sessionId);
                fail("peer closed connection");
            } else if (closed.load()) {
                fail("transport closed");
            } else {
                LOG_WARN("TcpTransport {} read error: {}", sessionId, e.what());
                fail(e.what());
            }
        } catch (const std::runtime_error& e) {
            LOG_ERROR("TcpTransport {} framing error: {}", sessionId, e.what());
            fail(std::string("framing error: ") + e.what());
        }
        co_return;
    }

    void send(const std::string& payload) {
        std::lock_guard<std::mutex> lk(writeMutex);
        if (closed.load() || failed.load() || !socket) {
            throw errors::TransportError("TcpTransport: not connected");
        }
        auto bytes = std::make_shared<std::string>(framer->encode(payload));
        auto done = std::make_shared<std::promise<void>>();
        auto fut = done->get_future();
        net::post(ioc, [this, bytes, done]() {
            net::async_write(*socket, net::buffer(*bytes),
                [bytes, done](const boost::system::error_code& ec, std::size_t) {
                    if (ec) {
                        done->set_exception(std::make_exception_ptr(
                            errors::TransportError("TcpTransport: write failed: " + ec.message())));
                    } else {
                        done->set_value();
                    }
                });
        });
        while (fut.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (ioExited.load()) {
                throw errors::TransportError("TcpTransport: I/O loop stopped");
            }
        }
        fut.get();
    }

    std::string receive() {
        std::unique_lock<std::mutex> lk(queueMutex);
        queueCv.wait(lk, [this]() { return !inbox.empty() || closed.load() || failed.load() || ioExited.load(); });
        if (closed.load()) {
            throw errors::TransportError("TcpTransport: transport closed");
        }
        if (!inbox.empty()) {
            std::string frame = std::move(inbox.front());
            inbox.pop_front();
            return frame;
        }
        throw errors::TransportError("TcpTransport: " + (failureReason.empty() ? std::string("connection lost") : failureReason));
    }

    void close() {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            closed = true;
        }
        connected = false;
        queueCv.notify_all();
        if (!ioThread.joinable()) {
            return;
        }
        net::post(ioc, [this]() {
            connectTimer.cancel();
            if (socket && socket->is_open()) {
                boost::system::error_code ec;
                socket->shutdown(tcp::socket::shutdown_both, ec);
                socket->close(ec);
            }
        });
        workGuard.reset();
        if (std::this_thread::get_id() == ioThread.get_id()) {
            ioThread.detach();
        } else {
            ioThread.join();
        }
    }
};

TcpTransport::TcpTransport(Options options) : pImpl(std::make_unique<Impl>(std::move(options))) {}

TcpTransport::TcpTransport(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

std::unique_ptr<TcpTransport> TcpTransport::FromAccepted(std::unique_ptr<Impl> impl) {
    return std::unique_ptr<TcpTransport>(new TcpTransport(std::move(impl)));
}

TcpTransport::~TcpTransport() = default;

std::future<void> TcpTransport::Start() {
    FUNC_SCOPE();
    auto ready = std::make_shared<std::promise<void>>();
    auto fut = ready->get_future();
    if (pImpl->connected.load()) {
        ready->set_value();
        return fut;
    }
    if (pImpl->closed.load() || pImpl->ioThread.joinable()) {
        ready->set_exception(std::make_exception_ptr(errors::TransportError("TcpTransport: cannot be restarted")));
        return fut;
    }
    pImpl->socket.emplace(pImpl->ioc);
    net::co_spawn(pImpl->ioc, pImpl->connectAndRead(ready), net::detached);
    pImpl->runIo();
    return fut;
}

std::future<void> TcpTransport::Close() {
    FUNC_SCOPE();
    pImpl->close();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool TcpTransport::IsConnected() const {
    return pImpl->connected.load() && !pImpl->closed.load() && !pImpl->failed.load();
}

std::string TcpTransport::GetSessionId() const {
    return pImpl->sessionId;
}

void TcpTransport::Send(const std::string& frame) {
    LOG_DEBUG("TcpTransport {} send: {}", pImpl->sessionId, frame);
    pImpl->send(frame);
}

std::string TcpTransport::Receive() {
    return pImpl->receive();
}

////////////////////////////////////////// TcpAcceptor //////////////////////////////////////////

class TcpAcceptor::Impl {
public:
    TcpAcceptor::Options opts;
    std::atomic<bool> running{false};
    std::atomic<std::uint16_t> boundPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;

    std::mutex queueMutex;
    std::condition_variable queueCv;
    std::deque<std::unique_ptr<ITransport>> accepted;
    bool stopped{false};

    explicit Impl(TcpAcceptor::Options o) : opts(std::move(o)) {}

    ~Impl() {
        stop();
    }

    void markStopped() {
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            stopped = true;
        }
        queueCv.notify_all();
    }

    net::awaitable<void> acceptLoop(std::shared_ptr<std::promise<void>> ready) {
        bool listening = false;
        try {
            if (!isValidPort(opts.port)) {
                throw std::invalid_argument("invalid port: " + opts.port);
            }
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto results = co_await resolver.async_resolve(opts.address, opts.port, net::use_awaitable);
            tcp::endpoint ep = *results.begin();

            acceptor = std::make_unique<tcp::acceptor>(ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
            boundPort = acceptor->local_endpoint().port();
            LOG_INFO("TcpAcceptor listening on {}", endpointToString(acceptor->local_endpoint()));
            listening = true;
            ready->set_value();

            while (running.load()) {
                TcpTransport::Options peerOpts;
                peerOpts.maxContentLength = opts.maxContentLength;
                auto impl = std::make_unique<TcpTransport::Impl>(peerOpts);
                tcp::socket socket = co_await acceptor->async_accept(impl->ioc, net::use_awaitable);
                impl->adopt(std::move(socket));
                LOG_DEBUG("TcpAcceptor accepted {}", impl->sessionId);
                std::unique_ptr<ITransport> transport = TcpTransport::FromAccepted(std::move(impl));
                {
                    std::lock_guard<std::mutex> lk(queueMutex);
                    accepted.push_back(std::move(transport));
                }
                queueCv.notify_one();
            }
        } catch (const std::exception& e) {
            if (!listening) {
                LOG_ERROR("TcpAcceptor failed to listen on {}:{}: {}", opts.address, opts.port, e.what());
                ready->set_exception(std::make_exception_ptr(errors::TransportError(
                    "TcpAcceptor: listen on " + opts.address + ":" + opts.port + " failed: " + e.what())));
            } else if (running.load()) {
                LOG_ERROR("TcpAcceptor accept error: {}", e.what());
            } else {
                LOG_DEBUG("TcpAcceptor accept loop ended during shutdown: {}", e.what());
            }
        }
        markStopped();
        co_return;
    }

    void stop() {
        running = false;
        if (ioThread.joinable()) {
            net::post(ioc, [this]() {
                if (acceptor) {
                    boost::system::error_code ec;
                    acceptor->close(ec);
                }
            });
            ioThread.join();
        }
        markStopped();
        std::deque<std::unique_ptr<ITransport>> orphaned;
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            orphaned.swap(accepted);
        }
        for (auto& t : orphaned) {
            t->Close().get();
        }
        boundPort = 0;
    }
};

TcpAcceptor::TcpAcceptor(Options options) : pImpl(std::make_unique<Impl>(std::move(options))) {}

TcpAcceptor::~TcpAcceptor() = default;

std::future<void> TcpAcceptor::Start() {
    FUNC_SCOPE();
    auto ready = std::make_shared<std::promise<void>>();
    auto fut = ready->get_future();
    if (pImpl->ioThread.joinable()) {
        ready->set_exception(std::make_exception_ptr(errors::TransportError("TcpAcceptor: already started")));
        return fut;
    }
    pImpl->running = true;
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(ready), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("TcpAcceptor I/O loop error: {}", e.what());
        }
        pImpl->markStopped();
    });
    return fut;
}

std::unique_ptr<ITransport> TcpAcceptor::AcceptPeer() {
    std::unique_lock<std::mutex> lk(pImpl->queueMutex);
    pImpl->queueCv.wait(lk, [this]() { return pImpl->stopped || !pImpl->accepted.empty(); });
    if (!pImpl->accepted.empty()) {
        auto t = std::move(pImpl->accepted.front());
        pImpl->accepted.pop_front();
        return t;
    }
    throw errors::TransportError("TcpAcceptor: stopped");
}

std::future<void> TcpAcceptor::Stop() {
    FUNC_SCOPE();
    pImpl->stop();
    std::promise<void> done; done.set_value(); return done.get_future();
}

std::uint16_t TcpAcceptor::GetBoundPort() const {
    return pImpl->boundPort.load();
}

} // namespace mcplink

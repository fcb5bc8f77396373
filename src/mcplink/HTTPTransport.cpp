//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcplink/HTTPTransport.cpp
// Purpose: HTTP client transport using Boost.Beast: GET event stream for receive, POST per frame for send
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcplink/HTTPTransport.hpp"
#include "mcplink/errors/Errors.h"

namespace mcplink {
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {
constexpr const char* kSessionHeader = "Mcp-Session-Id";
}

class HTTPTransport::Impl {
public:
    HTTPTransport::Options opts;

    net::io_context ioc;
    net::executor_work_guard<net::io_context::executor_type> workGuard;
    std::optional<boost::beast::tcp_stream> eventStream; // I/O thread only
    std::thread ioThread;

    mutable std::mutex idMutex;
    std::string sessionId{"http-pending"};

    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> failed{false};
    std::atomic<bool> ioExited{false};

    std::mutex lifecycleMutex;
    std::mutex writeMutex;
    std::mutex queueMutex;
    std::condition_variable queueCv;
    std::deque<std::string> inbox;
    std::string failureReason;

    // SSE parse state (I/O thread only)
    std::string eventData;
    bool haveData{false};

    explicit Impl(const HTTPTransport::Options& o) : opts(o), workGuard(net::make_work_guard(ioc)) {}

    ~Impl() {
        close();
    }

    std::string currentSessionId() const {
        std::lock_guard<std::mutex> lk(idMutex);
        return sessionId;
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

    void push(std::string frame) {
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            inbox.push_back(std::move(frame));
        }
        queueCv.notify_one();
    }

    // Splits complete SSE events out of pending; only data: fields are meaningful.
    void drainEvents(std::string& pending) {
        for (;;) {
            auto nl = pending.find('\n');
            if (nl == std::string::npos) {
                return;
            }
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                if (haveData) {
                    push(std::move(eventData));
                }
                eventData.clear();
                haveData = false;
                continue;
            }
            if (line.front() == ':') {
                continue;
            }
            auto colon = line.find(':');
            std::string field = line.substr(0, colon);
            std::string value = colon == std::string::npos ? std::string() : line.substr(colon + 1);
            if (!value.empty() && value.front() == ' ') {
                value.erase(0, 1);
            }
            if (field == "data") {
                if (haveData) {
                    eventData += '\n';
                }
                eventData += value;
                haveData = true;
            }
        }
    }

    net::awaitable<void> openStream(std::shared_ptr<std::promise<void>> ready) {
        boost::beast::flat_buffer buffer;
        bool ok = false;
        try {
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);
            eventStream.emplace(co_await net::this_coro::executor);
            eventStream->expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await eventStream->async_connect(results, net::use_awaitable);

            http::request<http::empty_body> req{http::verb::get, opts.path, 11};
            req.set(http::field::host, opts.host);
            req.set(http::field::accept, "text/event-stream");
            req.set(http::field::cache_control, "no-cache");
            co_await http::async_write(*eventStream, req, net::use_awaitable);

            http::response_parser<http::empty_body> parser;
            co_await http::async_read_header(*eventStream, buffer, parser, net::use_awaitable);
            const auto& res = parser.get();
            if (res.result() != http::status::ok) {
                throw errors::TransportError("event stream rejected with HTTP " + std::to_string(res.result_int()));
            }
            auto it = res.find(kSessionHeader);
            if (it == res.end() || it->value().empty()) {
                throw errors::TransportError("event stream response lacks Mcp-Session-Id");
            }
            {
                std::lock_guard<std::mutex> lk(idMutex);
                sessionId = std::string(it->value());
            }
            eventStream->expires_never();
            connected = true;
            ok = true;
            LOG_INFO("HTTPTransport connected to {}:{}{} (session {})", opts.host, opts.port, opts.path, currentSessionId());
        } catch (const std::exception& e) {
            LOG_WARN("HTTPTransport failed to open event stream: {}", e.what());
            fail(e.what());
            ready->set_exception(std::make_exception_ptr(
                errors::TransportError(std::string("HTTPTransport: connect failed: ") + e.what())));
        }
        if (!ok) {
            co_return;
        }
        ready->set_value();

        std::string pending = boost::beast::buffers_to_string(buffer.data());
        buffer.consume(buffer.size());
        char tmp[4096];
        try {
            for (;;) {
                drainEvents(pending);
                std::size_t n = co_await eventStream->socket().async_read_some(net::buffer(tmp, sizeof(tmp)), net::use_awaitable);
                pending.append(tmp, n);
            }
        } catch (const boost::system::system_error& e) {
            if (closed.load()) {
                fail("transport closed");
            } else if (e.code() == net::error::eof) {
                LOG_INFO("HTTPTransport: event stream closed by server");
                fail("event stream closed by server");
            } else {
                LOG_WARN("HTTPTransport: event stream error: {}", e.what());
                fail(e.what());
            }
        }
        co_return;
    }

    net::awaitable<unsigned> coExchange(http::verb verb, std::string body) {
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(opts.host, opts.port, net::use_awaitable);
        boost::beast::tcp_stream stream(co_await net::this_coro::executor);
        stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
        co_await stream.async_connect(results, net::use_awaitable);

        http::request<http::string_body> req{verb, opts.path, 11};
        req.set(http::field::host, opts.host);
        req.set(http::field::content_type, "application/json");
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        req.set(kSessionHeader, currentSessionId());
        req.body() = std::move(body);
        req.prepare_payload();

        stream.expires_after(std::chrono::milliseconds(opts.requestTimeoutMs));
        co_await http::async_write(stream, req, net::use_awaitable);
        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res.result_int();
    }

    net::awaitable<void> coSend(std::string frame, std::shared_ptr<std::promise<void>> done) {
        try {
            unsigned status = co_await coExchange(http::verb::post, std::move(frame));
            if (status == 200 || status == 202) {
                done->set_value();
                co_return;
            }
            if (status == 404) {
                fail("session not found on server");
            }
            done->set_exception(std::make_exception_ptr(
                errors::TransportError("HTTPTransport: POST rejected with HTTP " + std::to_string(status))));
        } catch (const std::exception& e) {
            done->set_exception(std::make_exception_ptr(
                errors::TransportError(std::string("HTTPTransport: POST failed: ") + e.what())));
        }
        co_return;
    }

    net::awaitable<void> coDelete(std::shared_ptr<std::promise<void>> done) {
        try {
            unsigned status = co_await coExchange(http::verb::delete_, std::string());
            LOG_DEBUG("HTTPTransport: DELETE session answered {}", status);
        } catch (const std::exception& e) {
            LOG_DEBUG("HTTPTransport: DELETE session failed: {}", e.what());
        }
        done->set_value();
        co_return;
    }

    void runIo() {
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPTransport I/O loop error: {}", e.what());
                fail(e.what());
            }
            {
                std::lock_guard<std::mutex> lk(queueMutex);
                ioExited = true;
            }
            queueCv.notify_all();
        });
    }

    void send(const std::string& frame) {
        std::lock_guard<std::mutex> lk(writeMutex);
        if (closed.load()) {
            throw errors::TransportError("HTTPTransport: transport closed");
        }
        if (failed.load() || !connected.load()) {
            throw errors::TransportError("HTTPTransport: not connected");
        }
        auto done = std::make_shared<std::promise<void>>();
        auto fut = done->get_future();
        net::co_spawn(ioc, coSend(frame, done), net::detached);
        while (fut.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
            if (ioExited.load()) {
                throw errors::TransportError("HTTPTransport: I/O loop stopped");
            }
        }
        fut.get();
    }

    std::string receive() {
        std::unique_lock<std::mutex> lk(queueMutex);
        queueCv.wait(lk, [this]() { return !inbox.empty() || closed.load() || failed.load() || ioExited.load(); });
        if (closed.load()) {
            throw errors::TransportError("HTTPTransport: transport closed");
        }
        if (!inbox.empty()) {
            std::string frame = std::move(inbox.front());
            inbox.pop_front();
            return frame;
        }
        throw errors::TransportError("HTTPTransport: " + (failureReason.empty() ? std::string("connection lost") : failureReason));
    }

    void close() {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
        bool wasOpen = connected.load() && !failed.load();
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            if (closed.load() && !ioThread.joinable()) {
                return;
            }
            closed = true;
        }
        connected = false;
        queueCv.notify_all();
        if (!ioThread.joinable()) {
            return;
        }
        if (wasOpen && !ioExited.load()) {
            auto done = std::make_shared<std::promise<void>>();
            auto fut = done->get_future();
            net::co_spawn(ioc, coDelete(done), net::detached);
            (void)fut.wait_for(std::chrono::milliseconds(opts.requestTimeoutMs));
        }
        net::post(ioc, [this]() {
            if (eventStream) {
                boost::system::error_code ec;
                eventStream->socket().shutdown(tcp::socket::shutdown_both, ec);
                eventStream->socket().close(ec);
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

HTTPTransport::HTTPTransport(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

HTTPTransport::~HTTPTransport() = default;

std::future<void> HTTPTransport::Start() {
    FUNC_SCOPE();
    auto ready = std::make_shared<std::promise<void>>();
    auto fut = ready->get_future();
    if (pImpl->closed.load() || pImpl->ioThread.joinable()) {
        ready->set_exception(std::make_exception_ptr(errors::TransportError("HTTPTransport: cannot be restarted")));
        return fut;
    }
    net::co_spawn(pImpl->ioc, pImpl->openStream(ready), net::detached);
    pImpl->runIo();
    return fut;
}

std::future<void> HTTPTransport::Close() {
    FUNC_SCOPE();
    pImpl->close();
    std::promise<void> p; p.set_value(); return p.get_future();
}

bool HTTPTransport::IsConnected() const {
    return pImpl->connected.load() && !pImpl->closed.load() && !pImpl->failed.load();
}

std::string HTTPTransport::GetSessionId() const {
    return pImpl->currentSessionId();
}

void HTTPTransport::Send(const std::string& frame) {
    LOG_DEBUG("HTTPTransport {} send: {}", pImpl->currentSessionId(), frame);
    pImpl->send(frame);
}

std::string HTTPTransport::Receive() {
    return pImpl->receive();
}

} // namespace mcplink

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcplink/HTTPServer.cpp
// Purpose: HTTP acceptor with server-sent-event push using Boost.Beast
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <random>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcplink/HTTPServer.hpp"
#include "mcplink/errors/Errors.h"

namespace mcplink {
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr const char* kSessionHeader = "Mcp-Session-Id";

// One SSE event; embedded newlines become additional data: lines.
std::string encodeSseEvent(const std::string& frame) {
    std::string out;
    out.reserve(frame.size() + 16);
    std::size_t start = 0;
    for (;;) {
        auto nl = frame.find('\n', start);
        out += "data: ";
        if (nl == std::string::npos) {
            out.append(frame, start, std::string::npos);
            out += "\n";
            break;
        }
        out.append(frame, start, nl - start);
        out += "\n";
        start = nl + 1;
    }
    out += "\n";
    return out;
}

std::string targetPath(boost::beast::string_view target) {
    std::string t(target);
    auto q = t.find('?');
    return q == std::string::npos ? t : t.substr(0, q);
}

//==========================================================================================================
// SseSession
// Purpose: State shared between the HTTP coroutines of one peer and the ITransport handed to the server.
//==========================================================================================================
struct SseSession {
    SseSession(std::shared_ptr<net::io_context> ctx, std::string sid)
        : ioc(std::move(ctx)), id(std::move(sid)), wakeTimer(*ioc) {
        wakeTimer.expires_at(net::steady_timer::time_point::max());
    }

    std::shared_ptr<net::io_context> ioc;
    std::string id;
    net::steady_timer wakeTimer; // I/O thread only

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> inbound;
    std::deque<std::string> outbound;
    bool closed{false};   // closed by the server side
    bool peerGone{false}; // DELETE received, stream lost, or server stopped
    std::string reason;

    void markPeerGone(const std::string& why) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (peerGone) {
                return;
            }
            peerGone = true;
            reason = why;
        }
        cv.notify_all();
    }

    // Wakes the event-stream writer; safe from any thread.
    static void wake(const std::shared_ptr<SseSession>& s) {
        std::weak_ptr<SseSession> weak = s;
        net::post(*s->ioc, [weak]() {
            if (auto strong = weak.lock()) {
                strong->wakeTimer.cancel();
            }
        });
    }
};

struct SessionTable {
    std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<SseSession>> sessions;

    void add(const std::shared_ptr<SseSession>& s) {
        std::lock_guard<std::mutex> lk(mutex);
        sessions[s->id] = s;
    }

    std::shared_ptr<SseSession> find(const std::string& id) {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = sessions.find(id);
        return it == sessions.end() ? nullptr : it->second;
    }

    void remove(const std::string& id) {
        std::lock_guard<std::mutex> lk(mutex);
        sessions.erase(id);
    }

    std::vector<std::shared_ptr<SseSession>> snapshot() {
        std::lock_guard<std::mutex> lk(mutex);
        std::vector<std::shared_ptr<SseSession>> out;
        out.reserve(sessions.size());
        for (auto& kv : sessions) {
            out.push_back(kv.second);
        }
        return out;
    }
};

//==========================================================================================================
// HTTPSessionTransport
// Purpose: Server-side ITransport for one HTTP peer: Receive() yields POSTed frames, Send() queues SSE events.
//==========================================================================================================
class HTTPSessionTransport : public ITransport {
public:
    HTTPSessionTransport(std::shared_ptr<SseSession> s, std::weak_ptr<SessionTable> t)
        : session(std::move(s)), table(std::move(t)) {}

    ~HTTPSessionTransport() override {
        closeSession();
    }

    std::future<void> Start() override {
        std::promise<void> p; p.set_value(); return p.get_future();
    }

    std::future<void> Close() override {
        closeSession();
        std::promise<void> p; p.set_value(); return p.get_future();
    }

    bool IsConnected() const override {
        std::lock_guard<std::mutex> lk(session->mutex);
        return !session->closed && !session->peerGone;
    }

    std::string GetSessionId() const override {
        return session->id;
    }

    void Send(const std::string& frame) override {
        {
            std::lock_guard<std::mutex> lk(session->mutex);
            if (session->closed) {
                throw errors::TransportError("HTTPServer: session closed");
            }
            if (session->peerGone) {
                throw errors::TransportError("HTTPServer: " + session->reason);
            }
            session->outbound.push_back(frame);
        }
        SseSession::wake(session);
    }

    std::string Receive() override {
        std::unique_lock<std::mutex> lk(session->mutex);
        session->cv.wait(lk, [this]() { return !session->inbound.empty() || session->closed || session->peerGone; });
        if (session->closed) {
            throw errors::TransportError("HTTPServer: session closed");
        }
        if (!session->inbound.empty()) {
            std::string frame = std::move(session->inbound.front());
            session->inbound.pop_front();
            return frame;
        }
        throw errors::TransportError("HTTPServer: " + session->reason);
    }

private:
    void closeSession() {
        {
            std::lock_guard<std::mutex> lk(session->mutex);
            if (session->closed) {
                return;
            }
            session->closed = true;
        }
        session->cv.notify_all();
        SseSession::wake(session);
        if (auto t = table.lock()) {
            t->remove(session->id);
        }
    }

    std::shared_ptr<SseSession> session;
    std::weak_ptr<SessionTable> table;
};

} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::atomic<bool> running{false};
    std::atomic<std::uint16_t> boundPort{0};

    std::shared_ptr<net::io_context> ioc{std::make_shared<net::io_context>()};
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;
    std::shared_ptr<SessionTable> table{std::make_shared<SessionTable>()};
    std::unordered_set<std::shared_ptr<boost::beast::tcp_stream>> liveStreams; // I/O thread only

    std::mutex queueMutex;
    std::condition_variable queueCv;
    std::deque<std::unique_ptr<ITransport>> accepted;
    bool stopped{false};

    std::mt19937_64 rng{std::random_device{}()};

    explicit Impl(const HTTPServer::Options& o) : opts(o) {}

    ~Impl() {
        stop();
    }

    std::string newSessionId() {
        static const char* hex = "0123456789abcdef";
        std::uint64_t v = rng();
        std::string id;
        id.reserve(16);
        for (int i = 0; i < 16; ++i) {
            id.push_back(hex[(v >> (i * 4)) & 0xF]);
        }
        return id;
    }

    void markStopped() {
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            stopped = true;
        }
        queueCv.notify_all();
    }

    http::response<http::string_body> makeResponse(http::status status, unsigned version, std::string body = std::string()) {
        http::response<http::string_body> res{status, version};
        res.set(http::field::server, "mcplink");
        res.keep_alive(false);
        if (!body.empty()) {
            res.set(http::field::content_type, "application/json");
        }
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    http::response<http::string_body> handlePost(const http::request<http::string_body>& req) {
        auto it = req.find(kSessionHeader);
        if (it == req.end()) {
            return makeResponse(http::status::bad_request, req.version(), "{\"error\":\"missing Mcp-Session-Id\"}");
        }
        auto s = table->find(std::string(it->value()));
        if (!s) {
            return makeResponse(http::status::not_found, req.version(), "{\"error\":\"unknown session\"}");
        }
        if (req.body().empty()) {
            return makeResponse(http::status::bad_request, req.version(), "{\"error\":\"empty body\"}");
        }
        {
            std::lock_guard<std::mutex> lk(s->mutex);
            if (s->closed || s->peerGone) {
                return makeResponse(http::status::not_found, req.version(), "{\"error\":\"session ended\"}");
            }
            s->inbound.push_back(req.body());
        }
        s->cv.notify_one();
        return makeResponse(http::status::accepted, req.version());
    }

    http::response<http::string_body> handleDelete(const http::request<http::string_body>& req) {
        auto it = req.find(kSessionHeader);
        if (it == req.end()) {
            return makeResponse(http::status::bad_request, req.version(), "{\"error\":\"missing Mcp-Session-Id\"}");
        }
        auto s = table->find(std::string(it->value()));
        if (!s) {
            return makeResponse(http::status::not_found, req.version(), "{\"error\":\"unknown session\"}");
        }
        LOG_INFO("HTTPServer: session {} terminated by client", s->id);
        s->markPeerGone("session terminated by client");
        SseSession::wake(s);
        table->remove(s->id);
        return makeResponse(http::status::ok, req.version());
    }

    net::awaitable<void> watchPeer(std::shared_ptr<boost::beast::tcp_stream> stream, std::shared_ptr<SseSession> s) {
        char scratch[512];
        try {
            for (;;) {
                co_await stream->socket().async_read_some(net::buffer(scratch, sizeof(scratch)), net::use_awaitable);
            }
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("HTTPServer: event stream {} reader ended: {}", s->id, e.what());
        }
        s->markPeerGone("event stream closed");
        s->wakeTimer.cancel();
        co_return;
    }

    net::awaitable<void> serveEventStream(std::shared_ptr<boost::beast::tcp_stream> stream, unsigned version) {
        auto s = std::make_shared<SseSession>(ioc, newSessionId());
        table->add(s);

        http::response<http::empty_body> res{http::status::ok, version};
        res.set(http::field::server, "mcplink");
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.set(kSessionHeader, s->id);
        res.keep_alive(false);
        http::response_serializer<http::empty_body> sr{res};

        try {
            co_await http::async_write_header(*stream, sr, net::use_awaitable);
        } catch (const boost::system::system_error& e) {
            LOG_WARN("HTTPServer: failed to open event stream: {}", e.what());
            table->remove(s->id);
            co_return;
        }

        LOG_INFO("HTTPServer: session {} opened", s->id);
        {
            std::lock_guard<std::mutex> lk(queueMutex);
            accepted.push_back(std::make_unique<HTTPSessionTransport>(s, table));
        }
        queueCv.notify_one();
        net::co_spawn(*ioc, watchPeer(stream, s), net::detached);

        try {
            for (;;) {
                std::deque<std::string> batch;
                bool done = false;
                {
                    std::lock_guard<std::mutex> lk(s->mutex);
                    batch.swap(s->outbound);
                    done = s->closed || s->peerGone;
                }
                for (const auto& frame : batch) {
                    std::string event = encodeSseEvent(frame);
                    co_await net::async_write(stream->socket(), net::buffer(event), net::use_awaitable);
                }
                if (!batch.empty()) {
                    continue;
                }
                if (done) {
                    break;
                }
                boost::system::error_code ec;
                co_await s->wakeTimer.async_wait(net::redirect_error(net::use_awaitable, ec));
            }
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("HTTPServer: event stream {} write ended: {}", s->id, e.what());
            s->markPeerGone("event stream write failed");
        }
        table->remove(s->id);
        boost::system::error_code ec;
        stream->socket().shutdown(tcp::socket::shutdown_both, ec);
        stream->socket().close(ec);
        LOG_INFO("HTTPServer: session {} stream closed", s->id);
        co_return;
    }

    net::awaitable<void> connection(tcp::socket socket) {
        auto stream = std::make_shared<boost::beast::tcp_stream>(std::move(socket));
        liveStreams.insert(stream);
        try {
            boost::beast::flat_buffer buffer;
            http::request_parser<http::string_body> parser;
            parser.body_limit(opts.maxBodyBytes);
            co_await http::async_read(*stream, buffer, parser, net::use_awaitable);
            http::request<http::string_body> req = parser.release();

            if (targetPath(req.target()) != opts.path) {
                auto res = makeResponse(http::status::not_found, req.version(), "{\"error\":\"Not found\"}");
                co_await http::async_write(*stream, res, net::use_awaitable);
            } else if (req.method() == http::verb::get) {
                co_await serveEventStream(stream, req.version());
            } else if (req.method() == http::verb::post) {
                auto res = handlePost(req);
                co_await http::async_write(*stream, res, net::use_awaitable);
            } else if (req.method() == http::verb::delete_) {
                auto res = handleDelete(req);
                co_await http::async_write(*stream, res, net::use_awaitable);
            } else {
                auto res = makeResponse(http::status::method_not_allowed, req.version(), "{\"error\":\"method not allowed\"}");
                co_await http::async_write(*stream, res, net::use_awaitable);
            }
            boost::system::error_code ec;
            stream->socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const boost::system::system_error& e) {
            if (running.load()) {
                LOG_DEBUG("HTTPServer connection error: {}", e.what());
            }
        }
        liveStreams.erase(stream);
        co_return;
    }

    net::awaitable<void> acceptLoop(std::shared_ptr<std::promise<void>> ready) {
        bool listening = false;
        try {
            // Port must be numeric and within [0, 65535]
            bool allDigits = !opts.port.empty() && opts.port.size() <= 5 &&
                std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
            if (!allDigits || std::stoul(opts.port) > 65535ul) {
                throw std::invalid_argument("invalid port: " + opts.port);
            }
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto r = co_await resolver.async_resolve(opts.address, opts.port, net::use_awaitable);
            tcp::endpoint ep = *r.begin();

            acceptor = std::make_unique<tcp::acceptor>(*ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
            boundPort = acceptor->local_endpoint().port();
            LOG_INFO("HTTPServer listening on {}:{}{}", opts.address, boundPort.load(), opts.path);
            listening = true;
            ready->set_value();

            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                net::co_spawn(*ioc, connection(std::move(socket)), net::detached);
            }
        } catch (const std::exception& e) {
            if (!listening) {
                LOG_ERROR("HTTPServer failed to listen on {}:{}: {}", opts.address, opts.port, e.what());
                ready->set_exception(std::make_exception_ptr(errors::TransportError(
                    "HTTPServer: listen on " + opts.address + ":" + opts.port + " failed: " + e.what())));
            } else if (running.load()) {
                LOG_ERROR("HTTPServer accept error: {}", e.what());
            } else {
                LOG_DEBUG("HTTPServer accept loop ended during shutdown: {}", e.what());
            }
        }
        markStopped();
        co_return;
    }

    void stop() {
        running = false;
        if (ioThread.joinable()) {
            auto sessions = table->snapshot();
            for (auto& s : sessions) {
                s->markPeerGone("server stopped");
            }
            net::post(*ioc, [this, sessions]() {
                boost::system::error_code ec;
                if (acceptor) {
                    acceptor->close(ec);
                }
                for (auto& s : sessions) {
                    s->wakeTimer.cancel();
                }
                for (auto& st : liveStreams) {
                    st->socket().shutdown(tcp::socket::shutdown_both, ec);
                    st->socket().close(ec);
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

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    auto ready = std::make_shared<std::promise<void>>();
    auto fut = ready->get_future();
    if (pImpl->ioThread.joinable()) {
        ready->set_exception(std::make_exception_ptr(errors::TransportError("HTTPServer: already started")));
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(*pImpl->ioc, pImpl->acceptLoop(ready), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc->run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer I/O loop error: {}", e.what());
        }
        pImpl->markStopped();
    });
    return fut;
}

std::unique_ptr<ITransport> HTTPServer::AcceptPeer() {
    std::unique_lock<std::mutex> lk(pImpl->queueMutex);
    pImpl->queueCv.wait(lk, [this]() { return pImpl->stopped || !pImpl->accepted.empty(); });
    if (!pImpl->accepted.empty()) {
        auto t = std::move(pImpl->accepted.front());
        pImpl->accepted.pop_front();
        return t;
    }
    throw errors::TransportError("HTTPServer: stopped");
}

std::future<void> HTTPServer::Stop() {
    pImpl->stop();
    std::promise<void> done; done.set_value(); return done.get_future();
}

std::uint16_t HTTPServer::GetBoundPort() const {
    return pImpl->boundPort.load();
}

} // namespace mcplink

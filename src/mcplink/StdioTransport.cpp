//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <cstring>

#include <atomic>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "mcplink/ContentFramer.h"
#include "mcplink/StdioTransport.hpp"
#include "mcplink/errors/Errors.h"

namespace mcplink {

namespace {
std::once_flag gIgnoreSigpipeOnce;

// Writes to a pipe whose reader has gone must fail with EPIPE instead of terminating the process.
void ignoreSigpipe() {
    std::call_once(gIgnoreSigpipeOnce, []() { ::signal(SIGPIPE, SIG_IGN); });
}
} // namespace

class StdioTransport::Impl {
public:
    Options options;
    std::unique_ptr<IContentFramer> framer;
    std::atomic<bool> started{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> eof{false};
    std::string sessionId;
    std::string readBuffer; // touched only by the single reader
    std::mutex writeMutex;
    int writeFd{-1};
    int wakeEventFd{-1};

    static constexpr int waitTimeoutMs = 100;

    explicit Impl(Options opts) : options(std::move(opts)) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));
        writeFd = options.writeFd;
        framer = options.framing == Framing::Newline ? MakeNewlineFramer(options.maxContentLength)
                                                     : MakeContentLengthFramer(options.maxContentLength);
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        closeWriteSide();
        if (options.ownsDescriptors && options.readFd >= 0) {
            ::close(options.readFd);
            options.readFd = -1;
        }
        if (wakeEventFd >= 0) { ::close(wakeEventFd); wakeEventFd = -1; }
    }

    void wake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    void closeWriteSide() {
        std::lock_guard<std::mutex> lk(writeMutex);
        if (options.ownsDescriptors && writeFd >= 0) {
            ::close(writeFd);
        }
        writeFd = -1;
    }

    void writeAll(const std::string& bytes) {
        std::lock_guard<std::mutex> lk(writeMutex);
        if (writeFd < 0) {
            throw errors::TransportError("StdioTransport: write side closed");
        }
        std::size_t total = 0;
        while (total < bytes.size()) {
            ssize_t w = ::write(writeFd, bytes.data() + total, bytes.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
                continue;
            }
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                struct pollfd pfd{writeFd, POLLOUT, 0};
                (void)::poll(&pfd, 1, waitTimeoutMs);
                if (closed.load()) {
                    throw errors::TransportError("StdioTransport: closed during write");
                }
                continue;
            }
            LOG_ERROR("StdioTransport: write error (errno={} msg={})", errno, ::strerror(errno));
            throw errors::TransportError(std::string("StdioTransport: write error: ") + ::strerror(errno));
        }
    }

    std::string readFrame() {
        while (true) {
            if (closed.load()) {
                throw errors::TransportError("StdioTransport: transport closed");
            }
            std::optional<std::string> frame;
            try {
                frame = framer->tryDecode(readBuffer);
            } catch (const std::runtime_error& e) {
                LOG_ERROR("StdioTransport: framing error: {}", e.what());
                throw errors::TransportError(std::string("StdioTransport: framing error: ") + e.what());
            }
            if (frame.has_value()) {
                return std::move(frame.value());
            }
            if (eof.load()) {
                throw errors::TransportError("StdioTransport: EOF on input");
            }

            struct pollfd pfds[2];
            pfds[0].fd = options.readFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
            int nfds = 1;
            if (wakeEventFd >= 0) { pfds[1].fd = wakeEventFd; pfds[1].events = POLLIN; pfds[1].revents = 0; nfds = 2; }
            int rc = ::poll(pfds, static_cast<nfds_t>(nfds), waitTimeoutMs);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                throw errors::TransportError("StdioTransport: poll failed");
            }
            if (rc == 0) {
                continue;
            }
            if (nfds == 2 && (pfds[1].revents & POLLIN)) {
                uint64_t v = 0;
                ssize_t r;
                do { r = ::read(wakeEventFd, &v, sizeof(v)); } while (r < 0 && errno == EINTR);
                continue;
            }
            if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                char tmp[4096];
                ssize_t n = ::read(options.readFd, tmp, sizeof(tmp));
                if (n > 0) {
                    readBuffer.append(tmp, static_cast<std::size_t>(n));
                } else if (n == 0) {
                    LOG_INFO("StdioTransport: EOF on input");
                    eof = true;
                } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                    throw errors::TransportError(std::string("StdioTransport: read error: ") + ::strerror(errno));
                }
            }
        }
    }
};

StdioTransport::StdioTransport() : StdioTransport(Options{}) {}

StdioTransport::StdioTransport(Options options) : pImpl(std::make_unique<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

StdioTransport::~StdioTransport() {
    FUNC_SCOPE();
    pImpl->closed = true;
    pImpl->wake();
}

std::pair<std::unique_ptr<StdioTransport>, std::unique_ptr<StdioTransport>> StdioTransport::CreatePipePair(Framing framing) {
    int aToB[2];
    int bToA[2];
    if (::pipe2(aToB, O_CLOEXEC) != 0) {
        throw errors::TransportError(std::string("StdioTransport: pipe failed: ") + ::strerror(errno));
    }
    if (::pipe2(bToA, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(aToB[0]); ::close(aToB[1]);
        throw errors::TransportError(std::string("StdioTransport: pipe failed: ") + ::strerror(err));
    }
    Options a;
    a.readFd = bToA[0]; a.writeFd = aToB[1]; a.framing = framing; a.ownsDescriptors = true;
    Options b;
    b.readFd = aToB[0]; b.writeFd = bToA[1]; b.framing = framing; b.ownsDescriptors = true;
    return std::make_pair(std::make_unique<StdioTransport>(a), std::make_unique<StdioTransport>(b));
}

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    LOG_INFO("Starting StdioTransport {} (fd in={} out={})", pImpl->sessionId, pImpl->options.readFd, pImpl->options.writeFd);
    std::promise<void> promise;
    if (pImpl->closed.load()) {
        promise.set_exception(std::make_exception_ptr(errors::TransportError("StdioTransport: already closed")));
        return promise.get_future();
    }
    ignoreSigpipe();
    pImpl->started = true;
    promise.set_value();
    return promise.get_future();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    if (!pImpl->closed.exchange(true)) {
        LOG_INFO("Closing StdioTransport {}", pImpl->sessionId);
        pImpl->wake();
        pImpl->closeWriteSide();
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool StdioTransport::IsConnected() const {
    return pImpl->started.load() && !pImpl->closed.load() && !pImpl->eof.load();
}

std::string StdioTransport::GetSessionId() const {
    return pImpl->sessionId;
}

void StdioTransport::Send(const std::string& frame) {
    if (pImpl->closed.load()) {
        throw errors::TransportError("StdioTransport: transport closed");
    }
    LOG_DEBUG("StdioTransport {} send: {}", pImpl->sessionId, frame);
    pImpl->writeAll(pImpl->framer->encode(frame));
}

std::string StdioTransport::Receive() {
    std::string frame = pImpl->readFrame();
    LOG_DEBUG("StdioTransport {} received: {}", pImpl->sessionId, frame);
    return frame;
}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    StdioTransport::Options options;
    if (config == "stdio" || config.empty()) {
        options.framing = StdioTransport::Framing::ContentLength;
    } else if (config == "stdio+newline") {
        options.framing = StdioTransport::Framing::Newline;
    } else {
        throw std::invalid_argument("StdioTransportFactory: unsupported config: " + config);
    }
    return std::make_unique<StdioTransport>(options);
}

} // namespace mcplink

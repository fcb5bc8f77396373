//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RawPeer.h
// Purpose: Test helper speaking raw JSON-RPC frames over the client end of an in-memory transport pair
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "mcplink/InMemoryTransport.hpp"
#include "mcplink/JSONRPCTypes.h"
#include "mcplink/Protocol.h"
#include "mcplink/Server.h"
#include "mcplink/errors/Errors.h"

namespace mcplink {
namespace testing {

class RawPeer {
public:
    // Wires a fresh transport pair, hands the far end to server.Serve() and starts reading.
    explicit RawPeer(Server& server) {
        auto [mine, theirs] = InMemoryTransport::CreatePair();
        transport = std::move(mine);
        transport->Start().get();
        sessionId = server.Serve(std::move(theirs));
        reader = std::thread([this]() { readLoop(); });
    }

    ~RawPeer() {
        transport->Close().get();
        if (reader.joinable()) {
            reader.join();
        }
    }

    RawPeer(const RawPeer&) = delete;
    RawPeer& operator=(const RawPeer&) = delete;

    void SendRaw(const std::string& frame) { transport->Send(frame); }

    void Request(int64_t id, const std::string& method, std::optional<JSONValue> params = std::nullopt) {
        SendRaw(JSONRPCRequest(id, method, std::move(params)).Serialize());
    }

    void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt) {
        SendRaw(JSONRPCNotification(method, std::move(params)).Serialize());
    }

    // Next inbound frame parsed as JSON, or nullopt when none arrived in time.
    std::optional<JSONValue> Next(std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lk(mutex);
        if (!cv.wait_for(lk, timeout, [this]() { return !frames.empty(); })) {
            return std::nullopt;
        }
        std::string frame = std::move(frames.front());
        frames.pop_front();
        return ParseJSON(frame);
    }

    // Next inbound frame that is a response to id; other frames are skipped.
    std::optional<JSONValue> ResponseTo(int64_t id, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return std::nullopt;
            }
            auto frame = Next(remaining);
            if (!frame.has_value()) {
                return std::nullopt;
            }
            if (frame->IsObject() && frame->Find("method") == nullptr && frame->GetInteger("id") == id) {
                return frame;
            }
        }
    }

    // Performs initialize + notifications/initialized and returns the initialize result.
    JSONValue Handshake(int64_t id = 0, const std::string& version = PROTOCOL_VERSION) {
        JSONValue params = MakeObject();
        params.Set("protocolVersion", JSONValue(version));
        params.Set("capabilities", MakeObject());
        params.Set("clientInfo", Implementation{"raw-peer", "1.0"}.ToJSONValue());
        Request(id, Methods::Initialize, params);
        auto reply = ResponseTo(id);
        if (!reply.has_value() || reply->Find("result") == nullptr) {
            throw errors::TransportError("handshake failed");
        }
        Notify(Methods::Initialized);
        return *reply->Find("result");
    }

    bool Closed() const {
        std::lock_guard<std::mutex> lk(mutex);
        return closed;
    }

    std::string sessionId;

private:
    void readLoop() {
        for (;;) {
            std::string frame;
            try {
                frame = transport->Receive();
            } catch (const errors::TransportError&) {
                break;
            }
            {
                std::lock_guard<std::mutex> lk(mutex);
                frames.push_back(std::move(frame));
            }
            cv.notify_all();
        }
        {
            std::lock_guard<std::mutex> lk(mutex);
            closed = true;
        }
        cv.notify_all();
    }

    std::unique_ptr<InMemoryTransport> transport;
    std::thread reader;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> frames;
    bool closed{false};
};

// Error code of a reply frame, or nullopt for a success reply.
inline std::optional<int64_t> ErrorCode(const JSONValue& reply) {
    const JSONValue* err = reply.Find("error");
    if (!err) {
        return std::nullopt;
    }
    return err->GetInteger("code");
}

} // namespace testing
} // namespace mcplink

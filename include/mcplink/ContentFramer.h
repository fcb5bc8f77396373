//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for byte-stream message framing (Content-Length headers or newline delimiters)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace mcplink {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the front of the buffer
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;

    //========================================================================================================
    // Extracts the next complete frame from buffer, erasing the consumed bytes.
    // Returns:
    //   The payload, or std::nullopt when more bytes are needed.
    // Throws:
    //   std::runtime_error when the buffer holds a malformed or oversized frame (the stream is unusable).
    //========================================================================================================
    std::optional<std::string> tryDecode(std::string& buffer);
};

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 4 * 1024 * 1024);
std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength = 4 * 1024 * 1024);

} // namespace mcplink

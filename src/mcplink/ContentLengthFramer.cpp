//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length header framing for byte-stream carriers
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "mcplink/ContentFramer.h"

namespace mcplink {

std::optional<std::string> IContentFramer::tryDecode(std::string& buffer) {
    DecodeResult r = tryDecodeEx(buffer);
    switch (r.status) {
        case DecodeStatus::Ok:
            buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            return r.payload;
        case DecodeStatus::Incomplete:
            return std::nullopt;
        case DecodeStatus::BodyTooLarge:
            throw std::runtime_error("frame exceeds maximum size");
        case DecodeStatus::InvalidHeader:
            break;
    }
    throw std::runtime_error("malformed frame header");
}

namespace {
class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string sep = "\r\n\r\n";
        std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            // A header block that never terminates is treated as garbage once it exceeds a sane size
            if (buffer.size() > MaxHeaderBytes) {
                LOG_WARN("Content-Length header block exceeds {} bytes", MaxHeaderBytes);
                return { DecodeStatus::InvalidHeader, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos <= headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            std::string line = buffer.substr(pos, eol - pos);
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = line.substr(0, colon);
                std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
                std::string value = line.substr(colon + 1);
                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
                if (name == "content-length") {
                    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; })) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerEnd + sep.size() };
                    }
                    unsigned long long v64 = 0;
                    try {
                        v64 = std::stoull(value);
                    } catch (const std::out_of_range&) {
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerEnd + sep.size() };
                    }
                    if (v64 > maxContentLength) {
                        LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerEnd + sep.size() };
                    }
                    contentLength = static_cast<std::size_t>(v64);
                    haveLength = true;
                }
            }
            pos = eol + 2;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerEnd + sep.size() };
        }

        const std::size_t headerAndSep = headerEnd + sep.size();
        std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        std::string payload = buffer.substr(headerAndSep, contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal };
    }

private:
    static constexpr std::size_t MaxHeaderBytes = 8192;
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace mcplink

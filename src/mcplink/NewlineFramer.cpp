//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NewlineFramer.cpp
// Purpose: Newline-delimited framing (one compact JSON document per line)
//========================================================================================================

#include <string>

#include "logging/Logger.h"
#include "mcplink/ContentFramer.h"

namespace mcplink {

namespace {
class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame;
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t start = 0;
        while (true) {
            std::size_t eol = buffer.find('\n', start);
            if (eol == std::string::npos) {
                if (buffer.size() - start > maxLineLength) {
                    LOG_WARN("Newline frame exceeds {} bytes", maxLineLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                return { DecodeStatus::Incomplete, std::nullopt, 0 };
            }
            std::size_t end = eol;
            if (end > start && buffer[end - 1] == '\r') {
                --end;
            }
            if (end == start) {
                // Blank keep-alive lines carry no frame
                start = eol + 1;
                continue;
            }
            if (end - start > maxLineLength) {
                return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
            }
            return { DecodeStatus::Ok, buffer.substr(start, end - start), eol + 1 };
        }
    }

private:
    std::size_t maxLineLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

} // namespace mcplink

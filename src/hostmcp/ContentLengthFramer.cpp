//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length based framer for the stdio transport
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <optional>
#include <string>

#include "hostmcp/ContentFramer.h"
#include "logging/Logger.h"

namespace hostmcp {

namespace {

// A header block larger than this without a terminating blank line is discarded.
constexpr std::size_t kMaxHeaderBytes = 8 * 1024;

// Locates the blank line ending the header block. Returns {position, separator length}.
std::optional<std::pair<std::size_t, std::size_t>> findHeaderEnd(const std::string& buffer) {
    std::size_t crlf = buffer.find("\r\n\r\n");
    std::size_t lf = buffer.find("\n\n");
    if (crlf == std::string::npos && lf == std::string::npos) {
        return std::nullopt;
    }
    if (lf != std::string::npos && (crlf == std::string::npos || lf < crlf)) {
        return std::make_pair(lf, std::size_t{2});
    }
    return std::make_pair(crlf, std::size_t{4});
}

std::string trimmed(std::string s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch){ return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), s.end());
    return s;
}

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
        auto end = findHeaderEnd(buffer);
        if (!end) {
            if (buffer.size() > kMaxHeaderBytes) {
                LOG_WARN("Discarding {} bytes without a header terminator", buffer.size());
                return { DecodeStatus::InvalidHeader, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerEnd = end->first;
        const std::size_t headerAndSep = headerEnd + end->second;

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos <= headerEnd) {
            std::size_t eol = buffer.find('\n', pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            std::string line = buffer.substr(pos, eol - pos);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = trimmed(line.substr(0, colon));
                std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
                if (name == "content-length") {
                    const std::string value = trimmed(line.substr(colon + 1));
                    unsigned long long v64 = 0;
                    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), v64);
                    if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
                    }
                    if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max() - headerAndSep) {
                        LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep, static_cast<std::size_t>(
                                 std::min<unsigned long long>(v64, std::numeric_limits<std::size_t>::max())) };
                    }
                    contentLength = static_cast<std::size_t>(v64);
                    haveLength = true;
                }
            } else if (!line.empty()) {
                LOG_DEBUG("Ignoring non-header line in frame header: {}", line);
            }
            if (eol >= headerEnd) {
                break;
            }
            pos = eol + 1;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header; skipping header block");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        const std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        std::string payload = buffer.substr(headerAndSep, contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace hostmcp

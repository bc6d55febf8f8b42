//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for header-delimited message framing (stdio transport)
//========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace hostmcp {

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
        std::size_t bodyToDiscard{0};       // BodyTooLarge: body bytes that follow the header and must be skipped
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

//========================================================================================================
// MakeContentLengthFramer
// Purpose: "Content-Length: N" framing. Header lines may end in CRLF or bare LF; other header lines are
//   ignored; a header block without Content-Length is InvalidHeader and is skipped as a whole.
//========================================================================================================
std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 4 * 1024 * 1024);

} // namespace hostmcp

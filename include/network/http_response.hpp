#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
//---------------------------------------------------------------------------
// MemRun - Remote Object to Memory Launcher
// Dominik Durner, 2025
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace memrun::network {
//---------------------------------------------------------------------------
/// Implements an helper to deserialize http responses
struct HttpResponse {
    /// Important status codes
    enum class Code : uint8_t {
        OK_200,
        PARTIAL_CONTENT_206,
        MOVED_PERMANENTLY_301,
        BAD_REQUEST_400,
        UNAUTHORIZED_401,
        FORBIDDEN_403,
        NOT_FOUND_404,
        RANGE_NOT_SATISFIABLE_416,
        TOO_MANY_REQUESTS_429,
        INTERNAL_SERVER_ERROR_500,
        SERVICE_UNAVAILABLE_503,
        UNKNOWN = 255
    };
    enum class Type : uint8_t {
        HTTP_1_0,
        HTTP_1_1
    };
    /// The headers - without trailing and leading whitespaces
    std::map<std::string, std::string> headers;
    /// The known code
    Code code = Code::UNKNOWN;
    /// The numeric status
    uint16_t status = 0;
    /// The type
    Type type = Type::HTTP_1_1;

    /// Get the status line text of a code
    static constexpr auto getResponseCode(const Code& code) noexcept {
        switch (code) {
            case Code::OK_200: return "200 OK";
            case Code::PARTIAL_CONTENT_206: return "206 Partial Content";
            case Code::MOVED_PERMANENTLY_301: return "301 Moved Permanently";
            case Code::BAD_REQUEST_400: return "400 Bad Request";
            case Code::UNAUTHORIZED_401: return "401 Unauthorized";
            case Code::FORBIDDEN_403: return "403 Forbidden";
            case Code::NOT_FOUND_404: return "404 Not Found";
            case Code::RANGE_NOT_SATISFIABLE_416: return "416 Range Not Satisfiable";
            case Code::TOO_MANY_REQUESTS_429: return "429 Too Many Requests";
            case Code::INTERNAL_SERVER_ERROR_500: return "500 Internal Server Error";
            case Code::SERVICE_UNAVAILABLE_503: return "503 Service Unavailable";
            default: return "UNKNOWN";
        }
    }
    /// Get the known code of a numeric status
    static constexpr Code getCode(uint16_t status) noexcept {
        switch (status) {
            case 200: return Code::OK_200;
            case 206: return Code::PARTIAL_CONTENT_206;
            case 301: return Code::MOVED_PERMANENTLY_301;
            case 400: return Code::BAD_REQUEST_400;
            case 401: return Code::UNAUTHORIZED_401;
            case 403: return Code::FORBIDDEN_403;
            case 404: return Code::NOT_FOUND_404;
            case 416: return Code::RANGE_NOT_SATISFIABLE_416;
            case 429: return Code::TOO_MANY_REQUESTS_429;
            case 500: return Code::INTERNAL_SERVER_ERROR_500;
            case 503: return Code::SERVICE_UNAVAILABLE_503;
            default: return Code::UNKNOWN;
        }
    }
    /// Get the response type
    static constexpr auto getResponseType(const Type& type) noexcept {
        switch (type) {
            case Type::HTTP_1_0: return "HTTP/1.0";
            case Type::HTTP_1_1: return "HTTP/1.1";
            default: return "UNKNOWN";
        }
    }
    /// Check for successful 2xx operations
    [[nodiscard]] bool success() const { return status >= 200 && status < 300; }
    /// Case insensitive header lookup
    [[nodiscard]] std::optional<std::string_view> findHeader(std::string_view key) const;
    /// Deserialize the response
    [[nodiscard]] static HttpResponse deserialize(std::string_view data);
};
//---------------------------------------------------------------------------
} // namespace memrun::network

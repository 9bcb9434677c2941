/*
 * Copyright 2025 Regmock Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Regmock HTTP Protocol - Header
// Request views into the receive buffer, owned body and response

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace regmock::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    UNKNOWN
};

/// HTTP version
enum class Version : uint8_t { HTTP_1_0, HTTP_1_1, UNKNOWN };

/// HTTP status codes used by the mock service
enum class StatusCode : uint16_t {
    OK = 200,
    Created = 201,

    BadRequest = 400,
    Unauthorized = 401,
    NotFound = 404,
    PayloadTooLarge = 413,

    InternalServerError = 500,
};

/// HTTP header (name-value pair)
/// Both name and value are views into the request buffer
struct Header {
    std::string_view name;
    std::string_view value;
};

/// HTTP request
/// Line and header fields are views into the connection's receive buffer.
/// The body is copied out because chunked framing splits it.
struct Request {
    Method method = Method::UNKNOWN;
    Version version = Version::HTTP_1_1;

    std::string_view uri;
    std::string_view path;   // URI without query string
    std::string_view query;  // Query string (if present)

    std::vector<Header> headers;

    std::string body;  // De-chunked payload

    // Helper: Find header by name (case-insensitive)
    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept;

    [[nodiscard]] std::string_view body_view() const noexcept { return body; }
};

/// HTTP response (owns its headers and body)
struct Response {
    Version version = Version::HTTP_1_1;
    StatusCode status = StatusCode::OK;

    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    /// Add header, or replace the value of an existing one with the same name
    void set_header(std::string_view name, std::string_view value);

    /// Serialize status line, headers (with Content-Length) and body
    [[nodiscard]] std::string serialize() const;
};

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert Version to string
[[nodiscard]] std::string_view to_string(Version version) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

}  // namespace regmock::http

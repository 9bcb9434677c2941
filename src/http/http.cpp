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

// Regmock HTTP Protocol - Implementation

#include "http.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace regmock::http {

// Request helper methods

const Header* Request::find_header(std::string_view name) const noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

// Response helper methods

void Response::set_header(std::string_view name, std::string_view value) {
    for (auto& [hdr_name, hdr_value] : headers) {
        if (header_name_equals(hdr_name, name)) {
            hdr_value.assign(value);
            return;
        }
    }
    headers.emplace_back(std::string(name), std::string(value));
}

std::string Response::serialize() const {
    std::string out;
    out.reserve(256 + body.size());

    fmt::format_to(std::back_inserter(out), "{} {} {}\r\n", to_string(version),
                   static_cast<uint16_t>(status), to_reason_phrase(status));

    for (const auto& [name, value] : headers) {
        if (header_name_equals(name, "Content-Length")) {
            continue;  // Always derived from body below
        }
        fmt::format_to(std::back_inserter(out), "{}: {}\r\n", name, value);
    }
    fmt::format_to(std::back_inserter(out), "Content-Length: {}\r\n\r\n", body.size());

    out += body;
    return out;
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string_view to_string(Version version) noexcept {
    switch (version) {
        case Version::HTTP_1_0:
            return "HTTP/1.0";
        case Version::HTTP_1_1:
            return "HTTP/1.1";
        case Version::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::Created:
            return "Created";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::PayloadTooLarge:
            return "Payload Too Large";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

}  // namespace regmock::http

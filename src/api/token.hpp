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

// Regmock Registration Tokens - Header
// Opaque runner registration tokens drawn from the OpenSSL CSPRNG

#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../core/time_utils.hpp"

namespace regmock::api {

/// Marks tokens as issued by the mock (never a real GitHub token format)
inline constexpr std::string_view TOKEN_PREFIX = "MOCK_REG_";

/// Random bytes per token (256 bits of entropy)
inline constexpr size_t TOKEN_ENTROPY_BYTES = 32;

/// Thrown when the secure random source cannot produce bytes
class TokenGenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RegistrationToken {
    std::string token;
    core::Clock::time_point expires_at;
};

inline void to_json(nlohmann::json& j, const RegistrationToken& t) {
    j = nlohmann::json{{"token", t.token}, {"expires_at", core::format_iso8601_utc(t.expires_at)}};
}

/// Issues registration tokens; holds no record of what it issued
class TokenGenerator {
public:
    explicit TokenGenerator(std::chrono::seconds ttl = std::chrono::hours(1)) noexcept
        : ttl_(ttl) {}

    /// Issue a token expiring ttl after now
    /// Throws TokenGenerationError if RAND_bytes fails
    [[nodiscard]] RegistrationToken issue() const { return issue(core::Clock::now()); }

    /// Issue a token expiring ttl after the given instant
    [[nodiscard]] RegistrationToken issue(core::Clock::time_point now) const;

    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return ttl_; }

private:
    std::chrono::seconds ttl_;
};

/// True if the credential looks like a token this service issued
[[nodiscard]] bool is_mock_token(std::string_view credential) noexcept;

/// Standard base64 (with padding, no newlines)
[[nodiscard]] std::string base64_encode(const unsigned char* data, size_t length);

}  // namespace regmock::api

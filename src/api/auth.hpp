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

// Regmock Authorization - Header
// Format-only checks of the Authorization header

#pragma once

#include <optional>
#include <string_view>

#include "../http/regex.hpp"

namespace regmock::api {

/// Accepts "Bearer ghp_..." and "Bearer github_pat_..." credentials.
/// No signature, expiry or revocation check is made.
class AuthorizationValidator {
public:
    explicit AuthorizationValidator(bool enabled = true);

    /// Authorization for the control-plane routes (PAT / app token)
    [[nodiscard]] bool is_authorized(std::optional<std::string_view> header) const;

    /// Authorization for runner registration ("RemoteAuth"/"Bearer" + MOCK_REG_ token)
    [[nodiscard]] bool is_registration_authorized(std::optional<std::string_view> header) const;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }

private:
    bool enabled_;
    http::Regex token_pattern_;
};

}  // namespace regmock::api

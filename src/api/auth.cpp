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

// Regmock Authorization - Implementation

#include "auth.hpp"

#include <stdexcept>

#include "../core/string_utils.hpp"
#include "token.hpp"

namespace regmock::api {

namespace {

constexpr std::string_view PAT_PATTERN = "^Bearer (ghp_|github_pat_)";

http::Regex compile_or_throw(std::string_view pattern) {
    std::string error;
    auto regex = http::Regex::compile(pattern, error);
    if (!regex) {
        throw std::logic_error(error);
    }
    return std::move(*regex);
}

}  // namespace

AuthorizationValidator::AuthorizationValidator(bool enabled)
    : enabled_(enabled), token_pattern_(compile_or_throw(PAT_PATTERN)) {}

bool AuthorizationValidator::is_authorized(std::optional<std::string_view> header) const {
    if (!enabled_) {
        return true;
    }

    if (!header || header->empty()) {
        return false;
    }

    return token_pattern_.matches(*header);
}

bool AuthorizationValidator::is_registration_authorized(
    std::optional<std::string_view> header) const {
    if (!enabled_) {
        return true;
    }

    if (!header || header->empty()) {
        return false;
    }

    std::string_view credential = core::strip_scheme(*header, "RemoteAuth ");
    if (credential.empty()) {
        credential = core::strip_scheme(*header, "Bearer ");
    }
    return is_mock_token(credential);
}

}  // namespace regmock::api

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

// Regmock Endpoint Handlers - Header
// One handler per route; each builds the JSON body for its response

#pragma once

#include "../control/config.hpp"
#include "router.hpp"
#include "token.hpp"

namespace regmock::api {

class EndpointHandlers {
public:
    explicit EndpointHandlers(control::MockConfig config);

    /// GET /repos/actions/runner/releases/latest
    [[nodiscard]] DispatchResult latest_release(RouteContext& ctx) const;

    /// POST /orgs/{org}/... and /repos/{owner}/{repo}/actions/runners/registration-token
    [[nodiscard]] DispatchResult registration_token(RouteContext& ctx) const;

    /// GET /orgs/{org}/actions/runners and /repos/{owner}/{repo}/actions/runners
    [[nodiscard]] DispatchResult list_runners(RouteContext& ctx) const;

    /// GET /health
    [[nodiscard]] DispatchResult health(RouteContext& ctx) const;

    /// POST /reset
    [[nodiscard]] DispatchResult reset(RouteContext& ctx) const;

    /// POST /actions/runner-registration
    [[nodiscard]] DispatchResult register_runner(RouteContext& ctx) const;

    /// Fallback for unmatched requests
    [[nodiscard]] DispatchResult not_found() const;

    [[nodiscard]] const control::MockConfig& config() const noexcept { return config_; }

private:
    control::MockConfig config_;
    TokenGenerator tokens_;
};

/// Build the route table in priority order
[[nodiscard]] Router build_routes(const EndpointHandlers& handlers);

/// {"message": ...} body
[[nodiscard]] std::string message_body(std::string_view message);

}  // namespace regmock::api

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

// Regmock Dispatcher - Header
// Counts, routes, authorizes and answers one request under the state lock

#pragma once

#include <optional>
#include <string_view>

#include "../control/config.hpp"
#include "../http/http.hpp"
#include "auth.hpp"
#include "handlers.hpp"
#include "registry.hpp"
#include "router.hpp"

namespace regmock::api {

class Dispatcher {
public:
    /// The dispatcher keeps a reference to state; state must outlive it
    Dispatcher(const control::Config& config, ServiceState& state);

    // Non-copyable, non-movable (routes capture a pointer to handlers_)
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Route one request and produce its status and JSON body.
    /// Increments the request counter exactly once, whatever the outcome.
    /// Never throws for handler faults: they become 500 responses.
    [[nodiscard]] DispatchResult dispatch(http::Method method, std::string_view path,
                                          std::optional<std::string_view> auth_header,
                                          std::string_view body = {});

    /// Dispatch a parsed request and wrap the result with the standard headers
    [[nodiscard]] http::Response handle(const http::Request& request, std::string_view request_id);

    [[nodiscard]] const Router& router() const noexcept { return router_; }

    [[nodiscard]] ServiceState& state() noexcept { return state_; }

private:
    [[nodiscard]] bool authorize(AuthPolicy policy,
                                 std::optional<std::string_view> auth_header) const;

    std::string api_version_;
    ServiceState& state_;
    AuthorizationValidator auth_;
    EndpointHandlers handlers_;
    Router router_;
};

/// 500 body: {"message":"Internal server error","error":<what>}
[[nodiscard]] std::string internal_error_body(std::string_view what);

/// Populate a response with the JSON body and the headers every answer carries
void finalize_response(http::Response& response, http::StatusCode status, std::string body,
                       std::string_view api_version, std::string_view request_id);

}  // namespace regmock::api

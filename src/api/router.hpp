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

// Regmock Router - Header
// Ordered (method, path pattern, handler) table; first match wins

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/time_utils.hpp"
#include "../http/http.hpp"
#include "../http/regex.hpp"

namespace regmock::api {

struct ServiceState;

/// Status and JSON body produced for one request
struct DispatchResult {
    http::StatusCode status = http::StatusCode::OK;
    std::string body;
};

/// Which credential a route demands
enum class AuthPolicy : uint8_t {
    None,          // Public (release metadata, health, reset)
    Token,         // "Bearer ghp_..." / "Bearer github_pat_..."
    Registration   // Registration token issued by this service
};

/// Inputs available to a handler
struct RouteContext {
    std::vector<std::string> params;  // Percent-decoded capture groups, in pattern order
    std::string_view body;            // Request body (may be empty)
    ServiceState& state;              // Caller holds state.mutex
    core::Clock::time_point now;
};

using Handler = std::function<DispatchResult(RouteContext&)>;

/// Route definition
struct Route {
    std::string name;        // Stable identifier, used in logs
    http::Method method;
    http::Regex pattern;     // Anchored path pattern
    AuthPolicy auth = AuthPolicy::None;
    Handler handler;
};

/// Match result from router
struct RouteMatch {
    const Route* route = nullptr;
    std::vector<std::string_view> captures;  // Raw capture groups (not decoded)

    [[nodiscard]] bool matched() const noexcept { return route != nullptr; }
};

/// Router evaluated top-to-bottom in insertion order
class Router {
public:
    Router() = default;

    // Non-copyable, movable
    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;
    Router(Router&&) noexcept = default;
    Router& operator=(Router&&) noexcept = default;

    /// Append a route; throws std::invalid_argument if the pattern does not compile
    void add_route(std::string name, http::Method method, std::string_view pattern,
                   AuthPolicy auth, Handler handler);

    /// First route whose method and pattern both match
    [[nodiscard]] RouteMatch match(http::Method method, std::string_view path) const;

    [[nodiscard]] const std::vector<Route>& routes() const noexcept { return routes_; }

    void clear() { routes_.clear(); }

private:
    std::vector<Route> routes_;
};

}  // namespace regmock::api

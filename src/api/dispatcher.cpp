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

// Regmock Dispatcher - Implementation

#include "dispatcher.hpp"

#include <mutex>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../core/logging.hpp"
#include "../http/regex.hpp"

namespace regmock::api {

std::string internal_error_body(std::string_view what) {
    return nlohmann::json{{"message", "Internal server error"}, {"error", std::string(what)}}
        .dump();
}

void finalize_response(http::Response& response, http::StatusCode status, std::string body,
                       std::string_view api_version, std::string_view request_id) {
    response.status = status;
    response.body = std::move(body);
    response.set_header("Content-Type", "application/json");
    response.set_header("X-GitHub-Api-Version", api_version);
    if (!request_id.empty()) {
        response.set_header("X-Request-Id", request_id);
    }
    response.set_header("Connection", "close");
    response.set_header("Server", "regmock/0.1.0");
}

Dispatcher::Dispatcher(const control::Config& config, ServiceState& state)
    : api_version_(config.mock.api_version),
      state_(state),
      auth_(config.auth.enabled),
      handlers_(config.mock),
      router_(build_routes(handlers_)) {}

bool Dispatcher::authorize(AuthPolicy policy, std::optional<std::string_view> auth_header) const {
    switch (policy) {
        case AuthPolicy::None:
            return true;
        case AuthPolicy::Token:
            return auth_.is_authorized(auth_header);
        case AuthPolicy::Registration:
            return auth_.is_registration_authorized(auth_header);
    }
    return false;
}

DispatchResult Dispatcher::dispatch(http::Method method, std::string_view path,
                                    std::optional<std::string_view> auth_header,
                                    std::string_view body) {
    // Coarse lock: one request mutates or reads the state at a time
    std::scoped_lock lock(state_.mutex);
    ++state_.request_count;

    auto* logger = logging::get_current_logger();

    try {
        RouteMatch match = router_.match(method, path);
        if (!match.matched()) {
            return handlers_.not_found();
        }

        const Route& route = *match.route;

        if (!authorize(route.auth, auth_header)) {
            if (logger) {
                LOG_WARNING(logger, "Authorization failed: route={}, path={}, header_present={}",
                            route.name, path, auth_header.has_value() && !auth_header->empty());
            }
            return {http::StatusCode::Unauthorized, message_body("Requires authentication")};
        }

        RouteContext ctx{{}, body, state_, core::Clock::now()};
        ctx.params.reserve(match.captures.size());
        for (auto capture : match.captures) {
            auto decoded = http::url::decode(capture);
            if (!decoded) {
                throw std::invalid_argument("Malformed path parameter '" + std::string(capture) +
                                            "'");
            }
            ctx.params.push_back(std::move(*decoded));
        }

        return route.handler(ctx);
    } catch (const std::exception& e) {
        if (logger) {
            LOG_ERROR(logger, "Handler failed: method={}, path={}, error={}",
                      http::to_string(method), path, e.what());
        }
        return {http::StatusCode::InternalServerError, internal_error_body(e.what())};
    }
}

http::Response Dispatcher::handle(const http::Request& request, std::string_view request_id) {
    std::optional<std::string_view> auth_header;
    if (const http::Header* header = request.find_header("Authorization")) {
        auth_header = header->value;
    }

    DispatchResult result = dispatch(request.method, request.path, auth_header, request.body_view());

    http::Response response;
    finalize_response(response, result.status, std::move(result.body), api_version_, request_id);
    return response;
}

}  // namespace regmock::api

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

// Regmock Endpoint Handlers - Implementation

#include "handlers.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"
#include "registry.hpp"

namespace regmock::api {

namespace {

// Fixed asset sizes for the mocked release payload
constexpr int64_t WINDOWS_ASSET_SIZE = 104857600;
constexpr int64_t LINUX_ASSET_SIZE = 183500800;

constexpr std::string_view RELEASE_DOWNLOAD_BASE =
    "https://github.com/actions/runner/releases/download";

std::string scope_of(const RouteContext& ctx) {
    if (ctx.params.size() == 1) {
        return "org=" + ctx.params[0];
    }
    if (ctx.params.size() == 2) {
        return "repo=" + ctx.params[0] + "/" + ctx.params[1];
    }
    return "scope=unknown";
}

}  // namespace

std::string message_body(std::string_view message) {
    return nlohmann::json{{"message", std::string(message)}}.dump();
}

EndpointHandlers::EndpointHandlers(control::MockConfig config)
    : config_(std::move(config)), tokens_(std::chrono::seconds(config_.token_ttl_seconds)) {}

DispatchResult EndpointHandlers::latest_release(RouteContext& /*ctx*/) const {
    const std::string& version = config_.runner_version;
    std::string tag = "v" + version;

    auto asset = [&](std::string file, int64_t size) {
        std::string url = fmt::format("{}/{}/{}", RELEASE_DOWNLOAD_BASE, tag, file);
        return nlohmann::json{
            {"name", std::move(file)}, {"browser_download_url", std::move(url)}, {"size", size}};
    };

    nlohmann::json body{
        {"tag_name", tag},
        {"name", tag},
        {"assets",
         nlohmann::json::array(
             {asset(fmt::format("actions-runner-win-x64-{}.zip", version), WINDOWS_ASSET_SIZE),
              asset(fmt::format("actions-runner-linux-x64-{}.tar.gz", version),
                    LINUX_ASSET_SIZE)})}};

    return {http::StatusCode::OK, body.dump()};
}

DispatchResult EndpointHandlers::registration_token(RouteContext& ctx) const {
    RegistrationToken token = tokens_.issue(ctx.now);

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Registration token issued: {}, expires_at={}", scope_of(ctx),
                 core::format_iso8601_utc(token.expires_at));
    }

    nlohmann::json body = token;
    return {http::StatusCode::OK, body.dump()};
}

DispatchResult EndpointHandlers::list_runners(RouteContext& ctx) const {
    // One registry for every org and repo
    RunnerList list = ctx.state.registry.list();

    nlohmann::json body{{"total_count", list.total_count}, {"runners", list.runners}};
    return {http::StatusCode::OK, body.dump()};
}

DispatchResult EndpointHandlers::health(RouteContext& ctx) const {
    auto uptime = ctx.state.uptime(ctx.now);

    nlohmann::json body{{"status", "healthy"},
                        {"uptime", core::format_uptime(uptime)},
                        {"uptime_seconds", uptime.count()},
                        {"request_count", ctx.state.request_count},
                        {"registered_runners", ctx.state.registry.size()}};
    return {http::StatusCode::OK, body.dump()};
}

DispatchResult EndpointHandlers::reset(RouteContext& ctx) const {
    size_t removed = ctx.state.registry.size();
    ctx.state.reset();

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Mock state reset: removed_runners={}", removed);
    }

    return {http::StatusCode::OK, message_body("Mock data reset successfully")};
}

DispatchResult EndpointHandlers::register_runner(RouteContext& ctx) const {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(ctx.body);
    } catch (const nlohmann::json::parse_error&) {
        return {http::StatusCode::BadRequest, message_body("Problems parsing JSON")};
    }

    if (!request.is_object()) {
        return {http::StatusCode::BadRequest, message_body("Problems parsing JSON")};
    }

    if (!request.contains("name") || !request["name"].is_string() ||
        request["name"].get_ref<const std::string&>().empty()) {
        return {http::StatusCode::BadRequest, message_body("Missing runner name")};
    }

    std::string labels_csv;
    if (request.contains("labels")) {
        const auto& labels = request["labels"];
        if (labels.is_string()) {
            labels_csv = labels.get<std::string>();
        } else if (labels.is_array()) {
            std::vector<std::string> names;
            for (const auto& label : labels) {
                if (!label.is_string()) {
                    return {http::StatusCode::BadRequest, message_body("Invalid labels")};
                }
                names.push_back(label.get<std::string>());
            }
            labels_csv = core::join(names, ",");
        } else {
            return {http::StatusCode::BadRequest, message_body("Invalid labels")};
        }
    }

    RegisteredRunner runner =
        ctx.state.registry.register_runner(request["name"].get<std::string>(), labels_csv, ctx.now);

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Runner registered: id={}, name={}, labels={}", runner.id, runner.name,
                 labels_csv);
    }

    nlohmann::json body = runner;
    return {http::StatusCode::Created, body.dump()};
}

DispatchResult EndpointHandlers::not_found() const {
    nlohmann::json body{{"message", "Not Found"}, {"documentation_url", config_.documentation_url}};
    return {http::StatusCode::NotFound, body.dump()};
}

Router build_routes(const EndpointHandlers& handlers) {
    using http::Method;

    Router router;
    const EndpointHandlers* h = &handlers;

    router.add_route("latest_release", Method::GET, "^/repos/actions/runner/releases/latest$",
                     AuthPolicy::None, [h](RouteContext& ctx) { return h->latest_release(ctx); });

    router.add_route("org_registration_token", Method::POST,
                     "^/orgs/([^/]+)/actions/runners/registration-token$", AuthPolicy::Token,
                     [h](RouteContext& ctx) { return h->registration_token(ctx); });

    router.add_route("repo_registration_token", Method::POST,
                     "^/repos/([^/]+)/([^/]+)/actions/runners/registration-token$",
                     AuthPolicy::Token,
                     [h](RouteContext& ctx) { return h->registration_token(ctx); });

    router.add_route("org_runners", Method::GET, "^/orgs/([^/]+)/actions/runners$",
                     AuthPolicy::Token, [h](RouteContext& ctx) { return h->list_runners(ctx); });

    router.add_route("repo_runners", Method::GET, "^/repos/([^/]+)/([^/]+)/actions/runners$",
                     AuthPolicy::Token, [h](RouteContext& ctx) { return h->list_runners(ctx); });

    router.add_route("health", Method::GET, "^/health$", AuthPolicy::None,
                     [h](RouteContext& ctx) { return h->health(ctx); });

    router.add_route("reset", Method::POST, "^/reset$", AuthPolicy::None,
                     [h](RouteContext& ctx) { return h->reset(ctx); });

    router.add_route("register_runner", Method::POST, "^/actions/runner-registration$",
                     AuthPolicy::Registration,
                     [h](RouteContext& ctx) { return h->register_runner(ctx); });

    return router;
}

}  // namespace regmock::api

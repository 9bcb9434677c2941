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


// Regmock Router - Implementation

#include "router.hpp"

#include <stdexcept>

namespace regmock::api {

void Router::add_route(std::string name, http::Method method, std::string_view pattern,
                       AuthPolicy auth, Handler handler) {
    std::string error;
    auto regex = http::Regex::compile(pattern, error);
    if (!regex) {
        throw std::invalid_argument("Route '" + name + "': " + error);
    }

    routes_.push_back(Route{std::move(name), method, std::move(*regex), auth, std::move(handler)});
}

RouteMatch Router::match(http::Method method, std::string_view path) const {
    for (const auto& route : routes_) {
        if (route.method != method) {
            continue;
        }

        auto groups = route.pattern.extract_groups(path);
        if (groups.empty()) {
            continue;
        }

        RouteMatch match;
        match.route = &route;
        match.captures.assign(groups.begin() + 1, groups.end());  // Drop full match
        return match;
    }

    return {};
}

}  // namespace regmock::api

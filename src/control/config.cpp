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

// Regmock Configuration - Implementation

#include "config.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace regmock::control {

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    ValidationResult result;
    return load_from_file(path, result);
}

std::optional<Config> ConfigLoader::load_from_file(std::string_view path,
                                                   ValidationResult& result) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        result.add_error("Cannot open configuration file '" + path_str + "'");
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_json(buffer.str(), result);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    ValidationResult result;
    return load_from_json(json, result);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json,
                                                   ValidationResult& result) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        result.add_error(std::string("JSON parsing error: ") + e.what());
        return std::nullopt;
    }

    result = validate(config);
    if (result.has_errors()) {
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Server
    if (config.server.listen_port == 0) {
        result.add_warning("Server listen_port is 0; an ephemeral port will be bound");
    }

    in_addr addr{};
    if (inet_pton(AF_INET, config.server.listen_address.c_str(), &addr) != 1) {
        result.add_error("Server listen_address '" + config.server.listen_address +
                         "' is not an IPv4 address");
    } else if (config.server.listen_address.rfind("127.", 0) != 0) {
        result.add_warning("Server listen_address '" + config.server.listen_address +
                           "' is not loopback; the mock service has no real authentication");
    }

    if (config.server.backlog == 0) {
        result.add_error("Server backlog must be > 0");
    }

    if (config.server.poll_interval_ms < 10 || config.server.poll_interval_ms > 1000) {
        result.add_error("Server poll_interval_ms must be between 10 and 1000");
    }

    if (config.server.max_request_size < 1024) {
        result.add_error("Server max_request_size must be >= 1024");
    }

    if (config.server.io_timeout_ms == 0) {
        result.add_error("Server io_timeout_ms must be > 0");
    }

    if (config.server.max_workers == 0) {
        result.add_error("Server max_workers must be > 0");
    }

    // Auth
    if (!config.auth.enabled) {
        result.add_warning("Authorization is disabled; every request will be accepted");
    }

    // Logging
    std::string level = config.logging.level;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (level != "debug" && level != "info" && level != "warning" && level != "warn" &&
        level != "error") {
        result.add_error("Unknown logging level '" + config.logging.level + "'");
    }

    if (config.logging.format != "text" && config.logging.format != "json") {
        result.add_error("Unknown logging format '" + config.logging.format +
                         "' (expected text or json)");
    }

    // Mock data
    if (config.mock.runner_version.empty()) {
        result.add_error("Mock runner_version cannot be empty");
    }

    if (config.mock.runner_id_min <= 0 || config.mock.runner_id_max < config.mock.runner_id_min) {
        result.add_error("Mock runner id range must satisfy 0 < runner_id_min <= runner_id_max");
    }

    if (config.mock.token_ttl_seconds == 0) {
        result.add_error("Mock token_ttl_seconds must be > 0");
    } else if (config.mock.token_ttl_seconds != 3600) {
        result.add_warning("Mock token_ttl_seconds differs from the real API (3600)");
    }

    if (config.mock.api_version.empty()) {
        result.add_error("Mock api_version cannot be empty");
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        return "";
    }
}

}  // namespace regmock::control

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

// Regmock Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace regmock::control {

/// Listener configuration
struct ServerConfig {
    std::string listen_address = "127.0.0.1";  // Loopback only
    uint16_t listen_port = 8080;
    uint32_t backlog = 32;

    // Upper bound on how long accept() waits before re-checking the stop flag
    uint32_t poll_interval_ms = 100;

    uint32_t max_request_size = 65536;  // 64KB, headers + body

    // Per-connection send/receive timeout
    uint32_t io_timeout_ms = 5000;

    // false = one request at a time
    // true  = one worker thread per connection, state mutations serialized
    bool concurrent_connections = false;

    // Live worker threads in concurrent mode; further connections are
    // served on the accept thread until a worker finishes
    uint32_t max_workers = 64;
};

/// Authorization configuration
struct AuthConfig {
    bool enabled = true;  // false = every request is authorized
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";  // debug, info, warning, error
    std::string format = "text";  // text, json
    std::string file;             // Append-only log file, empty = console
};

/// Mocked control-plane data
struct MockConfig {
    std::string runner_version = "2.311.0";
    std::string runner_os = "linux";
    int64_t runner_id_min = 1000;
    int64_t runner_id_max = 99999;
    uint32_t token_ttl_seconds = 3600;
    std::string api_version = "2022-11-28";
    std::string documentation_url = "https://docs.github.com/rest";
};

/// Full Regmock configuration
struct Config {
    ServerConfig server;
    AuthConfig auth;
    LogConfig logging;
    MockConfig mock;

    std::optional<std::string> description;
};

// Custom from_json functions to handle missing fields with defaults

inline void from_json(const nlohmann::json& j, ServerConfig& s) {
    s.listen_address = j.value("listen_address", std::string("127.0.0.1"));
    s.listen_port = j.value("listen_port", uint16_t(8080));
    s.backlog = j.value("backlog", 32u);
    s.poll_interval_ms = j.value("poll_interval_ms", 100u);
    s.max_request_size = j.value("max_request_size", 65536u);
    s.io_timeout_ms = j.value("io_timeout_ms", 5000u);
    s.concurrent_connections = j.value("concurrent_connections", false);
    s.max_workers = j.value("max_workers", 64u);
}

inline void from_json(const nlohmann::json& j, AuthConfig& a) {
    a.enabled = j.value("enabled", true);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.file = j.value("file", std::string());
}

inline void from_json(const nlohmann::json& j, MockConfig& m) {
    m.runner_version = j.value("runner_version", std::string("2.311.0"));
    m.runner_os = j.value("runner_os", std::string("linux"));
    m.runner_id_min = j.value("runner_id_min", int64_t(1000));
    m.runner_id_max = j.value("runner_id_max", int64_t(99999));
    m.token_ttl_seconds = j.value("token_ttl_seconds", 3600u);
    m.api_version = j.value("api_version", std::string("2022-11-28"));
    m.documentation_url =
        j.value("documentation_url", std::string("https://docs.github.com/rest"));
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get() instead of value() for nested structs
    if (j.contains("server")) {
        j.at("server").get_to(c.server);
    }
    if (j.contains("auth")) {
        j.at("auth").get_to(c.auth);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("mock")) {
        j.at("mock").get_to(c.mock);
    }
    if (j.contains("description") && !j.at("description").is_null()) {
        c.description = j.at("description").get<std::string>();
    }
}

inline void to_json(nlohmann::json& j, const ServerConfig& s) {
    j = nlohmann::json{{"listen_address", s.listen_address},
                       {"listen_port", s.listen_port},
                       {"backlog", s.backlog},
                       {"poll_interval_ms", s.poll_interval_ms},
                       {"max_request_size", s.max_request_size},
                       {"io_timeout_ms", s.io_timeout_ms},
                       {"concurrent_connections", s.concurrent_connections},
                       {"max_workers", s.max_workers}};
}

inline void to_json(nlohmann::json& j, const AuthConfig& a) {
    j = nlohmann::json{{"enabled", a.enabled}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{{"level", l.level}, {"format", l.format}, {"file", l.file}};
}

inline void to_json(nlohmann::json& j, const MockConfig& m) {
    j = nlohmann::json{{"runner_version", m.runner_version},
                       {"runner_os", m.runner_os},
                       {"runner_id_min", m.runner_id_min},
                       {"runner_id_max", m.runner_id_max},
                       {"token_ttl_seconds", m.token_ttl_seconds},
                       {"api_version", m.api_version},
                       {"documentation_url", m.documentation_url}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["server"] = c.server;
    j["auth"] = c.auth;
    j["logging"] = c.logging;
    j["mock"] = c.mock;
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON file, reporting why it was rejected
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path,
                                                              ValidationResult& result);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Load configuration from JSON string, reporting why it was rejected
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json,
                                                              ValidationResult& result);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

}  // namespace regmock::control

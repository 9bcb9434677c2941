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

// Regmock - Main Entry Point
#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>

#include "api/dispatcher.hpp"
#include "api/registry.hpp"
#include "control/config.hpp"
#include "core/logging.hpp"
#include "core/server.hpp"

namespace {

std::atomic<bool> g_server_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_server_running.store(false, std::memory_order_relaxed);
    }
}

void print_usage(const char* argv0) {
    fprintf(stderr,
            "Usage: %s [--config <config.json>] [--port <n>] [--no-auth]\n"
            "          [--log-file <path>] [--concurrent] [--help]\n",
            argv0);
}

struct CommandLine {
    std::optional<std::string> config_path;
    std::optional<uint16_t> port;
    std::optional<std::string> log_file;
    bool no_auth = false;
    bool concurrent = false;
    bool help = false;
};

std::optional<uint16_t> parse_port(const std::string& value) {
    if (value.empty() || value.size() > 5) {
        return std::nullopt;
    }
    unsigned long port = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        port = port * 10 + static_cast<unsigned long>(c - '0');
    }
    if (port > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(port);
}

// Returns nullopt on unknown flags or missing/invalid values
std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--no-auth") {
            cmd.no_auth = true;
        } else if (arg == "--concurrent") {
            cmd.concurrent = true;
        } else if (arg == "--config" && has_value) {
            cmd.config_path = argv[++i];
        } else if (arg == "--log-file" && has_value) {
            cmd.log_file = argv[++i];
        } else if (arg == "--port" && has_value) {
            cmd.port = parse_port(argv[++i]);
            if (!cmd.port) {
                fprintf(stderr, "Invalid port '%s'\n", argv[i]);
                return std::nullopt;
            }
        } else {
            fprintf(stderr, "Unknown or incomplete argument '%s'\n", arg.c_str());
            return std::nullopt;
        }
    }
    return cmd;
}

void print_validation(const regmock::control::ValidationResult& validation) {
    if (!validation.errors.empty()) {
        fprintf(stderr, "Configuration validation errors:\n");
        for (const auto& error : validation.errors) {
            fprintf(stderr, "  - %s\n", error.c_str());
        }
    }
    for (const auto& warning : validation.warnings) {
        printf("Warning: %s\n", warning.c_str());
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto cmd = parse_command_line(argc, argv);
    if (!cmd) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (cmd->help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    printf("Regmock v0.1.0\n");
    printf("Mock CI runner registration API\n\n");

    regmock::control::Config config;
    if (cmd->config_path) {
        printf("Loading configuration from %s...\n", cmd->config_path->c_str());
        regmock::control::ValidationResult load_result;
        auto loaded = regmock::control::ConfigLoader::load_from_file(*cmd->config_path, load_result);
        if (!loaded) {
            fprintf(stderr, "Failed to load configuration\n");
            print_validation(load_result);
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }

    // Command line wins over the file
    if (cmd->port) {
        config.server.listen_port = *cmd->port;
    }
    if (cmd->no_auth) {
        config.auth.enabled = false;
    }
    if (cmd->log_file) {
        config.logging.file = *cmd->log_file;
    }
    if (cmd->concurrent) {
        config.server.concurrent_connections = true;
    }

    auto validation = regmock::control::ConfigLoader::validate(config);
    print_validation(validation);
    if (validation.has_errors()) {
        return EXIT_FAILURE;
    }

    regmock::logging::init_logging_system();
    quill::Logger* logger = nullptr;
    try {
        logger = regmock::logging::init_service_logger(config.logging);
    } catch (const std::exception& e) {
        fprintf(stderr, "Failed to initialize logging (%s): %s\n",
                config.logging.file.empty() ? "console" : config.logging.file.c_str(), e.what());
        regmock::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    int exit_code = EXIT_SUCCESS;
    {
        regmock::api::ServiceState state(config.mock);
        regmock::api::Dispatcher dispatcher(config, state);
        regmock::core::Server server(config, dispatcher);

        if (auto ec = server.start(); ec) {
            fprintf(stderr, "Failed to bind %s:%u: %s\n", config.server.listen_address.c_str(),
                    static_cast<unsigned>(config.server.listen_port), ec.message().c_str());
            exit_code = EXIT_FAILURE;
        } else {
            printf("Listening on %s:%u (Ctrl+C to stop)\n", config.server.listen_address.c_str(),
                   static_cast<unsigned>(server.port()));
            fflush(stdout);

            server.run(&g_server_running);

            LOG_INFO(logger, "Shutdown complete: {} requests served",
                     state.request_count);
            printf("Shutdown complete\n");
        }
    }

    regmock::logging::shutdown_logging();
    return exit_code;
}

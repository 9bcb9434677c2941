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

// Regmock Server - Header
// Loopback HTTP/1.1 listener: one request per connection, cancellable accept loop

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include "../api/dispatcher.hpp"
#include "../control/config.hpp"

namespace regmock::core {

/// HTTP listener feeding the dispatcher.
///
/// run() polls the listening socket with poll_interval_ms as timeout, so
/// clearing the stop flag (or calling stop()) ends the loop within one
/// interval. Each accepted connection carries exactly one request and is
/// closed after the response. Sequential by default; with
/// concurrent_connections every connection gets its own worker thread
/// (up to max_workers), all joined before run() returns.
class Server {
public:
    Server(const control::Config& config, api::Dispatcher& dispatcher);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// Bind and listen. Returns the OS error on failure (e.g. EADDRINUSE).
    [[nodiscard]] std::error_code start();

    /// Accept loop (blocking). Returns when stop() is called or when
    /// `keep_running` becomes false. Closes the listening socket on exit.
    void run(const std::atomic<bool>* keep_running = nullptr);

    /// Request loop exit (safe from any thread or a signal handler)
    void stop() noexcept { running_.store(false, std::memory_order_relaxed); }

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

    /// Bound port, resolved after start() (useful with listen_port 0)
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    /// Connections answered since start (including 400/413)
    [[nodiscard]] uint64_t connections_handled() const noexcept {
        return connections_handled_.load(std::memory_order_relaxed);
    }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    /// Read, parse, dispatch and answer one connection (blocking, with I/O timeouts)
    void handle_connection(int client_fd);

    /// Serialize and write a response, logging one request line
    void respond(int client_fd, const http::Response& response, std::string_view method,
                 std::string_view path, std::string_view request_id,
                 std::chrono::steady_clock::time_point started);

    /// Hand the connection to a new worker thread. Returns false when the
    /// worker cap is reached or the thread cannot be created; the caller
    /// then serves the connection itself.
    [[nodiscard]] bool spawn_worker(int client_fd);

    /// Join finished workers (all of them when `all` is set)
    void reap_workers(bool all);

    const control::Config& config_;
    api::Dispatcher& dispatcher_;

    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> connections_handled_{0};

    std::vector<Worker> workers_;
};

}  // namespace regmock::core

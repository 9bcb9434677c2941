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

// Regmock Server - Implementation

#include "server.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <span>
#include <utility>

#include "../api/handlers.hpp"
#include "../http/parser.hpp"
#include "logging.hpp"
#include "socket.hpp"

namespace regmock::core {

namespace {

// Write the whole buffer; false on error or peer reset
bool send_all(int fd, std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

// Half-close and discard what the client is still sending, so the kernel
// does not answer unread input with RST before the response is read
void lingering_close(int fd) {
    shutdown(fd, SHUT_WR);
    (void)set_io_timeout(fd, std::chrono::milliseconds(200));

    char discard[4096];
    size_t drained = 0;
    while (drained < 1024 * 1024) {
        ssize_t n = recv(fd, discard, sizeof(discard), 0);
        if (n <= 0) {
            break;
        }
        drained += static_cast<size_t>(n);
    }
}

}  // namespace

Server::Server(const control::Config& config, api::Dispatcher& dispatcher)
    : config_(config), dispatcher_(dispatcher) {}

Server::~Server() {
    stop();
    reap_workers(true);
    close_fd(listen_fd_);
}

std::error_code Server::start() {
    std::error_code ec;
    listen_fd_ = create_listening_socket(config_.server.listen_address,
                                         config_.server.listen_port,
                                         static_cast<int>(config_.server.backlog), ec);

    auto* logger = logging::get_current_logger();
    if (listen_fd_ < 0) {
        if (logger) {
            LOG_ERROR(logger, "Failed to bind {}:{}: {}", config_.server.listen_address,
                      config_.server.listen_port, ec.message());
        }
        return ec;
    }

    port_ = local_port(listen_fd_);
    running_.store(true, std::memory_order_relaxed);

    if (logger) {
        LOG_INFO(logger, "Listening on {}:{} (auth={}, concurrent={})",
                 config_.server.listen_address, port_, config_.auth.enabled,
                 config_.server.concurrent_connections);
    }
    return {};
}

void Server::run(const std::atomic<bool>* keep_running) {
    auto should_run = [&] {
        return running_.load(std::memory_order_relaxed) &&
               (keep_running == nullptr || keep_running->load(std::memory_order_relaxed));
    };

    const int timeout_ms = static_cast<int>(config_.server.poll_interval_ms);

    while (listen_fd_ >= 0 && should_run()) {
        if (config_.server.concurrent_connections) {
            reap_workers(false);
        }

        pollfd pfd{listen_fd_, POLLIN, 0};
        int ready = poll(&pfd, 1, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;  // Signal delivered, re-check the stop flag
            }
            if (auto* logger = logging::get_current_logger()) {
                LOG_ERROR(logger, "poll() on listening socket failed: {}", std::strerror(errno));
            }
            break;
        }
        if (ready == 0) {
            continue;  // Timeout
        }

        int client_fd = accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            // EAGAIN: another wakeup raced us; the rest are per-connection failures
            continue;
        }

        if (!config_.server.concurrent_connections || !spawn_worker(client_fd)) {
            handle_connection(client_fd);
        }
    }

    running_.store(false, std::memory_order_relaxed);
    reap_workers(true);

    close_fd(listen_fd_);
    listen_fd_ = -1;

    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Listener on port {} stopped after {} connections", port_,
                 connections_handled());
    }
}

bool Server::spawn_worker(int client_fd) {
    if (workers_.size() >= config_.server.max_workers) {
        reap_workers(false);
        if (workers_.size() >= config_.server.max_workers) {
            return false;
        }
    }

    try {
        auto done = std::make_shared<std::atomic<bool>>(false);
        // Reserve first so the push_back below cannot throw with a live thread
        workers_.reserve(workers_.size() + 1);
        std::thread thread([this, client_fd, done] {
            handle_connection(client_fd);
            done->store(true, std::memory_order_release);
        });
        workers_.push_back(Worker{std::move(thread), std::move(done)});
    } catch (const std::exception& e) {
        if (auto* logger = logging::get_current_logger()) {
            LOG_WARNING(logger, "Cannot start worker thread, serving connection inline: {}",
                        e.what());
        }
        return false;
    }
    return true;
}

void Server::reap_workers(bool all) {
    auto finished = [all](Worker& w) {
        if (all || w.done->load(std::memory_order_acquire)) {
            if (w.thread.joinable()) {
                w.thread.join();
            }
            return true;
        }
        return false;
    };
    workers_.erase(std::remove_if(workers_.begin(), workers_.end(), finished), workers_.end());
}

void Server::handle_connection(int client_fd) {
    const auto started = std::chrono::steady_clock::now();
    auto* logger = logging::get_current_logger();

    try {
        if (auto ec = set_io_timeout(client_fd,
                                     std::chrono::milliseconds(config_.server.io_timeout_ms));
            ec) {
            if (logger) {
                LOG_WARNING(logger, "Cannot set connection timeout: {}", ec.message());
            }
        }

        const size_t max_size = config_.server.max_request_size;
        std::vector<uint8_t> buffer;
        buffer.reserve(std::min<size_t>(max_size, 4096));

        http::Parser parser;
        http::Request request;
        http::ParseResult result = http::ParseResult::Incomplete;

        uint8_t chunk[4096];
        while (result == http::ParseResult::Incomplete) {
            if (buffer.size() >= max_size) {
                break;
            }

            size_t want = std::min(sizeof(chunk), max_size - buffer.size());
            ssize_t n = recv(client_fd, chunk, want, 0);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                if (n < 0 && logger) {
                    LOG_WARNING(logger, "Connection dropped before a full request: {}",
                                std::strerror(errno));
                }
                if (buffer.empty()) {
                    close_fd(client_fd);
                    return;  // Nothing was sent; no request to answer
                }
                result = http::ParseResult::Error;
                break;
            }

            buffer.insert(buffer.end(), chunk, chunk + n);

            // Views refer to the buffer, which may have moved: parse from scratch
            parser.reset();
            request = http::Request{};
            result = parser.parse_request(std::span<const uint8_t>(buffer), request).first;
        }

        const std::string request_id = logging::generate_request_id();
        http::Response response;

        if (result == http::ParseResult::Complete) {
            response = dispatcher_.handle(request, request_id);
            respond(client_fd, response, http::to_string(request.method), request.path,
                    request_id, started);
        } else if (result == http::ParseResult::Error) {
            api::finalize_response(response, http::StatusCode::BadRequest,
                                   api::message_body("Bad Request"),
                                   config_.mock.api_version, request_id);
            if (logger) {
                LOG_WARNING(logger, "Malformed request: {}", parser.error_message());
            }
            respond(client_fd, response, "-", "-", request_id, started);
            lingering_close(client_fd);
        } else {
            api::finalize_response(response, http::StatusCode::PayloadTooLarge,
                                   api::message_body("Payload Too Large"),
                                   config_.mock.api_version, request_id);
            respond(client_fd, response, "-", "-", request_id, started);
            lingering_close(client_fd);
        }
    } catch (const std::exception& e) {
        if (logger) {
            LOG_ERROR(logger, "Connection handling failed: {}", e.what());
        }
    }

    close_fd(client_fd);
}

void Server::respond(int client_fd, const http::Response& response, std::string_view method,
                     std::string_view path, std::string_view request_id,
                     std::chrono::steady_clock::time_point started) {
    std::string wire = response.serialize();
    bool ok = send_all(client_fd, wire);
    int send_errno = ok ? 0 : errno;
    connections_handled_.fetch_add(1, std::memory_order_relaxed);

    auto* logger = logging::get_current_logger();
    if (!logger) {
        return;
    }

    if (!ok) {
        LOG_WARNING(logger, "Failed to send response: request_id={}, error={}", request_id,
                    std::strerror(send_errno));
    }

    const auto duration_us = std::chrono::duration_cast<std::chrono::microseconds>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
    const auto status = static_cast<uint16_t>(response.status);
    const size_t bytes = response.body.size();

    if (status >= 500) {
        REGMOCK_LOG_REQUEST(logger, LOG_ERROR, method, path, status, bytes, duration_us,
                            request_id);
    } else if (status == 400 || status == 401 || status == 413) {
        REGMOCK_LOG_REQUEST(logger, LOG_WARNING, method, path, status, bytes, duration_us,
                            request_id);
    } else {
        REGMOCK_LOG_REQUEST(logger, LOG_INFO, method, path, status, bytes, duration_us,
                            request_id);
    }
}

}  // namespace regmock::core

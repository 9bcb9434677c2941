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

// Regmock Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <string>

namespace regmock::core {

namespace {

// Capture errno, close the socket, return -1
int fail(int fd, std::error_code& ec, int err) {
    ec = std::error_code(err, std::system_category());
    close_fd(fd);
    return -1;
}

}  // namespace

int create_listening_socket(std::string_view address, uint16_t port, int backlog,
                            std::error_code& ec) {
    ec.clear();

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        ec = std::error_code(errno, std::system_category());
        return -1;
    }

    // SO_REUSEADDR - allows binding to same address immediately after restart.
    // No SO_REUSEPORT: a second instance on the same port must fail to bind.
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return fail(fd, ec, errno);
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string addr_str{address};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr.sin_addr) <= 0) {
        return fail(fd, ec, EINVAL);
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return fail(fd, ec, errno);
    }

    if (listen(fd, backlog) < 0) {
        return fail(fd, ec, errno);
    }

    // Non-blocking: accept() after poll() must never stall the loop
    if (auto nb_ec = set_nonblocking(fd); nb_ec) {
        ec = nb_ec;
        close_fd(fd);
        return -1;
    }

    return fd;
}

uint16_t local_port(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::error_code set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return std::error_code(errno, std::system_category());
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::error_code(errno, std::system_category());
    }

    return {};
}

std::error_code set_io_timeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

void close_fd(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

}  // namespace regmock::core

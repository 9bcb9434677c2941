// Regmock Socket Utilities - Header

#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace regmock::core {

/// Create non-blocking listening socket
/// Returns the fd, or -1 with `ec` set to the failing call's errno
[[nodiscard]] int create_listening_socket(
    std::string_view address,
    uint16_t port,
    int backlog,
    std::error_code& ec);

/// Port the socket is bound to (resolves port 0 binds), 0 on failure
[[nodiscard]] uint16_t local_port(int fd);

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_io_timeout(int fd, std::chrono::milliseconds timeout);

void close_fd(int fd);

} // namespace regmock::core

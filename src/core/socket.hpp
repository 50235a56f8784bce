// vcadmin Socket Utilities - Header

#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace vcadmin::core {

/// Create blocking listening socket bound to address:port
/// Returns the fd, or -1 with 'ec' set to the OS error
[[nodiscard]] int create_listening_socket(
    std::string_view address,
    uint16_t port,
    int backlog,
    std::error_code& ec);

/// Port the socket is bound to (resolves ephemeral port 0)
[[nodiscard]] uint16_t local_port(int fd) noexcept;

[[nodiscard]] std::error_code set_reuseaddr(int fd);

/// Write the whole buffer, retrying on EINTR and short writes
[[nodiscard]] std::error_code send_all(int fd, std::string_view data);

void close_fd(int fd);

} // namespace vcadmin::core

/*
 * Copyright 2025 Eden Contributors
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

// Eden Socket Utilities - Header

#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <system_error>

namespace eden::core {

/// Create blocking listening socket bound to address:port
/// @return fd, or -1 with ec set
[[nodiscard]] int create_listening_socket(std::string_view address, uint16_t port, int backlog,
                                          std::error_code& ec);

[[nodiscard]] std::error_code set_reuseaddr(int fd);

/// Bound blocking recv() on fd (SO_RCVTIMEO)
[[nodiscard]] std::error_code set_recv_timeout(int fd, std::chrono::milliseconds timeout);

/// Write the whole buffer, retrying on partial writes and EINTR
[[nodiscard]] std::error_code send_all(int fd, std::string_view data);

/// Non-blocking check whether the peer closed or reset the connection
[[nodiscard]] bool peer_hung_up(int fd) noexcept;

void close_fd(int fd);

}  // namespace eden::core

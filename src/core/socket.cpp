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

// Eden Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <string>

namespace eden::core {

int create_listening_socket(std::string_view address, uint16_t port, int backlog,
                            std::error_code& ec) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        ec = std::error_code(errno, std::system_category());
        return -1;
    }

    // SO_REUSEADDR - allows binding to same address immediately after restart
    if (auto reuse_ec = set_reuseaddr(fd); reuse_ec) {
        ec = reuse_ec;
        close_fd(fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string addr_str{address};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr.sin_addr) <= 0) {
        ec = std::make_error_code(std::errc::invalid_argument);
        close_fd(fd);
        return -1;
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ec = std::error_code(errno, std::system_category());
        close_fd(fd);
        return -1;
    }

    if (listen(fd, backlog) < 0) {
        ec = std::error_code(errno, std::system_category());
        close_fd(fd);
        return -1;
    }

    ec.clear();
    return fd;
}

std::error_code set_reuseaddr(int fd) {
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

std::error_code set_recv_timeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        return std::error_code(errno, std::system_category());
    }
    return {};
}

std::error_code send_all(int fd, std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::error_code(errno, std::system_category());
        }
        sent += static_cast<size_t>(n);
    }
    return {};
}

bool peer_hung_up(int fd) noexcept {
    pollfd pfd{};
    pfd.fd = fd;
#ifdef POLLRDHUP
    pfd.events = POLLRDHUP;
#else
    pfd.events = POLLIN;
#endif

    if (poll(&pfd, 1, 0) <= 0) {
        return false;
    }

    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
        return true;
    }
#ifdef POLLRDHUP
    return (pfd.revents & POLLRDHUP) != 0;
#else
    // Readable: distinguish pipelined data from orderly shutdown
    char byte;
    return recv(fd, &byte, 1, MSG_PEEK | MSG_DONTWAIT) == 0;
#endif
}

void close_fd(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

}  // namespace eden::core

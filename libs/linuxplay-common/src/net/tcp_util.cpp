///////////////////////////////////////////////////////////////////////////////
// tcp_util.cpp -- TCP helper implementation
///////////////////////////////////////////////////////////////////////////////

#include "lp/net/tcp_util.h"

#include <poll.h>

#include <chrono>

namespace lp {

namespace {

using Clock = std::chrono::steady_clock;

/// Milliseconds left until \p deadline, 0 once it has passed.
int remainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

bool waitReadable(int fd, Clock::time_point deadline) {
    for (;;) {
        int ms = remainingMs(deadline);
        if (ms == 0) return false;
        pollfd p{fd, POLLIN, 0};
        int r = ::poll(&p, 1, ms);
        if (r > 0) return true;
        if (r == 0) return false;
        if (errno != EINTR) return false;
    }
}

} // anonymous namespace

int openTcpListener(const std::string& address, uint16_t port, uint16_t& bound_port,
                    int backlog) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        LP_LOG(ERR, "TCP: socket() failed: %s", std::strerror(lp_socket_error()));
        return -1;
    }

    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    if (address.empty() || address == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        LP_LOG(ERR, "TCP: invalid bind address '%s'", address.c_str());
        lp_close_socket(fd);
        return -1;
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd, backlog) != 0) {
        LP_LOG(ERR, "TCP: cannot listen on %s:%u: %s",
               address.c_str(), port, std::strerror(lp_socket_error()));
        lp_close_socket(fd);
        return -1;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len);
    bound_port = ntohs(bound.sin_port);
    return fd;
}

int acceptWithTimeout(int listen_fd, uint32_t timeout_ms, sockaddr_in& peer) {
    pollfd p{listen_fd, POLLIN, 0};
    int r = ::poll(&p, 1, static_cast<int>(timeout_ms));
    if (r <= 0) return -1;

    socklen_t len = sizeof(peer);
    int fd = ::accept4(listen_fd, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
    if (fd < 0) {
        LP_LOG(DEBUG, "TCP: accept failed: %s", std::strerror(lp_socket_error()));
    }
    return fd;
}

int connectTcp(const std::string& host, uint16_t port, uint32_t timeout_ms) {
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0 || !res) {
        LP_LOG(ERR, "TCP: cannot resolve '%s'", host.c_str());
        return -1;
    }

    int fd = ::socket(res->ai_family, res->ai_socktype | SOCK_CLOEXEC, res->ai_protocol);
    if (fd < 0) {
        ::freeaddrinfo(res);
        return -1;
    }

    lp_set_nonblocking(fd);
    int rc = ::connect(fd, res->ai_addr, res->ai_addrlen);
    ::freeaddrinfo(res);

    if (rc != 0 && errno == EINPROGRESS) {
        pollfd p{fd, POLLOUT, 0};
        if (::poll(&p, 1, static_cast<int>(timeout_ms)) == 1) {
            int err = 0;
            socklen_t len = sizeof(err);
            ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
            rc = err == 0 ? 0 : -1;
            errno = err;
        } else {
            errno = ETIMEDOUT;
        }
    }
    if (rc != 0) {
        LP_LOG(ERR, "TCP: connect %s:%u failed: %s", host.c_str(), port, std::strerror(errno));
        lp_close_socket(fd);
        return -1;
    }

    // Back to blocking mode; reads below use poll() for their deadlines.
    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
    return fd;
}

bool readLine(int fd, size_t max_bytes, uint32_t timeout_ms, std::string& line) {
    line.clear();
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    char buf[4096];
    while (line.size() <= max_bytes) {
        if (!waitReadable(fd, deadline)) return false;
        // Peek so bytes after the newline stay in the socket.
        ssize_t n = ::recv(fd, buf, sizeof(buf), MSG_PEEK);
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            return false;
        }
        size_t take = static_cast<size_t>(n);
        const void* nl = std::memchr(buf, '\n', take);
        if (nl) take = static_cast<size_t>(static_cast<const char*>(nl) - buf) + 1;

        ssize_t got = ::recv(fd, buf, take, 0);
        if (got <= 0) return false;
        line.append(buf, static_cast<size_t>(got));
        if (nl) return line.size() <= max_bytes;
    }
    return false;
}

bool readExact(int fd, void* buf, size_t len, uint32_t timeout_ms) {
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    auto* p = static_cast<uint8_t*>(buf);
    size_t off = 0;
    while (off < len) {
        if (!waitReadable(fd, deadline)) return false;
        ssize_t n = ::recv(fd, p + off, len - off, 0);
        if (n == 0) return false;
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

bool writeAll(int fd, const void* data, size_t len) {
    const auto* p = static_cast<const uint8_t*>(data);
    size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, p + off, len - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

} // namespace lp

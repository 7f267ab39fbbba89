///////////////////////////////////////////////////////////////////////////////
// udp_channel.cpp -- UDP channel implementation
///////////////////////////////////////////////////////////////////////////////

#include "lp/net/udp_channel.h"

#include <sys/select.h>

#include <vector>

namespace lp {

UdpChannel::~UdpChannel() {
    stop();
}

// ---------------------------------------------------------------------------
// bind
// ---------------------------------------------------------------------------
bool UdpChannel::bind(const std::string& address, uint16_t port) {
    if (socket_fd_ >= 0) {
        LP_LOG(WARN, "UdpChannel: already bound to port %u", bound_port_);
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
    if (fd < 0) {
        LP_LOG(ERR, "UdpChannel: socket() failed: %s", std::strerror(lp_socket_error()));
        return false;
    }

    // No SO_REUSEADDR: on UDP it would let a second process share the
    // port and silently split the datagrams.
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    if (address.empty() || address == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        LP_LOG(ERR, "UdpChannel: invalid bind address '%s'", address.c_str());
        lp_close_socket(fd);
        return false;
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        LP_LOG(ERR, "UdpChannel: bind %s:%u failed: %s",
               address.c_str(), port, std::strerror(lp_socket_error()));
        lp_close_socket(fd);
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len);

    socket_fd_  = fd;
    bound_port_ = ntohs(bound.sin_port);
    LP_LOG(DEBUG, "UdpChannel: bound %s:%u", address.c_str(), bound_port_);
    return true;
}

// ---------------------------------------------------------------------------
// start / stop
// ---------------------------------------------------------------------------
bool UdpChannel::start(DatagramCallback cb) {
    if (socket_fd_ < 0) {
        LP_LOG(ERR, "UdpChannel: start() before bind()");
        return false;
    }
    if (running_.load()) {
        LP_LOG(WARN, "UdpChannel: already running");
        return false;
    }

    callback_ = std::move(cb);
    running_.store(true);
    recv_thread_ = std::thread(&UdpChannel::receiveLoop, this);
    return true;
}

void UdpChannel::stop() {
    running_.store(false);
    if (recv_thread_.joinable()) {
        recv_thread_.join();
    }
    if (socket_fd_ >= 0) {
        lp_close_socket(socket_fd_);
        socket_fd_ = -1;
        LP_LOG(DEBUG, "UdpChannel: closed port %u (packets=%llu)", bound_port_,
               static_cast<unsigned long long>(packets_received_.load()));
    }
}

// ---------------------------------------------------------------------------
// sendTo
// ---------------------------------------------------------------------------
bool UdpChannel::sendTo(const std::string& ip, uint16_t port, const void* data, size_t len) {
    if (socket_fd_ < 0 || port == 0) return false;

    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port   = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &dest.sin_addr) != 1) {
        LP_LOG(WARN, "UdpChannel: invalid destination '%s'", ip.c_str());
        return false;
    }

    std::lock_guard<std::mutex> lock(send_mutex_);
    ssize_t sent = ::sendto(socket_fd_, data, len, 0,
                            reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (sent < 0 || static_cast<size_t>(sent) != len) {
        LP_LOG(TRACE, "UdpChannel: sendto %s:%u failed: %s",
               ip.c_str(), port, std::strerror(lp_socket_error()));
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// receiveLoop
// ---------------------------------------------------------------------------
void UdpChannel::receiveLoop() {
    std::vector<uint8_t> buf(MAX_DATAGRAM_SIZE);

    while (running_.load()) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(socket_fd_, &read_fds);

        struct timeval tv;
        tv.tv_sec  = 0;
        tv.tv_usec = SELECT_TIMEOUT_MS * 1000;

        int sel = ::select(socket_fd_ + 1, &read_fds, nullptr, nullptr, &tv);
        if (sel <= 0) {
            continue;  // Timeout or EINTR, re-check running_
        }

        sockaddr_in from{};
        socklen_t from_len = sizeof(from);
        ssize_t n = ::recvfrom(socket_fd_, buf.data(), buf.size(), 0,
                               reinterpret_cast<sockaddr*>(&from), &from_len);
        if (n < 0) {
            int err = lp_socket_error();
            if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) continue;
            LP_LOG(WARN, "UdpChannel: recvfrom error on port %u: %s",
                   bound_port_, std::strerror(err));
            continue;
        }

        packets_received_.fetch_add(1);
        if (callback_) callback_(buf.data(), static_cast<size_t>(n), from);
    }
}

} // namespace lp

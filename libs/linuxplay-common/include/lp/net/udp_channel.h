///////////////////////////////////////////////////////////////////////////////
// udp_channel.h -- Bound UDP socket with a background receive loop
//
// Each datagram channel of a session (control, clipboard, heartbeat,
// gamepad) is one UdpChannel.  The receive loop waits in select() with a
// 200 ms timeout so stop() is always observed promptly, then hands every
// datagram and its source address to the registered callback.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/common.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace lp {

/// Callback invoked on the receive thread for every datagram.
using DatagramCallback =
    std::function<void(const uint8_t* data, size_t len, const sockaddr_in& from)>;

class UdpChannel {
public:
    static constexpr size_t   MAX_DATAGRAM_SIZE = 65536;
    static constexpr uint32_t SELECT_TIMEOUT_MS = 200;

    UdpChannel() = default;
    ~UdpChannel();

    // Non-copyable
    UdpChannel(const UdpChannel&) = delete;
    UdpChannel& operator=(const UdpChannel&) = delete;

    /// Create the socket and bind it.  Port 0 picks an ephemeral port.
    bool bind(const std::string& address, uint16_t port);

    /// Start the receive loop on a background thread.
    bool start(DatagramCallback cb);

    /// Stop the receive loop, join the thread and close the socket.
    void stop();

    bool isOpen() const { return socket_fd_ >= 0; }
    bool isRunning() const { return running_.load(); }

    /// Actual bound port (after bind()).
    uint16_t boundPort() const { return bound_port_; }

    /// Send one datagram.  Returns false on any socket error.
    bool sendTo(const std::string& ip, uint16_t port, const void* data, size_t len);
    bool sendTo(const std::string& ip, uint16_t port, const std::string& text) {
        return sendTo(ip, port, text.data(), text.size());
    }

    uint64_t packetsReceived() const { return packets_received_.load(); }

private:
    void receiveLoop();

    int                   socket_fd_  = -1;
    uint16_t              bound_port_ = 0;
    DatagramCallback      callback_;
    std::thread           recv_thread_;
    std::atomic<bool>     running_{false};
    std::atomic<uint64_t> packets_received_{0};
    std::mutex            send_mutex_;
};

} // namespace lp

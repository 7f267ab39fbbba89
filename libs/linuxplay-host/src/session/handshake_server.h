///////////////////////////////////////////////////////////////////////////////
// handshake_server.h -- TCP endpoint for session handshakes
//
// Each connection carries exactly one exchange: a newline-terminated JSON
// request from the viewer and a newline-terminated JSON response from the
// host.  Connections are served on short-lived worker threads so a slow
// client cannot hold up a competing one; the admission controller decides
// which of them wins the slot.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <thread>

namespace lp::host {

class AdmissionController;

class HandshakeServer {
public:
    static constexpr size_t   MAX_REQUEST_BYTES  = 65536;
    static constexpr uint32_t REQUEST_TIMEOUT_MS = 5000;
    static constexpr uint32_t ACCEPT_TIMEOUT_MS  = 200;
    static constexpr size_t   MAX_WORKERS        = 8;

    explicit HandshakeServer(AdmissionController* admission);
    ~HandshakeServer();

    HandshakeServer(const HandshakeServer&) = delete;
    HandshakeServer& operator=(const HandshakeServer&) = delete;

    bool start(const std::string& bind_address, uint16_t port);
    void stop();

    uint16_t boundPort() const { return bound_port_; }
    uint64_t handshakesServed() const { return served_.load(); }

private:
    struct Worker {
        std::thread       thread;
        std::atomic<bool> done{false};
    };

    void acceptLoop();
    void serve(int fd, const std::string& peer_ip);
    void reapWorkers(bool wait_all);

    AdmissionController*  admission_;
    int                   listen_fd_  = -1;
    uint16_t              bound_port_ = 0;
    std::atomic<bool>     running_{false};
    std::thread           thread_;
    std::atomic<uint64_t> served_{0};

    std::mutex            workers_mutex_;
    std::list<Worker>     workers_;
};

} // namespace lp::host

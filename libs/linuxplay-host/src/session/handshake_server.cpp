///////////////////////////////////////////////////////////////////////////////
// handshake_server.cpp -- TCP handshake endpoint implementation
///////////////////////////////////////////////////////////////////////////////

#include "handshake_server.h"
#include "admission_controller.h"

#include <lp/common.h>
#include <lp/control/handshake.h>
#include <lp/net/tcp_util.h>

namespace lp::host {

HandshakeServer::HandshakeServer(AdmissionController* admission)
    : admission_(admission)
{
}

HandshakeServer::~HandshakeServer() {
    stop();
}

bool HandshakeServer::start(const std::string& bind_address, uint16_t port) {
    if (running_.load()) return false;

    listen_fd_ = openTcpListener(bind_address, port, bound_port_, 8);
    if (listen_fd_ < 0) {
        LP_LOG(ERR, "Handshake: cannot listen on %s:%u", bind_address.c_str(), port);
        return false;
    }

    running_.store(true);
    thread_ = std::thread(&HandshakeServer::acceptLoop, this);
    LP_LOG(INFO, "Handshake: listening on %s:%u", bind_address.c_str(), bound_port_);
    return true;
}

void HandshakeServer::stop() {
    if (!running_.exchange(false)) return;

    if (thread_.joinable()) thread_.join();
    reapWorkers(true);

    if (listen_fd_ >= 0) {
        lp_close_socket(listen_fd_);
        listen_fd_ = -1;
    }
    LP_LOG(INFO, "Handshake: stopped (%llu served)",
           static_cast<unsigned long long>(served_.load()));
}

void HandshakeServer::acceptLoop() {
    while (running_.load()) {
        sockaddr_in peer{};
        int fd = acceptWithTimeout(listen_fd_, ACCEPT_TIMEOUT_MS, peer);
        reapWorkers(false);
        if (fd < 0) continue;

        const std::string peer_ip = addrToString(peer);

        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (workers_.size() >= MAX_WORKERS) {
            LP_LOG(WARN, "Handshake: too many pending handshakes, dropping %s",
                   peer_ip.c_str());
            lp_close_socket(fd);
            continue;
        }
        workers_.emplace_back();
        Worker& worker = workers_.back();
        worker.thread = std::thread([this, fd, peer_ip, &worker]() {
            serve(fd, peer_ip);
            worker.done.store(true);
        });
    }
}

void HandshakeServer::reapWorkers(bool wait_all) {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (wait_all || it->done.load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers_, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void HandshakeServer::serve(int fd, const std::string& peer_ip) {
    std::string line;
    HandshakeResponse response;

    if (!readLine(fd, MAX_REQUEST_BYTES, REQUEST_TIMEOUT_MS, line)) {
        LP_LOG(WARN, "Handshake: no complete request from %s", peer_ip.c_str());
        response = HandshakeResponse::error(sessionErrorName(SessionError::HandshakeMalformed));
    } else {
        HandshakeRequest request;
        std::string why;
        if (!HandshakeRequest::parse(line, request, &why)) {
            LP_LOG(WARN, "Handshake: malformed request from %s: %s",
                   peer_ip.c_str(), why.c_str());
            response = HandshakeResponse::error(sessionErrorName(SessionError::HandshakeMalformed));
        } else {
            response = admission_->onHandshake(request, peer_ip);
        }
    }

    if (!writeAll(fd, response.serialize())) {
        LP_LOG(WARN, "Handshake: failed to send %s response to %s",
               handshakeStatusName(response.status), peer_ip.c_str());
    }
    lp_close_socket(fd);
    served_.fetch_add(1);
}

} // namespace lp::host

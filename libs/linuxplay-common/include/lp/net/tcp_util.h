///////////////////////////////////////////////////////////////////////////////
// tcp_util.h -- Blocking TCP helpers with deadlines
//
// Used by the handshake and file-upload endpoints on the host and by the
// viewer's handshake client.  Every read is bounded by a timeout so a
// stalled peer never pins a thread.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/common.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace lp {

/// Create a listening socket.  Port 0 picks an ephemeral port, reported in
/// \p bound_port.  Returns the fd or -1.
int openTcpListener(const std::string& address, uint16_t port, uint16_t& bound_port,
                    int backlog = 4);

/// Wait up to \p timeout_ms for an incoming connection.  Returns the
/// accepted fd, or -1 on timeout or error.
int acceptWithTimeout(int listen_fd, uint32_t timeout_ms, sockaddr_in& peer);

/// Connect to host:port.  Returns the fd or -1.
int connectTcp(const std::string& host, uint16_t port, uint32_t timeout_ms);

/// Read bytes up to and including '\n'.  Fails on timeout, EOF or when more
/// than \p max_bytes arrive without a newline.
bool readLine(int fd, size_t max_bytes, uint32_t timeout_ms, std::string& line);

/// Read exactly \p len bytes.
bool readExact(int fd, void* buf, size_t len, uint32_t timeout_ms);

bool writeAll(int fd, const void* data, size_t len);
inline bool writeAll(int fd, const std::string& data) {
    return writeAll(fd, data.data(), data.size());
}

} // namespace lp

///////////////////////////////////////////////////////////////////////////////
// host_connection.h -- Viewer side of the session control plane
//
//   connect()       TCP handshake: certificate login when a stored
//                   certificate exists, PIN login otherwise.  An issued
//                   certificate bundle is written to the cert directory.
//   openChannels()  control/heartbeat/clipboard sockets, "NET <mode>"
//                   announcement, PONG responder and loss watchdog
//   close()         "GOODBYE" (unless the host is already gone), sockets down
//
// The heartbeat socket binds an ephemeral port and sends one PONG straight
// away so the host learns where to send.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/control/control_message.h>
#include <lp/control/handshake.h>
#include <lp/control/link_mode.h>
#include <lp/net/udp_channel.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lp {

struct ViewerConfig {
    std::string           host;
    uint16_t              handshake_port       = DEFAULT_HANDSHAKE_PORT;
    std::string           pin;
    std::string           cert_dir;
    LinkMode              link_mode            = LinkMode::AUTO;
    std::vector<uint32_t> monitors;             // empty = all
    bool                  request_cert         = false;
    std::string           device_name;
    std::string           decoder              = "ffplay";
    bool                  audio                = false;
    uint32_t              handshake_timeout_ms = 10000;
    uint32_t              heartbeat_timeout_ms = 10000;
};

// ---------------------------------------------------------------------------
// Stored certificate bundle
// ---------------------------------------------------------------------------
constexpr const char* CLIENT_CERT_FILE = "client_cert.pem";
constexpr const char* CLIENT_KEY_FILE  = "client_key.pem";
constexpr const char* HOST_CA_FILE     = "host_ca.pem";
constexpr const char* FINGERPRINT_FILE = "fingerprint";

/// Write the bundle into \p dir (created 0700); the private key is 0600.
bool saveCertificateBundle(const std::string& dir, const CertificateBundle& bundle);

/// Read a bundle written by saveCertificateBundle().  Needs at least the
/// certificate and fingerprint.
bool loadCertificateBundle(const std::string& dir, CertificateBundle& bundle);

/// Milliseconds since the Unix epoch.
uint64_t wallClockMs();

/// Sign certificateLoginMessage() with the bundle's private key.
bool signCertificateLogin(const CertificateBundle& bundle, uint64_t time_ms,
                          std::string& proof);

class HostConnection {
public:
    using LossCallback = std::function<void()>;

    explicit HostConnection(const ViewerConfig& config);
    ~HostConnection();

    HostConnection(const HostConnection&) = delete;
    HostConnection& operator=(const HostConnection&) = delete;

    /// Run the handshake with \p link_mode as the announced network.
    /// Returns true only for status OK; otherwise \p error names the
    /// status and reason.
    bool connect(LinkMode link_mode, HandshakeResponse& response, std::string& error);

    /// Open the datagram channels for the session returned by connect().
    bool openChannels(LossCallback on_loss);

    bool announceLink(LinkMode mode);
    bool sendControl(const std::string& text);

    /// GOODBYE (when the host is still alive) and close everything.
    void close();

    bool     hostLost() const { return host_lost_.load(); }
    uint64_t pingsReceived() const { return pings_.load(); }
    uint16_t heartbeatPort() const { return heartbeat_.boundPort(); }
    bool     lastStats(StatsMessage& out) const;

    const PortMap& ports() const { return ports_; }

private:
    bool buildRequest(LinkMode link_mode, HandshakeRequest& request, std::string& error);
    void onHeartbeat(const uint8_t* data, size_t len, const sockaddr_in& from);
    void watchdogLoop();

    const ViewerConfig      config_;
    std::string             host_ip_;           // resolved by connect()
    PortMap                 ports_;
    bool                    connected_ = false;

    UdpChannel              control_;
    UdpChannel              heartbeat_;

    LossCallback            on_loss_;
    std::atomic<bool>       host_lost_{false};
    std::atomic<uint64_t>   pings_{0};
    std::atomic<uint64_t>   last_ping_us_{0};

    mutable std::mutex      stats_mutex_;
    StatsMessage            stats_;
    bool                    have_stats_ = false;

    std::atomic<bool>       watching_{false};
    std::mutex              watch_mutex_;
    std::condition_variable watch_cv_;
    std::thread             watchdog_;
};

} // namespace lp

///////////////////////////////////////////////////////////////////////////////
// host_connection.cpp -- Handshake client, certificate storage, heartbeat
///////////////////////////////////////////////////////////////////////////////

#include "host_connection.h"

#include <lp/common.h>
#include <lp/crypto/openssl_util.h>
#include <lp/net/tcp_util.h>

#include <sys/stat.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

namespace lp {

namespace {

bool writeFile(const std::string& path, const std::string& data, mode_t mode) {
    FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) {
        LP_LOG(ERR, "Viewer: cannot write %s: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    ::chmod(path.c_str(), mode);
    bool ok = std::fwrite(data.data(), 1, data.size(), f) == data.size();
    ok = (std::fclose(f) == 0) && ok;
    return ok;
}

bool readFile(const std::string& path, std::string& out) {
    std::ifstream in(path);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Certificate bundle storage
// ---------------------------------------------------------------------------
bool saveCertificateBundle(const std::string& dir, const CertificateBundle& bundle) {
    if (::mkdir(dir.c_str(), 0700) != 0 && errno != EEXIST) {
        LP_LOG(ERR, "Viewer: cannot create %s: %s", dir.c_str(), std::strerror(errno));
        return false;
    }

    bool ok = writeFile(dir + "/" + CLIENT_CERT_FILE, bundle.client_cert_pem, 0644) &&
              writeFile(dir + "/" + HOST_CA_FILE, bundle.host_ca_pem, 0644) &&
              writeFile(dir + "/" + FINGERPRINT_FILE, bundle.fingerprint + "\n", 0644);
    if (ok && !bundle.client_key_pem.empty()) {
        ok = writeFile(dir + "/" + CLIENT_KEY_FILE, bundle.client_key_pem, 0600);
    }
    if (ok) LP_LOG(INFO, "Viewer: stored client certificate %s in %s",
                   bundle.fingerprint.c_str(), dir.c_str());
    return ok;
}

bool loadCertificateBundle(const std::string& dir, CertificateBundle& bundle) {
    CertificateBundle b;
    if (!readFile(dir + "/" + CLIENT_CERT_FILE, b.client_cert_pem) ||
        !readFile(dir + "/" + FINGERPRINT_FILE, b.fingerprint)) {
        return false;
    }
    b.fingerprint = trim(b.fingerprint);
    if (b.client_cert_pem.empty() || b.fingerprint.empty()) return false;

    // Optional parts
    if (!readFile(dir + "/" + CLIENT_KEY_FILE, b.client_key_pem)) b.client_key_pem.clear();
    if (!readFile(dir + "/" + HOST_CA_FILE, b.host_ca_pem)) b.host_ca_pem.clear();

    bundle = std::move(b);
    return true;
}

// ---------------------------------------------------------------------------
// Certificate login proof
// ---------------------------------------------------------------------------
uint64_t wallClockMs() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

bool signCertificateLogin(const CertificateBundle& bundle, uint64_t time_ms,
                          std::string& proof) {
    if (bundle.client_key_pem.empty()) {
        LP_LOG(ERR, "Viewer: no private key stored for %s", bundle.fingerprint.c_str());
        return false;
    }
    EvpPkeyPtr key = parsePrivateKeyPem(bundle.client_key_pem);
    if (!key) return false;
    return signMessage(key.get(), certificateLoginMessage(bundle.fingerprint, time_ms), proof);
}

// ---------------------------------------------------------------------------
// HostConnection
// ---------------------------------------------------------------------------
HostConnection::HostConnection(const ViewerConfig& config)
    : config_(config)
{
}

HostConnection::~HostConnection() {
    close();
}

bool HostConnection::buildRequest(LinkMode link_mode, HandshakeRequest& request,
                                  std::string& error) {
    request = HandshakeRequest{};
    request.monitors      = config_.monitors;
    request.has_link_mode = true;
    request.link_mode     = link_mode;

    CertificateBundle stored;
    if (!config_.cert_dir.empty() && loadCertificateBundle(config_.cert_dir, stored)) {
        request.auth            = AuthMethod::Certificate;
        request.certificate_pem = stored.client_cert_pem;
        request.fingerprint     = stored.fingerprint;
        request.proof_time_ms   = wallClockMs();
        if (!signCertificateLogin(stored, request.proof_time_ms, request.proof)) {
            error = "stored certificate key in " + config_.cert_dir + " is unusable";
            return false;
        }
        LP_LOG(INFO, "Viewer: certificate login as %s", stored.fingerprint.c_str());
        return true;
    }

    if (config_.pin.empty()) {
        error = "no stored certificate and no --pin given";
        return false;
    }
    request.auth         = AuthMethod::Pin;
    request.pin          = config_.pin;
    request.request_cert = config_.request_cert && !config_.cert_dir.empty();
    request.device_name  = config_.device_name;
    return true;
}

bool HostConnection::connect(LinkMode link_mode, HandshakeResponse& response,
                             std::string& error) {
    HandshakeRequest request;
    if (!buildRequest(link_mode, request, error)) return false;

    int fd = connectTcp(config_.host, config_.handshake_port, config_.handshake_timeout_ms);
    if (fd < 0) {
        error = "cannot reach " + config_.host + ":" + std::to_string(config_.handshake_port);
        return false;
    }

    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&peer), &peer_len) == 0) {
        host_ip_ = addrToString(peer);
    } else {
        host_ip_ = config_.host;
    }

    std::string line;
    bool ok = writeAll(fd, request.serialize()) &&
              readLine(fd, MAX_HANDSHAKE_BYTES, config_.handshake_timeout_ms, line);
    lp_close_socket(fd);
    if (!ok) {
        error = "handshake with " + host_ip_ + " failed";
        return false;
    }

    if (!HandshakeResponse::parse(line, response)) {
        error = "unreadable handshake response";
        return false;
    }

    if (response.status != HandshakeStatus::Ok) {
        error = handshakeStatusName(response.status);
        if (response.status == HandshakeStatus::AuthFailed) {
            error += std::string(" (") + authErrorName(response.auth_error) + ")";
        } else if (!response.error_reason.empty()) {
            error += " (" + response.error_reason + ")";
        }
        return false;
    }

    if (response.has_bundle && !saveCertificateBundle(config_.cert_dir, response.bundle)) {
        LP_LOG(WARN, "Viewer: issued certificate could not be stored, next login needs a PIN");
    }

    ports_     = response.ports;
    connected_ = true;
    LP_LOG(INFO, "Viewer: session %s with %s (%s, %zu monitor(s))",
           response.session_id.c_str(), host_ip_.c_str(), response.encoder.c_str(),
           response.monitors.size());
    return true;
}

bool HostConnection::openChannels(LossCallback on_loss) {
    if (!connected_) return false;
    on_loss_ = std::move(on_loss);

    if (!control_.bind("0.0.0.0", 0) || !heartbeat_.bind("0.0.0.0", 0)) {
        LP_LOG(ERR, "Viewer: cannot open datagram sockets");
        return false;
    }
    if (!heartbeat_.start([this](const uint8_t* data, size_t len, const sockaddr_in& from) {
            onHeartbeat(data, len, from);
        })) {
        return false;
    }

    last_ping_us_.store(getTimestampUs());
    host_lost_.store(false);
    heartbeat_.sendTo(host_ip_, ports_.heartbeat, HEARTBEAT_PONG);

    watching_.store(true);
    watchdog_ = std::thread(&HostConnection::watchdogLoop, this);
    return true;
}

bool HostConnection::announceLink(LinkMode mode) {
    return sendControl(formatNetAnnouncement(mode));
}

bool HostConnection::sendControl(const std::string& text) {
    if (!control_.isOpen()) return false;
    return control_.sendTo(host_ip_, ports_.control, text);
}

void HostConnection::onHeartbeat(const uint8_t* data, size_t len, const sockaddr_in& from) {
    if (addrToString(from) != host_ip_) return;

    std::string text(reinterpret_cast<const char*>(data), len);
    if (text == HEARTBEAT_PING) {
        last_ping_us_.store(getTimestampUs());
        pings_.fetch_add(1);
        heartbeat_.sendTo(host_ip_, ntohs(from.sin_port), HEARTBEAT_PONG);
        return;
    }

    StatsMessage stats;
    if (StatsMessage::parse(text, stats)) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_      = stats;
        have_stats_ = true;
    }
}

bool HostConnection::lastStats(StatsMessage& out) const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (!have_stats_) return false;
    out = stats_;
    return true;
}

void HostConnection::watchdogLoop() {
    const uint64_t timeout_us = config_.heartbeat_timeout_ms * 1000ULL;
    while (watching_.load()) {
        {
            std::unique_lock<std::mutex> lock(watch_mutex_);
            watch_cv_.wait_for(lock, std::chrono::milliseconds(200),
                               [this] { return !watching_.load(); });
        }
        if (!watching_.load()) break;

        if (getTimestampUs() - last_ping_us_.load() > timeout_us) {
            LP_LOG(WARN, "Viewer: no heartbeat from %s for %u ms",
                   host_ip_.c_str(), config_.heartbeat_timeout_ms);
            host_lost_.store(true);
            if (on_loss_) on_loss_();
            break;
        }
    }
}

void HostConnection::close() {
    if (!connected_) return;
    connected_ = false;

    if (!host_lost_.load()) sendControl(CONTROL_GOODBYE);

    watching_.store(false);
    watch_cv_.notify_all();
    if (watchdog_.joinable()) watchdog_.join();

    heartbeat_.stop();
    control_.stop();
    LP_LOG(INFO, "Viewer: disconnected from %s", host_ip_.c_str());
}

} // namespace lp

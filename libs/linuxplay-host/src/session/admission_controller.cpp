///////////////////////////////////////////////////////////////////////////////
// admission_controller.cpp -- Session admission state machine
///////////////////////////////////////////////////////////////////////////////

#include "admission_controller.h"
#include "auth/auth_manager.h"
#include <lp/crypto/openssl_util.h>

#include <lp/common.h>

#include <openssl/rand.h>

#include <algorithm>
#include <cstdio>

namespace lp::host {

std::string generateSessionId() {
    unsigned char raw[16];
    if (RAND_bytes(raw, sizeof(raw)) != 1) {
        logSslErrors("RAND_bytes(session id)");
        // Fall back to the clock; the id only has to be unique per host.
        uint64_t t = getTimestampUs();
        std::memcpy(raw, &t, sizeof(t));
        std::memset(raw + sizeof(t), 0, sizeof(raw) - sizeof(t));
    }
    char hex[sizeof(raw) * 2 + 1];
    for (size_t i = 0; i < sizeof(raw); ++i) {
        std::snprintf(hex + i * 2, 3, "%02x", raw[i]);
    }
    return hex;
}

AdmissionController::AdmissionController(AuthManager* auth,
                                         std::vector<MonitorGeometry> monitors,
                                         std::string encoder_name)
    : auth_(auth)
    , monitors_(std::move(monitors))
    , encoder_name_(std::move(encoder_name))
{
}

void AdmissionController::setHooks(AdmissionHooks hooks) {
    std::lock_guard<std::mutex> lock(mutex_);
    hooks_ = std::move(hooks);
}

// ---------------------------------------------------------------------------
// resolveMonitors -- empty request means every monitor
// ---------------------------------------------------------------------------
bool AdmissionController::resolveMonitors(const std::vector<uint32_t>& requested,
                                          Session& session) const {
    session.monitor_indices.clear();
    session.monitors.clear();

    if (requested.empty()) {
        for (uint32_t i = 0; i < monitors_.size(); ++i) {
            session.monitor_indices.push_back(i);
            session.monitors.push_back(monitors_[i]);
        }
        return !session.monitors.empty();
    }

    for (uint32_t idx : requested) {
        if (idx >= monitors_.size()) {
            LP_LOG(WARN, "Admission: requested monitor %u of %zu", idx, monitors_.size());
            return false;
        }
        if (std::find(session.monitor_indices.begin(), session.monitor_indices.end(), idx) !=
            session.monitor_indices.end()) {
            continue;
        }
        session.monitor_indices.push_back(idx);
        session.monitors.push_back(monitors_[idx]);
    }
    return true;
}

// ---------------------------------------------------------------------------
// onHandshake
// ---------------------------------------------------------------------------
HandshakeResponse AdmissionController::onHandshake(const HandshakeRequest& request,
                                                   const std::string& client_ip) {
    Session candidate;
    AdmissionHooks hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state != SessionState::Idle) {
            LP_LOG(INFO, "Admission: %s rejected, slot is %s",
                   client_ip.c_str(), sessionStateName(session_.state));
            return HandshakeResponse::busy();
        }
        if (cooldown_ms_ > 0 && last_teardown_us_ != 0 &&
            getTimestampUs() - last_teardown_us_ < cooldown_ms_ * 1000ULL) {
            LP_LOG(INFO, "Admission: %s rejected, reconnect cooldown", client_ip.c_str());
            return HandshakeResponse::busy();
        }

        if (!resolveMonitors(request.monitors, candidate)) {
            return HandshakeResponse::error(sessionErrorName(SessionError::HandshakeMalformed));
        }

        session_.state = SessionState::Authenticating;
        hooks = hooks_;
    }

    // Slot is reserved; everything below runs without the lock.
    auto releaseSlot = [this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        session_ = Session{};
    };

    HandshakeResponse response;
    response.status = HandshakeStatus::Ok;

    if (request.auth == AuthMethod::Pin) {
        AuthError err = auth_->verifyPin(request.pin);
        if (err != AuthError::None) {
            releaseSlot();
            return HandshakeResponse::authFailed(err);
        }
        if (request.request_cert) {
            CertificateRequest creq;
            creq.device_name    = request.device_name;
            creq.public_key_pem = request.public_key_pem;
            // Signed now, recorded only once the session is up.
            if (!auth_->signCertificate(creq, response.bundle, err)) {
                releaseSlot();
                if (err != AuthError::None) return HandshakeResponse::authFailed(err);
                return HandshakeResponse::error(SESSION_START_FAILED);
            }
            response.has_bundle = true;
        }
    } else {
        AuthError err = auth_->verifyCertificate(request.certificate_pem, request.fingerprint);
        if (err == AuthError::None) {
            err = auth_->verifyPossession(request.certificate_pem, request.fingerprint,
                                          request.proof_time_ms, request.proof);
        }
        if (err != AuthError::None) {
            releaseSlot();
            return HandshakeResponse::authFailed(err);
        }
        candidate.fingerprint = request.fingerprint;
    }

    candidate.id            = generateSessionId();
    candidate.state         = SessionState::Authenticating;
    candidate.client_ip     = client_ip;
    candidate.auth          = request.auth;
    candidate.start_time_us = getTimestampUs();
    candidate.last_heartbeat_us = candidate.start_time_us;
    candidate.link_mode     = request.has_link_mode ? request.link_mode : LinkMode::LAN;

    PortMap ports;
    if (hooks.start_channels) {
        TransportError terr = TransportError::None;
        if (!hooks.start_channels(candidate, ports, terr)) {
            LP_LOG(ERR, "Admission: session start failed (%s)", transportErrorName(terr));
            releaseSlot();
            return HandshakeResponse::error(SESSION_START_FAILED);
        }
    }

    if (response.has_bundle) {
        AuthError err = AuthError::None;
        if (!auth_->commitCertificate(response.bundle, request.device_name, err)) {
            LP_LOG(ERR, "Admission: certificate for %s not recorded, closing channels",
                   response.bundle.fingerprint.c_str());
            if (hooks.stop_channels) hooks.stop_channels(candidate);
            releaseSlot();
            if (err != AuthError::None) return HandshakeResponse::authFailed(err);
            return HandshakeResponse::error(SESSION_START_FAILED);
        }
        candidate.fingerprint = response.bundle.fingerprint;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        candidate.state = SessionState::Active;
        session_ = candidate;
        ++sessions_started_;
    }
    if (hooks.on_active_changed) hooks.on_active_changed(true);

    LP_LOG(INFO, "Admission: session %s active for %s (%s, %zu monitor(s), %s)",
           candidate.id.c_str(), client_ip.c_str(), authMethodName(candidate.auth),
           candidate.monitors.size(), linkModeName(candidate.link_mode));

    response.encoder    = encoder_name_;
    response.monitors   = candidate.monitors;
    response.ports      = ports;
    response.session_id = candidate.id;
    return response;
}

// ---------------------------------------------------------------------------
// Teardown
// ---------------------------------------------------------------------------
bool AdmissionController::onDisconnect() {
    return teardown("disconnect");
}

bool AdmissionController::onHeartbeatTimeout() {
    return teardown(timeoutErrorName(TimeoutError::HeartbeatLost));
}

bool AdmissionController::teardown(const char* cause) {
    Session ending;
    AdmissionHooks hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state != SessionState::Active) return false;
        session_.state = SessionState::TearingDown;
        ending = session_;
        hooks  = hooks_;
    }

    LP_LOG(INFO, "Admission: tearing down session %s (%s)", ending.id.c_str(), cause);
    if (hooks.stop_channels) hooks.stop_channels(ending);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        session_          = Session{};
        last_teardown_us_ = getTimestampUs();
    }
    if (hooks.on_active_changed) hooks.on_active_changed(false);

    LP_LOG(INFO, "Admission: slot idle");
    return true;
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------
SessionState AdmissionController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state;
}

bool AdmissionController::activeSession(Session& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state != SessionState::Active) return false;
    out = session_;
    return true;
}

bool AdmissionController::setLinkMode(LinkMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state != SessionState::Active || session_.link_mode == mode) return false;
    session_.link_mode = mode;
    return true;
}

void AdmissionController::touchHeartbeat(uint64_t now_us) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.state != SessionState::Active) return;
    session_.last_heartbeat_us = std::max(session_.last_heartbeat_us, now_us);
}

uint64_t AdmissionController::sessionsStarted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_started_;
}

} // namespace lp::host

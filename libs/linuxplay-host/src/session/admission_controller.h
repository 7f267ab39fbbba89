///////////////////////////////////////////////////////////////////////////////
// admission_controller.h -- Single-slot session state machine
//
//   Idle -> Authenticating -> Active -> TearingDown -> Idle
//
// A handshake is only considered while Idle; anything else is answered
// BUSY before authentication is touched.  Authentication and channel start
// run outside the lock, but the Authenticating state keeps the slot
// reserved, so exactly one transition is ever in flight.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include "session.h"

#include <lp/control/errors.h>
#include <lp/control/handshake.h>

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace lp::host {

class AuthManager;

// ---------------------------------------------------------------------------
// AdmissionHooks -- side effects of state transitions
// ---------------------------------------------------------------------------
struct AdmissionHooks {
    /// Open every channel for the session.  Fills \p ports with the
    /// endpoints to advertise.  Returns false (with \p error set) after
    /// rolling back whatever it opened.
    std::function<bool(const Session&, PortMap& ports, TransportError& error)> start_channels;

    /// Close every channel of the session.  Must not return before the
    /// full channel set is down.
    std::function<void(const Session&)> stop_channels;

    /// true on entering Active, false on returning to Idle from Active.
    std::function<void(bool active)> on_active_changed;
};

class AdmissionController {
public:
    AdmissionController(AuthManager* auth, std::vector<MonitorGeometry> monitors,
                        std::string encoder_name);

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    void setHooks(AdmissionHooks hooks);

    /// Handshakes arriving within this window after a teardown get BUSY.
    void setReconnectCooldownMs(uint32_t ms) { cooldown_ms_ = ms; }

    /// Process one handshake.  Always returns a response to send back.
    HandshakeResponse onHandshake(const HandshakeRequest& request,
                                  const std::string& client_ip);

    /// Clean disconnect (GOODBYE, channel failure).  Returns false if no
    /// session was Active.
    bool onDisconnect();

    /// Heartbeat loss.  Same teardown as onDisconnect().
    bool onHeartbeatTimeout();

    SessionState state() const;

    /// Copy of the active session.  Returns false unless Active.
    bool activeSession(Session& out) const;

    /// Record the announced link mode.  Returns true if it changed.
    bool setLinkMode(LinkMode mode);

    /// Monotonic heartbeat bookkeeping for the active session.
    void touchHeartbeat(uint64_t now_us);

    const std::vector<MonitorGeometry>& monitors() const { return monitors_; }

    uint64_t sessionsStarted() const;

private:
    bool teardown(const char* cause);
    bool resolveMonitors(const std::vector<uint32_t>& requested, Session& session) const;

    AuthManager*                 auth_;
    const std::vector<MonitorGeometry> monitors_;
    const std::string            encoder_name_;
    AdmissionHooks               hooks_;
    uint32_t                     cooldown_ms_ = 0;

    mutable std::mutex           mutex_;
    Session                      session_;
    uint64_t                     last_teardown_us_ = 0;
    uint64_t                     sessions_started_ = 0;
};

/// 128-bit random session identifier as lowercase hex.
std::string generateSessionId();

} // namespace lp::host

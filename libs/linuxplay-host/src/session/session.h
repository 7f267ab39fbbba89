///////////////////////////////////////////////////////////////////////////////
// session.h -- The single streaming session record
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/control/handshake.h>
#include <lp/control/link_mode.h>

#include <cstdint>
#include <string>
#include <vector>

namespace lp::host {

enum class SessionState : uint8_t {
    Idle,
    Authenticating,
    Active,
    TearingDown,
};

inline const char* sessionStateName(SessionState s) {
    switch (s) {
        case SessionState::Idle:           return "Idle";
        case SessionState::Authenticating: return "Authenticating";
        case SessionState::Active:         return "Active";
        case SessionState::TearingDown:    return "TearingDown";
    }
    return "Unknown";
}

// ---------------------------------------------------------------------------
// Session -- owned by the AdmissionController; others receive copies
// ---------------------------------------------------------------------------
struct Session {
    std::string                  id;
    SessionState                 state             = SessionState::Idle;
    std::string                  client_ip;
    AuthMethod                   auth              = AuthMethod::Pin;
    std::string                  fingerprint;      // certificate logins and upgrades
    uint64_t                     start_time_us     = 0;
    uint64_t                     last_heartbeat_us = 0;
    std::vector<uint32_t>        monitor_indices;
    std::vector<MonitorGeometry> monitors;         // parallel to monitor_indices
    LinkMode                     link_mode         = LinkMode::LAN;
};

} // namespace lp::host

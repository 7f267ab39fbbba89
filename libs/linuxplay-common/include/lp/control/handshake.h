///////////////////////////////////////////////////////////////////////////////
// handshake.h -- TCP handshake wire messages
//
// One newline-terminated flat JSON object in each direction:
//
//   viewer -> host   { "version":1, "auth":"pin", "pin":"482193",
//                      "monitors":"0,1", "net":"wifi", "request_cert":true,
//                      "device":"laptop", "public_key":"-----BEGIN ..." }
//                    { "version":1, "auth":"cert", "certificate":"-----BEGIN ...",
//                      "fingerprint":"AB:CD:..." }
//
//   host -> viewer   { "status":"OK", "encoder":"h.264",
//                      "monitors":"1920x1080+0+0;2560x1440+1920+0",
//                      "ports":"video=5000,audio=6001,...", "session_id":"...",
//                      ["client_cert", "client_key", "host_ca", "fingerprint"] }
//                    { "status":"BUSY" }
//                    { "status":"AUTH_FAILED", "reason":"InvalidPin" }
//                    { "status":"ERROR", "reason":"HandshakeMalformed" }
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include "lp/control/errors.h"
#include "lp/control/link_mode.h"
#include "lp/control/ports.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lp {

constexpr int    HANDSHAKE_PROTOCOL_VERSION = 1;
constexpr size_t MAX_HANDSHAKE_BYTES        = 64 * 1024;

// ---------------------------------------------------------------------------
// MonitorGeometry -- "WxH+X+Y"
// ---------------------------------------------------------------------------
struct MonitorGeometry {
    uint32_t width  = 1920;
    uint32_t height = 1080;
    int32_t  x      = 0;
    int32_t  y      = 0;

    std::string toString() const;
    static bool parse(const std::string& text, MonitorGeometry& out);

    bool operator==(const MonitorGeometry& o) const {
        return width == o.width && height == o.height && x == o.x && y == o.y;
    }
};

/// Semicolon-joined geometry list.
std::string formatMonitorList(const std::vector<MonitorGeometry>& monitors);
bool parseMonitorList(const std::string& text, std::vector<MonitorGeometry>& out);

// ---------------------------------------------------------------------------
// AuthMethod
// ---------------------------------------------------------------------------
enum class AuthMethod : uint8_t {
    Pin,
    Certificate,
};

inline const char* authMethodName(AuthMethod m) {
    return m == AuthMethod::Pin ? "PIN" : "CERT";
}

// ---------------------------------------------------------------------------
// CertificateBundle -- issued to a device after its first PIN login
// ---------------------------------------------------------------------------
struct CertificateBundle {
    std::string client_cert_pem;
    std::string client_key_pem;     // empty when the viewer supplied its own key
    std::string host_ca_pem;
    std::string fingerprint;
};

// ---------------------------------------------------------------------------
// HandshakeRequest
// ---------------------------------------------------------------------------
struct HandshakeRequest {
    int                   version       = HANDSHAKE_PROTOCOL_VERSION;
    AuthMethod            auth          = AuthMethod::Pin;
    std::string           pin;
    std::string           certificate_pem;
    std::string           fingerprint;
    uint64_t              proof_time_ms = 0;        // wall clock, cert logins
    std::string           proof;                    // hex signature, cert logins
    std::vector<uint32_t> monitors;                 // empty = every monitor
    bool                  has_link_mode = false;
    LinkMode              link_mode     = LinkMode::LAN;
    bool                  request_cert  = false;
    std::string           device_name;
    std::string           public_key_pem;

    /// JSON line including the trailing '\n'.
    std::string serialize() const;

    /// Parse one line.  On failure \p why (if given) describes the problem.
    static bool parse(const std::string& line, HandshakeRequest& out,
                      std::string* why = nullptr);
};

/// What a certificate login signs with the client key:
/// "linuxplay-cert-login:<fingerprint>:<time_ms>".
std::string certificateLoginMessage(const std::string& fingerprint, uint64_t time_ms);

// ---------------------------------------------------------------------------
// HandshakeResponse
// ---------------------------------------------------------------------------
enum class HandshakeStatus : uint8_t {
    Ok,
    Busy,
    AuthFailed,
    Error,
};

const char* handshakeStatusName(HandshakeStatus s);

/// Reason sent with HandshakeStatus::Error when session start aborted.
constexpr const char* SESSION_START_FAILED = "SessionStartFailed";

struct HandshakeResponse {
    HandshakeStatus              status     = HandshakeStatus::Error;
    AuthError                    auth_error = AuthError::None;
    std::string                  error_reason;
    std::string                  encoder;
    std::vector<MonitorGeometry> monitors;
    PortMap                      ports;
    std::string                  session_id;
    bool                         has_bundle = false;
    CertificateBundle            bundle;

    static HandshakeResponse busy();
    static HandshakeResponse authFailed(AuthError reason);
    static HandshakeResponse error(const std::string& reason);

    std::string serialize() const;
    static bool parse(const std::string& line, HandshakeResponse& out);
};

} // namespace lp

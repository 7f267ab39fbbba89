///////////////////////////////////////////////////////////////////////////////
// errors.h -- Session control plane error taxonomy
//
// AuthError and SessionError travel to the client inside the handshake
// response, so their names double as wire strings.  TransportError and
// TimeoutError never leave the host.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <string>

namespace lp {

enum class AuthError {
    None,
    InvalidPin,
    Expired,
    UntrustedClient,
    Revoked,
    AlreadyIssued,
};

enum class SessionError {
    None,
    Busy,
    HandshakeMalformed,
};

enum class TransportError {
    None,
    ChannelBindFailed,
    ProcessExitedUnexpectedly,
};

enum class TimeoutError {
    None,
    HeartbeatLost,
};

inline const char* authErrorName(AuthError e) {
    switch (e) {
        case AuthError::None:            return "None";
        case AuthError::InvalidPin:      return "InvalidPin";
        case AuthError::Expired:         return "Expired";
        case AuthError::UntrustedClient: return "UntrustedClient";
        case AuthError::Revoked:         return "Revoked";
        case AuthError::AlreadyIssued:   return "AlreadyIssued";
    }
    return "Unknown";
}

/// Inverse of authErrorName().  Unknown names map to UntrustedClient so a
/// garbled reason never reads as success.
inline AuthError parseAuthError(const std::string& name) {
    if (name == "InvalidPin")      return AuthError::InvalidPin;
    if (name == "Expired")         return AuthError::Expired;
    if (name == "UntrustedClient") return AuthError::UntrustedClient;
    if (name == "Revoked")         return AuthError::Revoked;
    if (name == "AlreadyIssued")   return AuthError::AlreadyIssued;
    if (name == "None")            return AuthError::None;
    return AuthError::UntrustedClient;
}

inline const char* sessionErrorName(SessionError e) {
    switch (e) {
        case SessionError::None:               return "None";
        case SessionError::Busy:               return "Busy";
        case SessionError::HandshakeMalformed: return "HandshakeMalformed";
    }
    return "Unknown";
}

inline const char* transportErrorName(TransportError e) {
    switch (e) {
        case TransportError::None:                      return "None";
        case TransportError::ChannelBindFailed:         return "ChannelBindFailed";
        case TransportError::ProcessExitedUnexpectedly: return "ProcessExitedUnexpectedly";
    }
    return "Unknown";
}

inline const char* timeoutErrorName(TimeoutError e) {
    switch (e) {
        case TimeoutError::None:          return "None";
        case TimeoutError::HeartbeatLost: return "HeartbeatLost";
    }
    return "Unknown";
}

} // namespace lp

///////////////////////////////////////////////////////////////////////////////
// handshake.cpp -- Handshake message codec and port map serialization
///////////////////////////////////////////////////////////////////////////////

#include "lp/control/handshake.h"
#include "lp/util/simple_json.h"

#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace lp {

namespace {

bool parseUint(const std::string& text, uint64_t max, uint64_t& out) {
    if (text.empty() || text.size() > 10) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    out = std::strtoull(text.c_str(), nullptr, 10);
    return out <= max;
}

bool parseInt32(const std::string& text, int32_t& out) {
    if (text.empty()) return false;
    size_t start = (text[0] == '-') ? 1 : 0;
    uint64_t magnitude = 0;
    if (!parseUint(text.substr(start), 0x7FFFFFFF, magnitude)) return false;
    out = static_cast<int32_t>(start ? -static_cast<int64_t>(magnitude)
                                     : static_cast<int64_t>(magnitude));
    return true;
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream in(text);
    while (std::getline(in, current, sep)) {
        parts.push_back(current);
    }
    return parts;
}

std::string stripNewline(const std::string& line) {
    std::string s = line;
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// PortMap
// ---------------------------------------------------------------------------
std::string PortMap::serialize() const {
    char buf[160];
    std::snprintf(buf, sizeof(buf),
                  "video=%u,audio=%u,control=%u,clipboard=%u,file=%u,"
                  "heartbeat=%u,gamepad=%u",
                  video_base, audio, control, clipboard, file, heartbeat, gamepad);
    return buf;
}

bool PortMap::parse(const std::string& text) {
    PortMap parsed;
    for (const auto& entry : split(text, ',')) {
        if (entry.empty()) continue;
        size_t eq = entry.find('=');
        if (eq == std::string::npos) return false;
        std::string key = entry.substr(0, eq);
        uint64_t value = 0;
        if (!parseUint(entry.substr(eq + 1), 65535, value)) return false;
        uint16_t port = static_cast<uint16_t>(value);

        if      (key == "video")     parsed.video_base = port;
        else if (key == "audio")     parsed.audio      = port;
        else if (key == "control")   parsed.control    = port;
        else if (key == "clipboard") parsed.clipboard  = port;
        else if (key == "file")      parsed.file       = port;
        else if (key == "heartbeat") parsed.heartbeat  = port;
        else if (key == "gamepad")   parsed.gamepad    = port;
    }
    *this = parsed;
    return true;
}

// ---------------------------------------------------------------------------
// MonitorGeometry
// ---------------------------------------------------------------------------
std::string MonitorGeometry::toString() const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%ux%u%+d%+d", width, height, x, y);
    return buf;
}

bool MonitorGeometry::parse(const std::string& text, MonitorGeometry& out) {
    // WxH followed by two signed offsets, each introduced by '+' or '-'
    size_t xpos = text.find('x');
    if (xpos == std::string::npos) return false;
    size_t off1 = text.find_first_of("+-", xpos + 1);
    if (off1 == std::string::npos) return false;
    size_t off2 = text.find_first_of("+-", off1 + 1);
    if (off2 == std::string::npos) return false;

    uint64_t w = 0, h = 0;
    if (!parseUint(text.substr(0, xpos), 65535, w)) return false;
    if (!parseUint(text.substr(xpos + 1, off1 - xpos - 1), 65535, h)) return false;
    if (w == 0 || h == 0) return false;

    auto signedPart = [&](size_t from, size_t to, int32_t& v) {
        std::string part = text.substr(from + 1, to - from - 1);
        if (text[from] == '-') part = "-" + part;
        return parseInt32(part, v);
    };

    int32_t ox = 0, oy = 0;
    if (!signedPart(off1, off2, ox)) return false;
    if (!signedPart(off2, text.size(), oy)) return false;

    out.width  = static_cast<uint32_t>(w);
    out.height = static_cast<uint32_t>(h);
    out.x      = ox;
    out.y      = oy;
    return true;
}

std::string formatMonitorList(const std::vector<MonitorGeometry>& monitors) {
    std::string out;
    for (size_t i = 0; i < monitors.size(); ++i) {
        if (i > 0) out += ';';
        out += monitors[i].toString();
    }
    return out;
}

bool parseMonitorList(const std::string& text, std::vector<MonitorGeometry>& out) {
    out.clear();
    for (const auto& part : split(text, ';')) {
        if (part.empty()) continue;
        MonitorGeometry g;
        if (!MonitorGeometry::parse(part, g)) return false;
        out.push_back(g);
    }
    return !out.empty();
}

// ---------------------------------------------------------------------------
// HandshakeRequest
// ---------------------------------------------------------------------------
std::string certificateLoginMessage(const std::string& fingerprint, uint64_t time_ms) {
    return "linuxplay-cert-login:" + fingerprint + ":" + std::to_string(time_ms);
}

std::string HandshakeRequest::serialize() const {
    SimpleJson json;
    json.setInt("version", version);
    json.setString("auth", auth == AuthMethod::Pin ? "pin" : "cert");
    if (auth == AuthMethod::Pin) {
        json.setString("pin", pin);
    } else {
        json.setString("certificate", certificate_pem);
        json.setString("fingerprint", fingerprint);
        if (!proof.empty()) {
            json.setUint("proof_ts", proof_time_ms);
            json.setString("proof", proof);
        }
    }

    if (!monitors.empty()) {
        std::string list;
        for (size_t i = 0; i < monitors.size(); ++i) {
            if (i > 0) list += ',';
            list += std::to_string(monitors[i]);
        }
        json.setString("monitors", list);
    }
    if (has_link_mode) {
        json.setString("net", link_mode == LinkMode::WIFI ? "wifi" : "lan");
    }
    if (request_cert) {
        json.setBool("request_cert", true);
        if (!device_name.empty())    json.setString("device", device_name);
        if (!public_key_pem.empty()) json.setString("public_key", public_key_pem);
    }
    return json.serialize() + "\n";
}

bool HandshakeRequest::parse(const std::string& line, HandshakeRequest& out,
                             std::string* why) {
    auto fail = [why](const char* reason) {
        if (why) *why = reason;
        return false;
    };

    if (line.size() > MAX_HANDSHAKE_BYTES) return fail("request too large");

    SimpleJson json;
    if (!json.parse(stripNewline(line))) return fail("not a JSON object");

    HandshakeRequest req;
    req.version = static_cast<int>(json.getInt("version", -1));
    if (req.version != HANDSHAKE_PROTOCOL_VERSION) return fail("unsupported version");

    std::string auth = json.getString("auth");
    if (auth == "pin") {
        req.auth = AuthMethod::Pin;
        req.pin  = json.getString("pin");
        if (req.pin.empty()) return fail("missing pin");
    } else if (auth == "cert") {
        req.auth            = AuthMethod::Certificate;
        req.certificate_pem = json.getString("certificate");
        req.fingerprint     = json.getString("fingerprint");
        if (req.certificate_pem.empty() || req.fingerprint.empty()) {
            return fail("missing certificate or fingerprint");
        }
        // A missing proof is an authentication failure, not a malformed request.
        req.proof_time_ms = json.getUint("proof_ts", 0);
        req.proof         = json.getString("proof");
    } else {
        return fail("unknown auth method");
    }

    std::string monitors = json.getString("monitors");
    for (const auto& part : split(monitors, ',')) {
        if (part.empty()) continue;
        uint64_t index = 0;
        if (!parseUint(part, 255, index)) return fail("bad monitor index");
        req.monitors.push_back(static_cast<uint32_t>(index));
    }

    if (json.hasKey("net")) {
        LinkMode mode = LinkMode::LAN;
        if (!parseLinkMode(json.getString("net"), mode) || mode == LinkMode::AUTO) {
            return fail("bad net mode");
        }
        req.has_link_mode = true;
        req.link_mode     = mode;
    }

    req.request_cert   = json.getBool("request_cert", false);
    req.device_name    = json.getString("device");
    req.public_key_pem = json.getString("public_key");
    if (req.request_cert && req.auth != AuthMethod::Pin) {
        return fail("certificate requests require PIN auth");
    }

    out = std::move(req);
    return true;
}

// ---------------------------------------------------------------------------
// HandshakeResponse
// ---------------------------------------------------------------------------
const char* handshakeStatusName(HandshakeStatus s) {
    switch (s) {
        case HandshakeStatus::Ok:         return "OK";
        case HandshakeStatus::Busy:       return "BUSY";
        case HandshakeStatus::AuthFailed: return "AUTH_FAILED";
        case HandshakeStatus::Error:      return "ERROR";
    }
    return "ERROR";
}

HandshakeResponse HandshakeResponse::busy() {
    HandshakeResponse r;
    r.status = HandshakeStatus::Busy;
    return r;
}

HandshakeResponse HandshakeResponse::authFailed(AuthError reason) {
    HandshakeResponse r;
    r.status     = HandshakeStatus::AuthFailed;
    r.auth_error = reason;
    return r;
}

HandshakeResponse HandshakeResponse::error(const std::string& reason) {
    HandshakeResponse r;
    r.status       = HandshakeStatus::Error;
    r.error_reason = reason;
    return r;
}

std::string HandshakeResponse::serialize() const {
    SimpleJson json;
    json.setString("status", handshakeStatusName(status));

    switch (status) {
        case HandshakeStatus::Ok:
            json.setString("encoder", encoder);
            json.setString("monitors", formatMonitorList(monitors));
            json.setString("ports", ports.serialize());
            json.setString("session_id", session_id);
            if (has_bundle) {
                json.setString("client_cert", bundle.client_cert_pem);
                json.setString("host_ca", bundle.host_ca_pem);
                json.setString("fingerprint", bundle.fingerprint);
                if (!bundle.client_key_pem.empty()) {
                    json.setString("client_key", bundle.client_key_pem);
                }
            }
            break;
        case HandshakeStatus::AuthFailed:
            json.setString("reason", authErrorName(auth_error));
            break;
        case HandshakeStatus::Error:
            json.setString("reason", error_reason);
            break;
        case HandshakeStatus::Busy:
            break;
    }
    return json.serialize() + "\n";
}

bool HandshakeResponse::parse(const std::string& line, HandshakeResponse& out) {
    SimpleJson json;
    if (!json.parse(stripNewline(line))) return false;

    HandshakeResponse r;
    std::string status = json.getString("status");
    if (status == "OK") {
        r.status     = HandshakeStatus::Ok;
        r.encoder    = json.getString("encoder");
        r.session_id = json.getString("session_id");
        if (!parseMonitorList(json.getString("monitors"), r.monitors)) return false;
        if (!r.ports.parse(json.getString("ports"))) return false;
        if (json.hasKey("client_cert")) {
            r.has_bundle                = true;
            r.bundle.client_cert_pem    = json.getString("client_cert");
            r.bundle.client_key_pem     = json.getString("client_key");
            r.bundle.host_ca_pem        = json.getString("host_ca");
            r.bundle.fingerprint        = json.getString("fingerprint");
        }
    } else if (status == "BUSY") {
        r.status = HandshakeStatus::Busy;
    } else if (status == "AUTH_FAILED") {
        r.status     = HandshakeStatus::AuthFailed;
        r.auth_error = parseAuthError(json.getString("reason"));
    } else if (status == "ERROR") {
        r.status       = HandshakeStatus::Error;
        r.error_reason = json.getString("reason");
    } else {
        return false;
    }

    out = std::move(r);
    return true;
}

} // namespace lp

///////////////////////////////////////////////////////////////////////////////
// control_message.cpp -- Control/clipboard/stats text codecs, gamepad events
///////////////////////////////////////////////////////////////////////////////

#include "lp/control/control_message.h"

#include <arpa/inet.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace lp {

namespace {

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream in(text);
    std::string tok;
    while (in >> tok) tokens.push_back(tok);
    return tokens;
}

std::string upper(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

bool toInt(const std::string& s, int& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (!end || *end != '\0') return false;
    if (v < -1'000'000 || v > 1'000'000) return false;
    out = static_cast<int>(v);
    return true;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ControlMessage
// ---------------------------------------------------------------------------
bool ControlMessage::parse(const std::string& text, ControlMessage& out) {
    auto tokens = tokenize(text);
    if (tokens.empty()) return false;

    ControlMessage msg;
    const std::string cmd = upper(tokens[0]);

    if (cmd == "NET" && tokens.size() >= 2) {
        LinkMode mode = LinkMode::LAN;
        if (!parseLinkMode(tokens[1], mode) || mode == LinkMode::AUTO) return false;
        msg.kind      = ControlKind::Net;
        msg.link_mode = mode;
    } else if (cmd == "GOODBYE") {
        msg.kind = ControlKind::Goodbye;
    } else if (cmd == "MOUSE_PKT" && tokens.size() == 5) {
        msg.kind = ControlKind::MousePacket;
        if (!toInt(tokens[1], msg.mouse_type) || !toInt(tokens[2], msg.button_mask) ||
            !toInt(tokens[3], msg.x) || !toInt(tokens[4], msg.y)) {
            return false;
        }
    } else if (cmd == "MOUSE_SCROLL" && tokens.size() == 2) {
        msg.kind = ControlKind::MouseScroll;
        if (!toInt(tokens[1], msg.button) || msg.button < 4 || msg.button > 7) return false;
    } else if (cmd == "KEY_PRESS" && tokens.size() == 2) {
        msg.kind = ControlKind::KeyPress;
        msg.key  = tokens[1];
    } else if (cmd == "KEY_RELEASE" && tokens.size() == 2) {
        msg.kind = ControlKind::KeyRelease;
        msg.key  = tokens[1];
    } else {
        return false;
    }

    out = std::move(msg);
    return true;
}

std::string ControlMessage::serialize() const {
    char buf[96];
    switch (kind) {
        case ControlKind::Net:
            return formatNetAnnouncement(link_mode);
        case ControlKind::Goodbye:
            return CONTROL_GOODBYE;
        case ControlKind::MousePacket:
            std::snprintf(buf, sizeof(buf), "MOUSE_PKT %d %d %d %d",
                          mouse_type, button_mask, x, y);
            return buf;
        case ControlKind::MouseScroll:
            std::snprintf(buf, sizeof(buf), "MOUSE_SCROLL %d", button);
            return buf;
        case ControlKind::KeyPress:
            return "KEY_PRESS " + key;
        case ControlKind::KeyRelease:
            return "KEY_RELEASE " + key;
    }
    return "";
}

// ---------------------------------------------------------------------------
// ClipboardMessage
// ---------------------------------------------------------------------------
bool ClipboardMessage::parse(const std::string& datagram, ClipboardMessage& out) {
    static const std::string kPrefix = "CLIPBOARD_UPDATE ";
    if (datagram.compare(0, kPrefix.size(), kPrefix) != 0) return false;

    size_t origin_end = datagram.find(' ', kPrefix.size());
    if (origin_end == std::string::npos) return false;

    std::string origin = datagram.substr(kPrefix.size(), origin_end - kPrefix.size());
    if (origin != "HOST" && origin != "CLIENT") return false;

    std::string text = datagram.substr(origin_end + 1);
    if (text.empty() || text.size() > MAX_CLIPBOARD_BYTES) return false;

    out.from_host = (origin == "HOST");
    out.text      = std::move(text);
    return true;
}

std::string ClipboardMessage::serialize() const {
    return std::string("CLIPBOARD_UPDATE ") + (from_host ? "HOST " : "CLIENT ") + text;
}

// ---------------------------------------------------------------------------
// StatsMessage
// ---------------------------------------------------------------------------
bool StatsMessage::parse(const std::string& datagram, StatsMessage& out) {
    StatsMessage m;
    char tag[8] = {};
    int n = std::sscanf(datagram.c_str(), "%5s %f %f %f %f", tag,
                        &m.cpu_percent, &m.gpu_percent, &m.mem_used_mb, &m.fps);
    if (n != 5 || std::strcmp(tag, "STATS") != 0) return false;
    out = m;
    return true;
}

std::string StatsMessage::serialize() const {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "STATS %.1f %.1f %.1f %.1f",
                  cpu_percent, gpu_percent, mem_used_mb, fps);
    return buf;
}

// ---------------------------------------------------------------------------
// Gamepad events
// ---------------------------------------------------------------------------
size_t decodeGamepadEvents(const uint8_t* data, size_t len,
                           std::vector<GamepadEvent>& out) {
    size_t count = 0;
    for (size_t off = 0; off + GamepadEvent::WIRE_SIZE <= len;
         off += GamepadEvent::WIRE_SIZE) {
        uint16_t code = 0, value = 0;
        std::memcpy(&code,  data + off + 1, 2);
        std::memcpy(&value, data + off + 3, 2);

        GamepadEvent ev;
        ev.type  = data[off];
        ev.code  = static_cast<int16_t>(ntohs(code));
        ev.value = static_cast<int16_t>(ntohs(value));
        out.push_back(ev);
        ++count;
    }
    return count;
}

void encodeGamepadEvent(const GamepadEvent& ev, std::vector<uint8_t>& out) {
    uint16_t code  = htons(static_cast<uint16_t>(ev.code));
    uint16_t value = htons(static_cast<uint16_t>(ev.value));
    uint8_t buf[GamepadEvent::WIRE_SIZE];
    buf[0] = ev.type;
    std::memcpy(buf + 1, &code, 2);
    std::memcpy(buf + 3, &value, 2);
    out.insert(out.end(), buf, buf + sizeof(buf));
}

} // namespace lp

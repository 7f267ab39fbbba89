///////////////////////////////////////////////////////////////////////////////
// control_message.h -- Text messages on the control, clipboard and heartbeat
// channels, plus the packed gamepad event format
//
// Control (viewer -> host, UDP):
//   NET LAN|WIFI
//   GOODBYE
//   MOUSE_PKT <type> <button_mask> <x> <y>     type 1=down 2=move 3=up
//   MOUSE_SCROLL <button>                      4=up 5=down 6=left 7=right
//   KEY_PRESS <keysym>  /  KEY_RELEASE <keysym>
//
// Clipboard (both directions):  CLIPBOARD_UPDATE HOST|CLIENT <text>
// Heartbeat (host -> viewer):   PING, STATS <cpu> <gpu> <mem_mb> <fps>
// Heartbeat (viewer -> host):   PONG
//
// Gamepad (viewer -> host): back-to-back 5-byte events, network byte order
//   [type:u8][code:i16][value:i16]
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include "lp/control/link_mode.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lp {

constexpr const char* HEARTBEAT_PING = "PING";
constexpr const char* HEARTBEAT_PONG = "PONG";
constexpr const char* CONTROL_GOODBYE = "GOODBYE";

constexpr size_t MAX_CLIPBOARD_BYTES = 65536;

// ---------------------------------------------------------------------------
// ControlMessage
// ---------------------------------------------------------------------------
enum class ControlKind : uint8_t {
    Net,
    Goodbye,
    MousePacket,
    MouseScroll,
    KeyPress,
    KeyRelease,
};

enum MouseEventType : int {
    MOUSE_DOWN = 1,
    MOUSE_MOVE = 2,
    MOUSE_UP   = 3,
};

struct ControlMessage {
    ControlKind kind        = ControlKind::Goodbye;
    LinkMode    link_mode   = LinkMode::LAN;   // Net
    int         mouse_type  = MOUSE_MOVE;      // MousePacket
    int         button_mask = 0;
    int         x           = 0;
    int         y           = 0;
    int         button      = 0;               // MouseScroll
    std::string key;                           // KeyPress / KeyRelease

    /// Parse one datagram.  Unknown or malformed messages return false.
    static bool parse(const std::string& text, ControlMessage& out);

    std::string serialize() const;
};

// ---------------------------------------------------------------------------
// ClipboardMessage
// ---------------------------------------------------------------------------
struct ClipboardMessage {
    bool        from_host = false;
    std::string text;

    static bool parse(const std::string& datagram, ClipboardMessage& out);
    std::string serialize() const;
};

// ---------------------------------------------------------------------------
// StatsMessage -- host resource usage broadcast on the heartbeat channel
// ---------------------------------------------------------------------------
struct StatsMessage {
    float cpu_percent = 0.0f;
    float gpu_percent = 0.0f;
    float mem_used_mb = 0.0f;
    float fps         = 0.0f;

    static bool parse(const std::string& datagram, StatsMessage& out);
    std::string serialize() const;
};

// ---------------------------------------------------------------------------
// GamepadEvent
// ---------------------------------------------------------------------------
struct GamepadEvent {
    uint8_t type  = 0;
    int16_t code  = 0;
    int16_t value = 0;

    static constexpr size_t WIRE_SIZE = 5;

    bool operator==(const GamepadEvent& o) const {
        return type == o.type && code == o.code && value == o.value;
    }
};

/// Decode every complete event in \p data; a trailing partial event is
/// ignored.  Returns the number of events appended.
size_t decodeGamepadEvents(const uint8_t* data, size_t len,
                           std::vector<GamepadEvent>& out);

void encodeGamepadEvent(const GamepadEvent& ev, std::vector<uint8_t>& out);

} // namespace lp

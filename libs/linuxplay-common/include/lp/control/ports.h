///////////////////////////////////////////////////////////////////////////////
// ports.h -- Channel types and default port assignments
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstdint>
#include <string>

namespace lp {

// ---------------------------------------------------------------------------
// Default ports
// ---------------------------------------------------------------------------
constexpr uint16_t DEFAULT_VIDEO_BASE_PORT = 5000;   // + monitor index
constexpr uint16_t DEFAULT_AUDIO_PORT      = 6001;
constexpr uint16_t DEFAULT_CONTROL_PORT    = 7000;
constexpr uint16_t DEFAULT_HANDSHAKE_PORT  = 7001;
constexpr uint16_t DEFAULT_CLIPBOARD_PORT  = 7002;
constexpr uint16_t DEFAULT_FILE_PORT       = 7003;
constexpr uint16_t DEFAULT_HEARTBEAT_PORT  = 7004;
constexpr uint16_t DEFAULT_GAMEPAD_PORT    = 7005;

// ---------------------------------------------------------------------------
// ChannelType -- one independent transport endpoint per data category
// ---------------------------------------------------------------------------
enum class ChannelType : uint8_t {
    Video,
    Audio,
    Control,
    Clipboard,
    File,
    Heartbeat,
    Gamepad,
};

inline const char* channelTypeName(ChannelType t) {
    switch (t) {
        case ChannelType::Video:     return "video";
        case ChannelType::Audio:     return "audio";
        case ChannelType::Control:   return "control";
        case ChannelType::Clipboard: return "clipboard";
        case ChannelType::File:      return "file";
        case ChannelType::Heartbeat: return "heartbeat";
        case ChannelType::Gamepad:   return "gamepad";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// PortMap -- the port assignment advertised in the handshake response
// ---------------------------------------------------------------------------
struct PortMap {
    uint16_t video_base = DEFAULT_VIDEO_BASE_PORT;
    uint16_t audio      = DEFAULT_AUDIO_PORT;
    uint16_t control    = DEFAULT_CONTROL_PORT;
    uint16_t clipboard  = DEFAULT_CLIPBOARD_PORT;
    uint16_t file       = DEFAULT_FILE_PORT;
    uint16_t heartbeat  = DEFAULT_HEARTBEAT_PORT;
    uint16_t gamepad    = DEFAULT_GAMEPAD_PORT;

    /// "video=5000,audio=6001,control=7000,..."
    std::string serialize() const;

    /// Parse the serialize() form.  Unknown keys are ignored; a malformed
    /// entry returns false.
    bool parse(const std::string& text);

    bool operator==(const PortMap& o) const {
        return video_base == o.video_base && audio == o.audio &&
               control == o.control && clipboard == o.clipboard &&
               file == o.file && heartbeat == o.heartbeat &&
               gamepad == o.gamepad;
    }
};

} // namespace lp

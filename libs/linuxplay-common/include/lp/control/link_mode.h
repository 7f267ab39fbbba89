///////////////////////////////////////////////////////////////////////////////
// link_mode.h -- Network path classification and derived buffer parameters
//
// The viewer classifies its route to the host as LAN or WIFI and announces
// it with "NET LAN" / "NET WIFI" on the control channel.  Both sides derive
// the MPEG-TS / UDP buffering of the media pipelines from the mode: Wi-Fi
// gets deep buffers and tolerates delay, LAN runs with minimal buffering.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstdint>
#include <string>

namespace lp {

enum class LinkMode : uint8_t {
    LAN,
    WIFI,
    AUTO,     // viewer-side only: classify from the routing table
};

inline const char* linkModeName(LinkMode m) {
    switch (m) {
        case LinkMode::LAN:  return "LAN";
        case LinkMode::WIFI: return "WIFI";
        case LinkMode::AUTO: return "AUTO";
    }
    return "LAN";
}

/// Case-insensitive parse of "lan", "wifi" or "auto".
bool parseLinkMode(const std::string& text, LinkMode& out);

// ---------------------------------------------------------------------------
// BufferParams -- per-link buffering applied to media channels at start
// ---------------------------------------------------------------------------
struct BufferParams {
    uint32_t video_buffer_bytes = 65536;    // UDP socket buffer (buffer_size=)
    uint32_t video_fifo_packets = 32768;    // circular receive FIFO (fifo_size=)
    uint32_t video_max_delay_us = 0;        // demuxer reorder tolerance (max_delay=)
    uint32_t audio_buffer_bytes = 512;
    uint32_t audio_max_delay_us = 0;

    bool operator==(const BufferParams& o) const {
        return video_buffer_bytes == o.video_buffer_bytes &&
               video_fifo_packets == o.video_fifo_packets &&
               video_max_delay_us == o.video_max_delay_us &&
               audio_buffer_bytes == o.audio_buffer_bytes &&
               audio_max_delay_us == o.audio_max_delay_us;
    }
    bool operator!=(const BufferParams& o) const { return !(*this == o); }
};

/// Buffer parameters for a resolved mode.  AUTO is treated as LAN.
BufferParams bufferParamsFor(LinkMode mode);

/// Largest MPEG-TS payload (a multiple of 188 bytes) that fits one UDP
/// datagram for the given path MTU.  Non-positive MTUs assume 1500.
uint32_t bestTsPacketSize(int mtu, bool ipv6);

/// "NET LAN" / "NET WIFI".  AUTO is announced as LAN.
std::string formatNetAnnouncement(LinkMode mode);

} // namespace lp

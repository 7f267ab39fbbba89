///////////////////////////////////////////////////////////////////////////////
// link_mode.cpp -- Link mode parsing and buffer parameter tables
///////////////////////////////////////////////////////////////////////////////

#include "lp/control/link_mode.h"

#include <algorithm>
#include <cctype>

namespace lp {

bool parseLinkMode(const std::string& text, LinkMode& out) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "lan")                     { out = LinkMode::LAN;  return true; }
    if (lower == "wifi" || lower == "wlan") { out = LinkMode::WIFI; return true; }
    if (lower == "auto")                    { out = LinkMode::AUTO; return true; }
    return false;
}

BufferParams bufferParamsFor(LinkMode mode) {
    BufferParams p;
    if (mode == LinkMode::WIFI) {
        p.video_buffer_bytes = 4'194'304;
        p.video_fifo_packets = 262'144;
        p.video_max_delay_us = 150'000;
        p.audio_buffer_bytes = 4'194'304;
        p.audio_max_delay_us = 150'000;
    }
    return p;
}

uint32_t bestTsPacketSize(int mtu, bool ipv6) {
    if (mtu <= 0) mtu = 1500;
    const int overhead    = ipv6 ? 48 : 28;     // IP + UDP headers
    const int max_payload = std::max(512, mtu - overhead);
    return static_cast<uint32_t>(std::max(188, (max_payload / 188) * 188));
}

std::string formatNetAnnouncement(LinkMode mode) {
    return std::string("NET ") + (mode == LinkMode::WIFI ? "WIFI" : "LAN");
}

} // namespace lp

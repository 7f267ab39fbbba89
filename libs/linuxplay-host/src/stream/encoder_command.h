///////////////////////////////////////////////////////////////////////////////
// encoder_command.h -- Command lines for the delegated ffmpeg pipelines
//
// Video: x11grab of one monitor region -> selected encoder -> MPEG-TS over
// UDP to the client.  Audio: PulseAudio monitor source -> Opus -> MPEG-TS
// over UDP.  The UDP URL carries the link-tuned buffer parameters and every
// process is tagged with a metadata marker naming its session.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/control/handshake.h>
#include <lp/control/link_mode.h>

#include <cstdint>
#include <string>
#include <vector>

namespace lp::host {

// ---------------------------------------------------------------------------
// EncoderSettings -- static per-host encoder choices
// ---------------------------------------------------------------------------
struct EncoderSettings {
    std::string program      = "ffmpeg";
    std::string codec        = "h.264";     // h.264 | h.265 | none
    std::string hwenc        = "cpu";       // cpu | nvenc | qsv | vaapi (resolved)
    uint32_t    framerate    = 60;
    std::string display      = ":0";
    bool        adaptive     = false;
    std::string preset;
    uint32_t    gop          = 0;           // 0 = encoder default
    std::string qp;
    std::string pix_fmt      = "yuv420p";
    int         mtu          = 1500;
    std::string audio_source;               // empty = default.monitor
};

// ---------------------------------------------------------------------------
// MediaTarget -- where one pipeline sends its stream
// ---------------------------------------------------------------------------
struct MediaTarget {
    std::string  client_ip;
    uint16_t     port = 0;
    BufferParams buffers;
    std::string  session_id;
};

/// "LinuxPlayHost:<session id>"
std::string processMarker(const std::string& session_id);

/// udp:// URL with packet size and buffer parameters.
std::string buildVideoUrl(const MediaTarget& target, uint32_t pkt_size);
std::string buildAudioUrl(const MediaTarget& target, uint32_t pkt_size);

/// Pick a concrete backend for hwenc "auto" by probing the machine.
/// Any other value is returned lower-cased.
std::string resolveHwEncoder(const std::string& codec, const std::string& hwenc);

/// Encoder arguments (-c:v ... rate control ...) for codec/backend/bitrate.
/// Empty for codec "none", which leaves the choice to ffmpeg.
std::vector<std::string> encoderArgs(const EncoderSettings& settings, uint64_t bitrate_bits);

/// Full argv for one monitor.  Bitrates below the safe minimum for the
/// monitor size are raised with a warning.
std::vector<std::string> buildVideoCommand(const EncoderSettings& settings,
                                           const MonitorGeometry& monitor,
                                           const MediaTarget& target,
                                           uint64_t bitrate_bits);

std::vector<std::string> buildAudioCommand(const EncoderSettings& settings,
                                           const MediaTarget& target);

} // namespace lp::host

///////////////////////////////////////////////////////////////////////////////
// decoder_command.h -- Command lines for the delegated ffplay decoders
//
// Each monitor is received by its own ffplay instance listening on
// video_base + index.  The UDP URL carries the same link-tuned buffering
// the host applied to its sender, so a Wi-Fi session absorbs jitter on
// both ends while a LAN session keeps every buffer minimal.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/control/link_mode.h>

#include <cstdint>
#include <string>
#include <vector>

namespace lp {

struct DecoderSettings {
    std::string program = "ffplay";
    int         mtu     = 1500;
};

/// "udp://@0.0.0.0:<port>?pkt_size=...&reuse=1&buffer_size=...".
std::string buildReceiveUrl(uint16_t port, const BufferParams& buffers,
                            uint32_t pkt_size, bool audio);

std::vector<std::string> buildVideoDecoderCommand(const DecoderSettings& settings,
                                                  uint16_t port,
                                                  const BufferParams& buffers,
                                                  const std::string& title);

std::vector<std::string> buildAudioDecoderCommand(const DecoderSettings& settings,
                                                  uint16_t port,
                                                  const BufferParams& buffers);

} // namespace lp

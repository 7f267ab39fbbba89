///////////////////////////////////////////////////////////////////////////////
// decoder_command.cpp -- ffplay argv builders
///////////////////////////////////////////////////////////////////////////////

#include "decoder_command.h"

namespace lp {

std::string buildReceiveUrl(uint16_t port, const BufferParams& buffers,
                            uint32_t pkt_size, bool audio) {
    std::string url = "udp://@0.0.0.0:" + std::to_string(port) +
                      "?pkt_size=" + std::to_string(pkt_size) + "&reuse=1";
    if (audio) {
        url += "&buffer_size=" + std::to_string(buffers.audio_buffer_bytes) +
               "&overrun_nonfatal=1&max_delay=" + std::to_string(buffers.audio_max_delay_us);
    } else {
        url += "&buffer_size=" + std::to_string(buffers.video_buffer_bytes) +
               "&fifo_size=" + std::to_string(buffers.video_fifo_packets) +
               "&overrun_nonfatal=1&max_delay=" + std::to_string(buffers.video_max_delay_us);
    }
    return url;
}

std::vector<std::string> buildVideoDecoderCommand(const DecoderSettings& settings,
                                                  uint16_t port,
                                                  const BufferParams& buffers,
                                                  const std::string& title) {
    const uint32_t pkt = bestTsPacketSize(settings.mtu, false);
    std::vector<std::string> argv = {
        settings.program,
        "-hide_banner", "-loglevel", "error",
        "-fflags", "nobuffer",
        "-flags", "low_delay",
        "-framedrop",
        "-probesize", "32",
        "-analyzeduration", "0",
        "-sync", "ext",
        "-window_title", title,
        "-f", "mpegts",
        "-i", buildReceiveUrl(port, buffers, pkt, false),
    };
    return argv;
}

std::vector<std::string> buildAudioDecoderCommand(const DecoderSettings& settings,
                                                  uint16_t port,
                                                  const BufferParams& buffers) {
    const uint32_t pkt = bestTsPacketSize(settings.mtu, false);
    return {
        settings.program,
        "-hide_banner", "-loglevel", "error",
        "-nodisp",
        "-fflags", "nobuffer",
        "-flags", "low_delay",
        "-f", "mpegts",
        "-i", buildReceiveUrl(port, buffers, pkt, true),
    };
}

} // namespace lp

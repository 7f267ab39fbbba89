#include <gtest/gtest.h>

#include "decode/decoder_command.h"

#include <algorithm>

using namespace lp;

namespace {

std::string after(const std::vector<std::string>& v, const std::string& flag) {
    auto it = std::find(v.begin(), v.end(), flag);
    if (it == v.end() || ++it == v.end()) return "";
    return *it;
}

} // namespace

TEST(DecoderCommand, ReceiveUrlMatchesLinkMode) {
    EXPECT_EQ(buildReceiveUrl(5000, bufferParamsFor(LinkMode::LAN), 1316, false),
              "udp://@0.0.0.0:5000?pkt_size=1316&reuse=1&buffer_size=65536&fifo_size=32768"
              "&overrun_nonfatal=1&max_delay=0");
    EXPECT_EQ(buildReceiveUrl(6001, bufferParamsFor(LinkMode::WIFI), 1316, true),
              "udp://@0.0.0.0:6001?pkt_size=1316&reuse=1&buffer_size=4194304"
              "&overrun_nonfatal=1&max_delay=150000");
}

TEST(DecoderCommand, VideoDecoderPerMonitor) {
    DecoderSettings s;
    auto cmd = buildVideoDecoderCommand(s, 5001, bufferParamsFor(LinkMode::LAN),
                                        "LinuxPlay monitor 1");
    ASSERT_FALSE(cmd.empty());
    EXPECT_EQ(cmd[0], "ffplay");
    EXPECT_EQ(after(cmd, "-window_title"), "LinuxPlay monitor 1");
    EXPECT_EQ(after(cmd, "-f"), "mpegts");
    EXPECT_EQ(after(cmd, "-i").rfind("udp://@0.0.0.0:5001?", 0), 0u);
}

TEST(DecoderCommand, AudioDecoderHasNoWindow) {
    DecoderSettings s;
    s.program = "/opt/ffmpeg/bin/ffplay";
    s.mtu     = 9000;
    auto cmd = buildAudioDecoderCommand(s, 6001, bufferParamsFor(LinkMode::LAN));
    EXPECT_EQ(cmd[0], "/opt/ffmpeg/bin/ffplay");
    EXPECT_NE(std::find(cmd.begin(), cmd.end(), "-nodisp"), cmd.end());
    // Jumbo frames allow larger TS bursts.
    EXPECT_NE(after(cmd, "-i").find("pkt_size=" + std::to_string(bestTsPacketSize(9000, false))),
              std::string::npos);
}

#include <gtest/gtest.h>

#include <lp/control/link_mode.h>

using namespace lp;

TEST(LinkMode, ParsesCaseInsensitive) {
    LinkMode m = LinkMode::LAN;
    EXPECT_TRUE(parseLinkMode("WiFi", m));
    EXPECT_EQ(m, LinkMode::WIFI);
    EXPECT_TRUE(parseLinkMode("lan", m));
    EXPECT_EQ(m, LinkMode::LAN);
    EXPECT_TRUE(parseLinkMode("AUTO", m));
    EXPECT_EQ(m, LinkMode::AUTO);
    EXPECT_FALSE(parseLinkMode("ethernet", m));
    EXPECT_EQ(m, LinkMode::AUTO);
}

TEST(LinkMode, WifiGetsDeeperBuffers) {
    BufferParams lan  = bufferParamsFor(LinkMode::LAN);
    BufferParams wifi = bufferParamsFor(LinkMode::WIFI);
    EXPECT_EQ(lan.video_max_delay_us, 0u);
    EXPECT_GT(wifi.video_buffer_bytes, lan.video_buffer_bytes);
    EXPECT_GT(wifi.video_fifo_packets, lan.video_fifo_packets);
    EXPECT_GT(wifi.video_max_delay_us, 0u);
    EXPECT_GT(wifi.audio_buffer_bytes, lan.audio_buffer_bytes);
    EXPECT_EQ(bufferParamsFor(LinkMode::AUTO), lan);
}

TEST(LinkMode, TsPacketSizeFitsMtu) {
    EXPECT_EQ(bestTsPacketSize(1500, false), 1316u);   // 7 * 188
    EXPECT_EQ(bestTsPacketSize(1500, true), 1316u);
    EXPECT_EQ(bestTsPacketSize(9000, false), 8836u);   // 47 * 188
    EXPECT_EQ(bestTsPacketSize(0, false), 1316u);
    EXPECT_EQ(bestTsPacketSize(400, false), 376u);     // floor at 512 payload
}

TEST(LinkMode, Announcement) {
    EXPECT_EQ(formatNetAnnouncement(LinkMode::WIFI), "NET WIFI");
    EXPECT_EQ(formatNetAnnouncement(LinkMode::LAN), "NET LAN");
    EXPECT_EQ(formatNetAnnouncement(LinkMode::AUTO), "NET LAN");
}

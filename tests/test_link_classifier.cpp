#include <gtest/gtest.h>

#include "net/link_classifier.h"

#include "test_util.h"

#include <sys/stat.h>

using namespace lp;

TEST(LinkClassifier, ParsesRouteDevice) {
    std::string iface;
    ASSERT_TRUE(parseRouteDevice(
        "192.168.1.10 via 192.168.1.1 dev wlp3s0 src 192.168.1.42 uid 1000\n    cache\n",
        iface));
    EXPECT_EQ(iface, "wlp3s0");

    ASSERT_TRUE(parseRouteDevice("local 127.0.0.1 dev lo table local src 127.0.0.1", iface));
    EXPECT_EQ(iface, "lo");

    EXPECT_FALSE(parseRouteDevice("RTNETLINK answers: Network is unreachable", iface));
    EXPECT_FALSE(parseRouteDevice("10.0.0.1 dev", iface));
}

TEST(LinkClassifier, WirelessDirectoryMeansWifi) {
    test::TempDir sys;
    ASSERT_EQ(::mkdir(sys.file("radio0").c_str(), 0755), 0);
    ASSERT_EQ(::mkdir(sys.file("radio0/wireless").c_str(), 0755), 0);
    ASSERT_EQ(::mkdir(sys.file("eth0").c_str(), 0755), 0);

    EXPECT_EQ(classifyInterface("radio0", sys.path()), LinkMode::WIFI);
    EXPECT_EQ(classifyInterface("eth0", sys.path()), LinkMode::LAN);
}

TEST(LinkClassifier, NamePrefixFallback) {
    test::TempDir sys;
    EXPECT_EQ(classifyInterface("wlan0", sys.path()), LinkMode::WIFI);
    EXPECT_EQ(classifyInterface("wlp2s0", sys.path()), LinkMode::WIFI);
    EXPECT_EQ(classifyInterface("enp4s0", sys.path()), LinkMode::LAN);
    EXPECT_EQ(classifyInterface("", sys.path()), LinkMode::LAN);
    EXPECT_EQ(classifyInterface("../wl", sys.path()), LinkMode::LAN);
}

TEST(LinkClassifier, ForcedModeSkipsDetection) {
    EXPECT_EQ(resolveLinkMode(LinkMode::WIFI, "203.0.113.1"), LinkMode::WIFI);
    EXPECT_EQ(resolveLinkMode(LinkMode::LAN, "203.0.113.1"), LinkMode::LAN);
}

TEST(LinkClassifier, LoopbackIsLan) {
    test::TempDir sys;
    EXPECT_EQ(detectLinkMode("127.0.0.1", sys.path()), LinkMode::LAN);
}

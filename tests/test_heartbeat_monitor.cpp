#include <gtest/gtest.h>

#include "session/heartbeat_monitor.h"

#include "test_util.h"

#include <atomic>

using namespace lp::host;

namespace {

constexpr uint64_t MS = 1000;

HeartbeatConfig config(uint32_t interval_ms, uint32_t timeout_ms) {
    HeartbeatConfig c;
    c.interval_ms = interval_ms;
    c.timeout_ms  = timeout_ms;
    c.tick_ms     = 10;
    return c;
}

} // namespace

TEST(HeartbeatMonitor, PingsOnInterval) {
    int pings = 0;
    HeartbeatMonitor hb(config(1000, 10000), [&] { ++pings; }, nullptr);
    hb.reset(0);

    EXPECT_FALSE(hb.poll(0));
    EXPECT_EQ(pings, 1);
    hb.poll(500 * MS);
    EXPECT_EQ(pings, 1);
    hb.poll(1000 * MS);
    EXPECT_EQ(pings, 2);
    hb.poll(1500 * MS);
    hb.poll(2100 * MS);
    EXPECT_EQ(pings, 3);
    EXPECT_EQ(hb.pingsSent(), 3u);
}

TEST(HeartbeatMonitor, TimeoutFiresOnce) {
    int timeouts = 0;
    HeartbeatMonitor hb(config(1000, 3000), nullptr, [&] { ++timeouts; });
    hb.reset(0);

    EXPECT_FALSE(hb.poll(3000 * MS));
    EXPECT_TRUE(hb.poll(3001 * MS));
    EXPECT_TRUE(hb.expired());
    EXPECT_FALSE(hb.poll(5000 * MS));
    EXPECT_FALSE(hb.poll(9000 * MS));
    EXPECT_EQ(timeouts, 1);
}

TEST(HeartbeatMonitor, AckExtendsWindow) {
    int timeouts = 0;
    HeartbeatMonitor hb(config(1000, 3000), nullptr, [&] { ++timeouts; });
    hb.reset(0);

    for (uint64_t t = 0; t <= 20000; t += 1000) {
        hb.onAck(t * MS);
        EXPECT_FALSE(hb.poll(t * MS + 500 * MS));
    }
    EXPECT_EQ(timeouts, 0);
    EXPECT_EQ(hb.lastAckUs(), 20000 * MS);

    // Out-of-order ack does not move the window backwards.
    hb.onAck(100 * MS);
    EXPECT_EQ(hb.lastAckUs(), 20000 * MS);
}

TEST(HeartbeatMonitor, AckAfterExpiryIsIgnored) {
    HeartbeatMonitor hb(config(1000, 2000), nullptr, nullptr);
    hb.reset(0);
    ASSERT_TRUE(hb.poll(2500 * MS));

    hb.onAck(2600 * MS);
    EXPECT_TRUE(hb.expired());
    EXPECT_EQ(hb.lastAckUs(), 0u);

    // A reset starts a clean window.
    hb.reset(10000 * MS);
    EXPECT_FALSE(hb.expired());
    EXPECT_FALSE(hb.poll(11000 * MS));
}

TEST(HeartbeatMonitor, TimerThreadDetectsSilence) {
    std::atomic<int> timeouts{0};
    std::atomic<int> pings{0};
    HeartbeatMonitor hb(config(20, 150), [&] { ++pings; }, [&] { ++timeouts; });
    hb.start();
    EXPECT_TRUE(lp::test::waitFor([&] { return timeouts.load() == 1; }, 2000));
    EXPECT_GE(pings.load(), 2);
    hb.stop();
    EXPECT_EQ(timeouts.load(), 1);
}

TEST(HeartbeatMonitor, TimerThreadStaysAliveWithAcks) {
    std::atomic<int> timeouts{0};
    HeartbeatMonitor hb(config(20, 150), nullptr, [&] { ++timeouts; });
    hb.start();
    for (int i = 0; i < 30; ++i) {
        hb.onAck();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(timeouts.load(), 0);
    hb.stop();
    EXPECT_FALSE(hb.running());
}

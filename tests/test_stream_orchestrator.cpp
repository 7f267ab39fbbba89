#include <gtest/gtest.h>

#include "stream/stream_orchestrator.h"

#include "fake_launcher.h"
#include "test_util.h"

#include <lp/net/udp_channel.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace lp;
using namespace lp::host;

namespace {

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.bind_address = "127.0.0.1";
        config_.ports.control   = 0;
        config_.ports.clipboard = 0;
        config_.ports.heartbeat = 0;
        config_.ports.gamepad   = 0;
        config_.ports.file      = 0;
        config_.process_grace_ms      = 50;
        config_.supervise_interval_ms = 20;
        config_.upload_dir = dir_.path();
    }

    Session session(size_t monitors, LinkMode mode = LinkMode::LAN) const {
        Session s;
        s.id        = "0123456789abcdef0123456789abcdef";
        s.client_ip = "127.0.0.1";
        s.link_mode = mode;
        for (uint32_t i = 0; i < monitors; ++i) {
            s.monitor_indices.push_back(i);
            MonitorGeometry g;
            g.x = static_cast<int32_t>(i * 1920);
            s.monitors.push_back(g);
        }
        return s;
    }

    test::TempDir      dir_;
    OrchestratorConfig config_;
    test::FakeLauncher launcher_;
};

} // namespace

TEST_F(OrchestratorTest, StartsFullChannelSet) {
    config_.audio_enabled = true;
    StreamOrchestrator orch(config_, &launcher_);

    PortMap ports;
    TransportError err = TransportError::ChannelBindFailed;
    ASSERT_TRUE(orch.startSession(session(2), 8'000'000, ports, err));
    EXPECT_EQ(err, TransportError::None);
    EXPECT_TRUE(orch.active());

    EXPECT_EQ(orch.mediaChannelCount(), 3u);
    EXPECT_NE(ports.control, 0);
    EXPECT_NE(ports.clipboard, 0);
    EXPECT_NE(ports.heartbeat, 0);
    EXPECT_NE(ports.gamepad, 0);
    EXPECT_NE(ports.file, 0);
    EXPECT_EQ(ports.control, orch.boundPort(ChannelType::Control));
    EXPECT_EQ(ports.file, orch.boundPort(ChannelType::File));

    auto reqs = launcher_.requests();
    ASSERT_EQ(reqs.size(), 3u);
    EXPECT_EQ(reqs[0].type, ChannelType::Video);
    EXPECT_EQ(reqs[0].target.port, config_.ports.video_base);
    EXPECT_EQ(reqs[1].target.port, config_.ports.video_base + 1);
    EXPECT_EQ(reqs[1].monitor.x, 1920);
    EXPECT_EQ(reqs[0].bitrate_bits, 8'000'000u);
    EXPECT_EQ(reqs[2].type, ChannelType::Audio);
    EXPECT_EQ(reqs[2].target.port, config_.ports.audio);
    EXPECT_EQ(reqs[0].target.session_id, "0123456789abcdef0123456789abcdef");

    orch.stopSession();
    EXPECT_FALSE(orch.active());
    EXPECT_EQ(launcher_.running(), 0u);
    EXPECT_EQ(orch.boundPort(ChannelType::Control), 0);

    // Idempotent.
    orch.stopSession();
}

TEST_F(OrchestratorTest, RefusesSecondSession) {
    StreamOrchestrator orch(config_, &launcher_);
    PortMap ports;
    TransportError err;
    ASSERT_TRUE(orch.startSession(session(1), 1, ports, err));
    EXPECT_FALSE(orch.startSession(session(1), 1, ports, err));
    EXPECT_EQ(launcher_.launches(), 1u);
}

TEST_F(OrchestratorTest, LaunchFailureRollsBackEverything) {
    StreamOrchestrator orch(config_, &launcher_);
    launcher_.failType(ChannelType::Video);

    PortMap ports;
    TransportError err = TransportError::None;
    EXPECT_FALSE(orch.startSession(session(1), 1, ports, err));
    EXPECT_EQ(err, TransportError::ChannelBindFailed);
    EXPECT_FALSE(orch.active());
    EXPECT_EQ(launcher_.running(), 0u);
    EXPECT_EQ(orch.boundPort(ChannelType::Control), 0);
    EXPECT_EQ(orch.boundPort(ChannelType::File), 0);
}

TEST_F(OrchestratorTest, PartialLaunchFailureStopsStartedSenders) {
    config_.audio_enabled = true;
    StreamOrchestrator orch(config_, &launcher_);
    launcher_.failType(ChannelType::Audio);

    PortMap ports;
    TransportError err = TransportError::None;
    EXPECT_FALSE(orch.startSession(session(2), 1, ports, err));
    EXPECT_EQ(launcher_.launches(), 3u);
    EXPECT_EQ(launcher_.running(), 0u);
    EXPECT_FALSE(orch.active());
}

TEST_F(OrchestratorTest, BindConflictFailsStart) {
    UdpChannel squatter;
    ASSERT_TRUE(squatter.bind("127.0.0.1", 0));
    config_.ports.gamepad = squatter.boundPort();

    StreamOrchestrator orch(config_, &launcher_);
    PortMap ports;
    TransportError err = TransportError::None;
    EXPECT_FALSE(orch.startSession(session(1), 1, ports, err));
    EXPECT_EQ(err, TransportError::ChannelBindFailed);
    EXPECT_EQ(launcher_.launches(), 0u);
    EXPECT_EQ(orch.boundPort(ChannelType::Control), 0);
}

TEST_F(OrchestratorTest, CrashedSenderRestartsOnceThenFails) {
    StreamOrchestrator orch(config_, &launcher_);
    std::atomic<int> failures{0};
    std::atomic<int> failed_type{-1};
    orch.setFailureCallback([&](ChannelType type, TransportError err) {
        EXPECT_EQ(err, TransportError::ProcessExitedUnexpectedly);
        failed_type = static_cast<int>(type);
        ++failures;
    });

    PortMap ports;
    TransportError err;
    ASSERT_TRUE(orch.startSession(session(1), 1, ports, err));

    launcher_.crashAll(1);
    ASSERT_TRUE(test::waitFor([&] { return launcher_.launches() == 2; }, 2000));
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(orch.mediaChannelCount(), 1u);

    launcher_.crashAll(1);
    ASSERT_TRUE(test::waitFor([&] { return failures.load() == 1; }, 2000));
    EXPECT_EQ(failed_type.load(), static_cast<int>(ChannelType::Video));
    EXPECT_EQ(launcher_.launches(), 2u);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(failures.load(), 1);
    orch.stopSession();
}

TEST_F(OrchestratorTest, FailedRestartReportsFailure) {
    StreamOrchestrator orch(config_, &launcher_);
    std::atomic<int> failures{0};
    orch.setFailureCallback([&](ChannelType, TransportError) { ++failures; });

    PortMap ports;
    TransportError err;
    ASSERT_TRUE(orch.startSession(session(1), 1, ports, err));

    launcher_.failNext(1);
    launcher_.crashAll(2);
    ASSERT_TRUE(test::waitFor([&] { return failures.load() == 1; }, 2000));
    orch.stopSession();
}

TEST_F(OrchestratorTest, LinkModeChangeRestartsAllMedia) {
    config_.audio_enabled = true;
    StreamOrchestrator orch(config_, &launcher_);
    PortMap ports;
    TransportError err;
    ASSERT_TRUE(orch.startSession(session(1), 1, ports, err));
    EXPECT_EQ(orch.currentBuffers(), bufferParamsFor(LinkMode::LAN));

    EXPECT_FALSE(orch.applyLinkMode(LinkMode::LAN));
    EXPECT_FALSE(orch.applyLinkMode(LinkMode::AUTO));
    EXPECT_EQ(launcher_.launches(), 2u);

    ASSERT_TRUE(orch.applyLinkMode(LinkMode::WIFI));
    EXPECT_EQ(orch.linkMode(), LinkMode::WIFI);
    EXPECT_EQ(orch.currentBuffers(), bufferParamsFor(LinkMode::WIFI));

    auto reqs = launcher_.requests();
    ASSERT_EQ(reqs.size(), 4u);
    EXPECT_EQ(reqs[2].target.buffers, bufferParamsFor(LinkMode::WIFI));
    EXPECT_EQ(reqs[3].target.buffers, bufferParamsFor(LinkMode::WIFI));
    EXPECT_EQ(launcher_.running(), 2u);
    orch.stopSession();
}

TEST_F(OrchestratorTest, WifiSessionStartsWithWifiBuffers) {
    StreamOrchestrator orch(config_, &launcher_);
    PortMap ports;
    TransportError err;
    ASSERT_TRUE(orch.startSession(session(1, LinkMode::WIFI), 1, ports, err));
    EXPECT_EQ(orch.linkMode(), LinkMode::WIFI);
    EXPECT_EQ(launcher_.requests()[0].target.buffers, bufferParamsFor(LinkMode::WIFI));
}

TEST_F(OrchestratorTest, BitrateChangeRestartsVideoOnly) {
    config_.audio_enabled = true;
    StreamOrchestrator orch(config_, &launcher_);
    PortMap ports;
    TransportError err;
    ASSERT_TRUE(orch.startSession(session(2), 4'000'000, ports, err));
    ASSERT_EQ(launcher_.launches(), 3u);

    EXPECT_FALSE(orch.setBitrate(4'000'000));
    ASSERT_TRUE(orch.setBitrate(2'000'000));
    EXPECT_EQ(orch.bitrate(), 2'000'000u);

    auto reqs = launcher_.requests();
    ASSERT_EQ(reqs.size(), 5u);
    EXPECT_EQ(reqs[3].type, ChannelType::Video);
    EXPECT_EQ(reqs[4].type, ChannelType::Video);
    EXPECT_EQ(reqs[3].bitrate_bits, 2'000'000u);
    EXPECT_EQ(launcher_.running(), 3u);
    orch.stopSession();

    EXPECT_FALSE(orch.setBitrate(1));
}

TEST_F(OrchestratorTest, SlowSenderStopDoesNotBlockSends) {
    config_.process_grace_ms = 1500;
    StreamOrchestrator orch(config_, &launcher_);
    launcher_.setStopDelay(1500);
    PortMap ports;
    TransportError err;
    ASSERT_TRUE(orch.startSession(session(1), 1, ports, err));
    launcher_.setStopDelay(0);

    std::thread retune([&] { EXPECT_TRUE(orch.applyLinkMode(LinkMode::WIFI)); });
    ASSERT_TRUE(test::waitFor([this] { return launcher_.anyTerminated(); }, 2000));

    const auto begin = std::chrono::steady_clock::now();
    orch.sendToClient(ChannelType::Control, "ping");
    EXPECT_EQ(orch.linkMode(), LinkMode::WIFI);
    EXPECT_TRUE(orch.active());
    const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin).count();
    EXPECT_LT(took, 500);

    retune.join();
    EXPECT_EQ(launcher_.launches(), 2u);
    EXPECT_EQ(launcher_.running(), 1u);
    EXPECT_EQ(orch.mediaChannelCount(), 1u);
    orch.stopSession();
}

TEST_F(OrchestratorTest, DatagramsFromClientReachHandler) {
    StreamOrchestrator orch(config_, &launcher_);
    std::atomic<int> control{0};
    std::mutex m;
    std::string last;
    orch.setDatagramHandler([&](ChannelType type, const uint8_t* data, size_t len,
                                const sockaddr_in&) {
        if (type != ChannelType::Control) return;
        std::lock_guard<std::mutex> lock(m);
        last.assign(reinterpret_cast<const char*>(data), len);
        ++control;
    });

    PortMap ports;
    TransportError err;
    ASSERT_TRUE(orch.startSession(session(1), 1, ports, err));

    UdpChannel client;
    ASSERT_TRUE(client.bind("127.0.0.1", 0));
    std::atomic<int> replies{0};
    ASSERT_TRUE(client.start([&](const uint8_t*, size_t, const sockaddr_in&) { ++replies; }));

    ASSERT_TRUE(client.sendTo("127.0.0.1", ports.control, "MOUSE_MOVE 10 20"));
    ASSERT_TRUE(test::waitFor([&] { return control.load() == 1; }, 2000));
    {
        std::lock_guard<std::mutex> lock(m);
        EXPECT_EQ(last, "MOUSE_MOVE 10 20");
    }

    // The reply goes back to the port the client sent from.
    ASSERT_TRUE(orch.sendToClient(ChannelType::Control, "ACK"));
    EXPECT_TRUE(test::waitFor([&] { return replies.load() == 1; }, 2000));

    client.stop();
    orch.stopSession();
    EXPECT_FALSE(orch.sendToClient(ChannelType::Control, "late"));
}

#include <gtest/gtest.h>

#include "session/session_manager.h"
#include "session/host_connection.h"
#include "input/input_injector.h"

#include "fake_launcher.h"
#include "test_util.h"

#include <lp/control/link_mode.h>

#include <chrono>
#include <cstdio>
#include <memory>
#include <thread>

using namespace lp;
using namespace lp::host;

// End-to-end runs of a host SessionManager against a viewer HostConnection
// over loopback.  Media senders are faked; everything else is real.

namespace {

class ScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.bind_address   = "127.0.0.1";
        config_.handshake_port = 0;
        config_.ports.control   = 0;
        config_.ports.clipboard = 0;
        config_.ports.heartbeat = 0;
        config_.ports.gamepad   = 0;
        config_.ports.file      = 0;
        config_.state_dir  = dir_.file("state");
        config_.upload_dir = dir_.file("drop");
        config_.input      = "none";
        config_.clipboard  = false;
        config_.heartbeat_interval_ms = 100;
        config_.heartbeat_timeout_ms  = 600;
        config_.process_grace_ms      = 50;

        manager_.reset(new SessionManager(config_, {MonitorGeometry{}}, &launcher_,
                                          &injector_, nullptr));
        ASSERT_TRUE(manager_->initialize());
        ASSERT_TRUE(manager_->start());
        ASSERT_NE(manager_->handshakePort(), 0);
    }

    void TearDown() override {
        if (manager_) manager_->stop();
    }

    ViewerConfig viewerConfig(const std::string& pin) const {
        ViewerConfig vc;
        vc.host                 = "127.0.0.1";
        vc.handshake_port       = manager_->handshakePort();
        vc.pin                  = pin;
        vc.handshake_timeout_ms = 2000;
        vc.heartbeat_timeout_ms = 2000;
        return vc;
    }

    std::string currentPin() { return manager_->auth().pins().current(); }

    bool waitIdle(uint32_t timeout_ms = 4000) {
        return test::waitFor([this] {
            return manager_->admission().state() == SessionState::Idle;
        }, timeout_ms);
    }

    test::TempDir                   dir_;
    HostConfig                      config_;
    test::FakeLauncher              launcher_;
    NullInputInjector               injector_;
    std::unique_ptr<SessionManager> manager_;
};

} // namespace

// ---------------------------------------------------------------------------
// Silent viewer: admitted, never acknowledges, torn down, host reusable
// ---------------------------------------------------------------------------
TEST_F(ScenarioTest, SilentViewerIsTornDownAndHostAcceptsNextClient) {
    HostConnection first(viewerConfig(currentPin()));
    HandshakeResponse resp;
    std::string error;
    ASSERT_TRUE(first.connect(LinkMode::LAN, resp, error)) << error;

    EXPECT_EQ(resp.status, HandshakeStatus::Ok);
    ASSERT_EQ(resp.monitors.size(), 1u);
    EXPECT_EQ(resp.monitors[0].toString(), "1920x1080+0+0");
    EXPECT_EQ(manager_->admission().state(), SessionState::Active);

    auto requests = launcher_.requests();
    ASSERT_FALSE(requests.empty());
    EXPECT_EQ(requests[0].type, ChannelType::Video);
    EXPECT_EQ(requests[0].target.client_ip, "127.0.0.1");
    EXPECT_EQ(requests[0].target.port, 5000);
    EXPECT_EQ(requests[0].target.session_id, resp.session_id);

    // No openChannels(): the host never hears a PONG.
    ASSERT_TRUE(waitIdle());
    EXPECT_TRUE(test::waitFor([this] { return launcher_.running() == 0; }, 2000));

    HostConnection second(viewerConfig(currentPin()));
    HandshakeResponse resp2;
    ASSERT_TRUE(second.connect(LinkMode::LAN, resp2, error)) << error;
    EXPECT_NE(resp2.session_id, resp.session_id);
}

// ---------------------------------------------------------------------------
// Second viewer is BUSY until the first one's session ends
// ---------------------------------------------------------------------------
TEST_F(ScenarioTest, SecondViewerIsBusyUntilFirstSessionLapses) {
    HostConnection first(viewerConfig(currentPin()));
    HandshakeResponse resp;
    std::string error;
    ASSERT_TRUE(first.connect(LinkMode::LAN, resp, error)) << error;

    HostConnection rejected(viewerConfig(currentPin()));
    HandshakeResponse busy;
    EXPECT_FALSE(rejected.connect(LinkMode::LAN, busy, error));
    EXPECT_EQ(busy.status, HandshakeStatus::Busy);
    EXPECT_EQ(error, "BUSY");

    ASSERT_TRUE(waitIdle());

    // The PIN rotates when the session ends; a retry uses the fresh one.
    HostConnection retry(viewerConfig(currentPin()));
    HandshakeResponse ok;
    ASSERT_TRUE(retry.connect(LinkMode::LAN, ok, error)) << error;
    EXPECT_EQ(manager_->admission().state(), SessionState::Active);
}

// ---------------------------------------------------------------------------
// Live session: heartbeats keep it up, stats arrive, GOODBYE ends it
// ---------------------------------------------------------------------------
TEST_F(ScenarioTest, AcknowledgingViewerStaysUpAndGoodbyeEndsSession) {
    HostConnection viewer(viewerConfig(currentPin()));
    HandshakeResponse resp;
    std::string error;
    ASSERT_TRUE(viewer.connect(LinkMode::LAN, resp, error)) << error;
    ASSERT_TRUE(viewer.openChannels(nullptr));

    // Well past the 600 ms timeout.
    std::this_thread::sleep_for(std::chrono::milliseconds(1200));
    EXPECT_EQ(manager_->admission().state(), SessionState::Active);
    EXPECT_GT(viewer.pingsReceived(), 0u);
    EXPECT_FALSE(viewer.hostLost());

    StatsMessage stats;
    EXPECT_TRUE(test::waitFor([&] { return viewer.lastStats(stats); }, 2000));

    viewer.close();
    ASSERT_TRUE(waitIdle(2000));
    EXPECT_TRUE(test::waitFor([this] { return launcher_.running() == 0; }, 2000));
}

TEST_F(ScenarioTest, WrongPinIsRejected) {
    std::string wrong = currentPin() == "000000" ? "111111" : "000000";
    HostConnection viewer(viewerConfig(wrong));
    HandshakeResponse resp;
    std::string error;
    EXPECT_FALSE(viewer.connect(LinkMode::LAN, resp, error));
    EXPECT_EQ(resp.status, HandshakeStatus::AuthFailed);
    EXPECT_EQ(error, "AUTH_FAILED (InvalidPin)");
    EXPECT_EQ(manager_->admission().state(), SessionState::Idle);
    EXPECT_EQ(launcher_.launches(), 0u);
}

// ---------------------------------------------------------------------------
// Certificate issued on PIN login, used for the next login, then revoked
// ---------------------------------------------------------------------------
TEST_F(ScenarioTest, IssuedCertificateReplacesPinUntilRevoked) {
    test::TempDir certs;
    ViewerConfig vc = viewerConfig(currentPin());
    vc.cert_dir     = certs.path();
    vc.request_cert = true;
    vc.device_name  = "laptop";

    std::string fingerprint;
    {
        HostConnection viewer(vc);
        HandshakeResponse resp;
        std::string error;
        ASSERT_TRUE(viewer.connect(LinkMode::LAN, resp, error)) << error;
        ASSERT_TRUE(resp.has_bundle);
        fingerprint = resp.bundle.fingerprint;
        ASSERT_TRUE(viewer.openChannels(nullptr));
        viewer.close();
    }
    ASSERT_TRUE(waitIdle(2000));
    EXPECT_TRUE(test::fileExists(certs.file(CLIENT_CERT_FILE)));

    ViewerConfig cert_only = vc;
    cert_only.pin.clear();
    cert_only.request_cert = false;
    {
        HostConnection viewer(cert_only);
        HandshakeResponse resp;
        std::string error;
        ASSERT_TRUE(viewer.connect(LinkMode::LAN, resp, error)) << error;
        EXPECT_FALSE(resp.has_bundle);
        ASSERT_TRUE(viewer.openChannels(nullptr));
        viewer.close();
    }
    ASSERT_TRUE(waitIdle(2000));

    ASSERT_TRUE(manager_->auth().revoke(fingerprint));
    HostConnection viewer(cert_only);
    HandshakeResponse resp;
    std::string error;
    EXPECT_FALSE(viewer.connect(LinkMode::LAN, resp, error));
    EXPECT_EQ(error, "AUTH_FAILED (Revoked)");
}

// ---------------------------------------------------------------------------
// Link announcement mid-session switches the media buffers
// ---------------------------------------------------------------------------
TEST_F(ScenarioTest, NetAnnouncementSwitchesLinkMode) {
    HostConnection viewer(viewerConfig(currentPin()));
    HandshakeResponse resp;
    std::string error;
    ASSERT_TRUE(viewer.connect(LinkMode::LAN, resp, error)) << error;
    ASSERT_TRUE(viewer.openChannels(nullptr));
    EXPECT_EQ(manager_->orchestrator().linkMode(), LinkMode::LAN);

    size_t before = launcher_.launches();
    ASSERT_TRUE(viewer.announceLink(LinkMode::WIFI));
    EXPECT_TRUE(test::waitFor([this] {
        return manager_->orchestrator().linkMode() == LinkMode::WIFI;
    }, 2000));
    EXPECT_TRUE(test::waitFor([&] { return launcher_.launches() > before; }, 2000));

    auto requests = launcher_.requests();
    EXPECT_EQ(requests.back().target.buffers.video_buffer_bytes,
              bufferParamsFor(LinkMode::WIFI).video_buffer_bytes);
    viewer.close();
}

// ---------------------------------------------------------------------------
// The PIN holds still for the whole session and rotates once it ends
// ---------------------------------------------------------------------------
TEST_F(ScenarioTest, PinRotationPausesWhileSessionIsActive) {
    manager_->stop();
    config_.pin_rotate_ms = 300;
    manager_.reset(new SessionManager(config_, {MonitorGeometry{}}, &launcher_,
                                      &injector_, nullptr));
    ASSERT_TRUE(manager_->initialize());
    ASSERT_TRUE(manager_->start());

    PinManager& pins = manager_->auth().pins();
    std::unique_ptr<HostConnection> viewer;
    HandshakeResponse resp;
    std::string error;
    std::string pin;
    // A rotation can land between reading the PIN and the handshake.
    for (int attempt = 0; attempt < 3 && !viewer; ++attempt) {
        pin = pins.current();
        viewer.reset(new HostConnection(viewerConfig(pin)));
        if (!viewer->connect(LinkMode::LAN, resp, error)) viewer.reset();
    }
    ASSERT_TRUE(viewer) << error;
    ASSERT_TRUE(viewer->openChannels(nullptr));
    EXPECT_TRUE(pins.paused());

    const uint64_t held = pins.rotationCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    EXPECT_EQ(manager_->admission().state(), SessionState::Active);
    EXPECT_EQ(pins.rotationCount(), held);
    EXPECT_EQ(pins.current(), pin);

    viewer->close();
    ASSERT_TRUE(waitIdle(2000));
    EXPECT_FALSE(pins.paused());
    EXPECT_EQ(pins.rotationCount(), held + 1);
    if (pins.current() != pin) {
        EXPECT_EQ(manager_->auth().verifyPin(pin), AuthError::InvalidPin);
    }
}

// ---------------------------------------------------------------------------
// A stored certificate without its key is never sent
// ---------------------------------------------------------------------------
TEST_F(ScenarioTest, StoredCertificateWithoutKeyCannotLogIn) {
    test::TempDir certs;
    ViewerConfig vc = viewerConfig(currentPin());
    vc.cert_dir     = certs.path();
    vc.request_cert = true;
    {
        HostConnection viewer(vc);
        HandshakeResponse resp;
        std::string error;
        ASSERT_TRUE(viewer.connect(LinkMode::LAN, resp, error)) << error;
        ASSERT_TRUE(viewer.openChannels(nullptr));
        viewer.close();
    }
    ASSERT_TRUE(waitIdle(2000));
    ASSERT_EQ(std::remove(certs.file(CLIENT_KEY_FILE).c_str()), 0);

    const size_t launches = launcher_.launches();
    ViewerConfig cert_only = vc;
    cert_only.pin.clear();
    cert_only.request_cert = false;
    HostConnection viewer(cert_only);
    HandshakeResponse resp;
    std::string error;
    EXPECT_FALSE(viewer.connect(LinkMode::LAN, resp, error));
    EXPECT_EQ(error, "stored certificate key in " + certs.path() + " is unusable");
    EXPECT_EQ(launcher_.launches(), launches);
}

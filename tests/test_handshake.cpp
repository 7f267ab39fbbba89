#include <gtest/gtest.h>

#include <lp/control/handshake.h>

using namespace lp;

TEST(MonitorGeometry, ParsesSignedOffsets) {
    MonitorGeometry g;
    ASSERT_TRUE(MonitorGeometry::parse("2560x1440+1920+0", g));
    EXPECT_EQ(g.width, 2560u);
    EXPECT_EQ(g.height, 1440u);
    EXPECT_EQ(g.x, 1920);
    EXPECT_EQ(g.y, 0);

    ASSERT_TRUE(MonitorGeometry::parse("1280x1024-1280+0", g));
    EXPECT_EQ(g.x, -1280);
    EXPECT_EQ(g.toString(), "1280x1024-1280+0");

    EXPECT_FALSE(MonitorGeometry::parse("0x1080+0+0", g));
    EXPECT_FALSE(MonitorGeometry::parse("1920x1080", g));
    EXPECT_FALSE(MonitorGeometry::parse("axb+0+0", g));
}

TEST(MonitorGeometry, ListFormat) {
    std::vector<MonitorGeometry> list;
    ASSERT_TRUE(parseMonitorList("1920x1080+0+0;2560x1440+1920+0", list));
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(formatMonitorList(list), "1920x1080+0+0;2560x1440+1920+0");
    EXPECT_FALSE(parseMonitorList("", list));
}

TEST(PortMap, SerializesAllChannels) {
    PortMap p;
    EXPECT_EQ(p.serialize(),
              "video=5000,audio=6001,control=7000,clipboard=7002,file=7003,"
              "heartbeat=7004,gamepad=7005");

    PortMap q;
    ASSERT_TRUE(q.parse("video=9000,heartbeat=9004,extra=1"));
    EXPECT_EQ(q.video_base, 9000);
    EXPECT_EQ(q.heartbeat, 9004);
    EXPECT_EQ(q.audio, DEFAULT_AUDIO_PORT);
    EXPECT_FALSE(q.parse("video=70000"));
    EXPECT_FALSE(q.parse("video"));
}

TEST(HandshakeRequest, PinRequestWithCertUpgrade) {
    HandshakeRequest req;
    req.auth          = AuthMethod::Pin;
    req.pin           = "482193";
    req.monitors      = {0, 1};
    req.has_link_mode = true;
    req.link_mode     = LinkMode::WIFI;
    req.request_cert  = true;
    req.device_name   = "laptop";

    const std::string line = req.serialize();
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_EQ(line.find('\n'), line.size() - 1);

    HandshakeRequest parsed;
    ASSERT_TRUE(HandshakeRequest::parse(line, parsed));
    EXPECT_EQ(parsed.auth, AuthMethod::Pin);
    EXPECT_EQ(parsed.pin, "482193");
    EXPECT_EQ(parsed.monitors, (std::vector<uint32_t>{0, 1}));
    EXPECT_TRUE(parsed.has_link_mode);
    EXPECT_EQ(parsed.link_mode, LinkMode::WIFI);
    EXPECT_TRUE(parsed.request_cert);
    EXPECT_EQ(parsed.device_name, "laptop");
}

TEST(HandshakeRequest, CertificateLoginCarriesProof) {
    HandshakeRequest req;
    req.auth            = AuthMethod::Certificate;
    req.certificate_pem = "-----BEGIN CERTIFICATE-----\nAAAA\n-----END CERTIFICATE-----\n";
    req.fingerprint     = "ab12";
    req.proof_time_ms   = 1760000000123ULL;
    req.proof           = "3045022100ff";

    HandshakeRequest parsed;
    ASSERT_TRUE(HandshakeRequest::parse(req.serialize(), parsed));
    EXPECT_EQ(parsed.auth, AuthMethod::Certificate);
    EXPECT_EQ(parsed.certificate_pem, req.certificate_pem);
    EXPECT_EQ(parsed.proof_time_ms, 1760000000123ULL);
    EXPECT_EQ(parsed.proof, "3045022100ff");

    // Accepted without a proof; admission rejects it later.
    ASSERT_TRUE(HandshakeRequest::parse(
        R"({"version":1,"auth":"cert","certificate":"X","fingerprint":"Y"})", parsed));
    EXPECT_TRUE(parsed.proof.empty());
    EXPECT_EQ(parsed.proof_time_ms, 0u);

    EXPECT_EQ(certificateLoginMessage("ab12", 42), "linuxplay-cert-login:ab12:42");
}

TEST(HandshakeRequest, RejectsMalformed) {
    HandshakeRequest r;
    std::string why;
    EXPECT_FALSE(HandshakeRequest::parse("hello\n", r, &why));
    EXPECT_FALSE(HandshakeRequest::parse(R"({"version":2,"auth":"pin","pin":"1"})", r, &why));
    EXPECT_EQ(why, "unsupported version");
    EXPECT_FALSE(HandshakeRequest::parse(R"({"version":1,"auth":"pin"})", r, &why));
    EXPECT_FALSE(HandshakeRequest::parse(R"({"version":1,"auth":"magic"})", r, &why));
    EXPECT_FALSE(HandshakeRequest::parse(
        R"({"version":1,"auth":"pin","pin":"1","monitors":"0,x"})", r, &why));
    EXPECT_FALSE(HandshakeRequest::parse(
        R"({"version":1,"auth":"pin","pin":"1","net":"auto"})", r, &why));
    EXPECT_FALSE(HandshakeRequest::parse(
        R"({"version":1,"auth":"cert","certificate":"X","fingerprint":"Y","request_cert":true})",
        r, &why));
    EXPECT_FALSE(HandshakeRequest::parse(std::string(MAX_HANDSHAKE_BYTES + 1, ' '), r, &why));
}

TEST(HandshakeResponse, OkCarriesSessionAndBundle) {
    HandshakeResponse ok;
    ok.status     = HandshakeStatus::Ok;
    ok.encoder    = "h.264";
    ok.monitors   = {MonitorGeometry{}};
    ok.session_id = "abc123";
    ok.has_bundle = true;
    ok.bundle.client_cert_pem = "CERT\n";
    ok.bundle.client_key_pem  = "KEY\n";
    ok.bundle.host_ca_pem     = "CA\n";
    ok.bundle.fingerprint     = "AA:BB";

    HandshakeResponse parsed;
    ASSERT_TRUE(HandshakeResponse::parse(ok.serialize(), parsed));
    EXPECT_EQ(parsed.status, HandshakeStatus::Ok);
    EXPECT_EQ(parsed.encoder, "h.264");
    ASSERT_EQ(parsed.monitors.size(), 1u);
    EXPECT_EQ(parsed.monitors[0].toString(), "1920x1080+0+0");
    EXPECT_EQ(parsed.ports.video_base, DEFAULT_VIDEO_BASE_PORT);
    EXPECT_EQ(parsed.session_id, "abc123");
    ASSERT_TRUE(parsed.has_bundle);
    EXPECT_EQ(parsed.bundle.client_key_pem, "KEY\n");
    EXPECT_EQ(parsed.bundle.fingerprint, "AA:BB");
}

TEST(HandshakeResponse, FailureStatuses) {
    HandshakeResponse r;
    ASSERT_TRUE(HandshakeResponse::parse(HandshakeResponse::busy().serialize(), r));
    EXPECT_EQ(r.status, HandshakeStatus::Busy);

    ASSERT_TRUE(HandshakeResponse::parse(
        HandshakeResponse::authFailed(AuthError::Revoked).serialize(), r));
    EXPECT_EQ(r.status, HandshakeStatus::AuthFailed);
    EXPECT_EQ(r.auth_error, AuthError::Revoked);

    ASSERT_TRUE(HandshakeResponse::parse(
        HandshakeResponse::error(SESSION_START_FAILED).serialize(), r));
    EXPECT_EQ(r.status, HandshakeStatus::Error);
    EXPECT_EQ(r.error_reason, SESSION_START_FAILED);

    EXPECT_FALSE(HandshakeResponse::parse(R"({"status":"MAYBE"})", r));
    EXPECT_EQ(parseAuthError("garbled"), AuthError::UntrustedClient);
}

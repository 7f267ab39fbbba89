///////////////////////////////////////////////////////////////////////////////
// main.cpp -- Entry point for linuxplay-host
//
// Runs the host until SIGINT/SIGTERM.  The current PIN is logged each time
// it rotates; enter it on the viewer for a first connection.
//
// Administrative modes (no streaming):
//   --list-trusted          print the trusted client store
//   --revoke <fingerprint>  revoke one client certificate
//
// See --help for the full option list.
///////////////////////////////////////////////////////////////////////////////

#include <lp/common.h>

#include "auth/trust_store.h"
#include "capture/monitor_layout.h"
#include "config/host_config.h"
#include "input/clipboard_sync.h"
#include "input/input_injector.h"
#include "session/session_manager.h"
#include "stream/stream_launcher.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

using namespace lp::host;

// ---------------------------------------------------------------------------
// Signal handling
// ---------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void signalHandler(int) {
    g_shutdown_requested.store(true);
}

// ---------------------------------------------------------------------------
// Admin modes
// ---------------------------------------------------------------------------
static int runListTrusted(const HostConfig& config) {
    TrustStore store(config.state_dir + "/" + TrustStore::FILE_NAME);
    if (!store.load()) {
        std::fprintf(stderr, "Cannot read %s\n", store.path().c_str());
        return 1;
    }

    auto clients = store.list();
    if (clients.empty()) {
        std::printf("No trusted clients in %s\n", store.path().c_str());
        return 0;
    }
    for (const auto& c : clients) {
        std::printf("%-8s %s  %-24s %s\n",
                    c.revoked ? "revoked" : "trusted",
                    c.fingerprint.c_str(), c.common_name.c_str(), c.issued_on.c_str());
    }
    return 0;
}

static int runRevoke(const HostConfig& config, const std::string& fingerprint) {
    TrustStore store(config.state_dir + "/" + TrustStore::FILE_NAME);
    if (!store.load()) {
        std::fprintf(stderr, "Cannot read %s\n", store.path().c_str());
        return 1;
    }
    if (!store.revoke(fingerprint)) {
        std::fprintf(stderr, "No trusted client with fingerprint %s\n", fingerprint.c_str());
        return 1;
    }
    std::printf("Revoked %s\n", fingerprint.c_str());
    return 0;
}

// ---------------------------------------------------------------------------
// main()
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    HostConfig  config;
    HostOptions options;
    std::string error;

    if (!parseHostArgs(argc, argv, config, options, error)) {
        std::fprintf(stderr, "%s\n", error.c_str());
        printHostUsage(argv[0]);
        return 1;
    }
    if (options.command == HostCommand::Help) {
        printHostUsage(argv[0]);
        return 0;
    }

    config.resolvePaths();
    lp::globalLogLevel() = config.log_level;

    if (options.command == HostCommand::ListTrusted) return runListTrusted(config);
    if (options.command == HostCommand::Revoke) {
        return runRevoke(config, options.revoke_fingerprint);
    }

    LP_LOG(INFO, "linuxplay-host starting (state %s, uploads %s)",
           config.state_dir.c_str(), config.upload_dir.c_str());

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    // ---- Capture and encode ----
    auto monitors = detectMonitors(config.display);

    EncoderSettings enc;
    enc.codec        = config.encoder;
    enc.hwenc        = config.hwenc;
    enc.framerate    = config.framerate;
    enc.display      = config.display;
    enc.adaptive     = config.adaptive;
    enc.preset       = config.preset;
    enc.gop          = config.gop;
    enc.qp           = config.qp;
    enc.pix_fmt      = config.pix_fmt;
    enc.mtu          = config.mtu;
    enc.audio_source = config.audio_source;
    SubprocessLauncher launcher(enc);

    // ---- Input ----
    auto injector = createInputInjector(config.input, config.display);
    std::unique_ptr<IClipboardBackend> clipboard;
    if (config.clipboard) clipboard = std::make_unique<XclipClipboard>(config.display);

    // ---- Session manager ----
    SessionManager session(config, monitors, &launcher, injector.get(), std::move(clipboard));
    if (!session.initialize()) {
        LP_LOG(ERR, "Failed to initialize session manager");
        return 1;
    }
    if (!session.start()) {
        LP_LOG(ERR, "Failed to start handshake listener");
        return 1;
    }

    LP_LOG(INFO, "Waiting for a viewer on port %u", session.handshakePort());
    while (!g_shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ---- Clean shutdown ----
    LP_LOG(INFO, "Shutting down...");
    session.stop();
    injector->shutdown();

    LP_LOG(INFO, "linuxplay-host exiting");
    return 0;
}

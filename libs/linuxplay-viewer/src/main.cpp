///////////////////////////////////////////////////////////////////////////////
// main.cpp -- Entry point for linuxplay-viewer
//
// Connects to a host, announces the link type and plays each selected
// monitor in its own ffplay window until SIGINT, the host goes silent or
// every decoder window is closed.
///////////////////////////////////////////////////////////////////////////////

#include <lp/common.h>
#include <lp/util/child_process.h>

#include "config/viewer_options.h"
#include "decode/decoder_command.h"
#include "net/link_classifier.h"
#include "session/host_connection.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace lp;

static constexpr uint32_t DECODER_GRACE_MS = 1000;

static std::atomic<bool> g_shutdown_requested{false};

static void signalHandler(int) {
    g_shutdown_requested.store(true);
}

// ---------------------------------------------------------------------------
// Decoders
// ---------------------------------------------------------------------------
static bool launchDecoders(const ViewerConfig& config, const HandshakeResponse& session,
                           LinkMode mode,
                           std::vector<std::unique_ptr<ChildProcess>>& decoders) {
    DecoderSettings settings;
    settings.program = config.decoder;
    const BufferParams buffers = bufferParamsFor(mode);

    std::vector<uint32_t> indices = config.monitors;
    if (indices.empty()) {
        for (uint32_t i = 0; i < session.monitors.size(); ++i) indices.push_back(i);
    }

    for (uint32_t idx : indices) {
        if (idx >= session.monitors.size()) {
            LP_LOG(WARN, "Viewer: host has no monitor %u", idx);
            continue;
        }
        const uint16_t port = static_cast<uint16_t>(session.ports.video_base + idx);
        const std::string title = "LinuxPlay monitor " + std::to_string(idx) + " (" +
                                  session.monitors[idx].toString() + ")";

        auto proc = std::make_unique<ChildProcess>();
        if (!proc->start(buildVideoDecoderCommand(settings, port, buffers, title))) {
            LP_LOG(ERR, "Viewer: cannot start %s for monitor %u",
                   settings.program.c_str(), idx);
            return false;
        }
        LP_LOG(INFO, "Viewer: monitor %u on udp port %u", idx, port);
        decoders.push_back(std::move(proc));
    }

    if (config.audio) {
        auto proc = std::make_unique<ChildProcess>();
        if (proc->start(buildAudioDecoderCommand(settings, session.ports.audio, buffers))) {
            decoders.push_back(std::move(proc));
        } else {
            LP_LOG(WARN, "Viewer: audio decoder failed to start, continuing without audio");
        }
    }
    return !decoders.empty();
}

static bool anyRunning(std::vector<std::unique_ptr<ChildProcess>>& decoders) {
    bool running = false;
    for (auto& d : decoders) {
        int code = 0;
        if (d->running() && !d->poll(code)) running = true;
    }
    return running;
}

// ---------------------------------------------------------------------------
// main()
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    ViewerConfig  config;
    ViewerOptions options;
    std::string   error;

    if (!parseViewerArgs(argc, argv, config, options, error)) {
        std::fprintf(stderr, "%s\n", error.c_str());
        printViewerUsage(argv[0]);
        return 1;
    }
    if (options.help) {
        printViewerUsage(argv[0]);
        return 0;
    }
    lp::globalLogLevel() = options.log_level;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    const LinkMode mode = resolveLinkMode(config.link_mode, config.host);
    LP_LOG(INFO, "Viewer: connecting to %s:%u over %s",
           config.host.c_str(), config.handshake_port, linkModeName(mode));

    HostConnection connection(config);
    HandshakeResponse session;
    if (!connection.connect(mode, session, error)) {
        LP_LOG(ERR, "Viewer: connection refused: %s", error.c_str());
        return 1;
    }

    if (!connection.openChannels([] { g_shutdown_requested.store(true); })) {
        LP_LOG(ERR, "Viewer: cannot open session channels");
        connection.close();
        return 1;
    }
    connection.announceLink(mode);

    std::vector<std::unique_ptr<ChildProcess>> decoders;
    if (!launchDecoders(config, session, mode, decoders)) {
        for (auto& d : decoders) d->stop(DECODER_GRACE_MS);
        connection.close();
        return 1;
    }

    auto last_report = std::chrono::steady_clock::now();
    while (!g_shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (!anyRunning(decoders)) {
            LP_LOG(INFO, "Viewer: all decoder windows closed");
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_report >= std::chrono::seconds(10)) {
            last_report = now;
            StatsMessage stats;
            if (connection.lastStats(stats)) {
                LP_LOG(DEBUG, "Host: cpu %.1f%% gpu %.1f%% mem %.0f MB fps %.0f",
                       stats.cpu_percent, stats.gpu_percent, stats.mem_used_mb, stats.fps);
            }
        }
    }

    if (connection.hostLost()) LP_LOG(WARN, "Viewer: host stopped responding");

    connection.close();
    for (auto& d : decoders) d->stop(DECODER_GRACE_MS);

    LP_LOG(INFO, "linuxplay-viewer exiting");
    return 0;
}

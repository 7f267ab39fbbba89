///////////////////////////////////////////////////////////////////////////////
// stream_orchestrator.h -- Per-session channel lifecycle
//
// Owns every transport endpoint of the active session:
//
//   video[i]   ffmpeg sender -> client:video_base+i     (one per monitor)
//   audio      ffmpeg sender -> client:audio            (optional)
//   control    UDP receive   <- client
//   clipboard  UDP both ways
//   heartbeat  UDP both ways
//   gamepad    UDP receive   <- client
//   file       TCP listener  <- client
//
// startSession() opens all of them or none.  A supervisor thread polls the
// media senders every 200 ms and restarts a crashed one exactly once; a
// second crash, or a failed restart, is reported through the failure
// callback so the owner can tear the whole session down.  Link-mode and
// bitrate changes restart only the affected senders.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include "stream_launcher.h"
#include "session/session.h"
#include "channels/file_upload.h"

#include <lp/control/errors.h>
#include <lp/control/link_mode.h>
#include <lp/control/ports.h>
#include <lp/net/udp_channel.h>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lp::host {

struct OrchestratorConfig {
    std::string bind_address          = "0.0.0.0";
    PortMap     ports;
    bool        audio_enabled         = false;
    uint32_t    process_grace_ms      = 1500;
    uint32_t    supervise_interval_ms = 200;
    std::string upload_dir            = ".";
    uint64_t    max_upload_bytes      = DEFAULT_MAX_UPLOAD_BYTES;
};

class StreamOrchestrator {
public:
    /// Invoked on a channel's receive thread for every datagram.
    using DatagramHandler =
        std::function<void(ChannelType, const uint8_t* data, size_t len, const sockaddr_in& from)>;

    /// Invoked (once per session) when a channel is beyond recovery.
    using FailureCallback = std::function<void(ChannelType, TransportError)>;

    StreamOrchestrator(const OrchestratorConfig& config, IStreamLauncher* launcher);
    ~StreamOrchestrator();

    StreamOrchestrator(const StreamOrchestrator&) = delete;
    StreamOrchestrator& operator=(const StreamOrchestrator&) = delete;

    void setDatagramHandler(DatagramHandler handler) { datagram_handler_ = std::move(handler); }
    void setFailureCallback(FailureCallback cb) { failure_cb_ = std::move(cb); }

    /// Open the full channel set for \p session.  On failure everything
    /// opened so far is closed again and \p error says why.
    bool startSession(const Session& session, uint64_t bitrate_bits,
                      PortMap& advertised, TransportError& error);

    /// Terminate senders (SIGTERM, grace, SIGKILL), close sockets and join
    /// receive threads.  Idempotent.
    void stopSession();

    /// Restart the media senders with buffers for \p mode.  Returns false
    /// if there is no session or the mode is unchanged.
    bool applyLinkMode(LinkMode mode);

    /// Restart the video senders at \p bits.  Returns false if there is no
    /// session or the bitrate is unchanged.
    bool setBitrate(uint64_t bits);

    /// Send a datagram to the client on \p type.  The destination is the
    /// address the client last sent from on that channel, or the client IP
    /// and the configured port if it has not sent anything yet.
    bool sendToClient(ChannelType type, const std::string& payload);

    bool         active() const;
    uint16_t     boundPort(ChannelType type) const;
    size_t       mediaChannelCount() const;
    LinkMode     linkMode() const;
    BufferParams currentBuffers() const;
    uint64_t     bitrate() const;

private:
    struct MediaChannel {
        MediaLaunchRequest              request;
        std::unique_ptr<IStreamProcess> process;
        uint32_t                        restarts = 0;
    };

    bool openDatagramChannel(ChannelType type, uint16_t port);
    uint16_t clientPort(ChannelType type, uint32_t monitor_index = 0) const;

    /// Stop then relaunch the media channels selected by \p filter.  The
    /// senders are waited on without mutex_ held.  Caller holds
    /// restart_mutex_.
    void restartMedia(const std::function<bool(const MediaChannel&)>& filter);

    void supervisorLoop();
    void reportFailure(ChannelType type, TransportError error);

    static void stopProcesses(std::vector<MediaChannel>& media, uint32_t grace_ms);

    const OrchestratorConfig config_;
    IStreamLauncher*         launcher_;
    DatagramHandler          datagram_handler_;
    FailureCallback          failure_cb_;

    std::mutex               restart_mutex_;
    mutable std::mutex       mutex_;
    bool                     active_  = false;
    Session                  session_;
    LinkMode                 link_mode_ = LinkMode::LAN;
    BufferParams             buffers_;
    uint64_t                 bitrate_   = 0;
    std::vector<MediaChannel>                          media_;
    std::map<ChannelType, std::unique_ptr<UdpChannel>> datagram_;
    std::unique_ptr<FileUploadServer>                  upload_;
    bool                     failure_reported_ = false;

    std::mutex                         peers_mutex_;
    std::string                        client_ip_;
    std::map<ChannelType, sockaddr_in> client_peers_;

    std::atomic<bool>        supervising_{false};
    std::mutex               supervisor_mutex_;
    std::condition_variable  supervisor_cv_;
    std::thread              supervisor_;
};

} // namespace lp::host

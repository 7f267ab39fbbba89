///////////////////////////////////////////////////////////////////////////////
// stream_orchestrator.cpp -- Channel set start/stop, supervision, retuning
///////////////////////////////////////////////////////////////////////////////

#include "stream_orchestrator.h"

#include <lp/common.h>
#include <lp/util/bitrate.h>

#include <algorithm>
#include <chrono>

namespace lp::host {

StreamOrchestrator::StreamOrchestrator(const OrchestratorConfig& config,
                                       IStreamLauncher* launcher)
    : config_(config)
    , launcher_(launcher)
{
}

StreamOrchestrator::~StreamOrchestrator() {
    stopSession();
}

// ---------------------------------------------------------------------------
// Start
// ---------------------------------------------------------------------------
bool StreamOrchestrator::startSession(const Session& session, uint64_t bitrate_bits,
                                      PortMap& advertised, TransportError& error) {
    error = TransportError::None;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_) {
            LP_LOG(ERR, "Orchestrator: session %s already running", session_.id.c_str());
            error = TransportError::ChannelBindFailed;
            return false;
        }
        session_          = session;
        link_mode_        = (session.link_mode == LinkMode::WIFI) ? LinkMode::WIFI : LinkMode::LAN;
        buffers_          = bufferParamsFor(link_mode_);
        bitrate_          = bitrate_bits;
        failure_reported_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        client_ip_ = session.client_ip;
        client_peers_.clear();
    }

    auto rollback = [this]() {
        std::vector<MediaChannel> media;
        std::map<ChannelType, std::unique_ptr<UdpChannel>> datagram;
        std::unique_ptr<FileUploadServer> upload;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            media.swap(media_);
            datagram.swap(datagram_);
            upload = std::move(upload_);
        }
        stopProcesses(media, config_.process_grace_ms);
        for (auto& [type, channel] : datagram) channel->stop();
        if (upload) upload->stop();
    };

    // Datagram endpoints
    const std::pair<ChannelType, uint16_t> endpoints[] = {
        {ChannelType::Control,   config_.ports.control},
        {ChannelType::Clipboard, config_.ports.clipboard},
        {ChannelType::Heartbeat, config_.ports.heartbeat},
        {ChannelType::Gamepad,   config_.ports.gamepad},
    };
    for (const auto& [type, port] : endpoints) {
        if (!openDatagramChannel(type, port)) {
            rollback();
            error = TransportError::ChannelBindFailed;
            return false;
        }
    }

    // File upload endpoint
    auto upload = std::make_unique<FileUploadServer>(config_.upload_dir, config_.max_upload_bytes);
    if (!upload->start(config_.bind_address, config_.ports.file, session.client_ip)) {
        LP_LOG(ERR, "Orchestrator: file channel failed to start on port %u",
               config_.ports.file);
        rollback();
        error = TransportError::ChannelBindFailed;
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        upload_ = std::move(upload);
    }

    // Media senders
    std::vector<MediaChannel> media;
    for (size_t i = 0; i < session.monitor_indices.size(); ++i) {
        MediaChannel ch;
        ch.request.type          = ChannelType::Video;
        ch.request.monitor_index = session.monitor_indices[i];
        ch.request.monitor       = (i < session.monitors.size()) ? session.monitors[i]
                                                                 : MonitorGeometry{};
        ch.request.target.client_ip  = session.client_ip;
        ch.request.target.port       = clientPort(ChannelType::Video, ch.request.monitor_index);
        ch.request.target.buffers    = buffers_;
        ch.request.target.session_id = session.id;
        ch.request.bitrate_bits      = bitrate_bits;
        media.push_back(std::move(ch));
    }
    if (config_.audio_enabled) {
        MediaChannel ch;
        ch.request.type              = ChannelType::Audio;
        ch.request.target.client_ip  = session.client_ip;
        ch.request.target.port       = clientPort(ChannelType::Audio);
        ch.request.target.buffers    = buffers_;
        ch.request.target.session_id = session.id;
        media.push_back(std::move(ch));
    }

    for (auto& ch : media) {
        ch.process = launcher_ ? launcher_->launch(ch.request) : nullptr;
        if (!ch.process) {
            LP_LOG(ERR, "Orchestrator: failed to launch %s sender (monitor %u) -> %s:%u",
                   channelTypeName(ch.request.type), ch.request.monitor_index,
                   ch.request.target.client_ip.c_str(), ch.request.target.port);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                media_ = std::move(media);
            }
            rollback();
            error = TransportError::ChannelBindFailed;
            return false;
        }
    }

    const size_t media_count = media.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        media_  = std::move(media);
        active_ = true;

        advertised            = config_.ports;
        advertised.control    = datagram_[ChannelType::Control]->boundPort();
        advertised.clipboard  = datagram_[ChannelType::Clipboard]->boundPort();
        advertised.heartbeat  = datagram_[ChannelType::Heartbeat]->boundPort();
        advertised.gamepad    = datagram_[ChannelType::Gamepad]->boundPort();
        advertised.file       = upload_->boundPort();
    }

    supervising_.store(true);
    supervisor_ = std::thread(&StreamOrchestrator::supervisorLoop, this);

    LP_LOG(INFO, "Orchestrator: session %s streaming to %s (%zu media, %s link, %s)",
           session.id.c_str(), session.client_ip.c_str(), media_count,
           linkModeName(link_mode_), advertised.serialize().c_str());
    return true;
}

bool StreamOrchestrator::openDatagramChannel(ChannelType type, uint16_t port) {
    auto channel = std::make_unique<UdpChannel>();
    if (!channel->bind(config_.bind_address, port)) {
        LP_LOG(ERR, "Orchestrator: %s channel failed to bind %s:%u",
               channelTypeName(type), config_.bind_address.c_str(), port);
        return false;
    }

    bool started = channel->start(
        [this, type](const uint8_t* data, size_t len, const sockaddr_in& from) {
            {
                std::lock_guard<std::mutex> lock(peers_mutex_);
                if (addrToString(from) != client_ip_) {
                    LP_LOG(DEBUG, "Orchestrator: dropped %s datagram from %s",
                           channelTypeName(type), addrToString(from).c_str());
                    return;
                }
                client_peers_[type] = from;
            }
            if (datagram_handler_) datagram_handler_(type, data, len, from);
        });
    if (!started) {
        LP_LOG(ERR, "Orchestrator: %s channel receive thread failed", channelTypeName(type));
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    datagram_[type] = std::move(channel);
    return true;
}

uint16_t StreamOrchestrator::clientPort(ChannelType type, uint32_t monitor_index) const {
    switch (type) {
        case ChannelType::Video:     return static_cast<uint16_t>(config_.ports.video_base + monitor_index);
        case ChannelType::Audio:     return config_.ports.audio;
        case ChannelType::Control:   return config_.ports.control;
        case ChannelType::Clipboard: return config_.ports.clipboard;
        case ChannelType::File:      return config_.ports.file;
        case ChannelType::Heartbeat: return config_.ports.heartbeat;
        case ChannelType::Gamepad:   return config_.ports.gamepad;
    }
    return 0;
}

// ---------------------------------------------------------------------------
// Stop
// ---------------------------------------------------------------------------
void StreamOrchestrator::stopSession() {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return;
        active_    = false;
        session_id = session_.id;
    }

    supervising_.store(false);
    supervisor_cv_.notify_all();
    if (supervisor_.joinable()) supervisor_.join();

    std::vector<MediaChannel> media;
    std::map<ChannelType, std::unique_ptr<UdpChannel>> datagram;
    std::unique_ptr<FileUploadServer> upload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        media.swap(media_);
        datagram.swap(datagram_);
        upload = std::move(upload_);
    }

    stopProcesses(media, config_.process_grace_ms);
    for (auto& [type, channel] : datagram) channel->stop();
    if (upload) upload->stop();

    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        client_ip_.clear();
        client_peers_.clear();
    }

    LP_LOG(INFO, "Orchestrator: session %s stopped", session_id.c_str());
}

void StreamOrchestrator::stopProcesses(std::vector<MediaChannel>& media, uint32_t grace_ms) {
    // SIGTERM everything first so all senders share one grace period.
    for (auto& ch : media) {
        if (ch.process) ch.process->terminate();
    }

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(grace_ms);
    for (auto& ch : media) {
        if (!ch.process) continue;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        ch.process->stop(static_cast<uint32_t>(std::max<int64_t>(0, left)));
        ch.process.reset();
    }
}

// ---------------------------------------------------------------------------
// Retuning
// ---------------------------------------------------------------------------
void StreamOrchestrator::restartMedia(
        const std::function<bool(const MediaChannel&)>& filter) {
    std::vector<MediaChannel> retired;
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return;
        session_id = session_.id;
        for (auto& ch : media_) {
            if (!filter(ch) || !ch.process) continue;
            MediaChannel old;
            old.request = ch.request;
            old.process = std::move(ch.process);
            retired.push_back(std::move(old));
        }
    }

    // Sends and accessors keep going while the old senders wind down.
    stopProcesses(retired, config_.process_grace_ms);

    bool        any_failed = false;
    ChannelType failed     = ChannelType::Video;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || session_.id != session_id) return;

        for (auto& ch : media_) {
            if (!filter(ch)) continue;
            ch.request.target.buffers = buffers_;
            if (ch.request.type == ChannelType::Video) ch.request.bitrate_bits = bitrate_;
            ch.restarts = 0;
            ch.process  = launcher_->launch(ch.request);
            if (!ch.process && !any_failed) {
                LP_LOG(ERR, "Orchestrator: %s sender (monitor %u) failed to relaunch",
                       channelTypeName(ch.request.type), ch.request.monitor_index);
                failed     = ch.request.type;
                any_failed = true;
            }
        }
    }

    if (any_failed) reportFailure(failed, TransportError::ProcessExitedUnexpectedly);
}

bool StreamOrchestrator::applyLinkMode(LinkMode mode) {
    if (mode == LinkMode::AUTO) mode = LinkMode::LAN;

    std::lock_guard<std::mutex> restart(restart_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || mode == link_mode_) return false;

        LP_LOG(INFO, "Orchestrator: link %s -> %s, restarting media senders",
               linkModeName(link_mode_), linkModeName(mode));
        link_mode_ = mode;
        buffers_   = bufferParamsFor(mode);
    }

    restartMedia([](const MediaChannel&) { return true; });
    return true;
}

bool StreamOrchestrator::setBitrate(uint64_t bits) {
    std::lock_guard<std::mutex> restart(restart_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || bits == bitrate_) return false;

        LP_LOG(INFO, "Orchestrator: bitrate %s -> %s, restarting video senders",
               formatBits(bitrate_).c_str(), formatBits(bits).c_str());
        bitrate_ = bits;
    }

    restartMedia([](const MediaChannel& ch) { return ch.request.type == ChannelType::Video; });
    return true;
}

// ---------------------------------------------------------------------------
// Supervision
// ---------------------------------------------------------------------------
void StreamOrchestrator::supervisorLoop() {
    while (supervising_.load()) {
        {
            std::unique_lock<std::mutex> lock(supervisor_mutex_);
            supervisor_cv_.wait_for(lock,
                                    std::chrono::milliseconds(config_.supervise_interval_ms),
                                    [this] { return !supervising_.load(); });
        }
        if (!supervising_.load()) break;

        bool        failed      = false;
        ChannelType failed_type = ChannelType::Video;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_) continue;

            for (auto& ch : media_) {
                if (!ch.process) continue;

                int exit_code = 0;
                if (!ch.process->poll(exit_code)) continue;
                ch.process.reset();

                if (ch.restarts == 0) {
                    LP_LOG(WARN, "Orchestrator: %s sender (monitor %u) exited with %d, restarting",
                           channelTypeName(ch.request.type), ch.request.monitor_index, exit_code);
                    ch.restarts = 1;
                    ch.process  = launcher_->launch(ch.request);
                    if (ch.process) continue;
                    LP_LOG(ERR, "Orchestrator: %s sender (monitor %u) failed to relaunch",
                           channelTypeName(ch.request.type), ch.request.monitor_index);
                } else {
                    LP_LOG(ERR, "Orchestrator: %s sender (monitor %u) exited again with %d",
                           channelTypeName(ch.request.type), ch.request.monitor_index, exit_code);
                }

                if (!failed) {
                    failed      = true;
                    failed_type = ch.request.type;
                }
            }
        }

        if (failed) reportFailure(failed_type, TransportError::ProcessExitedUnexpectedly);
    }
}

void StreamOrchestrator::reportFailure(ChannelType type, TransportError error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure_reported_) return;
        failure_reported_ = true;
    }
    LP_LOG(ERR, "Orchestrator: %s channel failed: %s",
           channelTypeName(type), transportErrorName(error));
    if (failure_cb_) failure_cb_(type, error);
}

// ---------------------------------------------------------------------------
// Client traffic and accessors
// ---------------------------------------------------------------------------
bool StreamOrchestrator::sendToClient(ChannelType type, const std::string& payload) {
    UdpChannel* channel = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) return false;
        auto it = datagram_.find(type);
        if (it == datagram_.end()) return false;
        channel = it->second.get();
    }

    std::string ip;
    uint16_t    port = 0;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = client_peers_.find(type);
        if (it != client_peers_.end()) {
            ip   = addrToString(it->second);
            port = ntohs(it->second.sin_port);
        } else {
            ip   = client_ip_;
            port = clientPort(type);
        }
    }

    // Channels are only destroyed by stopSession(), which the session
    // manager never runs concurrently with its own sends.
    return channel->sendTo(ip, port, payload);
}

bool StreamOrchestrator::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

uint16_t StreamOrchestrator::boundPort(ChannelType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (type == ChannelType::File) return upload_ ? upload_->boundPort() : 0;
    auto it = datagram_.find(type);
    return (it != datagram_.end()) ? it->second->boundPort() : 0;
}

size_t StreamOrchestrator::mediaChannelCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(media_.begin(), media_.end(),
        [](const MediaChannel& ch) { return ch.process != nullptr; }));
}

LinkMode StreamOrchestrator::linkMode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return link_mode_;
}

BufferParams StreamOrchestrator::currentBuffers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffers_;
}

uint64_t StreamOrchestrator::bitrate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bitrate_;
}

} // namespace lp::host

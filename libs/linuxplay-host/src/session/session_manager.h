///////////////////////////////////////////////////////////////////////////////
// session_manager.h -- Top-level owner of the LinuxPlay host
//
// Owns and coordinates every session component: authentication, the
// admission slot, the handshake endpoint, the stream orchestrator, the
// heartbeat monitor, bitrate strategy, input injection, clipboard sync and
// stats reporting.
//
// Lifecycle:
//   1. initialize()  -- load/create the CA and trust store, start PIN rotation
//   2. start()       -- listen for handshakes, start the event loop
//   3. stop()        -- end any session, stop listening, stop PIN rotation
//
// Every teardown runs on the event-loop thread.  Receive threads, the
// heartbeat timer and the process supervisor only post events:
//
//   HeartbeatLost   heartbeat window lapsed      -> onHeartbeatTimeout()
//   Goodbye         client sent GOODBYE          -> onDisconnect()
//   ChannelFailed   sender died twice            -> onDisconnect()
//   LinkChanged     client sent NET LAN|WIFI     -> retune media senders
//   BitrateTick     once per second              -> IBitrateStrategy
//
// Events carry the id of the session they were raised for and are dropped
// if that session is no longer the active one.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include "admission_controller.h"
#include "handshake_server.h"
#include "heartbeat_monitor.h"

#include "auth/auth_manager.h"
#include "config/host_config.h"
#include "input/clipboard_sync.h"
#include "input/gamepad_mapper.h"
#include "input/input_injector.h"
#include "qos/bitrate_strategy.h"
#include "stats/stats_reporter.h"
#include "stream/stream_orchestrator.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lp::host {

enum class SessionEventType {
    HeartbeatLost,
    Goodbye,
    ChannelFailed,
    LinkChanged,
    BitrateTick,
};

const char* sessionEventName(SessionEventType type);

struct SessionEvent {
    SessionEventType type = SessionEventType::BitrateTick;
    std::string      session_id;
    LinkMode         link_mode = LinkMode::LAN;
};

class SessionManager {
public:
    static constexpr uint32_t BITRATE_TICK_MS = 1000;

    /// \p launcher and \p injector must outlive the manager.  A null
    /// \p clipboard disables clipboard sync.
    SessionManager(const HostConfig& config,
                   std::vector<MonitorGeometry> monitors,
                   IStreamLauncher* launcher,
                   IInputInjector* injector,
                   std::unique_ptr<IClipboardBackend> clipboard);
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    bool initialize();
    bool start();
    void stop();

    /// Queue an event for the event loop.
    void post(SessionEvent event);

    uint16_t handshakePort() const { return handshake_.boundPort(); }

    AuthManager&         auth()         { return auth_; }
    AdmissionController& admission()    { return admission_; }
    StreamOrchestrator&  orchestrator() { return orchestrator_; }
    HeartbeatMonitor&    heartbeat()    { return heartbeat_; }

private:
    // Admission hooks
    bool startChannels(const Session& session, PortMap& ports, TransportError& error);
    void stopChannels(const Session& session);

    // Receive-thread dispatch
    void onDatagram(ChannelType type, const uint8_t* data, size_t len);
    void onControl(const std::string& text);
    void onGamepad(const uint8_t* data, size_t len);

    // Heartbeat timer thread
    void sendPing();

    void eventLoop();
    void handleEvent(const SessionEvent& event);
    std::string activeSessionId() const;

    const HostConfig        config_;
    IInputInjector*         injector_;

    AuthManager             auth_;
    AdmissionController     admission_;
    StreamOrchestrator      orchestrator_;
    HeartbeatMonitor        heartbeat_;
    HandshakeServer         handshake_;
    StatsReporter           stats_;
    std::unique_ptr<ClipboardSync> clipboard_;

    std::mutex              bitrate_mutex_;
    std::unique_ptr<IBitrateStrategy> bitrate_;

    std::mutex              gamepad_mutex_;
    GamepadMapper           gamepad_;

    mutable std::mutex      session_id_mutex_;
    std::string             session_id_;        // set while channels are up

    std::mutex              events_mutex_;
    std::condition_variable events_cv_;
    std::deque<SessionEvent> events_;
    std::atomic<bool>       running_{false};
    std::thread             event_thread_;
};

} // namespace lp::host

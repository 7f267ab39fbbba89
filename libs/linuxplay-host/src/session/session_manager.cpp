///////////////////////////////////////////////////////////////////////////////
// session_manager.cpp -- Component wiring and the teardown event loop
///////////////////////////////////////////////////////////////////////////////

#include "session_manager.h"

#include <lp/common.h>
#include <lp/control/control_message.h>
#include <lp/util/bitrate.h>

#include <chrono>

namespace lp::host {

namespace {

AuthConfig makeAuthConfig(const HostConfig& c) {
    AuthConfig ac;
    ac.state_dir     = c.state_dir;
    ac.pin_rotate_ms = c.pin_rotate_ms;
    return ac;
}

OrchestratorConfig makeOrchestratorConfig(const HostConfig& c) {
    OrchestratorConfig oc;
    oc.bind_address     = c.bind_address;
    oc.ports            = c.ports;
    oc.audio_enabled    = c.audio;
    oc.process_grace_ms = c.process_grace_ms;
    oc.upload_dir       = c.upload_dir;
    oc.max_upload_bytes = c.max_upload_bytes;
    return oc;
}

HeartbeatConfig makeHeartbeatConfig(const HostConfig& c) {
    HeartbeatConfig hc;
    hc.interval_ms = c.heartbeat_interval_ms;
    hc.timeout_ms  = c.heartbeat_timeout_ms;
    return hc;
}

} // anonymous namespace

const char* sessionEventName(SessionEventType type) {
    switch (type) {
        case SessionEventType::HeartbeatLost: return "HeartbeatLost";
        case SessionEventType::Goodbye:       return "Goodbye";
        case SessionEventType::ChannelFailed: return "ChannelFailed";
        case SessionEventType::LinkChanged:   return "LinkChanged";
        case SessionEventType::BitrateTick:   return "BitrateTick";
    }
    return "Unknown";
}

SessionManager::SessionManager(const HostConfig& config,
                               std::vector<MonitorGeometry> monitors,
                               IStreamLauncher* launcher,
                               IInputInjector* injector,
                               std::unique_ptr<IClipboardBackend> clipboard)
    : config_(config)
    , injector_(injector)
    , auth_(makeAuthConfig(config))
    , admission_(&auth_, std::move(monitors), config.encoder)
    , orchestrator_(makeOrchestratorConfig(config), launcher)
    , heartbeat_(makeHeartbeatConfig(config),
                 [this]() { sendPing(); },
                 [this]() {
                     SessionEvent ev;
                     ev.type       = SessionEventType::HeartbeatLost;
                     ev.session_id = activeSessionId();
                     post(ev);
                 })
    , handshake_(&admission_)
    , bitrate_(createBitrateStrategy(config.adaptive, config.bitrate_bits,
                                     config.adaptive_low_bits, config.adaptive_period_secs))
{
    if (clipboard) clipboard_ = std::make_unique<ClipboardSync>(std::move(clipboard));
}

SessionManager::~SessionManager() {
    stop();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
bool SessionManager::initialize() {
    auth_.pins().setRotateCallback([](const std::string& pin) {
        LP_LOG(INFO, "Session PIN: %s", pin.c_str());
    });

    if (!auth_.initialize()) {
        LP_LOG(ERR, "SessionManager: authentication setup failed");
        return false;
    }

    AdmissionHooks hooks;
    hooks.start_channels = [this](const Session& s, PortMap& ports, TransportError& err) {
        return startChannels(s, ports, err);
    };
    hooks.stop_channels     = [this](const Session& s) { stopChannels(s); };
    admission_.setHooks(std::move(hooks));
    admission_.setReconnectCooldownMs(config_.reconnect_cooldown_ms);

    orchestrator_.setDatagramHandler(
        [this](ChannelType type, const uint8_t* data, size_t len, const sockaddr_in&) {
            onDatagram(type, data, len);
        });
    orchestrator_.setFailureCallback([this](ChannelType type, TransportError err) {
        LP_LOG(WARN, "SessionManager: %s channel lost (%s)",
               channelTypeName(type), transportErrorName(err));
        SessionEvent ev;
        ev.type       = SessionEventType::ChannelFailed;
        ev.session_id = activeSessionId();
        post(ev);
    });

    LP_LOG(INFO, "SessionManager: bitrate %s (%s), heartbeat %u/%u ms",
           formatBits(config_.bitrate_bits).c_str(), bitrate_->name(),
           config_.heartbeat_interval_ms, config_.heartbeat_timeout_ms);
    return true;
}

bool SessionManager::start() {
    if (running_.load()) return false;

    running_.store(true);
    event_thread_ = std::thread(&SessionManager::eventLoop, this);

    if (!handshake_.start(config_.bind_address, config_.handshake_port)) {
        running_.store(false);
        events_cv_.notify_all();
        event_thread_.join();
        return false;
    }
    return true;
}

void SessionManager::stop() {
    handshake_.stop();

    if (running_.exchange(false)) {
        events_cv_.notify_all();
        if (event_thread_.joinable()) event_thread_.join();
    }

    // Runs on the caller's thread now that the event loop is gone.
    admission_.onDisconnect();
    auth_.shutdown();
}

void SessionManager::post(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        events_.push_back(std::move(event));
    }
    events_cv_.notify_one();
}

std::string SessionManager::activeSessionId() const {
    std::lock_guard<std::mutex> lock(session_id_mutex_);
    return session_id_;
}

// ---------------------------------------------------------------------------
// Admission hooks
// ---------------------------------------------------------------------------
bool SessionManager::startChannels(const Session& session, PortMap& ports,
                                   TransportError& error) {
    uint64_t bits = 0;
    {
        std::lock_guard<std::mutex> lock(bitrate_mutex_);
        bits = bitrate_->startSession(getTimestampUs());
    }

    if (!orchestrator_.startSession(session, bits, ports, error)) return false;

    {
        std::lock_guard<std::mutex> lock(session_id_mutex_);
        session_id_ = session.id;
    }
    {
        std::lock_guard<std::mutex> lock(gamepad_mutex_);
        gamepad_.reset();
    }

    // Before the slot turns Active, so a PIN shown to the user cannot
    // rotate under a connected session.
    auth_.pins().pause();
    heartbeat_.start();

    if (clipboard_) {
        clipboard_->start([this](const std::string& datagram) {
            orchestrator_.sendToClient(ChannelType::Clipboard, datagram);
        });
    }
    return true;
}

void SessionManager::stopChannels(const Session& session) {
    heartbeat_.stop();
    if (clipboard_) clipboard_->stop();
    orchestrator_.stopSession();

    {
        std::lock_guard<std::mutex> lock(session_id_mutex_);
        session_id_.clear();
    }

    // Pairs with the pause in startChannels(); the next client needs a new PIN.
    auth_.pins().resume();
    LP_LOG(INFO, "SessionManager: channels for %s closed", session.id.c_str());
}

// ---------------------------------------------------------------------------
// Datagrams
// ---------------------------------------------------------------------------
void SessionManager::onDatagram(ChannelType type, const uint8_t* data, size_t len) {
    switch (type) {
        case ChannelType::Heartbeat: {
            std::string text(reinterpret_cast<const char*>(data), len);
            while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
            if (text == HEARTBEAT_PONG) {
                const uint64_t now = getTimestampUs();
                heartbeat_.onAck(now);
                admission_.touchHeartbeat(now);
            }
            break;
        }
        case ChannelType::Control:
            onControl(std::string(reinterpret_cast<const char*>(data), len));
            break;
        case ChannelType::Clipboard:
            if (clipboard_) clipboard_->onDatagram(data, len);
            break;
        case ChannelType::Gamepad:
            onGamepad(data, len);
            break;
        default:
            break;
    }
}

void SessionManager::onControl(const std::string& text) {
    ControlMessage msg;
    if (!ControlMessage::parse(text, msg)) {
        LP_LOG(DEBUG, "SessionManager: unrecognised control message '%.40s'", text.c_str());
        return;
    }

    if (msg.kind == ControlKind::Net || msg.kind == ControlKind::Goodbye) {
        SessionEvent ev;
        ev.type       = (msg.kind == ControlKind::Net) ? SessionEventType::LinkChanged
                                                       : SessionEventType::Goodbye;
        ev.session_id = activeSessionId();
        ev.link_mode  = msg.link_mode;
        post(ev);
        return;
    }

    if (injector_) dispatchControl(*injector_, msg);
}

void SessionManager::onGamepad(const uint8_t* data, size_t len) {
    std::vector<GamepadEvent> in;
    decodeGamepadEvents(data, len, in);
    if (in.empty() || !injector_) return;

    std::vector<GamepadEvent> out;
    {
        std::lock_guard<std::mutex> lock(gamepad_mutex_);
        for (const auto& ev : in) gamepad_.map(ev, out);
    }
    for (const auto& ev : out) injector_->injectGamepad(ev);
}

void SessionManager::sendPing() {
    orchestrator_.sendToClient(ChannelType::Heartbeat, HEARTBEAT_PING);

    StatsMessage stats = stats_.sample(orchestrator_.active()
                                           ? static_cast<float>(config_.framerate)
                                           : 0.0f);
    orchestrator_.sendToClient(ChannelType::Heartbeat, stats.serialize());
}

// ---------------------------------------------------------------------------
// Event loop
// ---------------------------------------------------------------------------
void SessionManager::eventLoop() {
    auto next_tick = std::chrono::steady_clock::now() +
                     std::chrono::milliseconds(BITRATE_TICK_MS);

    while (running_.load()) {
        std::deque<SessionEvent> batch;
        {
            std::unique_lock<std::mutex> lock(events_mutex_);
            events_cv_.wait_until(lock, next_tick, [this] {
                return !events_.empty() || !running_.load();
            });
            batch.swap(events_);
        }
        if (!running_.load()) break;

        if (std::chrono::steady_clock::now() >= next_tick) {
            next_tick += std::chrono::milliseconds(BITRATE_TICK_MS);
            SessionEvent tick;
            tick.type       = SessionEventType::BitrateTick;
            tick.session_id = activeSessionId();
            batch.push_back(tick);
        }

        for (const auto& ev : batch) handleEvent(ev);
    }
}

void SessionManager::handleEvent(const SessionEvent& event) {
    Session active;
    if (!admission_.activeSession(active) || event.session_id != active.id) {
        if (event.type != SessionEventType::BitrateTick) {
            LP_LOG(DEBUG, "SessionManager: dropped stale %s event",
                   sessionEventName(event.type));
        }
        return;
    }

    switch (event.type) {
        case SessionEventType::HeartbeatLost:
            LP_LOG(WARN, "SessionManager: no heartbeat from %s for %u ms",
                   active.client_ip.c_str(), config_.heartbeat_timeout_ms);
            admission_.onHeartbeatTimeout();
            break;

        case SessionEventType::Goodbye:
            LP_LOG(INFO, "SessionManager: %s said goodbye", active.client_ip.c_str());
            admission_.onDisconnect();
            break;

        case SessionEventType::ChannelFailed:
            admission_.onDisconnect();
            break;

        case SessionEventType::LinkChanged:
            if (admission_.setLinkMode(event.link_mode)) {
                orchestrator_.applyLinkMode(event.link_mode);
            }
            break;

        case SessionEventType::BitrateTick: {
            uint64_t bits = 0;
            bool changed = false;
            {
                std::lock_guard<std::mutex> lock(bitrate_mutex_);
                changed = bitrate_->onTick(getTimestampUs(), bits);
            }
            if (changed) orchestrator_.setBitrate(bits);
            break;
        }
    }
}

} // namespace lp::host

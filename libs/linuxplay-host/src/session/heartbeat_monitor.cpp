///////////////////////////////////////////////////////////////////////////////
// heartbeat_monitor.cpp -- Heartbeat PING / timeout implementation
///////////////////////////////////////////////////////////////////////////////

#include "heartbeat_monitor.h"

#include <lp/common.h>

#include <algorithm>
#include <chrono>

namespace lp::host {

HeartbeatMonitor::HeartbeatMonitor(const HeartbeatConfig& config, PingFunc ping,
                                   TimeoutFunc on_timeout)
    : config_(config)
    , ping_(std::move(ping))
    , on_timeout_(std::move(on_timeout))
{
}

HeartbeatMonitor::~HeartbeatMonitor() {
    stop();
}

void HeartbeatMonitor::reset(uint64_t now_us) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_ack_us_   = now_us;
    next_ping_us_ = now_us;    // first PING goes out immediately
    expired_       = false;
}

void HeartbeatMonitor::start() {
    stop();
    reset(getTimestampUs());
    pings_sent_.store(0);
    running_.store(true);
    thread_ = std::thread(&HeartbeatMonitor::timerLoop, this);
    LP_LOG(DEBUG, "Heartbeat: started (interval=%ums timeout=%ums)",
           config_.interval_ms, config_.timeout_ms);
}

void HeartbeatMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false) && !thread_.joinable()) return;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    LP_LOG(DEBUG, "Heartbeat: stopped");
}

void HeartbeatMonitor::onAck() {
    onAck(getTimestampUs());
}

void HeartbeatMonitor::onAck(uint64_t now_us) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (expired_) return;
    last_ack_us_ = std::max(last_ack_us_, now_us);
}

bool HeartbeatMonitor::poll(uint64_t now_us) {
    bool send_ping = false;
    bool fire       = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (expired_) return false;

        if (now_us > last_ack_us_ &&
            now_us - last_ack_us_ > static_cast<uint64_t>(config_.timeout_ms) * 1000) {
            expired_ = true;
            fire     = true;
        } else if (now_us >= next_ping_us_) {
            next_ping_us_ = now_us + static_cast<uint64_t>(config_.interval_ms) * 1000;
            send_ping     = true;
        }
    }

    if (send_ping && ping_) {
        pings_sent_.fetch_add(1);
        ping_();
    }
    if (fire) {
        LP_LOG(WARN, "Heartbeat: no ack for %u ms, session lost", config_.timeout_ms);
        if (on_timeout_) on_timeout_();
    }
    return fire;
}

bool HeartbeatMonitor::expired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return expired_;
}

uint64_t HeartbeatMonitor::lastAckUs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_ack_us_;
}

void HeartbeatMonitor::timerLoop() {
    const auto tick = std::chrono::milliseconds(std::max<uint32_t>(1, config_.tick_ms));
    while (running_.load()) {
        poll(getTimestampUs());
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, tick, [this] { return !running_.load(); });
    }
}

} // namespace lp::host

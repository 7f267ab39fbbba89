///////////////////////////////////////////////////////////////////////////////
// heartbeat_monitor.h -- Session liveness check
//
// While running, sends a PING every interval and expects an ack within
// the timeout window.  When the window lapses the timeout callback fires
// exactly once; the monitor then stays expired until the next start().
//
// Timers are reset on every start() so nothing carries over between
// sessions.  poll() is the whole state machine and can be driven directly
// with synthetic timestamps.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace lp::host {

struct HeartbeatConfig {
    uint32_t interval_ms = 1000;
    uint32_t timeout_ms  = 10000;
    uint32_t tick_ms     = 100;     // timer thread resolution
};

class HeartbeatMonitor {
public:
    using PingFunc    = std::function<void()>;
    using TimeoutFunc = std::function<void()>;

    HeartbeatMonitor(const HeartbeatConfig& config, PingFunc ping, TimeoutFunc on_timeout);
    ~HeartbeatMonitor();

    HeartbeatMonitor(const HeartbeatMonitor&) = delete;
    HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

    /// Reset timers and start the timer thread.
    void start();

    /// Stop the timer thread.  Safe to call from any thread except the
    /// timer thread itself.
    void stop();

    /// Record an ack from the client.
    void onAck();
    void onAck(uint64_t now_us);

    /// Advance the state machine to \p now_us: send a PING if one is due
    /// and detect expiry.  Returns true only on the call that expired.
    bool poll(uint64_t now_us);

    /// Reset timers to \p now_us without starting the thread.
    void reset(uint64_t now_us);

    bool     running() const { return running_.load(); }
    bool     expired() const;
    uint64_t lastAckUs() const;
    uint64_t pingsSent() const { return pings_sent_.load(); }

    const HeartbeatConfig& config() const { return config_; }

private:
    void timerLoop();

    const HeartbeatConfig   config_;
    PingFunc                ping_;
    TimeoutFunc             on_timeout_;

    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    uint64_t                last_ack_us_    = 0;
    uint64_t                next_ping_us_   = 0;
    bool                    expired_        = false;

    std::atomic<bool>       running_{false};
    std::atomic<uint64_t>   pings_sent_{0};
    std::thread             thread_;
};

} // namespace lp::host

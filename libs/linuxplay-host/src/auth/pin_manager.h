///////////////////////////////////////////////////////////////////////////////
// pin_manager.h -- Rotating numeric PIN for first-contact authentication
//
// The PIN is drawn from the OpenSSL CSPRNG and replaced on a fixed interval
// by a background thread.  Rotation is paused while a session is active so
// the code shown on the host does not change under a connected user; resume
// issues a fresh PIN and restarts the interval.
//
// Single writer (the rotation thread, or rotateNow()), many readers.
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <lp/control/errors.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace lp::host {

class PinManager {
public:
    static constexpr uint32_t PIN_DIGITS              = 6;
    static constexpr uint32_t DEFAULT_ROTATE_INTERVAL = 30'000;  // ms

    /// Invoked (on the writer's thread) with every newly generated PIN.
    using RotateCallback = std::function<void(const std::string& pin)>;

    explicit PinManager(uint32_t rotate_interval_ms = DEFAULT_ROTATE_INTERVAL);
    ~PinManager();

    PinManager(const PinManager&) = delete;
    PinManager& operator=(const PinManager&) = delete;

    /// Generate the first PIN and start the rotation thread.
    bool start();

    /// Stop the rotation thread.  The current PIN stays readable.
    void stop();

    /// Replace the PIN immediately.  Returns false if the CSPRNG failed.
    bool rotateNow();

    /// Stop rotating until resume().  Idempotent.
    void pause();

    /// Issue a new PIN and restart the interval.  A no-op unless paused.
    void resume();

    /// Timing-safe comparison against the current PIN.
    /// Returns AuthError::None on a match.
    AuthError verify(const std::string& candidate) const;

    std::string current() const;
    bool        paused() const;
    uint64_t    rotationCount() const { return rotations_.load(); }
    uint32_t    rotateIntervalMs() const { return interval_ms_; }

    void setRotateCallback(RotateCallback cb);

    /// Uniformly random zero-padded decimal string of \p digits digits
    /// (1..9).  Returns false if the CSPRNG failed.
    static bool generatePin(uint32_t digits, std::string& out);

private:
    using Clock = std::chrono::steady_clock;

    void rotationLoop();
    bool rotateLocked();

    const uint32_t            interval_ms_;

    mutable std::mutex        mutex_;
    std::condition_variable   cv_;
    std::string               pin_;
    Clock::time_point         generated_at_{};
    bool                      paused_  = false;
    bool                      running_ = false;
    RotateCallback            on_rotate_;

    std::thread               thread_;
    std::atomic<uint64_t>     rotations_{0};
};

} // namespace lp::host

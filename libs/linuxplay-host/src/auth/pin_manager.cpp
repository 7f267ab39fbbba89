///////////////////////////////////////////////////////////////////////////////
// pin_manager.cpp -- Rotating PIN implementation
///////////////////////////////////////////////////////////////////////////////

#include "pin_manager.h"
#include <lp/crypto/openssl_util.h>
#include <lp/common.h>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <cstdio>

namespace lp::host {

PinManager::PinManager(uint32_t rotate_interval_ms)
    : interval_ms_(rotate_interval_ms > 0 ? rotate_interval_ms : DEFAULT_ROTATE_INTERVAL)
{
}

PinManager::~PinManager() {
    stop();
}

// ---------------------------------------------------------------------------
// generatePin -- rejection sampling over a 32-bit draw so every value in
// [0, 10^digits) is equally likely
// ---------------------------------------------------------------------------
bool PinManager::generatePin(uint32_t digits, std::string& out) {
    if (digits == 0 || digits > 9) return false;

    uint32_t range = 1;
    for (uint32_t i = 0; i < digits; ++i) range *= 10;

    // Largest multiple of range that fits in 2^32.
    const uint64_t limit = (0x1'0000'0000ULL / range) * range;

    uint32_t value = 0;
    for (;;) {
        if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
            logSslErrors("RAND_bytes");
            return false;
        }
        if (value < limit) break;
    }

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%0*u", static_cast<int>(digits), value % range);
    out = buf;
    return true;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
bool PinManager::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return true;
        if (!rotateLocked()) return false;
        running_ = true;
    }
    thread_ = std::thread(&PinManager::rotationLoop, this);
    LP_LOG(INFO, "PIN: rotation started (every %u ms)", interval_ms_);
    return true;
}

void PinManager::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    LP_LOG(DEBUG, "PIN: rotation stopped");
}

bool PinManager::rotateNow() {
    std::lock_guard<std::mutex> lock(mutex_);
    return rotateLocked();
}

bool PinManager::rotateLocked() {
    std::string fresh;
    if (!generatePin(PIN_DIGITS, fresh)) {
        LP_LOG(ERR, "PIN: generation failed, keeping previous value");
        return false;
    }
    pin_          = fresh;
    generated_at_ = Clock::now();
    rotations_.fetch_add(1);
    LP_LOG(DEBUG, "PIN: rotated");
    if (on_rotate_) on_rotate_(pin_);
    return true;
}

void PinManager::rotationLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (paused_) {
            cv_.wait(lock);
            continue;
        }
        const auto deadline = generated_at_ + std::chrono::milliseconds(interval_ms_);
        cv_.wait_until(lock, deadline);
        if (!running_ || paused_) continue;
        if (Clock::now() >= generated_at_ + std::chrono::milliseconds(interval_ms_)) {
            rotateLocked();
        }
    }
}

// ---------------------------------------------------------------------------
// Pause / resume
// ---------------------------------------------------------------------------
void PinManager::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_) return;
    paused_ = true;
    LP_LOG(INFO, "PIN: rotation paused");
}

void PinManager::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!paused_) return;
        paused_ = false;
        rotateLocked();
    }
    cv_.notify_all();
    LP_LOG(INFO, "PIN: rotation resumed");
}

bool PinManager::paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

// ---------------------------------------------------------------------------
// verify
// ---------------------------------------------------------------------------
AuthError PinManager::verify(const std::string& candidate) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (pin_.empty() || candidate.size() != pin_.size()) return AuthError::InvalidPin;
    if (CRYPTO_memcmp(candidate.data(), pin_.data(), pin_.size()) != 0) {
        return AuthError::InvalidPin;
    }

    // A PIN older than its interval means the rotation thread stalled or
    // was never started.
    if (Clock::now() - generated_at_ > std::chrono::milliseconds(interval_ms_)) {
        return AuthError::Expired;
    }
    return AuthError::None;
}

std::string PinManager::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pin_;
}

void PinManager::setRotateCallback(RotateCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_rotate_ = std::move(cb);
}

} // namespace lp::host

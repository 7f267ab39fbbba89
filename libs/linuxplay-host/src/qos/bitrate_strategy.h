///////////////////////////////////////////////////////////////////////////////
// bitrate_strategy.h -- Pluggable video bitrate policy
//
// The orchestrator asks the strategy for a starting bitrate and then ticks
// it about once per second.  Whenever onTick() reports a new value only
// the video channels are restarted with it.
//
//   FixedBitrateStrategy    -- never changes (default)
//   TwoPointToggleStrategy  -- alternates high/low on a fixed period
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include <cstdint>
#include <memory>

namespace lp::host {

class IBitrateStrategy {
public:
    virtual ~IBitrateStrategy() = default;

    /// Bitrate for a freshly started session.  Also resets internal timers.
    virtual uint64_t startSession(uint64_t now_us) = 0;

    /// Returns true and sets \p bits when the bitrate should change.
    virtual bool onTick(uint64_t now_us, uint64_t& bits) = 0;

    virtual uint64_t current() const = 0;

    virtual const char* name() const = 0;
};

// ---------------------------------------------------------------------------
// FixedBitrateStrategy
// ---------------------------------------------------------------------------
class FixedBitrateStrategy : public IBitrateStrategy {
public:
    explicit FixedBitrateStrategy(uint64_t bits) : bits_(bits) {}

    uint64_t startSession(uint64_t) override { return bits_; }
    bool onTick(uint64_t, uint64_t&) override { return false; }
    uint64_t current() const override { return bits_; }
    const char* name() const override { return "fixed"; }

private:
    uint64_t bits_;
};

// ---------------------------------------------------------------------------
// TwoPointToggleStrategy
// ---------------------------------------------------------------------------
class TwoPointToggleStrategy : public IBitrateStrategy {
public:
    TwoPointToggleStrategy(uint64_t high_bits, uint64_t low_bits, uint32_t period_secs);

    uint64_t startSession(uint64_t now_us) override;
    bool onTick(uint64_t now_us, uint64_t& bits) override;
    uint64_t current() const override { return on_high_ ? high_ : low_; }
    const char* name() const override { return "two-point"; }

    uint32_t toggles() const { return toggles_; }

private:
    uint64_t high_;
    uint64_t low_;
    uint64_t period_us_;
    uint64_t last_switch_us_ = 0;
    bool     on_high_        = true;
    uint32_t toggles_        = 0;
};

/// Strategy selected by configuration.  \p low_bits of 0 means half of
/// \p bits.
std::unique_ptr<IBitrateStrategy> createBitrateStrategy(bool adaptive, uint64_t bits,
                                                        uint64_t low_bits,
                                                        uint32_t period_secs);

} // namespace lp::host

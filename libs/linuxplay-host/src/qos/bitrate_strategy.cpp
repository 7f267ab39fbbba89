///////////////////////////////////////////////////////////////////////////////
// bitrate_strategy.cpp -- Bitrate policies
///////////////////////////////////////////////////////////////////////////////

#include "bitrate_strategy.h"

#include <lp/common.h>
#include <lp/util/bitrate.h>

#include <algorithm>

namespace lp::host {

TwoPointToggleStrategy::TwoPointToggleStrategy(uint64_t high_bits, uint64_t low_bits,
                                               uint32_t period_secs)
    : high_(std::max(high_bits, low_bits))
    , low_(std::min(high_bits, low_bits))
    , period_us_(static_cast<uint64_t>(std::max<uint32_t>(1, period_secs)) * 1'000'000)
{
}

uint64_t TwoPointToggleStrategy::startSession(uint64_t now_us) {
    on_high_        = true;
    last_switch_us_ = now_us;
    toggles_        = 0;
    return high_;
}

bool TwoPointToggleStrategy::onTick(uint64_t now_us, uint64_t& bits) {
    if (now_us < last_switch_us_ + period_us_) return false;

    on_high_        = !on_high_;
    last_switch_us_ = now_us;
    ++toggles_;
    bits = current();
    LP_LOG(INFO, "Bitrate: toggled to %s (%s)",
           formatBits(bits).c_str(), on_high_ ? "high" : "low");
    return true;
}

std::unique_ptr<IBitrateStrategy> createBitrateStrategy(bool adaptive, uint64_t bits,
                                                        uint64_t low_bits,
                                                        uint32_t period_secs) {
    if (!adaptive) {
        return std::make_unique<FixedBitrateStrategy>(bits);
    }
    if (low_bits == 0) low_bits = bits / 2;
    LP_LOG(INFO, "Bitrate: two-point toggle %s <-> %s every %us",
           formatBits(bits).c_str(), formatBits(low_bits).c_str(), period_secs);
    return std::make_unique<TwoPointToggleStrategy>(bits, low_bits, period_secs);
}

} // namespace lp::host

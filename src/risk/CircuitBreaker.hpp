#pragma once
#include <string>
#include "risk/CampaignState.hpp"

namespace strikebox {

// ---------------------------------------------------------------------------
// Emergency stop, checked after every resolved strike. Fires when any of:
//   capital < 85% of peak                        (hard floor, not configurable)
//   capital < peak * (1 - max_drawdown_pct/100)  (when max_drawdown_pct > 0)
//   consecutive misses >= max_consecutive_misses
// One-shot: once tripped, stays tripped.
// ---------------------------------------------------------------------------
class CircuitBreaker {
public:
    static constexpr int64_t HARD_FLOOR_PCT = 85;

    explicit CircuitBreaker(const CampaignLimits& limits);

    // Returns true if the campaign must halt. reason() explains the first trip.
    bool check(const CampaignSnapshot& s);

    bool tripped() const { return tripped_; }
    const std::string& reason() const { return reason_; }

private:
    CampaignLimits limits_;
    bool           tripped_{false};
    std::string    reason_;
};

} // namespace strikebox

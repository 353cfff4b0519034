#pragma once
#include "core/Strike.hpp"

namespace strikebox {

struct SizingPolicy {
    double strike_force_pct{0.15};
    int    min_leverage{3};
    int    max_leverage{5};
    double risk_per_trade_pct{0.0};   // fraction; 0 = no risk cap
    double stop_loss_pct{0.0025};     // stop distance the risk cap assumes
};

// ---------------------------------------------------------------------------
// size = capital * strike_force * confidence * leverage
// With a risk budget, size is capped so a stop-out at that leverage loses
// at most capital * risk_per_trade_pct.
// ---------------------------------------------------------------------------
class PositionSizer {
public:
    explicit PositionSizer(const SizingPolicy& policy);

    // Momentum and Volatility run at the upper bound, everything else at the
    // lower bound.
    int leverage_for(StrikeCategory category) const;

    double size_usd(double capital_usd, double confidence, int leverage) const;

    const SizingPolicy& policy() const { return policy_; }

private:
    int clamp_leverage(int lev) const;

    SizingPolicy policy_;
};

} // namespace strikebox

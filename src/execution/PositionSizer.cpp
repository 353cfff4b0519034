#include "execution/PositionSizer.hpp"
#include <algorithm>

using namespace strikebox;

PositionSizer::PositionSizer(const SizingPolicy& policy)
    : policy_(policy) {}

int PositionSizer::clamp_leverage(int lev) const {
    return std::max(policy_.min_leverage, std::min(policy_.max_leverage, lev));
}

int PositionSizer::leverage_for(StrikeCategory category) const {
    switch (category) {
        case StrikeCategory::Momentum:
        case StrikeCategory::Volatility:
            return clamp_leverage(policy_.max_leverage);
        default:
            return clamp_leverage(policy_.min_leverage);
    }
}

double PositionSizer::size_usd(double capital_usd, double confidence, int leverage) const {
    int lev = clamp_leverage(leverage);
    double size = capital_usd * policy_.strike_force_pct * confidence * lev;

    if (policy_.risk_per_trade_pct > 0.0 && policy_.stop_loss_pct > 0.0) {
        double risk_usd = capital_usd * policy_.risk_per_trade_pct;
        double max_by_risk = risk_usd / (policy_.stop_loss_pct * lev);
        size = std::min(size, max_by_risk);
    }
    return std::max(size, 0.0);
}

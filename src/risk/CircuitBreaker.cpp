#include "risk/CircuitBreaker.hpp"
#include <iostream>

using namespace strikebox;

CircuitBreaker::CircuitBreaker(const CampaignLimits& limits)
    : limits_(limits) {}

bool CircuitBreaker::check(const CampaignSnapshot& s) {
    if (tripped_) return true;

    // Integer compare: capital/peak < 85/100 without floating point.
    if (s.capital_cents * 100 < s.peak_capital_cents * HARD_FLOOR_PCT) {
        reason_ = "capital " + std::to_string(s.capital_cents) +
                  " below 85% of peak " + std::to_string(s.peak_capital_cents);
    } else if (limits_.max_drawdown_pct > 0.0) {
        double floor = static_cast<double>(s.peak_capital_cents) *
                       (1.0 - limits_.max_drawdown_pct / 100.0);
        if (static_cast<double>(s.capital_cents) < floor) {
            reason_ = "configured drawdown " + std::to_string(limits_.max_drawdown_pct) +
                      "% hit: capital " + std::to_string(s.capital_cents) +
                      " peak " + std::to_string(s.peak_capital_cents);
        }
    }

    if (reason_.empty() && s.consecutive_misses >= limits_.max_consecutive_misses) {
        reason_ = "too many consecutive misses: " + std::to_string(s.consecutive_misses);
    }

    if (reason_.empty()) return false;

    tripped_ = true;
    std::cerr << "[KILL] EMERGENCY STOP: " << reason_ << "\n";
    return true;
}

#include "risk/CampaignState.hpp"

using namespace strikebox;

CampaignState::CampaignState(int64_t initial_capital_cents, const CampaignLimits& limits)
    : initial_(initial_capital_cents),
      limits_(limits),
      start_(std::chrono::steady_clock::now()),
      capital_(initial_capital_cents),
      peak_(initial_capital_cents) {}

void CampaignState::apply_result(const StrikeOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mtx_);

    int64_t capital = capital_.fetch_add(outcome.pnl_cents) + outcome.pnl_cents;
    total_pnl_.fetch_add(outcome.pnl_cents);
    total_strikes_.fetch_add(1);
    trades_completed_.fetch_add(1);

    if (outcome.success) {
        successful_.fetch_add(1);
        consecutive_misses_.store(0);
    } else {
        failed_.fetch_add(1);
        consecutive_misses_.fetch_add(1);
    }

    int64_t peak = peak_.load();
    while (capital > peak && !peak_.compare_exchange_weak(peak, capital)) {}
}

std::chrono::milliseconds CampaignState::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
}

CampaignSnapshot CampaignState::snapshot() const {
    CampaignSnapshot s;
    s.capital_cents      = capital_.load();
    s.peak_capital_cents = peak_.load();
    s.total_pnl_cents    = total_pnl_.load();
    s.total_strikes      = total_strikes_.load();
    s.successful_strikes = successful_.load();
    s.failed_strikes     = failed_.load();
    s.consecutive_misses = consecutive_misses_.load();
    s.trades_completed   = trades_completed_.load();
    s.elapsed            = elapsed();
    return s;
}

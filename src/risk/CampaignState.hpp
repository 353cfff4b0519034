#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace strikebox {

struct CampaignLimits {
    int64_t                   target_capital_cents{0};
    std::chrono::milliseconds max_duration{0};
    int64_t                   max_consecutive_misses{20};
    double                    max_drawdown_pct{0.0};   // percent, 0 disables
};

// Result of one executed strike, as the ledger sees it.
struct StrikeOutcome {
    int64_t pnl_cents{0};
    bool    success{false};
};

// Point-in-time copy of the ledger. Fields are read one by one, so a copy
// taken while a writer is inside apply_result() may straddle the update.
struct CampaignSnapshot {
    int64_t capital_cents{0};
    int64_t peak_capital_cents{0};
    int64_t total_pnl_cents{0};
    int64_t total_strikes{0};
    int64_t successful_strikes{0};
    int64_t failed_strikes{0};
    int64_t consecutive_misses{0};
    int64_t trades_completed{0};
    std::chrono::milliseconds elapsed{0};
};

// ---------------------------------------------------------------------------
// Process-wide campaign ledger.
//
// Every counter is an atomic so readers never need the lock. Writers go
// through apply_result(), which takes mtx_ so that capital and peak move
// together:
//   - capital changes only by a resolved strike's P&L, applied once
//   - peak never decreases and is >= capital after every apply
//   - consecutive misses reset on success, +1 otherwise
//   - trades_completed counts executed strikes only
// ---------------------------------------------------------------------------
class CampaignState {
public:
    CampaignState(int64_t initial_capital_cents, const CampaignLimits& limits);

    void apply_result(const StrikeOutcome& outcome);

    int64_t capital_cents() const      { return capital_.load(); }
    int64_t peak_capital_cents() const { return peak_.load(); }
    int64_t initial_capital_cents() const { return initial_; }
    int64_t total_pnl_cents() const    { return total_pnl_.load(); }
    int64_t total_strikes() const      { return total_strikes_.load(); }
    int64_t successful_strikes() const { return successful_.load(); }
    int64_t failed_strikes() const     { return failed_.load(); }
    int64_t consecutive_misses() const { return consecutive_misses_.load(); }
    int64_t trades_completed() const   { return trades_completed_.load(); }

    const CampaignLimits& limits() const { return limits_; }
    std::chrono::steady_clock::time_point started() const { return start_; }
    std::chrono::milliseconds elapsed() const;

    CampaignSnapshot snapshot() const;

private:
    const int64_t  initial_;
    CampaignLimits limits_;
    const std::chrono::steady_clock::time_point start_;

    std::atomic<int64_t> capital_;
    std::atomic<int64_t> peak_;
    std::atomic<int64_t> total_pnl_{0};
    std::atomic<int64_t> total_strikes_{0};
    std::atomic<int64_t> successful_{0};
    std::atomic<int64_t> failed_{0};
    std::atomic<int64_t> consecutive_misses_{0};
    std::atomic<int64_t> trades_completed_{0};

    std::mutex mtx_;
};

} // namespace strikebox

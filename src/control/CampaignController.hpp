#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

#include "execution/StrikeExecutor.hpp"
#include "risk/CampaignState.hpp"
#include "risk/CircuitBreaker.hpp"
#include "runtime/Clock.hpp"
#include "strategy/StrikeGenerator.hpp"
#include "telemetry/CampaignReport.hpp"
#include "telemetry/StrikeJournal.hpp"

namespace strikebox {

struct CampaignParams {
    int64_t                   total_trades{2500};
    bool                      production{true};   // target + time window stops active
    std::chrono::milliseconds cooldown{1};
    int64_t                   progress_every{100};
    bool                      debug_log{false};
};

// ---------------------------------------------------------------------------
// Drives generate -> execute -> apply -> check until one of:
//   trade count reached
//   target capital reached          (production only)
//   campaign window elapsed         (production only)
//   circuit breaker tripped
//   request_stop() / clock cancelled
//
// Single-threaded: one strike is fully resolved before the next is generated.
// The ledger (CampaignState) is only written here, through apply_result().
// The controller never flattens positions on a stop.
// ---------------------------------------------------------------------------
class CampaignController {
public:
    CampaignController(CampaignState& state,
                       StrikeGenerator& generator,
                       StrikeExecutor& executor,
                       CircuitBreaker& breaker,
                       Clock& clock,
                       StrikeJournal* journal,
                       const CampaignParams& params);

    CampaignReport run();

    // Thread-safe. Loop exits before the next candidate is generated.
    void request_stop() { stop_requested_.store(true); }

    int64_t skipped() const { return skipped_; }
    int64_t aborted() const { return aborted_; }

private:
    // Returns true and sets reason/detail if the loop must not start another strike.
    bool should_stop(StopReason& reason, std::string& detail) const;
    void log_progress() const;

    CampaignState&   state_;
    StrikeGenerator& generator_;
    StrikeExecutor&  executor_;
    CircuitBreaker&  breaker_;
    Clock&           clock_;
    StrikeJournal*   journal_;
    CampaignParams   params_;

    std::atomic<bool> stop_requested_{false};
    int64_t skipped_{0};
    int64_t aborted_{0};
};

} // namespace strikebox

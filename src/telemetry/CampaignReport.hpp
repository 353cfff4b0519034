#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "risk/CampaignState.hpp"

namespace strikebox {

enum class StopReason {
    TradeCountReached,
    TargetReached,
    TimeWindowElapsed,
    EmergencyStop,
    Interrupted
};

const char* to_string(StopReason r);

// Externally visible result of a campaign run.
struct CampaignReport {
    StopReason  stop_reason{StopReason::TradeCountReached};
    std::string stop_detail;
    int64_t     initial_capital_cents{0};
    int64_t     final_capital_cents{0};
    int64_t     peak_capital_cents{0};
    int64_t     total_pnl_cents{0};
    int64_t     total_strikes{0};
    int64_t     successful_strikes{0};
    int64_t     failed_strikes{0};
    int64_t     trades_completed{0};
    int64_t     skipped_candidates{0};
    int64_t     aborted_strikes{0};
    std::chrono::milliseconds elapsed{0};

    static CampaignReport from(const CampaignState& state, StopReason reason,
                               const std::string& detail);

    double return_pct() const;
    std::string to_json() const;
    std::string summary() const;

    // Writes to_json() to path. Returns false (and logs) on I/O failure.
    bool write(const std::string& path) const;
};

} // namespace strikebox

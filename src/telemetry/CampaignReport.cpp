#include "telemetry/CampaignReport.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace strikebox;
using json = nlohmann::json;

const char* strikebox::to_string(StopReason r) {
    switch (r) {
        case StopReason::TradeCountReached: return "TRADE_COUNT_REACHED";
        case StopReason::TargetReached:     return "TARGET_REACHED";
        case StopReason::TimeWindowElapsed: return "TIME_WINDOW_ELAPSED";
        case StopReason::EmergencyStop:     return "EMERGENCY_STOP";
        case StopReason::Interrupted:       return "INTERRUPTED";
    }
    return "UNKNOWN";
}

CampaignReport CampaignReport::from(const CampaignState& state, StopReason reason,
                                    const std::string& detail) {
    CampaignSnapshot s = state.snapshot();
    CampaignReport r;
    r.stop_reason           = reason;
    r.stop_detail           = detail;
    r.initial_capital_cents = state.initial_capital_cents();
    r.final_capital_cents   = s.capital_cents;
    r.peak_capital_cents    = s.peak_capital_cents;
    r.total_pnl_cents       = s.total_pnl_cents;
    r.total_strikes         = s.total_strikes;
    r.successful_strikes    = s.successful_strikes;
    r.failed_strikes        = s.failed_strikes;
    r.trades_completed      = s.trades_completed;
    r.elapsed               = s.elapsed;
    return r;
}

double CampaignReport::return_pct() const {
    if (initial_capital_cents == 0) return 0.0;
    return 100.0 * static_cast<double>(final_capital_cents - initial_capital_cents) /
           static_cast<double>(initial_capital_cents);
}

std::string CampaignReport::to_json() const {
    json j = {
        {"stop_reason",           to_string(stop_reason)},
        {"stop_detail",           stop_detail},
        {"initial_capital_cents", initial_capital_cents},
        {"final_capital_cents",   final_capital_cents},
        {"peak_capital_cents",    peak_capital_cents},
        {"total_pnl_cents",       total_pnl_cents},
        {"return_pct",            return_pct()},
        {"total_strikes",         total_strikes},
        {"successful_strikes",    successful_strikes},
        {"failed_strikes",        failed_strikes},
        {"trades_completed",      trades_completed},
        {"skipped_candidates",    skipped_candidates},
        {"aborted_strikes",       aborted_strikes},
        {"elapsed_ms",            elapsed.count()},
    };
    return j.dump(2);
}

std::string CampaignReport::summary() const {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << "[CAMPAIGN] COMPLETE: " << to_string(stop_reason);
    if (!stop_detail.empty()) os << " (" << stop_detail << ")";
    os << "\n"
       << "[CAMPAIGN] Final capital: $" << final_capital_cents / 100.0
       << " | Return: " << return_pct() << "%"
       << " | Peak: $" << peak_capital_cents / 100.0 << "\n"
       << "[CAMPAIGN] Strikes: " << total_strikes
       << " (hit " << successful_strikes << ", miss " << failed_strikes << ")"
       << " | Skipped: " << skipped_candidates
       << " | Aborted: " << aborted_strikes << "\n"
       << "[CAMPAIGN] Time: " << elapsed.count() / 1000.0 << "s\n";
    return os.str();
}

bool CampaignReport::write(const std::string& path) const {
    std::ofstream f(path, std::ios::out | std::ios::trunc);
    if (!f.is_open()) {
        std::cerr << "[CAMPAIGN] cannot write report to " << path << "\n";
        return false;
    }
    f << to_json() << "\n";
    return f.good();
}

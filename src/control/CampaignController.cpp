#include "control/CampaignController.hpp"
#include <cstdio>
#include <iostream>

using namespace strikebox;

CampaignController::CampaignController(CampaignState& state,
                                       StrikeGenerator& generator,
                                       StrikeExecutor& executor,
                                       CircuitBreaker& breaker,
                                       Clock& clock,
                                       StrikeJournal* journal,
                                       const CampaignParams& params)
    : state_(state), generator_(generator), executor_(executor),
      breaker_(breaker), clock_(clock), journal_(journal), params_(params) {}

bool CampaignController::should_stop(StopReason& reason, std::string& detail) const {
    if (stop_requested_.load() || clock_.cancelled()) {
        reason = StopReason::Interrupted;
        detail = "operator stop";
        return true;
    }
    if (state_.trades_completed() >= params_.total_trades) {
        reason = StopReason::TradeCountReached;
        detail = std::to_string(params_.total_trades) + " trades";
        return true;
    }
    if (params_.production) {
        const CampaignLimits& lim = state_.limits();
        if (lim.max_duration.count() > 0 && state_.elapsed() > lim.max_duration) {
            reason = StopReason::TimeWindowElapsed;
            detail = std::to_string(lim.max_duration.count() / 86400000) + " days";
            return true;
        }
        if (lim.target_capital_cents > 0 && state_.capital_cents() >= lim.target_capital_cents) {
            reason = StopReason::TargetReached;
            char buf[64];
            std::snprintf(buf, sizeof(buf), "$%.2f", lim.target_capital_cents / 100.0);
            detail = buf;
            return true;
        }
    }
    return false;
}

void CampaignController::log_progress() const {
    CampaignSnapshot s = state_.snapshot();
    double capital  = s.capital_cents / 100.0;
    double initial  = state_.initial_capital_cents() / 100.0;
    double progress = initial > 0.0 ? (capital - initial) / initial : 0.0;
    double secs     = s.elapsed.count() / 1000.0;
    double rate     = secs > 0.0 ? s.trades_completed / secs : 0.0;
    std::printf("[CAMPAIGN] Progress: %lld/%lld trades | Capital: $%.2f | Return: %.1f%% | Rate: %.1f trades/sec\n",
                static_cast<long long>(s.trades_completed),
                static_cast<long long>(params_.total_trades),
                capital, progress * 100.0, rate);
}

CampaignReport CampaignController::run() {
    std::printf("[CAMPAIGN] MACRO STRIKE CAMPAIGN INITIATED - %lld TRADES\n",
                static_cast<long long>(params_.total_trades));
    if (params_.production && state_.limits().target_capital_cents > 0)
        std::printf("[CAMPAIGN] Target: $%.2f\n", state_.limits().target_capital_cents / 100.0);

    StopReason  reason = StopReason::TradeCountReached;
    std::string detail;

    while (!should_stop(reason, detail)) {
        GenerateResult gen = generator_.next(state_.snapshot());

        if (gen.skipped) {
            ++skipped_;
            if (params_.debug_log)
                std::cout << "[CAMPAIGN] skip (" << to_string(gen.skip_code) << "): "
                          << gen.skip_reason << "\n";
            clock_.wait_for(params_.cooldown);
            continue;
        }

        Strike& strike = gen.strike;
        ExecutionResult res = executor_.execute(strike, state_.snapshot());

        if (!res.executed) {
            ++aborted_;
            std::cerr << "[EXEC] FAILED strike " << strike.id << " " << strike.symbol
                      << " (" << to_string(res.cause) << "): " << res.message << "\n";
            if (journal_) journal_->record(strike, state_.capital_cents());
            clock_.wait_for(params_.cooldown);
            continue;
        }

        state_.apply_result(res.outcome());
        if (journal_) journal_->record(strike, state_.capital_cents());

        std::printf("[CAMPAIGN] %s: %s | PnL=$%.2f | Capital=$%.2f | Trades: %lld/%lld\n",
                    strike.status == StrikeStatus::Hit ? "HIT" : "MISS",
                    strike.symbol.c_str(), res.pnl_usd,
                    state_.capital_cents() / 100.0,
                    static_cast<long long>(state_.trades_completed()),
                    static_cast<long long>(params_.total_trades));

        if (breaker_.check(state_.snapshot())) {
            reason = StopReason::EmergencyStop;
            detail = breaker_.reason();
            break;
        }

        if (params_.progress_every > 0 && state_.trades_completed() % params_.progress_every == 0)
            log_progress();

        clock_.wait_for(params_.cooldown);
    }

    CampaignReport report = CampaignReport::from(state_, reason, detail);
    report.skipped_candidates = skipped_;
    report.aborted_strikes    = aborted_;
    return report;
}

#include "execution/StrikeExecutor.hpp"
#include <utility>

using namespace strikebox;

SimulatedStrikeExecutor::SimulatedStrikeExecutor(const PositionSizer& sizer,
                                                 const SimulationParams& params,
                                                 Draw draw)
    : sizer_(sizer), params_(params), draw_(std::move(draw)) {}

ExecutionResult SimulatedStrikeExecutor::execute(Strike& strike, const CampaignSnapshot& campaign) {
    double capital_usd = to_usd(campaign.capital_cents);
    double size = sizer_.size_usd(capital_usd, strike.confidence, strike.leverage);
    strike.begin_striking(size);

    const double lev  = static_cast<double>(strike.leverage);
    const double fees = size * params_.round_trip_fee_pct;
    const double tp   = params_.use_expected_return ? strike.expected_return
                                                    : params_.take_profit_pct;
    const double sl   = params_.stop_loss_pct;

    bool hit = draw_() < strike.confidence;

    double pnl  = 0.0;
    double exit = strike.entry_price;
    if (hit) {
        pnl  = size * tp * lev - fees;
        exit = strike.entry_price * (1.0 + tp);
    } else {
        pnl  = -size * sl * lev - fees;
        exit = strike.entry_price * (1.0 - sl);
    }

    strike.resolve(hit, exit, pnl);

    ExecutionResult r;
    r.executed  = true;
    r.success   = hit;          // simulated success is the Hit status, not the sign of pnl
    r.pnl_usd   = pnl;
    r.pnl_cents = strike.pnl_cents;
    return r;
}

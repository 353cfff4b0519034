#pragma once
#include <functional>
#include <string>

#include "core/Strike.hpp"
#include "core/StrikeError.hpp"
#include "execution/PositionSizer.hpp"
#include "exchange/OrderGateway.hpp"
#include "risk/CampaignState.hpp"
#include "runtime/Clock.hpp"

namespace strikebox {

// ---------------------------------------------------------------------------
// What happened to one strike. executed == false means the strike ended
// Aborted: no capital change, not counted as a trade. error/message say why.
// When executed, the strike is Hit or Miss and pnl_cents is what the
// controller applies to the ledger.
// ---------------------------------------------------------------------------
struct ExecutionResult {
    bool        executed{false};
    bool        success{false};
    int64_t     pnl_cents{0};
    double      pnl_usd{0.0};
    ErrorCode   error{ErrorCode::ExecutionFailed};
    ErrorCode   cause{ErrorCode::ExecutionFailed};   // underlying code, e.g. NoFill
    std::string message;

    StrikeOutcome outcome() const { return StrikeOutcome{pnl_cents, success}; }
};

class StrikeExecutor {
public:
    virtual ~StrikeExecutor() = default;

    // Sizes and runs the strike. The strike leaves in a terminal state.
    // Never throws for exchange-side failures; those become an aborted result.
    virtual ExecutionResult execute(Strike& strike, const CampaignSnapshot& campaign) = 0;
};

// ---------------------------------------------------------------------------
// Probabilistic fills for throughput and regression runs. Never wired into
// RunMode::Live. Hit iff draw() < confidence.
//   fees = size * round_trip_fee_pct
//   Hit  pnl = size * take_profit * leverage - fees
//   Miss pnl = -size * stop_loss * leverage - fees
// take_profit is the fixed sim value, or the strike's own expected return
// when use_expected_return is set (paper trading on oracle strikes).
// ---------------------------------------------------------------------------
struct SimulationParams {
    double round_trip_fee_pct{0.0016};
    double take_profit_pct{0.003};
    double stop_loss_pct{0.0025};
    bool   use_expected_return{false};
};

class SimulatedStrikeExecutor : public StrikeExecutor {
public:
    using Draw = std::function<double()>;   // uniform in [0, 1)

    SimulatedStrikeExecutor(const PositionSizer& sizer,
                            const SimulationParams& params,
                            Draw draw);

    ExecutionResult execute(Strike& strike, const CampaignSnapshot& campaign) override;

private:
    const PositionSizer& sizer_;
    SimulationParams     params_;
    Draw                 draw_;
};

struct LiveParams {
    double                    order_usd_size{25.0};
    std::chrono::milliseconds poll_interval{2000};
    std::chrono::milliseconds fill_timeout{30000};
    std::chrono::milliseconds hold{20000};
};

// ---------------------------------------------------------------------------
// Live Kraken sequence:
//   buy (market, order_usd_size) -> poll for fill -> hold -> sell -> poll exit
//   pnl = (exit - entry) * filled volume, Hit iff pnl >= 0
// No fill inside fill_timeout: the order is cancelled and the strike aborted.
// ---------------------------------------------------------------------------
class LiveStrikeExecutor : public StrikeExecutor {
public:
    LiveStrikeExecutor(OrderGateway& gateway,
                       const PositionSizer& sizer,
                       Clock& clock,
                       const LiveParams& params);

    ExecutionResult execute(Strike& strike, const CampaignSnapshot& campaign) override;

private:
    struct Fill {
        double volume{0.0};
        double price{0.0};
    };

    // Polls until volume_executed > 0 or timeout. Returns volume 0 on timeout.
    Fill await_entry_fill(const std::string& order_id, double fallback_price);
    // Polls until a fill price shows up; falls back to last_price on timeout.
    double await_exit_price(const std::string& order_id, double last_price);

    ExecutionResult abort(Strike& strike, ErrorCode cause, const std::string& msg);

    OrderGateway&        gateway_;
    const PositionSizer& sizer_;
    Clock&               clock_;
    LiveParams           params_;
};

} // namespace strikebox

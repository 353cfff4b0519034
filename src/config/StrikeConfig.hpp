#pragma once
#include <cstdint>
#include <string>
#include "execution/PositionSizer.hpp"

namespace strikebox {

// ---------------------------------------------------------------------------
// Run modes. The mode alone decides which generator and executor main()
// wires together; nothing downstream re-reads the environment.
//   Simulation  synthetic strikes + simulated fills. No target/time stops.
//   Paper       oracle-driven strikes + simulated fills.
//   Live        oracle-driven strikes + Kraken orders. Needs credentials.
// ---------------------------------------------------------------------------
enum class RunMode { Simulation, Paper, Live };

const char* to_string(RunMode m);

struct StrikeConfig {
    RunMode     mode{RunMode::Paper};

    // Credentials: never logged, never placed in error text.
    std::string api_key;
    std::string api_secret;
    std::string kraken_base_url{"https://api.kraken.com"};

    // Sizing / risk
    double   order_usd_size{25.0};
    double   risk_per_trade_pct{0.01};     // fraction, env value is percent
    double   strike_force_pct{0.15};
    int      min_leverage{3};
    int      max_leverage{5};
    double   round_trip_fee_pct{0.0016};
    double   sim_take_profit_pct{0.003};
    double   sim_stop_loss_pct{0.0025};

    // Campaign limits
    int64_t  initial_capital_cents{10000000};
    int64_t  target_capital_cents{11850000};
    int      total_trades{2500};
    int      campaign_days{5};
    double   max_drawdown_pct{10.0};       // percent, 0 disables
    int      max_consecutive_misses{20};

    // Analysis
    double      min_confidence{0.80};
    std::string oracle_command{"julia"};
    std::string oracle_script{"market_analysis.jl"};
    int         oracle_timeout_ms{5000};

    // Live execution timing
    int      hold_seconds{20};
    int      fill_poll_interval_ms{2000};
    int      fill_timeout_ms{30000};
    int      cooldown_ms{1};

    // Outputs
    std::string journal_path;
    std::string report_path;
    bool        debug_log{false};
    uint64_t    seed{0};                   // 0 = time-based

    bool simulated_execution() const { return mode != RunMode::Live; }
    bool production() const          { return mode != RunMode::Simulation; }

    // Reads the process environment. Throws StrikeError(ConfigurationError)
    // naming the offending variable.
    static StrikeConfig from_env();

    // Sizer settings for this mode. Only Simulation carries the per-trade
    // risk cap.
    SizingPolicy sizing_policy() const;

    // One-line-per-setting summary, credentials masked.
    std::string describe() const;
};

// KEY=VALUE loader. Existing environment variables win. Missing file is not
// an error. Returns true if the file was read.
bool load_dotenv(const char* path);

} // namespace strikebox

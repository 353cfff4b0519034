#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <random>

#include <curl/curl.h>

#include "analysis/AnalysisGateway.hpp"
#include "analysis/OracleProcess.hpp"
#include "config/StrikeConfig.hpp"
#include "control/CampaignController.hpp"
#include "core/StrikeError.hpp"
#include "exchange/HttpTransport.hpp"
#include "exchange/kraken/KrakenAuth.hpp"
#include "exchange/kraken/KrakenRestClient.hpp"
#include "execution/PositionSizer.hpp"
#include "execution/StrikeExecutor.hpp"
#include "risk/CampaignState.hpp"
#include "risk/CircuitBreaker.hpp"
#include "runtime/Clock.hpp"
#include "runtime/SignalWatcher.hpp"
#include "strategy/StrikeGenerator.hpp"
#include "telemetry/CampaignReport.hpp"
#include "telemetry/StrikeJournal.hpp"

using namespace strikebox;

// ---------------------------------------------------------------------------
// Signal handler only flips an atomic. The SignalWatcher in run() turns
// that into clock.cancel() + controller.request_stop(), which are not
// async-signal-safe.
// ---------------------------------------------------------------------------
static std::atomic<bool> g_sigint_flag{false};

static void handle_signal(int) {
    g_sigint_flag.store(true, std::memory_order_relaxed);
}

static int run(const StrikeConfig& cfg) {
    std::cout << cfg.describe();

    AsioClock clock;

    // ---- RNG (simulated paths only) ----
    uint64_t seed = cfg.seed ? cfg.seed
                             : static_cast<uint64_t>(std::chrono::steady_clock::now()
                                                         .time_since_epoch().count());
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    auto draw = [&rng, &unit]() { return unit(rng); };

    // ---- Ledger + risk ----
    CampaignLimits limits;
    limits.target_capital_cents   = cfg.target_capital_cents;
    limits.max_duration           = std::chrono::hours(24 * cfg.campaign_days);
    limits.max_consecutive_misses = cfg.max_consecutive_misses;
    limits.max_drawdown_pct       = cfg.max_drawdown_pct;

    CampaignState  state(cfg.initial_capital_cents, limits);
    CircuitBreaker breaker(limits);

    PositionSizer sizer(cfg.sizing_policy());

    StrikeIdSource ids;

    // ---- Generator ----
    std::unique_ptr<OracleProcess>   oracle;
    std::unique_ptr<AnalysisGateway> gateway;
    std::unique_ptr<StrikeGenerator> generator;
    if (cfg.mode == RunMode::Simulation) {
        generator = std::make_unique<SimulatedStrikeGenerator>(ids, sizer, draw);
    } else {
        oracle    = std::make_unique<OracleProcess>(cfg.oracle_command, cfg.oracle_script,
                                                    cfg.oracle_timeout_ms);
        gateway   = std::make_unique<AnalysisGateway>(*oracle, cfg.min_confidence);
        generator = std::make_unique<AnalysisStrikeGenerator>(ids, sizer, *gateway);
        std::cout << "[ORACLE] " << cfg.oracle_command << " " << cfg.oracle_script
                  << " timeout=" << cfg.oracle_timeout_ms << "ms min_conf=" << cfg.min_confidence << "\n";
    }

    // ---- Executor ----
    std::unique_ptr<KrakenAuth>       auth;
    std::unique_ptr<CurlTransport>    transport;
    std::unique_ptr<KrakenRestClient> rest;
    std::unique_ptr<StrikeExecutor>   executor;
    if (cfg.mode == RunMode::Live) {
        auth      = std::make_unique<KrakenAuth>(cfg.api_key, cfg.api_secret);
        transport = std::make_unique<CurlTransport>();
        rest      = std::make_unique<KrakenRestClient>(cfg.kraken_base_url, *auth, *transport, clock);

        LiveParams lp;
        lp.order_usd_size = cfg.order_usd_size;
        lp.poll_interval  = std::chrono::milliseconds(cfg.fill_poll_interval_ms);
        lp.fill_timeout   = std::chrono::milliseconds(cfg.fill_timeout_ms);
        lp.hold           = std::chrono::seconds(cfg.hold_seconds);
        executor = std::make_unique<LiveStrikeExecutor>(*rest, sizer, clock, lp);
        std::cout << "[STRIKEBOX] LIVE TRADING ARMED on " << cfg.kraken_base_url << "\n";
    } else {
        SimulationParams sp;
        sp.round_trip_fee_pct  = cfg.round_trip_fee_pct;
        sp.take_profit_pct     = cfg.sim_take_profit_pct;
        sp.stop_loss_pct       = cfg.sim_stop_loss_pct;
        sp.use_expected_return = (cfg.mode == RunMode::Paper);
        executor = std::make_unique<SimulatedStrikeExecutor>(sizer, sp, draw);
        std::cout << "[STRIKEBOX] Simulated execution, seed=" << seed << "\n";
    }

    StrikeJournal journal(cfg.journal_path);

    CampaignParams cp;
    cp.total_trades = cfg.total_trades;
    cp.production   = cfg.production();
    cp.cooldown     = std::chrono::milliseconds(cfg.cooldown_ms);
    cp.debug_log    = cfg.debug_log;

    CampaignController controller(state, *generator, *executor, breaker, clock,
                                  journal.enabled() ? &journal : nullptr, cp);

    // ---- Signal watcher ----
    CampaignReport report;
    {
        SignalWatcher watcher(g_sigint_flag, [&] {
            std::cout << "\n[STRIKEBOX] Signal received, stopping after current strike\n";
            controller.request_stop();
            clock.cancel();
        });
        report = controller.run();
    }

    std::cout << report.summary();
    if (!cfg.report_path.empty() && report.write(cfg.report_path))
        std::cout << "[STRIKEBOX] Report written to " << cfg.report_path << "\n";

    return 0;
}

int main() {
    // .env before anything else: credentials must exist before the REST
    // client is built. ../.env covers running from build/.
    load_dotenv(".env");
    load_dotenv("../.env");

    StrikeConfig cfg;
    try {
        cfg = StrikeConfig::from_env();
    } catch (const std::exception& e) {
        std::cerr << "[CONFIG] FATAL: " << e.what() << "\n";
        return 2;
    }

    std::signal(SIGINT,  handle_signal);
    std::signal(SIGTERM, handle_signal);

    curl_global_init(CURL_GLOBAL_ALL);

    int rc = 0;
    try {
        rc = run(cfg);
    } catch (const StrikeError& e) {
        if (e.code() == ErrorCode::ConfigurationError) {
            std::cerr << "[CONFIG] FATAL: " << e.what() << "\n";
            rc = 2;
        } else {
            std::cerr << "[STRIKEBOX] FATAL (" << to_string(e.code()) << "): " << e.what() << "\n";
            rc = 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[STRIKEBOX] FATAL: " << e.what() << "\n";
        rc = 1;
    }

    curl_global_cleanup();
    return rc;
}

// =============================================================================
// src/execution_test.cpp - Sizing, simulated fills and live strike sequence
// =============================================================================
// Live path runs against a scripted order gateway on a virtual clock: a 30s
// fill timeout costs nothing here.
// =============================================================================

#include <cmath>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>

#include "config/StrikeConfig.hpp"
#include "core/Strike.hpp"
#include "execution/PositionSizer.hpp"
#include "execution/StrikeExecutor.hpp"
#include "testing/TestFakes.hpp"

using namespace strikebox;
using namespace strikebox::testing;

static bool near(double a, double b, double eps = 1e-6) { return std::fabs(a - b) < eps; }

static SizingPolicy default_policy() {
    SizingPolicy p;
    p.strike_force_pct   = 0.15;
    p.min_leverage       = 3;
    p.max_leverage       = 5;
    p.risk_per_trade_pct = 0.01;
    p.stop_loss_pct      = 0.0025;
    return p;
}

static CampaignSnapshot campaign_at(int64_t capital_cents) {
    CampaignSnapshot s;
    s.capital_cents      = capital_cents;
    s.peak_capital_cents = capital_cents;
    return s;
}

static LiveParams live_params() {
    LiveParams p;
    p.order_usd_size = 25.0;
    p.poll_interval  = std::chrono::milliseconds(2000);
    p.fill_timeout   = std::chrono::milliseconds(30000);
    p.hold           = std::chrono::milliseconds(20000);
    return p;
}

class ExecutionTest {
public:
    int run_all_tests() {
        std::cout << "\n=== STRIKE EXECUTION - UNIT TESTS ===\n\n";

        test_leverage_bands();
        test_sizing();
        test_risk_cap();
        test_risk_cap_by_mode();
        test_simulated_hit();
        test_simulated_miss();
        test_simulated_expected_return();
        test_live_happy_path();
        test_live_no_fill();
        test_live_entry_rejected();
        test_live_exit_price_fallback();
        test_live_exit_failure();
        test_live_unknown_pair();
        test_live_hold_interrupted();
        test_strike_lifecycle();

        print_summary();
        return tests_failed_;
    }

private:
    int tests_passed_ = 0;
    int tests_failed_ = 0;

    void test_pass(const char* name) {
        std::cout << "  [PASS] " << name << "\n";
        tests_passed_++;
    }

    void test_fail(const char* name, const std::string& reason) {
        std::cout << "  [FAIL] " << name << " - " << reason << "\n";
        tests_failed_++;
    }

    void check(bool ok, const char* name, const std::string& reason) {
        if (ok) test_pass(name);
        else    test_fail(name, reason);
    }

    // =========================================================================
    // SIZING
    // =========================================================================

    void test_leverage_bands() {
        std::cout << "Testing leverage bands...\n";
        PositionSizer sizer(default_policy());
        check(sizer.leverage_for(StrikeCategory::Momentum) == 5, "Momentum at upper bound",
              std::to_string(sizer.leverage_for(StrikeCategory::Momentum)));
        check(sizer.leverage_for(StrikeCategory::Volatility) == 5, "Volatility at upper bound",
              std::to_string(sizer.leverage_for(StrikeCategory::Volatility)));
        check(sizer.leverage_for(StrikeCategory::Arbitrage) == 3, "Arbitrage at lower bound",
              std::to_string(sizer.leverage_for(StrikeCategory::Arbitrage)));
        check(sizer.leverage_for(StrikeCategory::Flash) == 3, "Flash at lower bound",
              std::to_string(sizer.leverage_for(StrikeCategory::Flash)));
        std::cout << "\n";
    }

    void test_sizing() {
        std::cout << "Testing position size...\n";
        PositionSizer sizer(default_policy());
        double size = sizer.size_usd(100000.0, 0.9, 3);
        check(near(size, 40500.0), "$100k * 15% * 0.9 * 3x = $40500", std::to_string(size));

        double clamped = sizer.size_usd(100000.0, 0.9, 10);
        double at_max  = sizer.size_usd(100000.0, 0.9, 5);
        check(near(clamped, at_max), "leverage above band clamped", std::to_string(clamped));
        check(sizer.size_usd(0.0, 0.9, 3) == 0.0, "no capital, no size", "non-zero");
        std::cout << "\n";
    }

    void test_risk_cap() {
        std::cout << "Testing risk cap...\n";
        SizingPolicy p = default_policy();
        p.risk_per_trade_pct = 0.001;
        PositionSizer capped(p);
        double size = capped.size_usd(100000.0, 0.9, 3);
        // $100 budget / (0.25% stop * 3x)
        check(near(size, 100.0 / 0.0075, 1e-3), "cap binds at $13333.33", std::to_string(size));
        double loss = size * p.stop_loss_pct * 3;
        check(loss <= 100.0 + 1e-9, "stop-out loses at most the budget", std::to_string(loss));

        p.risk_per_trade_pct = 0.0;
        PositionSizer uncapped(p);
        check(near(uncapped.size_usd(100000.0, 0.9, 3), 40500.0), "zero budget disables cap",
              std::to_string(uncapped.size_usd(100000.0, 0.9, 3)));
        std::cout << "\n";
    }

    void test_risk_cap_by_mode() {
        std::cout << "Testing risk cap per run mode...\n";
        StrikeConfig cfg;
        cfg.risk_per_trade_pct = 0.001;

        cfg.mode = RunMode::Simulation;
        double sim = PositionSizer(cfg.sizing_policy()).size_usd(100000.0, 0.9, 3);
        check(near(sim, 100.0 / 0.0075, 1e-3), "Simulation sizing is capped", std::to_string(sim));

        cfg.mode = RunMode::Paper;
        check(cfg.sizing_policy().risk_per_trade_pct == 0.0, "Paper carries no risk cap",
              std::to_string(cfg.sizing_policy().risk_per_trade_pct));
        double paper = PositionSizer(cfg.sizing_policy()).size_usd(100000.0, 0.9, 3);
        check(near(paper, 40500.0), "Paper sizing is uncapped", std::to_string(paper));

        cfg.mode = RunMode::Live;
        check(cfg.sizing_policy().risk_per_trade_pct == 0.0, "Live carries no risk cap",
              std::to_string(cfg.sizing_policy().risk_per_trade_pct));
        std::cout << "\n";
    }

    // =========================================================================
    // SIMULATED
    // =========================================================================

    void test_simulated_hit() {
        std::cout << "Testing simulated hit...\n";
        PositionSizer sizer(default_policy());
        SimulationParams sp;
        SimulatedStrikeExecutor exec(sizer, sp, [] { return 0.10; });

        Strike s = make_test_strike(1, "WETH/USDC", 3000.0, 0.9, 3);
        ExecutionResult r = exec.execute(s, campaign_at(10000000));

        check(r.executed && r.success, "draw below confidence is a hit", "not a hit");
        check(s.status == StrikeStatus::Hit, "strike ends Hit", to_string(s.status));
        check(near(s.strike_force_usd, 40500.0), "size recorded", std::to_string(s.strike_force_usd));
        // 40500 * 0.003 * 3 - 40500 * 0.0016 = 364.50 - 64.80
        check(r.pnl_cents == 29970, "pnl +$299.70", std::to_string(r.pnl_cents));
        check(s.exit_price && near(*s.exit_price, 3009.0), "exit at take-profit",
              s.exit_price ? std::to_string(*s.exit_price) : "none");
        std::cout << "\n";
    }

    void test_simulated_miss() {
        std::cout << "Testing simulated miss...\n";
        PositionSizer sizer(default_policy());
        SimulationParams sp;
        SimulatedStrikeExecutor exec(sizer, sp, [] { return 0.95; });

        Strike s = make_test_strike(2, "WETH/USDC", 3000.0, 0.9, 3);
        ExecutionResult r = exec.execute(s, campaign_at(10000000));

        check(r.executed && !r.success, "draw above confidence is a miss", "not a miss");
        check(s.status == StrikeStatus::Miss, "strike ends Miss", to_string(s.status));
        // -(40500 * 0.0025 * 3) - 64.80
        check(r.pnl_cents == -36855, "pnl -$368.55", std::to_string(r.pnl_cents));
        check(s.exit_price && near(*s.exit_price, 2992.5), "exit at stop",
              s.exit_price ? std::to_string(*s.exit_price) : "none");
        std::cout << "\n";
    }

    void test_simulated_expected_return() {
        std::cout << "Testing paper fills on expected return...\n";
        PositionSizer sizer(default_policy());
        SimulationParams sp;
        sp.use_expected_return = true;
        SimulatedStrikeExecutor exec(sizer, sp, [] { return 0.0; });

        Strike s = make_test_strike(3, "WETH/USDC", 3000.0, 0.9, 3);
        s.expected_return = 0.022;
        ExecutionResult r = exec.execute(s, campaign_at(10000000));
        // 40500 * 0.022 * 3 - 64.80
        check(r.pnl_cents == 260820, "take-profit follows the strike", std::to_string(r.pnl_cents));
        std::cout << "\n";
    }

    // =========================================================================
    // LIVE
    // =========================================================================

    void test_live_happy_path() {
        std::cout << "Testing live strike...\n";
        PositionSizer sizer(default_policy());
        FakeOrderGateway gw;
        FakeClock clock;
        LiveStrikeExecutor exec(gw, sizer, clock, live_params());

        gw.script_entry({OrderFill{}, FakeOrderGateway::filled(0.0005, 50000.0)});
        gw.script_exit({FakeOrderGateway::filled(0.0005, 50100.0)});

        Strike s = make_test_strike(4, "WBTC/USDC", 50000.0, 0.9, 3);
        ExecutionResult r = exec.execute(s, campaign_at(10000000));

        check(r.executed && r.success, "profitable round trip is a hit", r.message);
        check(r.pnl_cents == 5, "pnl (50100 - 50000) * 0.0005 = $0.05", std::to_string(r.pnl_cents));
        check(gw.placed().size() == 2 && gw.placed()[0] == "XBTUSD:buy" && gw.placed()[1] == "XBTUSD:sell",
              "buy then sell on XBTUSD", std::to_string(gw.placed().size()) + " orders");
        check(near(gw.last_notional(), 25.0), "fixed $25 ticket", std::to_string(gw.last_notional()));
        check(near(gw.exit_volume(), 0.0005, 1e-12), "exit sells the filled volume",
              std::to_string(gw.exit_volume()));
        check(clock.waited().count() == 20000, "held 20s", std::to_string(clock.waited().count()));
        check(clock.slept().count() == 2000, "one poll interval before the fill",
              std::to_string(clock.slept().count()));
        check(gw.cancelled().empty(), "nothing cancelled", "cancel sent");
        std::cout << "\n";
    }

    void test_live_no_fill() {
        std::cout << "Testing live no-fill...\n";
        PositionSizer sizer(default_policy());
        FakeOrderGateway gw;
        FakeClock clock;
        LiveStrikeExecutor exec(gw, sizer, clock, live_params());

        Strike s = make_test_strike(5, "WETH/USDC", 3000.0, 0.9, 3);
        ExecutionResult r = exec.execute(s, campaign_at(10000000));

        check(!r.executed, "no fill is not a trade", "executed");
        check(r.cause == ErrorCode::NoFill, "cause is NoFill", to_string(r.cause));
        check(s.status == StrikeStatus::Aborted, "strike ends Aborted", to_string(s.status));
        check(gw.cancelled().size() == 1 && gw.cancelled()[0] == "ENTRY-1",
              "unfilled order cancelled", std::to_string(gw.cancelled().size()) + " cancels");
        check(clock.slept().count() == 30000, "polled for the full 30s",
              std::to_string(clock.slept().count()));
        check(gw.queries() == 15, "15 polls at 2s", std::to_string(gw.queries()));
        check(gw.placed().size() == 1, "no exit order", std::to_string(gw.placed().size()));
        std::cout << "\n";
    }

    void test_live_entry_rejected() {
        std::cout << "Testing live entry rejection...\n";
        PositionSizer sizer(default_policy());
        FakeOrderGateway gw;
        FakeClock clock;
        LiveStrikeExecutor exec(gw, sizer, clock, live_params());
        gw.fail_entry(ErrorCode::ExchangeRejected);

        Strike s = make_test_strike(6, "LINK/USDC", 15.5, 0.9, 3);
        ExecutionResult r = exec.execute(s, campaign_at(10000000));

        check(!r.executed && r.error == ErrorCode::ExecutionFailed, "entry failure aborts",
              r.message);
        check(r.cause == ErrorCode::ExchangeRejected, "cause kept", to_string(r.cause));
        check(s.status == StrikeStatus::Aborted, "strike ends Aborted", to_string(s.status));
        check(gw.queries() == 0 && gw.cancelled().empty(), "nothing polled or cancelled", "activity");
        std::cout << "\n";
    }

    void test_live_exit_price_fallback() {
        std::cout << "Testing exit price fallback...\n";
        PositionSizer sizer(default_policy());
        FakeOrderGateway gw;
        FakeClock clock;
        LiveStrikeExecutor exec(gw, sizer, clock, live_params());
        gw.script_entry({FakeOrderGateway::filled(0.002, 3000.0)});

        Strike s = make_test_strike(7, "WETH/USDC", 3000.0, 0.9, 3);
        ExecutionResult r = exec.execute(s, campaign_at(10000000));

        check(r.executed, "strike still resolves", r.message);
        check(s.exit_price && near(*s.exit_price, 3000.0), "exit priced at entry fill",
              s.exit_price ? std::to_string(*s.exit_price) : "none");
        check(r.pnl_cents == 0 && r.success, "flat round trip counts as hit",
              std::to_string(r.pnl_cents));
        std::cout << "\n";
    }

    void test_live_exit_failure() {
        std::cout << "Testing exit failure...\n";
        PositionSizer sizer(default_policy());
        FakeOrderGateway gw;
        FakeClock clock;
        LiveStrikeExecutor exec(gw, sizer, clock, live_params());
        gw.script_entry({FakeOrderGateway::filled(0.002, 3000.0)});
        gw.fail_exit(ErrorCode::TransportError);

        Strike s = make_test_strike(8, "WETH/USDC", 3000.0, 0.9, 3);
        ExecutionResult r = exec.execute(s, campaign_at(10000000));

        check(!r.executed, "failed exit aborts the strike", "executed");
        check(r.cause == ErrorCode::TransportError, "cause is TransportError", to_string(r.cause));
        check(s.status == StrikeStatus::Aborted, "strike ends Aborted", to_string(s.status));
        std::cout << "\n";
    }

    void test_live_unknown_pair() {
        std::cout << "Testing unmapped symbol...\n";
        PositionSizer sizer(default_policy());
        FakeOrderGateway gw;
        FakeClock clock;
        LiveStrikeExecutor exec(gw, sizer, clock, live_params());

        Strike s = make_test_strike(9, "DOGE/USDC", 0.1, 0.9, 3);
        ExecutionResult r = exec.execute(s, campaign_at(10000000));

        check(!r.executed && r.cause == ErrorCode::InvalidSize, "unmapped symbol aborted",
              to_string(r.cause));
        check(gw.placed().empty(), "no order sent", std::to_string(gw.placed().size()));
        std::cout << "\n";
    }

    void test_live_hold_interrupted() {
        std::cout << "Testing interrupted hold...\n";
        PositionSizer sizer(default_policy());
        FakeOrderGateway gw;
        FakeClock clock;
        LiveStrikeExecutor exec(gw, sizer, clock, live_params());
        gw.script_entry({FakeOrderGateway::filled(0.002, 3000.0)});
        gw.script_exit({FakeOrderGateway::filled(0.002, 2990.0)});
        clock.cancel_after_waits(1);

        Strike s = make_test_strike(10, "WETH/USDC", 3000.0, 0.9, 3);
        ExecutionResult r = exec.execute(s, campaign_at(10000000));

        check(clock.waited().count() == 0, "hold cut short", std::to_string(clock.waited().count()));
        check(gw.placed().size() == 2, "position still closed", std::to_string(gw.placed().size()));
        check(r.executed && !r.success && r.pnl_cents == -2, "loss booked as miss",
              std::to_string(r.pnl_cents));
        std::cout << "\n";
    }

    // =========================================================================
    // LIFECYCLE
    // =========================================================================

    void expect_logic_error(const char* name, const std::function<void()>& fn) {
        try {
            fn();
            test_fail(name, "allowed");
        } catch (const std::logic_error&) {
            test_pass(name);
        }
    }

    void test_strike_lifecycle() {
        std::cout << "Testing strike state machine...\n";
        Strike a = make_test_strike(11, "WETH/USDC", 3000.0, 0.9, 3);
        expect_logic_error("resolve before striking", [&a] { a.resolve(true, 1.0, 1.0); });

        Strike b = make_test_strike(12, "WETH/USDC", 3000.0, 0.9, 3);
        b.begin_striking(100.0);
        expect_logic_error("begin twice", [&b] { b.begin_striking(100.0); });
        b.resolve(true, 3010.0, 1.0);
        check(b.terminal() && b.resolved_ms.has_value(), "resolved strike is terminal", "not terminal");
        expect_logic_error("abort after hit", [&b] { b.abort(); });
        expect_logic_error("resolve twice", [&b] { b.resolve(false, 1.0, -1.0); });

        Strike c = make_test_strike(13, "WETH/USDC", 3000.0, 0.9, 3);
        c.abort();
        check(c.status == StrikeStatus::Aborted && !c.pnl_usd, "abort from targeting", "wrong state");
        expect_logic_error("strike after abort", [&c] { c.begin_striking(1.0); });
        std::cout << "\n";
    }

    void print_summary() {
        std::cout << "=== TEST SUMMARY ===\n";
        std::cout << "  Passed: " << std::setw(3) << tests_passed_ << "\n";
        std::cout << "  Failed: " << std::setw(3) << tests_failed_ << "\n";
        std::cout << (tests_failed_ == 0 ? "\nALL TESTS PASSED\n\n" : "\nSOME TESTS FAILED\n\n");
    }
};

int main() {
    ExecutionTest tester;
    return tester.run_all_tests() == 0 ? 0 : 1;
}

#include "execution/StrikeExecutor.hpp"
#include "exchange/kraken/KrakenRestClient.hpp"

#include <cstdio>
#include <iostream>

using namespace strikebox;

LiveStrikeExecutor::LiveStrikeExecutor(OrderGateway& gateway,
                                       const PositionSizer& sizer,
                                       Clock& clock,
                                       const LiveParams& params)
    : gateway_(gateway), sizer_(sizer), clock_(clock), params_(params) {}

ExecutionResult LiveStrikeExecutor::abort(Strike& strike, ErrorCode cause, const std::string& msg) {
    strike.abort();
    ExecutionResult r;
    r.executed = false;
    r.error    = ErrorCode::ExecutionFailed;
    r.cause    = cause;
    r.message  = msg;
    return r;
}

LiveStrikeExecutor::Fill LiveStrikeExecutor::await_entry_fill(const std::string& order_id,
                                                              double fallback_price) {
    Fill fill;
    fill.price = fallback_price;

    const auto deadline = clock_.now() + params_.fill_timeout;
    while (clock_.now() < deadline) {
        try {
            OrderFill f = gateway_.query_order(order_id);
            if (f.average_price) fill.price = *f.average_price;
            if (f.volume_executed) {
                fill.volume = *f.volume_executed;
                return fill;
            }
        } catch (const StrikeError& e) {
            // A failed status query is not a failed order; keep polling.
            std::cout << "[EXEC] query " << order_id << " failed: " << e.what() << "\n";
        }
        clock_.sleep_for(params_.poll_interval);
    }
    fill.volume = 0.0;
    return fill;
}

double LiveStrikeExecutor::await_exit_price(const std::string& order_id, double last_price) {
    const auto deadline = clock_.now() + params_.fill_timeout;
    while (clock_.now() < deadline) {
        try {
            OrderFill f = gateway_.query_order(order_id);
            if (f.volume_executed && f.average_price) return *f.average_price;
        } catch (const StrikeError& e) {
            std::cout << "[EXEC] query " << order_id << " failed: " << e.what() << "\n";
        }
        clock_.sleep_for(params_.poll_interval);
    }
    std::cout << "[EXEC] exit " << order_id << " price not reported, using last price "
              << last_price << "\n";
    return last_price;
}

ExecutionResult LiveStrikeExecutor::execute(Strike& strike, const CampaignSnapshot& campaign) {
    const std::string pair = kraken_pair(strike.symbol);
    if (pair.empty())
        return abort(strike, ErrorCode::InvalidSize, "no kraken pair for " + strike.symbol);

    // Sized as in simulation for the record; the live ticket is the fixed
    // per-order notional.
    double capital_usd = to_usd(campaign.capital_cents);
    strike.begin_striking(sizer_.size_usd(capital_usd, strike.confidence, strike.leverage));

    // ---- 1. Entry ----
    std::string entry_id;
    try {
        entry_id = gateway_.place_order(pair, Side::Buy, params_.order_usd_size, strike.entry_price);
    } catch (const StrikeError& e) {
        return abort(strike, e.code(), std::string("entry order failed: ") + e.what());
    }
    std::printf("[EXEC] LIVE ORDER %s buy $%.2f @ ~%.4f lev=%dx (txid=%s)\n",
                pair.c_str(), params_.order_usd_size, strike.entry_price,
                strike.leverage, entry_id.c_str());

    // ---- 2. Fill ----
    Fill entry = await_entry_fill(entry_id, strike.entry_price);
    if (entry.volume <= 0.0) {
        try {
            gateway_.cancel_order(entry_id);
            std::cout << "[EXEC] cancelled unfilled order " << entry_id << "\n";
        } catch (const StrikeError& e) {
            std::cerr << "[EXEC] ALERT: cancel of unfilled order " << entry_id
                      << " failed, order may still be working: " << e.what() << "\n";
        }
        return abort(strike, ErrorCode::NoFill,
                     "no fill for " + entry_id + " in " +
                     std::to_string(params_.fill_timeout.count() / 1000) + "s");
    }

    // ---- 3. Hold ----
    if (!clock_.wait_for(params_.hold))
        std::cout << "[EXEC] hold interrupted, exiting " << pair << " early\n";

    // ---- 4. Exit ----
    std::string exit_id;
    try {
        exit_id = gateway_.place_exit(pair, entry.volume);
    } catch (const StrikeError& e) {
        char vol[32];
        std::snprintf(vol, sizeof(vol), "%.8f", entry.volume);
        std::cerr << "[EXEC] ALERT: exit failed, position OPEN " << pair
                  << " vol=" << vol << " (buyTx=" << entry_id << ")\n";
        return abort(strike, e.code(), std::string("exit failed: ") + e.what());
    }

    double exit_price = await_exit_price(exit_id, entry.price);

    // ---- 5. P&L ----
    double pnl = (exit_price - entry.price) * entry.volume;
    bool hit = pnl >= 0.0;
    strike.resolve(hit, exit_price, pnl);

    std::printf("[EXEC] LIVE EXIT %s filled=%.8f buy=%.4f sell=%.4f PnL=$%.2f (buyTx=%s, sellTx=%s)\n",
                pair.c_str(), entry.volume, entry.price, exit_price, pnl,
                entry_id.c_str(), exit_id.c_str());

    ExecutionResult r;
    r.executed  = true;
    r.success   = hit;
    r.pnl_usd   = pnl;
    r.pnl_cents = strike.pnl_cents;
    return r;
}

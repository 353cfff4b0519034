#include "core/Strike.hpp"
#include <chrono>
#include <cmath>
#include <stdexcept>

using namespace strikebox;

const char* strikebox::to_string(StrikeCategory c) {
    switch (c) {
        case StrikeCategory::Arbitrage:  return "Arbitrage";
        case StrikeCategory::Momentum:   return "Momentum";
        case StrikeCategory::Volatility: return "Volatility";
        case StrikeCategory::Liquidity:  return "Liquidity";
        case StrikeCategory::Funding:    return "Funding";
        case StrikeCategory::Flash:      return "Flash";
    }
    return "Arbitrage";
}

const char* strikebox::to_string(StrikeStatus s) {
    switch (s) {
        case StrikeStatus::Targeting: return "TARGETING";
        case StrikeStatus::Striking:  return "STRIKING";
        case StrikeStatus::Hit:       return "HIT";
        case StrikeStatus::Miss:      return "MISS";
        case StrikeStatus::Aborted:   return "ABORTED";
    }
    return "UNKNOWN";
}

std::string strikebox::oracle_label(StrikeCategory c) {
    return std::string("Macro") + to_string(c);
}

StrikeCategory strikebox::category_from_index(uint64_t n) {
    return static_cast<StrikeCategory>(n % STRIKE_CATEGORY_COUNT);
}

bool Strike::terminal() const {
    return status == StrikeStatus::Hit ||
           status == StrikeStatus::Miss ||
           status == StrikeStatus::Aborted;
}

void Strike::begin_striking(double size_usd) {
    if (status != StrikeStatus::Targeting)
        throw std::logic_error("strike " + std::to_string(id) +
                               ": begin_striking from " + to_string(status));
    strike_force_usd = size_usd;
    status = StrikeStatus::Striking;
}

void Strike::resolve(bool hit, double exit, double pnl) {
    if (status != StrikeStatus::Striking)
        throw std::logic_error("strike " + std::to_string(id) +
                               ": resolve from " + to_string(status));
    exit_price  = exit;
    pnl_usd     = pnl;
    pnl_cents   = to_cents(pnl);
    resolved_ms = now_epoch_ms();
    status = hit ? StrikeStatus::Hit : StrikeStatus::Miss;
}

void Strike::abort() {
    if (terminal())
        throw std::logic_error("strike " + std::to_string(id) +
                               ": abort from " + to_string(status));
    resolved_ms = now_epoch_ms();
    status = StrikeStatus::Aborted;
}

int64_t strikebox::now_epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

int64_t strikebox::to_cents(double usd) {
    return static_cast<int64_t>(std::llround(usd * 100.0));
}

double strikebox::to_usd(int64_t cents) {
    return static_cast<double>(cents) / 100.0;
}

#include "strategy/StrikeGenerator.hpp"
#include <utility>

using namespace strikebox;

const SymbolSpec strikebox::STRIKE_SYMBOLS[SYMBOL_COUNT] = {
    {"WETH/USDC", 3000.0},
    {"WBTC/USDC", 45000.0},
    {"LINK/USDC", 15.50},
    {"UNI/USDC",  8.50},
    {"AAVE/USDC", 120.0},
    {"CRV/USDC",  0.85},
    {"USDC/USDT", 1.00},
    {"DAI/USDC",  1.00},
};

double strikebox::expected_return_for(StrikeCategory c) {
    switch (c) {
        case StrikeCategory::Arbitrage:  return 0.005;
        case StrikeCategory::Momentum:   return 0.022;
        case StrikeCategory::Volatility: return 0.032;
        case StrikeCategory::Liquidity:  return 0.035;
        case StrikeCategory::Funding:    return 0.042;
        case StrikeCategory::Flash:      return 0.059;
    }
    return 0.01;
}

static Strike make_targeting(uint64_t id, const std::string& symbol, StrikeCategory category,
                             double entry, double confidence, double expected, int leverage) {
    Strike s;
    s.id              = id;
    s.symbol          = symbol;
    s.category        = category;
    s.entry_price     = entry;
    s.target_price    = entry * (1.0 + expected);
    s.stop_loss       = entry * STOP_LOSS_FRACTION;
    s.confidence      = confidence;
    s.expected_return = expected;
    s.max_exposure_ms = MAX_EXPOSURE_MS;
    s.leverage        = leverage;
    s.created_ms      = now_epoch_ms();
    s.status          = StrikeStatus::Targeting;
    return s;
}

// ---------------------------------------------------------------------------
// Simulation
// ---------------------------------------------------------------------------
SimulatedStrikeGenerator::SimulatedStrikeGenerator(StrikeIdSource& ids,
                                                   const PositionSizer& sizer,
                                                   Draw draw)
    : ids_(ids), sizer_(sizer), draw_(std::move(draw)) {}

GenerateResult SimulatedStrikeGenerator::next(const CampaignSnapshot&) {
    uint64_t id = ids_.next();
    const SymbolSpec& sym = STRIKE_SYMBOLS[id % SYMBOL_COUNT];
    StrikeCategory category = category_from_index(id);

    double confidence = 0.80 + draw_() * 0.15;
    return GenerateResult::make_strike(
        make_targeting(id, sym.symbol, category, sym.base_price, confidence,
                       expected_return_for(category), sizer_.leverage_for(category)));
}

// ---------------------------------------------------------------------------
// Oracle-driven
// ---------------------------------------------------------------------------
AnalysisStrikeGenerator::AnalysisStrikeGenerator(StrikeIdSource& ids,
                                                 const PositionSizer& sizer,
                                                 AnalysisGateway& gateway)
    : ids_(ids), sizer_(sizer), gateway_(gateway) {}

GenerateResult AnalysisStrikeGenerator::next(const CampaignSnapshot&) {
    uint64_t id = ids_.next();
    const SymbolSpec& sym = STRIKE_SYMBOLS[id % SYMBOL_COUNT];
    StrikeCategory category = category_from_index(id);

    AnalysisDecision d = gateway_.evaluate(sym.symbol, category);
    if (!d.accepted)
        return GenerateResult::make_skip(d.skip_code, d.reason);

    return GenerateResult::make_strike(
        make_targeting(id, sym.symbol, category, d.result.price, d.adjusted_confidence,
                       d.result.expected_return, sizer_.leverage_for(category)));
}

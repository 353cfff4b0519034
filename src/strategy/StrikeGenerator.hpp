#pragma once
#include <functional>
#include <string>
#include <utility>

#include "analysis/AnalysisGateway.hpp"
#include "core/Strike.hpp"
#include "core/StrikeError.hpp"
#include "execution/PositionSizer.hpp"
#include "risk/CampaignState.hpp"

namespace strikebox {

// Either a fresh Targeting strike or a typed skip. A skip is not a trade:
// the controller neither counts it nor penalises it.
struct GenerateResult {
    bool        skipped{false};
    ErrorCode   skip_code{ErrorCode::AnalysisUnavailable};
    std::string skip_reason;
    Strike      strike;

    static GenerateResult make_strike(Strike s) {
        GenerateResult r;
        r.strike = std::move(s);
        return r;
    }
    static GenerateResult make_skip(ErrorCode code, std::string reason) {
        GenerateResult r;
        r.skipped     = true;
        r.skip_code   = code;
        r.skip_reason = std::move(reason);
        return r;
    }
};

// ---------------------------------------------------------------------------
// Fixed universe. Strike n trades symbol n % 8 with category n % 6.
// ---------------------------------------------------------------------------
struct SymbolSpec {
    const char* symbol;
    double      base_price;
};

static constexpr int SYMBOL_COUNT = 8;
extern const SymbolSpec STRIKE_SYMBOLS[SYMBOL_COUNT];

double expected_return_for(StrikeCategory c);

static constexpr double   STOP_LOSS_FRACTION = 0.98;   // stop = entry * 0.98
static constexpr uint64_t MAX_EXPOSURE_MS    = 30000;

class StrikeGenerator {
public:
    virtual ~StrikeGenerator() = default;
    virtual GenerateResult next(const CampaignSnapshot& campaign) = 0;
};

// Synthetic strikes for load and regression runs. Bypasses the oracle.
// Confidence is drawn uniformly from [0.80, 0.95).
class SimulatedStrikeGenerator : public StrikeGenerator {
public:
    using Draw = std::function<double()>;   // uniform in [0, 1)

    SimulatedStrikeGenerator(StrikeIdSource& ids, const PositionSizer& sizer, Draw draw);

    GenerateResult next(const CampaignSnapshot& campaign) override;

private:
    StrikeIdSource&      ids_;
    const PositionSizer& sizer_;
    Draw                 draw_;
};

// Oracle-driven strikes. Every candidate goes through the gateway; a
// rejection becomes a skip carrying the gateway's reason.
class AnalysisStrikeGenerator : public StrikeGenerator {
public:
    AnalysisStrikeGenerator(StrikeIdSource& ids, const PositionSizer& sizer, AnalysisGateway& gateway);

    GenerateResult next(const CampaignSnapshot& campaign) override;

private:
    StrikeIdSource&      ids_;
    const PositionSizer& sizer_;
    AnalysisGateway&     gateway_;
};

} // namespace strikebox

#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace strikebox {

enum class StrikeCategory : uint8_t {
    Arbitrage, Momentum, Volatility, Liquidity, Funding, Flash
};

static constexpr int STRIKE_CATEGORY_COUNT = 6;

enum class StrikeStatus : uint8_t {
    Targeting, Striking, Hit, Miss, Aborted
};

const char* to_string(StrikeCategory c);
const char* to_string(StrikeStatus s);

// Label the analysis oracle expects on its command line (e.g. "MacroMomentum").
std::string oracle_label(StrikeCategory c);

StrikeCategory category_from_index(uint64_t n);

// ---------------------------------------------------------------------------
// Strike: one candidate/placed trade.
//
// Created in Targeting by a generator. Only the executor moves it forward:
//   Targeting -> Striking           begin_striking()
//   Striking  -> Hit | Miss         resolve()
//   Targeting | Striking -> Aborted abort()
// A terminal strike is frozen. Any further transition throws std::logic_error.
// ---------------------------------------------------------------------------
struct Strike {
    uint64_t       id{0};
    std::string    symbol;
    StrikeCategory category{StrikeCategory::Arbitrage};
    double         entry_price{0.0};
    double         target_price{0.0};
    double         stop_loss{0.0};
    double         confidence{0.0};
    double         expected_return{0.0};
    uint64_t       max_exposure_ms{30000};
    int            leverage{1};
    double         strike_force_usd{0.0};   // position size after sizing
    int64_t        created_ms{0};

    StrikeStatus   status{StrikeStatus::Targeting};
    std::optional<double>  exit_price;
    std::optional<double>  pnl_usd;
    int64_t                pnl_cents{0};
    std::optional<int64_t> resolved_ms;

    bool terminal() const;

    void begin_striking(double size_usd);
    void resolve(bool hit, double exit, double pnl);
    void abort();
};

// Process-wide strike id counter. First id handed out is 1.
class StrikeIdSource {
public:
    uint64_t next() { return next_.fetch_add(1, std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> next_{1};
};

int64_t now_epoch_ms();

// USD -> integer cents, rounded to nearest.
int64_t to_cents(double usd);
double  to_usd(int64_t cents);

} // namespace strikebox

#pragma once
#include <optional>
#include <string>

namespace strikebox {

enum class Side { Buy, Sell };

inline const char* to_string(Side s) { return s == Side::Buy ? "buy" : "sell"; }

// Fill progress of one exchange order. Both fields stay empty until the
// exchange reports a non-zero value.
struct OrderFill {
    std::optional<double> volume_executed;
    std::optional<double> average_price;
    std::string           status;   // exchange status string, e.g. "open", "closed"
};

// ---------------------------------------------------------------------------
// Private order API used by the live executor.
// All methods throw StrikeError:
//   InvalidSize       bad notional/price/volume, nothing sent
//   ExchangeRejected  exchange answered with an error (terminal)
//   TransportError    transport still failing after the retry budget
// ---------------------------------------------------------------------------
class OrderGateway {
public:
    virtual ~OrderGateway() = default;

    virtual std::string place_order(const std::string& pair, Side side,
                                    double notional_usd, double reference_price) = 0;
    virtual OrderFill   query_order(const std::string& order_id) = 0;
    virtual std::string place_exit(const std::string& pair, double volume) = 0;
    virtual void        cancel_order(const std::string& order_id) = 0;
};

} // namespace strikebox

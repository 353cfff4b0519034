#pragma once
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "exchange/OrderGateway.hpp"
#include "exchange/HttpTransport.hpp"
#include "exchange/kraken/KrakenAuth.hpp"
#include "runtime/Clock.hpp"

namespace strikebox {

// Internal symbol -> Kraken pair code. Empty string for unknown symbols.
std::string kraken_pair(const std::string& symbol);

class KrakenRestClient : public OrderGateway {
public:
    using Params = std::vector<std::pair<std::string, std::string>>;

    static constexpr int  MAX_ATTEMPTS     = 3;
    static constexpr long BACKOFF_STEP_MS  = 500;   // wait = attempt * step

    KrakenRestClient(const std::string& base_url,
                     const KrakenAuth& auth,
                     HttpTransport& transport,
                     Clock& clock);

    std::string place_order(const std::string& pair, Side side,
                            double notional_usd, double reference_price) override;
    OrderFill   query_order(const std::string& order_id) override;
    std::string place_exit(const std::string& pair, double volume) override;
    void        cancel_order(const std::string& order_id) override;

    // Signed POST with the retry policy. Returns the "result" object.
    nlohmann::json private_call(const std::string& path, const Params& params);

private:
    nlohmann::json attempt_once(const std::string& path, const Params& params);
    std::string    submit_market(const std::string& pair, Side side, double volume);

    std::string    base_;
    const KrakenAuth& auth_;
    HttpTransport& transport_;
    Clock&         clock_;
    NonceSource    nonce_;
};

// application/x-www-form-urlencoded encoding of a single component.
std::string form_encode(const std::string& s);

} // namespace strikebox

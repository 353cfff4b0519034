#include "exchange/kraken/KrakenRestClient.hpp"
#include "core/StrikeError.hpp"

#include <cstdio>
#include <iostream>
#include <unordered_map>

using namespace strikebox;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Kraken private REST, signed request flow:
//   1. nonce = epoch ms, strictly increasing
//   2. body  = "nonce=<n>&k1=v1&..." (form-encoded)
//   3. API-Sign = HMAC-SHA512(secret, path + SHA256(nonce + body)) -> base64
//   4. POST base + path, headers API-Key / API-Sign
// Response: {"error":[...], "result":{...}}. Non-empty error = rejection.
// ---------------------------------------------------------------------------

static constexpr const char* ADD_ORDER_PATH    = "/0/private/AddOrder";
static constexpr const char* QUERY_ORDERS_PATH = "/0/private/QueryOrders";
static constexpr const char* CANCEL_ORDER_PATH = "/0/private/CancelOrder";

std::string strikebox::kraken_pair(const std::string& symbol) {
    static const std::unordered_map<std::string, std::string> pairs = {
        {"WETH/USDC", "ETHUSD"},
        {"WBTC/USDC", "XBTUSD"},
        {"LINK/USDC", "LINKUSD"},
        {"UNI/USDC",  "UNIUSD"},
        {"AAVE/USDC", "AAVEUSD"},
        {"CRV/USDC",  "CRVUSD"},
        {"USDC/USDT", "USDCUSD"},
        {"DAI/USDC",  "DAIUSD"},
    };
    auto it = pairs.find(symbol);
    return it == pairs.end() ? std::string() : it->second;
}

std::string strikebox::form_encode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

static std::string format_volume(double volume) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.8f", volume);
    return buf;
}

// Kraken sends numbers as strings ("0.00120000"). Accept either form.
static std::optional<double> positive_number(const json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    const json& v = j[key];
    double d = 0.0;
    try {
        if (v.is_string())      d = std::stod(v.get<std::string>());
        else if (v.is_number()) d = v.get<double>();
        else return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (d > 0.0) return d;
    return std::nullopt;
}

KrakenRestClient::KrakenRestClient(const std::string& base_url,
                                   const KrakenAuth& auth,
                                   HttpTransport& transport,
                                   Clock& clock)
    : base_(base_url), auth_(auth), transport_(transport), clock_(clock) {
    std::cout << "[KRAKEN] REST base=" << base_ << " key=" << auth_.masked_key() << "\n";
}

json KrakenRestClient::attempt_once(const std::string& path, const Params& params) {
    // Fresh nonce per attempt. Kraken rejects a reused nonce.
    uint64_t nonce = nonce_.next();

    std::string body = "nonce=" + std::to_string(nonce);
    for (const auto& kv : params)
        body += "&" + form_encode(kv.first) + "=" + form_encode(kv.second);

    std::vector<std::string> headers = {
        "API-Key: "  + auth_.api_key(),
        "API-Sign: " + auth_.sign(path, nonce, body),
        "Content-Type: application/x-www-form-urlencoded; charset=utf-8",
    };

    HttpResponse resp = transport_.post(base_ + path, headers, body);

    if (resp.status < 200 || resp.status >= 300)
        throw StrikeError(ErrorCode::TransportError,
                          "HTTP " + std::to_string(resp.status) + " on " + path);

    json doc;
    try {
        doc = json::parse(resp.body);
    } catch (const json::parse_error& e) {
        throw StrikeError(ErrorCode::TransportError,
                          std::string("unparseable response on ") + path + ": " + e.what());
    }

    if (doc.contains("error") && doc["error"].is_array() && !doc["error"].empty())
        throw StrikeError(ErrorCode::ExchangeRejected,
                          "kraken rejected " + path + ": " + doc["error"].dump());

    if (!doc.contains("result") || !doc["result"].is_object())
        throw StrikeError(ErrorCode::TransportError, "no result object on " + path);

    return doc["result"];
}

json KrakenRestClient::private_call(const std::string& path, const Params& params) {
    std::string last_error;
    for (int attempt = 1; attempt <= MAX_ATTEMPTS; ++attempt) {
        try {
            return attempt_once(path, params);
        } catch (const StrikeError& e) {
            if (!e.retryable()) throw;
            last_error = e.what();
        }
        if (attempt < MAX_ATTEMPTS) {
            std::cout << "[KRAKEN] Retry " << attempt << "/" << MAX_ATTEMPTS
                      << " " << path << " (" << last_error << ")\n";
            clock_.sleep_for(std::chrono::milliseconds(attempt * BACKOFF_STEP_MS));
        }
    }
    throw StrikeError(ErrorCode::TransportError,
                      path + " failed after " + std::to_string(MAX_ATTEMPTS) +
                      " attempts: " + last_error);
}

std::string KrakenRestClient::submit_market(const std::string& pair, Side side, double volume) {
    json result = private_call(ADD_ORDER_PATH, {
        {"pair",      pair},
        {"type",      to_string(side)},
        {"ordertype", "market"},
        {"volume",    format_volume(volume)},
    });

    if (result.contains("txid") && result["txid"].is_array() && !result["txid"].empty()) {
        const json& id = result["txid"][0];
        return id.is_string() ? id.get<std::string>() : id.dump();
    }
    throw StrikeError(ErrorCode::ExchangeRejected, "AddOrder response carries no txid");
}

std::string KrakenRestClient::place_order(const std::string& pair, Side side,
                                          double notional_usd, double reference_price) {
    if (notional_usd <= 0.0 || reference_price <= 0.0)
        throw StrikeError(ErrorCode::InvalidSize,
                          "invalid size/price: notional=" + std::to_string(notional_usd) +
                          " price=" + std::to_string(reference_price));
    return submit_market(pair, side, notional_usd / reference_price);
}

std::string KrakenRestClient::place_exit(const std::string& pair, double volume) {
    if (volume <= 0.0)
        throw StrikeError(ErrorCode::InvalidSize, "invalid exit volume " + std::to_string(volume));
    return submit_market(pair, Side::Sell, volume);
}

OrderFill KrakenRestClient::query_order(const std::string& order_id) {
    json result = private_call(QUERY_ORDERS_PATH, {{"txid", order_id}});

    OrderFill fill;
    if (!result.contains(order_id) || !result[order_id].is_object())
        return fill;   // not visible yet

    const json& info = result[order_id];
    fill.volume_executed = positive_number(info, "vol_exec");
    fill.average_price   = positive_number(info, "price");
    if (info.contains("status") && info["status"].is_string())
        fill.status = info["status"].get<std::string>();
    return fill;
}

void KrakenRestClient::cancel_order(const std::string& order_id) {
    private_call(CANCEL_ORDER_PATH, {{"txid", order_id}});
}

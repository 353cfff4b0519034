#include "analysis/AnalysisResult.hpp"
#include "core/StrikeError.hpp"
#include <nlohmann/json.hpp>

using namespace strikebox;
using json = nlohmann::json;

static double required_number(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number())
        throw StrikeError(ErrorCode::AnalysisUnavailable,
                          std::string("oracle output missing numeric '") + key + "'");
    return j[key].get<double>();
}

static double optional_number(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<double>();
    return 0.0;
}

AnalysisResult strikebox::parse_analysis(const std::string& text) {
    // Oracle may print diagnostics before the object; take the outermost braces.
    size_t open  = text.find('{');
    size_t close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open)
        throw StrikeError(ErrorCode::AnalysisUnavailable, "oracle output has no JSON object");

    json doc;
    try {
        doc = json::parse(text.substr(open, close - open + 1));
    } catch (const json::parse_error& e) {
        throw StrikeError(ErrorCode::AnalysisUnavailable,
                          std::string("oracle output unparseable: ") + e.what());
    }

    if (!doc.is_object())
        throw StrikeError(ErrorCode::AnalysisUnavailable, "oracle output is not a JSON object");

    AnalysisResult r;
    if (doc.contains("symbol")) {
        if (!doc["symbol"].is_string())
            throw StrikeError(ErrorCode::AnalysisUnavailable, "oracle output 'symbol' is not a string");
        r.symbol = doc["symbol"].get<std::string>();
    }
    r.price           = required_number(doc, "price");
    r.confidence      = required_number(doc, "confidence");
    r.expected_return = required_number(doc, "expected_return");
    r.precision_score = required_number(doc, "precision_score");
    r.volatility      = optional_number(doc, "volatility");
    r.momentum        = optional_number(doc, "momentum");
    r.liquidity       = optional_number(doc, "liquidity");
    if (doc.contains("timestamp") && doc["timestamp"].is_number_integer())
        r.timestamp = doc["timestamp"].get<int64_t>();

    if (!doc.contains("recommendation") || !doc["recommendation"].is_string())
        throw StrikeError(ErrorCode::AnalysisUnavailable, "oracle output missing 'recommendation'");
    std::string rec = doc["recommendation"].get<std::string>();
    if (rec == "EXECUTE")     r.recommendation = Recommendation::Execute;
    else if (rec == "WAIT")   r.recommendation = Recommendation::Wait;
    else throw StrikeError(ErrorCode::AnalysisUnavailable, "unknown recommendation '" + rec + "'");

    if (r.price <= 0.0)
        throw StrikeError(ErrorCode::AnalysisUnavailable, "oracle price is not positive");

    return r;
}

#pragma once
#include <cstdint>
#include <string>

namespace strikebox {

enum class Recommendation { Execute, Wait };

// Read-only output of the analysis oracle for one (symbol, strategy) query.
struct AnalysisResult {
    std::string    symbol;
    double         price{0.0};
    double         confidence{0.0};
    double         expected_return{0.0};
    double         volatility{0.0};
    double         momentum{0.0};
    double         liquidity{0.0};
    double         precision_score{0.0};
    Recommendation recommendation{Recommendation::Wait};
    int64_t        timestamp{0};
};

// Parses the oracle's JSON object. Throws StrikeError(AnalysisUnavailable)
// on malformed or incomplete output.
AnalysisResult parse_analysis(const std::string& text);

// Any analysis source. Throws StrikeError(AnalysisUnavailable) when no
// result can be produced.
class Evaluator {
public:
    virtual ~Evaluator() = default;
    virtual AnalysisResult evaluate(const std::string& symbol, const std::string& label) = 0;
};

} // namespace strikebox

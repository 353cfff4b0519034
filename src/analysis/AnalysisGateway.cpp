#include "analysis/AnalysisGateway.hpp"
#include <cstdio>

using namespace strikebox;

AnalysisGateway::AnalysisGateway(Evaluator& evaluator, double min_confidence)
    : evaluator_(evaluator), min_confidence_(min_confidence) {}

AnalysisDecision AnalysisGateway::evaluate(const std::string& symbol, StrikeCategory category) {
    AnalysisDecision d;

    try {
        d.result = evaluator_.evaluate(symbol, oracle_label(category));
    } catch (const StrikeError& e) {
        d.skip_code = ErrorCode::AnalysisUnavailable;
        d.reason    = std::string("analysis unavailable: ") + e.what();
        return d;
    }

    d.adjusted_confidence = d.result.confidence * d.result.precision_score;

    bool execute = d.result.recommendation == Recommendation::Execute;
    if (execute && d.adjusted_confidence >= min_confidence_) {
        d.accepted = true;
        return d;
    }

    char buf[128];
    std::snprintf(buf, sizeof(buf), "%s conf=%.2f min=%.2f",
                  execute ? "EXECUTE" : "WAIT", d.adjusted_confidence, min_confidence_);
    d.skip_code = ErrorCode::BelowThreshold;
    d.reason    = buf;
    return d;
}

#pragma once
#include <string>

#include "analysis/AnalysisResult.hpp"
#include "core/Strike.hpp"
#include "core/StrikeError.hpp"

namespace strikebox {

// Outcome of one gateway evaluation. When accepted is false, skip_code is
// AnalysisUnavailable or BelowThreshold and reason says why.
struct AnalysisDecision {
    bool           accepted{false};
    double         adjusted_confidence{0.0};
    AnalysisResult result;
    ErrorCode      skip_code{ErrorCode::AnalysisUnavailable};
    std::string    reason;
};

// ---------------------------------------------------------------------------
// Go/no-go gate in front of the oracle.
//   adjusted = confidence * precision_score
//   accept  <=> recommendation == EXECUTE && adjusted >= min_confidence
// Oracle failures never escape: they come back as an AnalysisUnavailable skip.
// ---------------------------------------------------------------------------
class AnalysisGateway {
public:
    AnalysisGateway(Evaluator& evaluator, double min_confidence);

    AnalysisDecision evaluate(const std::string& symbol, StrikeCategory category);

    double min_confidence() const { return min_confidence_; }

private:
    Evaluator& evaluator_;
    double     min_confidence_;
};

} // namespace strikebox

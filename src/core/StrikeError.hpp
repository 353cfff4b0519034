#pragma once
#include <stdexcept>
#include <string>

namespace strikebox {

// ---------------------------------------------------------------------------
// Error taxonomy for the strike loop.
//
//   ConfigurationError   fatal, process exits non-zero
//   AnalysisUnavailable  candidate skipped, not counted
//   BelowThreshold       candidate skipped, not counted
//   TransportError       retried by the REST client, then ExecutionFailed
//   ExchangeRejected     terminal for the strike, never retried
//   InvalidSize          order refused before it reaches the wire
//   NoFill               order placed but not filled inside the poll window
//   ExecutionFailed      strike aborted, logged as actionable
//   EmergencyStop        controller-level halt, not tied to a single strike
// ---------------------------------------------------------------------------
enum class ErrorCode {
    ConfigurationError,
    AnalysisUnavailable,
    BelowThreshold,
    TransportError,
    ExchangeRejected,
    InvalidSize,
    NoFill,
    ExecutionFailed,
    EmergencyStop
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigurationError:  return "ConfigurationError";
        case ErrorCode::AnalysisUnavailable: return "AnalysisUnavailable";
        case ErrorCode::BelowThreshold:      return "BelowThreshold";
        case ErrorCode::TransportError:      return "TransportError";
        case ErrorCode::ExchangeRejected:    return "ExchangeRejected";
        case ErrorCode::InvalidSize:         return "InvalidSize";
        case ErrorCode::NoFill:              return "NoFill";
        case ErrorCode::ExecutionFailed:     return "ExecutionFailed";
        case ErrorCode::EmergencyStop:       return "EmergencyStop";
    }
    return "Unknown";
}

class StrikeError : public std::runtime_error {
public:
    StrikeError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

    // Only transport-level failures are worth another attempt.
    bool retryable() const { return code_ == ErrorCode::TransportError; }

private:
    ErrorCode code_;
};

} // namespace strikebox

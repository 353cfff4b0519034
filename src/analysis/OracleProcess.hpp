#pragma once
#include <string>
#include "analysis/AnalysisResult.hpp"

namespace strikebox {

// ---------------------------------------------------------------------------
// Analysis oracle run as a child process:
//   <command> <script> <symbol> <label>
// stdout is read through a pipe until EOF or the deadline. On timeout the
// child is SIGKILLed and reaped. stderr is inherited.
// ---------------------------------------------------------------------------
class OracleProcess : public Evaluator {
public:
    OracleProcess(std::string command, std::string script, int timeout_ms);

    AnalysisResult evaluate(const std::string& symbol, const std::string& label) override;

private:
    std::string run(const std::string& symbol, const std::string& label);

    std::string command_;
    std::string script_;
    int         timeout_ms_;
};

} // namespace strikebox

#include "config/StrikeConfig.hpp"
#include "core/StrikeError.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace strikebox;

const char* strikebox::to_string(RunMode m) {
    switch (m) {
        case RunMode::Simulation: return "SIMULATION";
        case RunMode::Paper:      return "PAPER";
        case RunMode::Live:       return "LIVE";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// .env loader, KEY=VALUE per line. Blank lines and # comments skipped,
// "export " prefix and surrounding quotes stripped. Only sets variables that
// are not already in the environment.
// ---------------------------------------------------------------------------
bool strikebox::load_dotenv(const char* path) {
    std::ifstream f(path);
    if (!f.is_open()) return false;

    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key   = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        if (key.compare(0, 7, "export ") == 0) key = key.substr(7);
        while (!key.empty() && key.back() == ' ') key.pop_back();

        size_t vs = 0;
        while (vs < value.size() && value[vs] == ' ') vs++;
        value = value.substr(vs);

        if (value.size() >= 2) {
            char q = value.front();
            if ((q == '"' || q == '\'') && value.back() == q)
                value = value.substr(1, value.size() - 2);
        }

        if (!key.empty() && !std::getenv(key.c_str()))
            setenv(key.c_str(), value.c_str(), 0);
    }

    std::cout << "[CONFIG] .env loaded from " << path << "\n";
    return true;
}

// ---------------------------------------------------------------------------
// Typed environment readers. Unset or empty = keep default. Anything that
// does not parse completely, or falls outside its range, is fatal.
// ---------------------------------------------------------------------------
namespace {

[[noreturn]] void bad_setting(const char* name, const std::string& why) {
    throw StrikeError(ErrorCode::ConfigurationError, std::string(name) + ": " + why);
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

void read_double(const char* name, double& out, double min_inclusive, double max_inclusive) {
    const char* v = env(name);
    if (!v) return;
    char* end = nullptr;
    double d = std::strtod(v, &end);
    if (end == v || *end != '\0') bad_setting(name, "not a number");
    if (d < min_inclusive || d > max_inclusive) {
        std::ostringstream os;
        os << "out of range [" << min_inclusive << ", " << max_inclusive << "]";
        bad_setting(name, os.str());
    }
    out = d;
}

template <typename Int>
void read_int(const char* name, Int& out, long long min_inclusive, long long max_inclusive) {
    const char* v = env(name);
    if (!v) return;
    char* end = nullptr;
    long long n = std::strtoll(v, &end, 10);
    if (end == v || *end != '\0') bad_setting(name, "not an integer");
    if (n < min_inclusive || n > max_inclusive) {
        std::ostringstream os;
        os << "out of range [" << min_inclusive << ", " << max_inclusive << "]";
        bad_setting(name, os.str());
    }
    out = static_cast<Int>(n);
}

void read_string(const char* name, std::string& out) {
    const char* v = env(name);
    if (v) out = v;
}

bool read_flag(const char* name) {
    const char* v = env(name);
    if (!v) return false;
    std::string s(v);
    if (s == "1" || s == "true")  return true;
    if (s == "0" || s == "false") return false;
    bad_setting(name, "expected 0 or 1");
}

} // namespace

StrikeConfig StrikeConfig::from_env() {
    StrikeConfig c;

    bool live = read_flag("LIVE_TRADING");
    bool sim  = read_flag("SIM_MODE");
    if (live && sim) bad_setting("LIVE_TRADING", "cannot be combined with SIM_MODE=1");
    c.mode = live ? RunMode::Live : (sim ? RunMode::Simulation : RunMode::Paper);

    read_string("KRAKEN_API_KEY",    c.api_key);
    read_string("KRAKEN_API_SECRET", c.api_secret);
    read_string("KRAKEN_BASE_URL",   c.kraken_base_url);

    read_double("ORDER_USD_SIZE", c.order_usd_size, 0.01, 1e9);

    double risk_pct = c.risk_per_trade_pct * 100.0;
    read_double("ORDER_RISK_PCT", risk_pct, 0.0, 100.0);
    c.risk_per_trade_pct = risk_pct / 100.0;

    read_double("STRIKE_FORCE_PCT",       c.strike_force_pct, 0.0001, 1.0);
    read_int   ("MIN_LEVERAGE",           c.min_leverage, 1, 100);
    read_int   ("MAX_LEVERAGE",           c.max_leverage, 1, 100);
    read_int   ("INITIAL_CAPITAL_CENTS",  c.initial_capital_cents, 1, 1000000000000000LL);
    read_int   ("TARGET_CAPITAL_CENTS",   c.target_capital_cents, 1, 1000000000000000LL);
    read_int   ("TOTAL_TRADES",           c.total_trades, 1, 100000000);
    read_int   ("CAMPAIGN_DAYS",          c.campaign_days, 1, 3650);
    read_double("MAX_DRAWDOWN_PCT",       c.max_drawdown_pct, 0.0, 100.0);
    read_int   ("MAX_CONSECUTIVE_MISSES", c.max_consecutive_misses, 1, 1000000);
    read_double("MIN_CONFIDENCE",         c.min_confidence, 0.0, 1.0);
    read_string("ORACLE_COMMAND",         c.oracle_command);
    read_string("ORACLE_SCRIPT",          c.oracle_script);
    read_int   ("ORACLE_TIMEOUT_MS",      c.oracle_timeout_ms, 100, 600000);
    read_int   ("HOLD_SECONDS",           c.hold_seconds, 0, 86400);
    read_int   ("COOLDOWN_MS",            c.cooldown_ms, 0, 3600000);
    read_string("STRIKE_JOURNAL_PATH",    c.journal_path);
    read_string("STRIKE_REPORT_PATH",     c.report_path);
    read_int   ("STRIKE_SEED",            c.seed, 0, 9223372036854775807LL);
    c.debug_log = read_flag("STRIKE_DEBUG");

    if (c.min_leverage > c.max_leverage)
        bad_setting("MIN_LEVERAGE", "greater than MAX_LEVERAGE");

    if (c.mode == RunMode::Live) {
        if (c.api_key.empty())    bad_setting("KRAKEN_API_KEY", "required when LIVE_TRADING=1");
        if (c.api_secret.empty()) bad_setting("KRAKEN_API_SECRET", "required when LIVE_TRADING=1");
    }

    return c;
}

SizingPolicy StrikeConfig::sizing_policy() const {
    SizingPolicy p;
    p.strike_force_pct   = strike_force_pct;
    p.min_leverage       = min_leverage;
    p.max_leverage       = max_leverage;
    p.risk_per_trade_pct = mode == RunMode::Simulation ? risk_per_trade_pct : 0.0;
    p.stop_loss_pct      = sim_stop_loss_pct;
    return p;
}

std::string StrikeConfig::describe() const {
    std::ostringstream os;
    os << "[CONFIG] mode=" << to_string(mode) << "\n"
       << "[CONFIG] capital=" << initial_capital_cents / 100.0
       << " target=" << target_capital_cents / 100.0
       << " trades=" << total_trades
       << " days=" << campaign_days << "\n"
       << "[CONFIG] strike_force=" << strike_force_pct * 100.0 << "%"
       << " leverage=" << min_leverage << "-" << max_leverage << "x"
       << " risk/trade=" << risk_per_trade_pct * 100.0 << "%"
       << " order_usd=" << order_usd_size << "\n"
       << "[CONFIG] max_dd=" << max_drawdown_pct << "%"
       << " max_misses=" << max_consecutive_misses
       << " min_conf=" << min_confidence << "\n"
       << "[CONFIG] oracle=" << oracle_command << " " << oracle_script
       << " timeout=" << oracle_timeout_ms << "ms\n"
       << "[CONFIG] credentials=" << (api_key.empty() ? "absent" : "present") << "\n";
    return os.str();
}

#include "telemetry/StrikeJournal.hpp"
#include <cstdio>
#include <ctime>
#include <iostream>

using namespace strikebox;

StrikeJournal::StrikeJournal(const std::string& path) {
    if (path.empty()) return;

    out_.open(path, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        std::cerr << "[JOURNAL] cannot open " << path << ", journal disabled\n";
        return;
    }

    char header[128];
    time_t now = time(nullptr);
    struct tm tmv;
    localtime_r(&now, &tmv);
    std::snprintf(header, sizeof(header),
                  "# STRIKEBOX JOURNAL - Started %04d-%02d-%02d %02d:%02d:%02d\n",
                  tmv.tm_year + 1900, tmv.tm_mon + 1, tmv.tm_mday,
                  tmv.tm_hour, tmv.tm_min, tmv.tm_sec);
    out_ << header;
    out_.flush();
    std::cout << "[JOURNAL] Initialized: " << path << "\n";
}

std::string StrikeJournal::format(const Strike& s, int64_t capital_cents) {
    char exit_buf[32] = "";
    if (s.exit_price) std::snprintf(exit_buf, sizeof(exit_buf), "%.6f", *s.exit_price);

    char buf[512];
    std::snprintf(buf, sizeof(buf),
                  "S|%llu|%s|%s|%s|%.6f|%s|%d|%.2f|%lld|%lld|%lld",
                  static_cast<unsigned long long>(s.id),
                  s.symbol.c_str(),
                  to_string(s.category),
                  to_string(s.status),
                  s.entry_price,
                  exit_buf,
                  s.leverage,
                  s.strike_force_usd,
                  static_cast<long long>(s.pnl_cents),
                  static_cast<long long>(capital_cents),
                  static_cast<long long>(s.resolved_ms.value_or(now_epoch_ms())));
    return buf;
}

void StrikeJournal::record(const Strike& s, int64_t capital_cents) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!out_.is_open()) return;
    out_ << format(s, capital_cents) << "\n";
    out_.flush();
}

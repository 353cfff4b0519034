#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

#include "core/Strike.hpp"

namespace strikebox {

// ---------------------------------------------------------------------------
// Append-only strike journal. One line per strike that reached a terminal
// state:
//   S|<id>|<symbol>|<category>|<status>|<entry>|<exit>|<lev>|<size>|<pnl_cents>|<capital_cents>|<ts_ms>
// Aborted strikes have an empty exit field. Disabled when path is empty.
// ---------------------------------------------------------------------------
class StrikeJournal {
public:
    explicit StrikeJournal(const std::string& path);

    bool enabled() const { return out_.is_open(); }
    void record(const Strike& s, int64_t capital_cents);

    // Line as written, without the trailing newline.
    static std::string format(const Strike& s, int64_t capital_cents);

private:
    std::ofstream out_;
    std::mutex    mtx_;
};

} // namespace strikebox

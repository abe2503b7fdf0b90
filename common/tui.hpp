#pragma once

// ============================================================
// tui.hpp -- ANSI progress display for one session
//
// Fed from a ProgressSubscription callback; rate and ETA come
// from the snapshot. Non-TTY output degrades to one stats line
// per second.
// ============================================================

#include "../common/platform.hpp"
#include "progress.hpp"
#include "session.hpp"
#include <mutex>
#include <string>

class Tui {
public:
    // label: "Sent" or "Recv"; title: shown above the bar
    Tui(std::string label, std::string title);

    // Render one frame to stdout
    void render(const ProgressSnapshot& snap);

    // Replace the bar with the session outcome
    void finish(const SessionReport& report);

    static bool is_tty();

private:
    std::mutex  mu_;
    std::string label_;
    std::string title_;
    int         lines_printed_{0};
    u64         last_plain_ms_{0};

    void clear_lines(int n);
    std::string build_progress_bar(double pct, int width) const;
};

// ============================================================
// tui.cpp -- ANSI progress display implementation
// ============================================================

#include "tui.hpp"
#include "../common/utils.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cstdio>

#ifdef _WIN32
#  include <io.h>
#  define ISATTY _isatty
#  define FILENO _fileno
#else
#  include <unistd.h>
#  define ISATTY isatty
#  define FILENO fileno
#endif

bool Tui::is_tty() {
    return ISATTY(FILENO(stdout)) != 0;
}

Tui::Tui(std::string label, std::string title)
    : label_(std::move(label)), title_(std::move(title)) {}

void Tui::clear_lines(int n) {
    for (int i = 0; i < n; ++i) {
        // Move cursor up one line, then clear line
        std::cout << "\x1b[A\x1b[2K";
    }
    if (n > 0) {
        std::cout << "\r";
        std::cout.flush();
    }
    lines_printed_ = 0;
}

std::string Tui::build_progress_bar(double pct, int width) const {
    if (width < 4) return "";
    int fill = (int)(pct / 100.0 * width);
    fill = utils::clamp(fill, 0, width);

    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        if (i < fill)          bar += '=';
        else if (i == fill)    bar += '>';
        else                   bar += ' ';
    }
    bar += "]";
    return bar;
}

void Tui::render(const ProgressSnapshot& snap) {
    if (!snap.valid) return;
    std::lock_guard<std::mutex> lk(mu_);

    double pct = snap.total_bytes > 0 ? (double)snap.bytes_transferred / snap.total_bytes * 100.0
                                      : 100.0;
    pct = utils::clamp(pct, 0.0, 100.0);

    std::string eta_str = "     ";
    if (snap.eta_seconds > 0) {
        eta_str = "ETA " + utils::format_duration_s((u64)snap.eta_seconds);
    }

    std::ostringstream ss;
    ss << std::fixed;

    // Line 1: Progress bar
    ss << build_progress_bar(pct, 40) << " " << std::setw(5) << std::setprecision(1) << pct << "%";
    std::string line1 = ss.str();
    ss.str("");

    // Line 2: Stats
    ss << "  " << label_ << ": " << utils::format_bytes(snap.bytes_transferred)
       << "/" << utils::format_bytes(snap.total_bytes)
       << "  Speed: " << utils::format_speed(snap.rate_bps)
       << "  " << eta_str;
    std::string line2 = ss.str();

    if (!is_tty()) {
        u64 now = utils::now_ms();
        if (now - last_plain_ms_ < 1000 && !snap.terminal) return;
        last_plain_ms_ = now;
        std::cout << line2 << "\n";
        std::cout.flush();
        return;
    }

    clear_lines(lines_printed_);
    std::cout << "  " << title_ << "\n" << line1 << "\n" << line2 << "\n";
    std::cout.flush();
    lines_printed_ = 3;
}

void Tui::finish(const SessionReport& report) {
    std::lock_guard<std::mutex> lk(mu_);
    if (is_tty()) clear_lines(lines_printed_);

    std::cout << "  " << title_ << ": " << session_state_name(report.state);
    if (report.state == SessionState::COMPLETED) {
        double secs = report.elapsed_ms / 1000.0;
        std::cout << ", " << utils::format_bytes(report.total_bytes) << " in "
                  << utils::format_duration_s((u64)secs) << " ("
                  << utils::format_speed(secs > 0 ? report.total_bytes / secs : 0.0) << ")";
        if (!report.output_dir.empty()) std::cout << " -> " << report.output_dir;
    } else if (report.failure.is_set()) {
        std::cout << " -- " << report.failure.describe();
    }
    std::cout << "\n";
    std::cout.flush();
}

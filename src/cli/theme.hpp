#pragma once

#include <string>
#include <unistd.h>
#include <fmt/format.h>

namespace theme {

namespace color {
    const std::string BLUE      = "\033[94m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Colors only when stdout is a terminal
inline bool enabled() {
    static const bool tty = isatty(STDOUT_FILENO) != 0;
    return tty;
}

inline std::string paint(const std::string& code, const std::string& s) {
    return enabled() ? code + s + color::RESET : s;
}

inline std::string bold(const std::string& s)    { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)     { return paint(color::DIM, s); }

// Section header, padded by blank lines
inline std::string section(const std::string& title) {
    return "\n" + paint(color::BOLD, "  " + title) + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return paint(color::GREEN, "    + ") + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return paint(color::RED, "    x ") + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return paint(color::BLUE, "    ~ ") + msg + "\n";
}

// Subtle log line for progress messages
inline std::string log(const std::string& msg) {
    return paint(color::GRAY, "    \xc2\xb7 " + msg) + "\n";
}

// Aligned usage row
inline std::string usage_row(const std::string& cmd, const std::string& help) {
    return "    " + paint(color::BLUE, fmt::format("{:<46}", cmd)) + dim(help) + "\n";
}

} // namespace theme

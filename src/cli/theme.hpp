#pragma once

#include <string>
#include <unistd.h>
#include <fmt/format.h>

namespace theme {

// Colors are dropped when stderr is not a terminal (job logs, pipes)
inline bool use_color() {
    static const bool tty = isatty(STDERR_FILENO) && isatty(STDOUT_FILENO);
    return tty;
}

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string paint(const std::string& c, const std::string& s) {
    return use_color() ? c + s + color::RESET : s;
}

inline std::string bold(const std::string& s)  { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)   { return paint(color::DIM, s); }
inline std::string brown(const std::string& s) { return paint(color::BROWN, s); }

// Section header: blank line before and after the title
inline std::string section(const std::string& title) {
    return "\n" + paint(color::BROWN + color::BOLD, "  " + title) + "\n\n";
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

inline std::string step(const std::string& msg) {
    return paint(color::BROWN, "    > ") + msg + "\n";
}

// Usage row: command in blue, description dimmed
inline std::string usage(const std::string& cmd, const std::string& desc) {
    return paint(color::BLUE, fmt::format("    {:<34}", cmd)) + dim(desc) + "\n";
}

} // namespace theme

#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[94m";
    const std::string CYAN      = "\033[96m";
    const std::string RED       = "\033[91m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Shorthand wrappers
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string blue(const std::string& s)    { return color::BLUE + s + color::RESET; }

// Section header followed by a newline
inline std::string section(const std::string& title) {
    return color::BOLD + title + ":" + color::RESET + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::YELLOW + "> " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::CYAN + "~ " + color::RESET + msg + "\n";
}

// Usage row: command in blue, padded, then a dim description
inline std::string usage_row(const std::string& cmd, const std::string& desc = "") {
    if (desc.empty()) return "  " + blue(cmd) + "\n";
    return "  " + color::BLUE + fmt::format("{:<38}", cmd) + color::RESET
         + color::DIM + desc + color::RESET + "\n";
}

} // namespace theme

#pragma once

#include <string>
#include <unistd.h>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences; empty when stdout is not a terminal so logs and
// pipes stay clean.
namespace color {
    inline bool enabled() {
        static const bool tty = isatty(STDOUT_FILENO) != 0;
        return tty;
    }
    inline std::string code(const char* seq) { return enabled() ? seq : ""; }

    const std::string BLUE      = code("\033[38;2;62;120;178m");
    const std::string AMBER     = code("\033[38;2;191;139;46m");
    const std::string RED       = code("\033[91m");
    const std::string GREEN     = code("\033[92m");
    const std::string BOLD      = code("\033[1m");
    const std::string DIM       = code("\033[2m");
    const std::string RESET     = code("\033[0m");
}

inline std::string dim(const std::string& s) { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

// Section header with a blank line on either side
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Key-value row for summary panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<16}", key) + color::RESET + value + "\n";
}

} // namespace theme

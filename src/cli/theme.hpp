#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// sshdeck palette (ANSI escape sequences)
// Teal:  #2A9D8F
// Amber: #E9A23B
namespace color {
    const std::string TEAL      = "\033[38;2;42;157;143m";
    const std::string AMBER     = "\033[38;2;233;162;59m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string teal(const std::string& s)    { return color::TEAL + s + color::RESET; }
inline std::string amber(const std::string& s)   { return color::AMBER + s + color::RESET; }
inline std::string bold(const std::string& s)    { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Clears screen, then title + rule
inline std::string banner(const std::string& version) {
    return
        "\033[2J\033[H\n"
        + color::TEAL + color::BOLD
        + "  sshdeck\n"
        + color::RESET + color::DIM + "  v" + version + "\n"
        + "  SSH connections, commands, forwards and files"
        + color::RESET + "\n\n"
        + rule();
}

// Blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

inline std::string divider() {
    return "\n" + rule() + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::TEAL + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Key-value row for listings
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

// "[#####.....]  42%" without trailing newline
inline std::string progress_bar(double percent, int width = 24) {
    if (percent < 0) percent = 0;
    if (percent > 100) percent = 100;
    int filled = static_cast<int>(percent * width / 100.0);
    return color::TEAL + "[" + std::string(filled, '#') + color::RESET
         + color::DIM + std::string(width - filled, '.') + "]" + color::RESET
         + fmt::format(" {:>3.0f}%", percent);
}

} // namespace theme

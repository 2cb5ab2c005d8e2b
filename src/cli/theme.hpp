#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/types.hpp>

namespace theme {

// Plex amber on slate (ANSI escape sequences)
// Amber: #E5A00D
// Slate: #7A8794
namespace color {
    const std::string AMBER     = "\033[38;2;229;160;13m";
    const std::string SLATE     = "\033[38;2;122;135;148m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string amber(const std::string& s)  { return color::AMBER + s + color::RESET; }
inline std::string slate(const std::string& s)  { return color::SLATE + s + color::RESET; }
inline std::string bold(const std::string& s)   { return color::BOLD + s + color::RESET; }
inline std::string dim(const std::string& s)    { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)  { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)    { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s) { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule(int width = 44) {
    std::string line;
    for (int i = 0; i < width; i++) line += "\xe2\x94\x80";   // U+2500
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Title + version + rule (no screen clear: output is often piped to a log)
inline std::string banner() {
    return "\n" + color::AMBER + color::BOLD + "  plexmover" + color::RESET
        + color::DIM + "  v" + PLEXMOVER_VERSION + "\n"
        + "  Remote transfer orchestrator" + color::RESET + "\n\n"
        + rule();
}

// Section header: blank line before title, blank line after
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

inline std::string skip(const std::string& msg) {
    return color::YELLOW + "    - " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::SLATE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

// Dim progress line from worker threads
inline std::string log(const std::string& msg) {
    return "\033[38;2;90;90;90m    \xc2\xb7 " + msg + "\033[0m\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

inline std::string run_status(RunStatus status) {
    switch (status) {
        case RunStatus::Success:        return green(run_status_name(status));
        case RunStatus::PartialFailure: return yellow(run_status_name(status));
        case RunStatus::Failed:         return red(run_status_name(status));
    }
    return run_status_name(status);
}

} // namespace theme

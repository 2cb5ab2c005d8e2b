#pragma once

#include <string>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Quote a string for a POSIX shell: wraps in single quotes, escaping embedded ones.
std::string shell_quote(const std::string& s);

// Parent directory of a remote (POSIX) path. "/a/b/c.mkv" -> "/a/b", "/c" -> "/".
std::string remote_parent(const std::string& path);

// Join a remote base directory and a relative path with exactly one '/'.
std::string remote_join(const std::string& base, const std::string& rel);

// Expand a leading "~/" to the home directory.
std::string expand_home(const std::string& path);

// Run id: YYYY-MM-DDTHH-MM-SS-mmm__<4 hex>
std::string generate_run_id();

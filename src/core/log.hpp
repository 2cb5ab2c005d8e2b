#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string plexmover_log_path() {
    static std::string path = (platform::temp_dir() / "plexmover_debug.log").string();
    return path;
}

// Workers log concurrently; one lock covers both log files.
inline std::mutex& plexmover_log_mutex() {
    static std::mutex mtx;
    return mtx;
}

// Persistent run log path: ~/.plexmover/logs/{run_id}.log
inline std::string run_log_path(const std::string& run_id) {
    return (platform::home_dir() / ".plexmover" / "logs" / (run_id + ".log")).string();
}

// Append a timestamped line to a run's persistent log file.
inline void append_run_log(const std::string& run_id, const std::string& msg) {
    std::string path = run_log_path(run_id);
    std::lock_guard<std::mutex> lock(plexmover_log_mutex());
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) return;
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

inline void plexmover_log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(plexmover_log_mutex());
    std::ofstream out(plexmover_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

inline void plexmover_log_remote(const std::string& label, const std::string& cmd,
                                 const SSHResult& r) {
    plexmover_log(fmt::format("{} CMD: {}", label, cmd));
    plexmover_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                              r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        plexmover_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}

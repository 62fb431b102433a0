#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string arrayprep_log_path() {
    static std::string path = (platform::temp_dir() / "arrayprep_debug.log").string();
    return path;
}

// Per-run log path: <output_dir>/<name>.arrayprep.log
inline std::string run_log_path(const std::string& output_dir, const std::string& name) {
    return (std::filesystem::path(output_dir) / (name + ".arrayprep.log")).string();
}

// Append a timestamped line to a run's log file in its output directory.
inline void append_run_log(const std::string& output_dir, const std::string& name,
                           const std::string& msg) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    std::ofstream f(run_log_path(output_dir, name), std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

inline void arrayprep_log(const std::string& msg) {
    std::ofstream out(arrayprep_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

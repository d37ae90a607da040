#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <cstdio>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string par_log_path() {
    static std::string path = (platform::temp_dir() / "par_debug.log").string();
    return path;
}

// Append a timestamped line to the debug log. Safe to call from workers.
inline void par_log(const std::string& msg) {
    static std::mutex log_mutex;

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

    std::lock_guard<std::mutex> lock(log_mutex);
    std::ofstream out(par_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}

// Log a child process outcome, truncating large output.
inline void par_log_process(const std::string& label, const std::string& cmd,
                            int exit_code, const std::string& output) {
    par_log(fmt::format("{} CMD: {}", label, cmd));
    par_log(fmt::format("{} exit={} output({})={}", label, exit_code,
                        output.size(), output.substr(0, 500)));
}

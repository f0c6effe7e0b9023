#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

inline std::string rcr_log_path() {
    static std::string path = (platform::temp_dir() / "rcr_debug.log").string();
    return path;
}

// Append a timestamped line to the debug log. Never throws; a log that
// cannot be opened is skipped.
inline void rcr_log(const std::string& msg) {
    std::ofstream out(rcr_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

// Log an argument vector as one bracketed, comma-separated list so that
// arguments containing spaces stay distinguishable.
inline void rcr_log_argv(const std::string& label, const std::vector<std::string>& argv) {
    rcr_log(fmt::format("{} argv=[{}]", label, fmt::join(argv, ", ")));
}

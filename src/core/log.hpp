#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <platform/platform.hpp>
#include <core/constants.hpp>
#include <fmt/format.h>

inline std::string wcstore_log_path() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
    return path;
}

// Append a timestamped line to the debug log. Silently gives up if the
// log cannot be opened; logging must never fail an operation.
inline void wcstore_log(const std::string& msg) {
    std::ofstream out(wcstore_log_path(), std::ios::app);
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

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

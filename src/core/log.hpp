#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdlib>
#include <core/constants.hpp>
#include <platform/platform.hpp>

inline std::string batchy_log_path() {
    static std::string path = [] {
        const char* env = std::getenv(LOG_PATH_ENV);
        if (env && *env) return std::string(env);
        return (platform::temp_dir() / LOG_FILE_NAME).string();
    }();
    return path;
}

inline void batchy_log(const std::string& msg) {
    std::ofstream out(batchy_log_path(), std::ios::app);
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

#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace wallpanel {

// Global mutex to keep stderr logs from multiple wall workers readable (one line at a time).
inline std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

constexpr int kLogSilent = 0;
constexpr int kLogWarn = 1;
constexpr int kLogTrace = 2;

struct LogOptions {
    int verbosity = kLogWarn;
    std::string prefix = "[wallpanel]";
};

template <typename... Args>
void log_line(const LogOptions& log, int level, const Args&... args) {
    if (log.verbosity < level) {
        return;
    }
    std::ostringstream oss;
    oss << log.prefix << " ";
    (oss << ... << args);
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cerr << oss.str() << "\n";
}

template <typename... Args>
void log_warn(const LogOptions& log, const Args&... args) {
    log_line(log, kLogWarn, "[WARN] ", args...);
}

template <typename... Args>
void log_trace(const LogOptions& log, const Args&... args) {
    log_line(log, kLogTrace, args...);
}

}  // namespace wallpanel

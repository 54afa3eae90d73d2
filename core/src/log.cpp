#include "codemode/log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace codemode {

namespace {

LogLevel level_from_env() {
    const char* env = std::getenv("CODEMODE_LOG_LEVEL");
    if (!env) return LogLevel::INFO;
    std::string v(env);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::atomic<int>& threshold_slot() {
    static std::atomic<int> slot{(int)level_from_env()};
    return slot;
}

std::mutex& stderr_mu() {
    static std::mutex mu;
    return mu;
}

} // namespace

const char* log_level_name(LogLevel l) {
    switch (l) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

LogLevel log_threshold() {
    return (LogLevel)threshold_slot().load();
}

void set_log_threshold(LogLevel l) {
    threshold_slot().store((int)l);
}

void log_line(LogLevel level, const char* tag, const std::string& msg) {
    if ((int)level < threshold_slot().load()) return;
    std::lock_guard<std::mutex> lk(stderr_mu());
    std::cerr << "[codemode] " << log_level_name(level) << " " << (tag ? tag : "-")
              << ": " << msg << "\n";
}

} // namespace codemode

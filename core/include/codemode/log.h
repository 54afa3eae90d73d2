#pragma once
#include <string>

namespace codemode {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

const char* log_level_name(LogLevel l);

// Threshold from CODEMODE_LOG_LEVEL (debug|info|warn|error), default info.
// Read once; set_log_threshold overrides it.
LogLevel log_threshold();
void set_log_threshold(LogLevel l);

// "[codemode] WARN pool: message" on stderr. Lines from concurrent
// threads do not interleave.
void log_line(LogLevel level, const char* tag, const std::string& msg);

inline void log_debug(const char* tag, const std::string& msg) { log_line(LogLevel::DEBUG, tag, msg); }
inline void log_info(const char* tag, const std::string& msg) { log_line(LogLevel::INFO, tag, msg); }
inline void log_warn(const char* tag, const std::string& msg) { log_line(LogLevel::WARN, tag, msg); }
inline void log_error(const char* tag, const std::string& msg) { log_line(LogLevel::ERROR, tag, msg); }

} // namespace codemode

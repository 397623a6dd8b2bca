#ifndef UARTRX_LOG_H
#define UARTRX_LOG_H

#include <string>

namespace uartrx {

enum LogLevel {
    LOG_DEBUG = 0,
    LOG_INFO = 1,
    LOG_WARN = 2,
    LOG_ERROR = 3,
    LOG_OFF = 4
};

void set_log_level(LogLevel level);
bool log_enabled(LogLevel level);

// Parses "debug", "info", "warn", "error" or "off".
bool parse_log_level(const std::string& text, LogLevel& level);

// Writes "[tag] LEVEL message" if `level` is enabled. WARN and ERROR go to
// std::cerr.
void log_write(LogLevel level, const char* tag, const std::string& message);

inline void log_debug(const char* tag, const std::string& message) {
    log_write(LOG_DEBUG, tag, message);
}

inline void log_info(const char* tag, const std::string& message) {
    log_write(LOG_INFO, tag, message);
}

inline void log_warn(const char* tag, const std::string& message) {
    log_write(LOG_WARN, tag, message);
}

inline void log_error(const char* tag, const std::string& message) {
    log_write(LOG_ERROR, tag, message);
}

} // namespace uartrx

#endif // UARTRX_LOG_H

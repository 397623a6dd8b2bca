#include "uartrx/log.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace uartrx {

namespace {

std::atomic<int> min_level(LOG_INFO);
std::mutex out_mtx; // one line at a time from the worker and main threads

const char* level_name(LogLevel level) {
    switch (level) {
    case LOG_DEBUG:
        return "DEBUG";
    case LOG_INFO:
        return "INFO ";
    case LOG_WARN:
        return "WARN ";
    case LOG_ERROR:
        return "ERROR";
    default:
        return "";
    }
}

} // namespace

void set_log_level(LogLevel level) { min_level = level; }

bool log_enabled(LogLevel level) {
    return level != LOG_OFF && (int)level >= min_level.load();
}

bool parse_log_level(const std::string& text, LogLevel& level) {
    if (text == "debug") {
        level = LOG_DEBUG;
    } else if (text == "info") {
        level = LOG_INFO;
    } else if (text == "warn" || text == "warning") {
        level = LOG_WARN;
    } else if (text == "error") {
        level = LOG_ERROR;
    } else if (text == "off") {
        level = LOG_OFF;
    } else {
        return false;
    }
    return true;
}

void log_write(LogLevel level, const char* tag, const std::string& message) {
    if (!log_enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(out_mtx);
    std::ostream& os = level >= LOG_WARN ? std::cerr : std::cout;
    os << "[" << tag << "] " << level_name(level) << " " << message << std::endl;
}

} // namespace uartrx

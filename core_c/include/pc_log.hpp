#pragma once

// C++ обёртка над pc_log.
// Перегрузки const char* не выделяют память и годятся для пути запроса.

#include "pc_log.h"
#include <string>

namespace probe {

inline bool log_enabled(pc_log_level level) {
    return level >= pc_log_get_level();
}

inline void log_debug(const char* msg) {
    if (log_enabled(PC_LOG_DEBUG)) pc_log_debug("%s", msg);
}

inline void log_info(const char* msg) {
    if (log_enabled(PC_LOG_INFO)) pc_log_info("%s", msg);
}

inline void log_warn(const char* msg) {
    pc_log_warn("%s", msg);
}

inline void log_error(const char* msg) {
    pc_log_error("%s", msg);
}

inline void log_debug(const std::string& msg) { log_debug(msg.c_str()); }
inline void log_info(const std::string& msg) { log_info(msg.c_str()); }
inline void log_warn(const std::string& msg) { log_warn(msg.c_str()); }
inline void log_error(const std::string& msg) { log_error(msg.c_str()); }

inline void set_log_level(pc_log_level level) {
    pc_log_set_level(level);
}

inline void set_log_callback(pc_log_callback callback) {
    pc_log_set_callback(callback);
}

/**
 * Временно меняет уровень и приёмник лога, восстанавливает уровень
 * и stderr-приёмник при выходе из области.
 */
class LogScope {
public:
    LogScope(pc_log_level level, pc_log_callback callback)
        : saved_level_(pc_log_get_level()) {
        pc_log_set_callback(callback);
        pc_log_set_level(level);
    }

    ~LogScope() {
        pc_log_set_callback(nullptr);
        pc_log_set_level(saved_level_);
    }

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    pc_log_level saved_level_;
};

} // namespace probe

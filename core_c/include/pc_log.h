#ifndef PC_LOG_H
#define PC_LOG_H

/// @file pc_log.h
/// @brief Logging facility of the probe core

// PC_LOG_API is dllexport when building probe_core (PC_EXPORTS)
#ifdef _WIN32
    #if defined(PC_EXPORTS)
        #define PC_LOG_API __declspec(dllexport)
    #else
        #define PC_LOG_API __declspec(dllimport)
    #endif
#else
    #define PC_LOG_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/// Log levels
typedef enum {
    PC_LOG_DEBUG = 0,  ///< Debug messages
    PC_LOG_INFO = 1,   ///< Informational messages
    PC_LOG_WARN = 2,   ///< Warnings
    PC_LOG_ERROR = 3   ///< Errors
} pc_log_level;

/// Callback that intercepts log output
/// @param level Message level
/// @param message Formatted message text
typedef void (*pc_log_callback)(pc_log_level level, const char* message);

/// Installs a callback that receives every message instead of stderr
/// @param callback Handler, or NULL to restore the stderr sink
PC_LOG_API void pc_log_set_callback(pc_log_callback callback);

/// Sets the minimum level
/// @param min_level Messages below this level are dropped
PC_LOG_API void pc_log_set_level(pc_log_level min_level);

/// Returns the current minimum level
PC_LOG_API pc_log_level pc_log_get_level(void);

/// Emits a message at the given level
/// @param level Message level
/// @param format printf-style format string
PC_LOG_API void pc_log(pc_log_level level, const char* format, ...);

/// Emits a debug message
/// @param format printf-style format string
PC_LOG_API void pc_log_debug(const char* format, ...);

/// Emits an informational message
/// @param format printf-style format string
PC_LOG_API void pc_log_info(const char* format, ...);

/// Emits a warning
/// @param format printf-style format string
PC_LOG_API void pc_log_warn(const char* format, ...);

/// Emits an error
/// @param format printf-style format string
PC_LOG_API void pc_log_error(const char* format, ...);

#ifdef __cplusplus
}
#endif

#endif // PC_LOG_H

#ifndef BLOCKFLOW_COMMON_UTILS_LOG_H
#define BLOCKFLOW_COMMON_UTILS_LOG_H

#include <cstdint>
#include <string>

namespace blockflow {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// 全局最低日志级别 (默认 INFO)
void set_log_level(LogLevel level);
LogLevel log_level();

// "debug" | "info" | "warning" | "error"; throws on anything else
LogLevel parse_log_level(const std::string& name);

// Writes "[LEVEL] message" as one line. DEBUG/INFO go to stdout, WARNING/ERROR to stderr.
void log(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log(LogLevel::DEBUG, message); }
inline void log_info(const std::string& message) { log(LogLevel::INFO, message); }
inline void log_warning(const std::string& message) { log(LogLevel::WARNING, message); }
inline void log_error(const std::string& message) { log(LogLevel::ERROR, message); }

} // namespace blockflow

#endif // BLOCKFLOW_COMMON_UTILS_LOG_H

// common/utils/log.cpp
#include "common/utils/log.h"
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace blockflow {

namespace {

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::mutex g_output_mutex; // 多个 worker 线程共享输出

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG] ";
        case LogLevel::INFO: return "[INFO] ";
        case LogLevel::WARNING: return "[WARNING] ";
        case LogLevel::ERROR: return "[ERROR] ";
    }
    return "[INFO] ";
}

} // namespace

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    throw std::runtime_error("Unknown log level '" + name + "'");
}

void log(LogLevel level, const std::string& message) {
    if (static_cast<uint8_t>(level) < static_cast<uint8_t>(g_level.load())) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::ostream& out = (level >= LogLevel::WARNING) ? std::cerr : std::cout;
    out << level_tag(level) << message << std::endl;
}

} // namespace blockflow

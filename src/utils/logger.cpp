#include "utils/logger.hpp"
#include "utils/string_utils.hpp"
#include <iostream>
#include <mutex>

namespace jukebox {

namespace {

std::mutex g_log_mutex;
LogSink g_sink;
dpp::loglevel g_min_level = dpp::ll_info;

const char* level_name(dpp::loglevel level) {
    switch (level) {
        case dpp::ll_trace: return "TRACE";
        case dpp::ll_debug: return "DEBUG";
        case dpp::ll_info: return "INFO";
        case dpp::ll_warning: return "WARN";
        case dpp::ll_error: return "ERROR";
        case dpp::ll_critical: return "CRITICAL";
    }
    return "INFO";
}

} // namespace

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_sink = std::move(sink);
}

void set_log_level(dpp::loglevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_min_level = level;
}

dpp::loglevel parse_log_level(const std::string& name, dpp::loglevel fallback) {
    std::string value = string_utils::to_lower(string_utils::trim(name));
    if (value == "trace") return dpp::ll_trace;
    if (value == "debug") return dpp::ll_debug;
    if (value == "info") return dpp::ll_info;
    if (value == "warning" || value == "warn") return dpp::ll_warning;
    if (value == "error") return dpp::ll_error;
    if (value == "critical") return dpp::ll_critical;
    return fallback;
}

void log(dpp::loglevel level, const std::string& message) {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        if (level < g_min_level) {
            return;
        }
        sink = g_sink;
    }

    if (sink) {
        sink(level, message);
        return;
    }

    if (level >= dpp::ll_warning) {
        std::cerr << "[" << level_name(level) << "] " << message << std::endl;
    } else {
        std::cout << "[" << level_name(level) << "] " << message << std::endl;
    }
}

} // namespace jukebox

#pragma once

#include <dpp/misc-enum.h>
#include <functional>
#include <string>

namespace jukebox {

using LogSink = std::function<void(dpp::loglevel, const std::string&)>;

// Replace the sink (main routes it into dpp::cluster::log)
void set_log_sink(LogSink sink);
void set_log_level(dpp::loglevel level);
dpp::loglevel parse_log_level(const std::string& name, dpp::loglevel fallback = dpp::ll_info);

void log(dpp::loglevel level, const std::string& message);

inline void log_debug(const std::string& message) { log(dpp::ll_debug, message); }
inline void log_info(const std::string& message) { log(dpp::ll_info, message); }
inline void log_warning(const std::string& message) { log(dpp::ll_warning, message); }
inline void log_error(const std::string& message) { log(dpp::ll_error, message); }

} // namespace jukebox

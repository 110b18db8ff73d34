#pragma once
#include <string>

namespace core {

enum class LogLevel { Debug = 0, Info, Warn, Error };

// Messages below this level are dropped. Default: Info, or Debug when
// LIVE_TRANSCRIBE_DEBUG is set in the environment.
void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

}

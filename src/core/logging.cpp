#include "core/logging.hpp"
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace core {

namespace {
LogLevel initial_level() {
    return std::getenv("LIVE_TRANSCRIBE_DEBUG") != nullptr ? LogLevel::Debug : LogLevel::Info;
}

std::atomic<int> g_level{static_cast<int>(initial_level())};
std::mutex g_log_mutex;

void write(std::ostream& os, const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    os << tag << msg << std::endl;
}
} // namespace

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }
LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }
bool log_enabled(LogLevel level) { return static_cast<int>(level) >= g_level.load(); }

void log_debug(const std::string& msg) {
    if (log_enabled(LogLevel::Debug)) write(std::cout, "[DEBUG] ", msg);
}
void log_info(const std::string& msg) {
    if (log_enabled(LogLevel::Info)) write(std::cout, "[INFO] ", msg);
}
void log_warn(const std::string& msg) {
    if (log_enabled(LogLevel::Warn)) write(std::cerr, "[WARN] ", msg);
}
void log_error(const std::string& msg) { write(std::cerr, "[ERROR] ", msg); }

}

// ─────────────────────────────────────────────────────────────────────────────
// log.cpp  –  Tagged Console Logging
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/log.h"

#include <atomic>
#include <iostream>

namespace swingphase {

static std::atomic<int> g_log_level{static_cast<int>(LogLevel::Warn)};

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

void log_write(LogLevel level, const char* tag, const std::string& message) {
    std::ostream& out = (level <= LogLevel::Warn) ? std::cerr : std::cout;
    switch (level) {
        case LogLevel::Error:
            out << "[ERROR][" << tag << "] " << message << "\n";
            break;
        case LogLevel::Warn:
            out << "[WARN][" << tag << "] " << message << "\n";
            break;
        default:
            out << "[" << tag << "] " << message << "\n";
            break;
    }
}

}  // namespace swingphase

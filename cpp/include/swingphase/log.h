#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// log.h  –  Tagged Console Logging
//
// Messages are written as "[Tag] message" (warnings and errors to stderr,
// everything else to stdout) and filtered by a process-wide level.
// The default level is Warn so a library caller sees fallbacks only when
// asking for them.
// ─────────────────────────────────────────────────────────────────────────────

#include <sstream>
#include <string>

namespace swingphase {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(log_level());
}

void log_write(LogLevel level, const char* tag, const std::string& message);

}  // namespace swingphase

#define SWINGPHASE_LOG(level, tag, message)                                  \
    do {                                                                     \
        if (::swingphase::log_enabled(level)) {                              \
            std::ostringstream _swingphase_log_stream;                       \
            _swingphase_log_stream << message;                               \
            ::swingphase::log_write(level, tag,                              \
                                    _swingphase_log_stream.str());           \
        }                                                                    \
    } while (0)

#define SWINGPHASE_LOG_ERROR(tag, message) \
    SWINGPHASE_LOG(::swingphase::LogLevel::Error, tag, message)
#define SWINGPHASE_LOG_WARN(tag, message) \
    SWINGPHASE_LOG(::swingphase::LogLevel::Warn, tag, message)
#define SWINGPHASE_LOG_INFO(tag, message) \
    SWINGPHASE_LOG(::swingphase::LogLevel::Info, tag, message)
#define SWINGPHASE_LOG_DEBUG(tag, message) \
    SWINGPHASE_LOG(::swingphase::LogLevel::Debug, tag, message)

#pragma once

#include <functional>
#include <string_view>

namespace stevedore::core {

enum class LogLevel {
  Trace = 0,
  Debug = 1,
  Info  = 2,
  Warn  = 3,
  Error = 4,
  Off   = 5
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
bool logEnabled(LogLevel level);

std::string_view toString(LogLevel level);

// Accepts the names printed by toString() in any case ("debug", "WARN", ...).
bool parseLogLevel(std::string_view text, LogLevel& out);

// Optional sink replacing the console writer (tests capture lines with it).
// Sinks are invoked under the logger mutex; they must not log themselves.
using LogSink = std::function<void(LogLevel, std::string_view)>;
void setLogSink(LogSink sink);

void log(LogLevel level, std::string_view message);

} // namespace stevedore::core

// Convenience macros
#define STEVEDORE_LOG_TRACE(msg) ::stevedore::core::log(::stevedore::core::LogLevel::Trace, (msg))
#define STEVEDORE_LOG_DEBUG(msg) ::stevedore::core::log(::stevedore::core::LogLevel::Debug, (msg))
#define STEVEDORE_LOG_INFO(msg)  ::stevedore::core::log(::stevedore::core::LogLevel::Info,  (msg))
#define STEVEDORE_LOG_WARN(msg)  ::stevedore::core::log(::stevedore::core::LogLevel::Warn,  (msg))
#define STEVEDORE_LOG_ERROR(msg) ::stevedore::core::log(::stevedore::core::LogLevel::Error, (msg))

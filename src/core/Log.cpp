#include "stevedore/core/Log.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

namespace stevedore::core {
namespace {
  std::mutex g_logMutex;
  std::atomic<LogLevel> g_level{LogLevel::Info};
  LogSink g_sink;

  std::tm localTime(std::time_t t) {
    std::tm out{};
  #if defined(_WIN32)
    localtime_s(&out, &t);
  #else
    localtime_r(&t, &out);
  #endif
    return out;
  }

  std::string nowTimeString() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto tt = system_clock::to_time_t(now);
    const auto tm = localTime(tt);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
  }
} // namespace

void setLogLevel(LogLevel level) { g_level.store(level, std::memory_order_relaxed); }
LogLevel getLogLevel() { return g_level.load(std::memory_order_relaxed); }

bool logEnabled(LogLevel level) {
  const LogLevel current = getLogLevel();
  return current != LogLevel::Off && level >= current;
}

std::string_view toString(LogLevel level) {
  switch (level) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "UNKNOWN";
}

bool parseLogLevel(std::string_view text, LogLevel& out) {
  std::string upper;
  upper.reserve(text.size());
  for (char c : text) upper.push_back((char)std::toupper((unsigned char)c));
  if (upper == "WARNING") upper = "WARN";

  for (int i = (int)LogLevel::Trace; i <= (int)LogLevel::Off; ++i) {
    const auto level = static_cast<LogLevel>(i);
    if (toString(level) == upper) {
      out = level;
      return true;
    }
  }
  return false;
}

void setLogSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_logMutex);
  g_sink = std::move(sink);
}

void log(LogLevel level, std::string_view message) {
  if (!logEnabled(level)) {
    return;
  }

  std::lock_guard<std::mutex> lock(g_logMutex);

  if (g_sink) {
    g_sink(level, message);
    return;
  }

  // Worker threads interleave heavily; tag each line with its thread.
  std::ostream& os = (level >= LogLevel::Warn) ? std::cerr : std::cout;
  os << "[" << nowTimeString() << "]"
     << "[" << toString(level) << "]"
     << "[t" << std::hash<std::thread::id>{}(std::this_thread::get_id()) % 10000 << "] "
     << message
     << "\n";
}

} // namespace stevedore::core

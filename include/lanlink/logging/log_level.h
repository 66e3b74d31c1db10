#pragma once

#include <cctype>
#include <cstdint>
#include <string>

#include "lanlink/core/compat.h"

namespace lanlink {
namespace logging {

// Ordered by severity; a logger emits everything at or above its level
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  Critical = 4,
  Off = 5
};

// Custom covers sinks installed by the host through setDefaultSink()
enum class SinkType { Stdio, File, Custom };

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warning:
      return "WARNING";
    case LogLevel::Error:
      return "ERROR";
    case LogLevel::Critical:
      return "CRITICAL";
    case LogLevel::Off:
      return "OFF";
  }
  return "UNKNOWN";
}

// Case-insensitive; "warn" is accepted as an alias of "warning"
inline optional<LogLevel> parseLogLevel(const std::string& name) {
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (lower == "debug") return LogLevel::Debug;
  if (lower == "info") return LogLevel::Info;
  if (lower == "warning" || lower == "warn") return LogLevel::Warning;
  if (lower == "error") return LogLevel::Error;
  if (lower == "critical") return LogLevel::Critical;
  if (lower == "off") return LogLevel::Off;
  return nullopt;
}

}  // namespace logging
}  // namespace lanlink

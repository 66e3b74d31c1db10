#include "lanlink/logging/log_formatter.h"

#include <cstring>
#include <ctime>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace lanlink {
namespace logging {

namespace {

std::string timestampString(std::chrono::system_clock::time_point tp) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  long millis = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          tp.time_since_epoch())
          .count() %
      1000);

  std::tm local;
  localtime_r(&seconds, &local);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  return fmt::format("{}.{:03d}", buf, millis);
}

const char* baseName(const char* path) {
  const char* slash = std::strrchr(path, '/');
  return slash ? slash + 1 : path;
}

}  // namespace

std::string TextFormatter::format(const LogMessage& msg) const {
  std::string out = fmt::format("{} [{}] [{}] ", timestampString(msg.timestamp),
                                logLevelToString(msg.level), msg.logger_name);

  if (!msg.peer.empty()) {
    out += fmt::format("[peer:{}] ", msg.peer);
  }
  out += msg.message;

  if (!msg.fields.empty()) {
    out += " {";
    const char* sep = "";
    for (const auto& field : msg.fields) {
      out += fmt::format("{}{}={}", sep, field.first, field.second);
      sep = ", ";
    }
    out += '}';
  }

  if (msg.level == LogLevel::Debug && msg.file && msg.line > 0) {
    out += fmt::format(" ({}:{})", baseName(msg.file), msg.line);
  }
  return out;
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json j;
  j["timestamp"] = timestampString(msg.timestamp);
  j["level"] = logLevelToString(msg.level);
  j["logger"] = msg.logger_name;

  std::ostringstream thread;
  thread << msg.thread_id;
  j["thread"] = thread.str();

  if (msg.file) {
    j["file"] = baseName(msg.file);
    j["line"] = msg.line;
  }
  if (!msg.peer.empty()) {
    j["peer"] = msg.peer;
  }
  j["message"] = msg.message;
  if (!msg.fields.empty()) {
    j["metadata"] = msg.fields;
  }

  // Datagram payloads can contain anything; never throw from a log call
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace lanlink

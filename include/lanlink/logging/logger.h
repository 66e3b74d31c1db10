#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "lanlink/logging/log_level.h"
#include "lanlink/logging/log_message.h"
#include "lanlink/logging/log_sink.h"

namespace lanlink {
namespace logging {

/**
 * Named logger writing synchronously to a shared sink.
 *
 * Arguments are formatted with fmt only when the level is enabled, so
 * disabled debug calls cost one atomic load.
 */
class Logger {
 public:
  explicit Logger(std::string name, LogLevel level = LogLevel::Info)
      : name_(std::move(name)), level_(level) {}

  template <typename... Args>
  void log(LogLevel level, const char* fmt, const Args&... args) {
    logAt(level, nullptr, 0, std::string(), fmt, args...);
  }

  // Full form used by the macros: source location and optional peer
  template <typename... Args>
  void logAt(LogLevel level,
             const char* file,
             int line,
             const std::string& peer,
             const char* fmt,
             const Args&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    msg.level = level;
    msg.logger_name = name_;
    msg.message = fmt::vformat(fmt, fmt::make_format_args(args...));
    msg.file = file;
    msg.line = line;
    msg.peer = peer;
    write(msg);
  }

  template <typename... Args>
  void debug(const char* fmt, const Args&... args) {
    log(LogLevel::Debug, fmt, args...);
  }

  template <typename... Args>
  void info(const char* fmt, const Args&... args) {
    log(LogLevel::Info, fmt, args...);
  }

  template <typename... Args>
  void warning(const char* fmt, const Args&... args) {
    log(LogLevel::Warning, fmt, args...);
  }

  template <typename... Args>
  void error(const char* fmt, const Args&... args) {
    log(LogLevel::Error, fmt, args...);
  }

  template <typename... Args>
  void critical(const char* fmt, const Args&... args) {
    log(LogLevel::Critical, fmt, args...);
  }

  // Off never passes, even for Critical records
  bool shouldLog(LogLevel level) const {
    LogLevel threshold = level_.load(std::memory_order_relaxed);
    return threshold != LogLevel::Off && level != LogLevel::Off &&
           level >= threshold;
  }

  void write(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->log(msg);
    }
  }

  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }
  LogLevel getLevel() const { return level_.load(std::memory_order_relaxed); }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  void flush() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->flush();
    }
  }

  const std::string& getName() const { return name_; }

 private:
  const std::string name_;
  std::atomic<LogLevel> level_;
  std::shared_ptr<LogSink> sink_;
  mutable std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace lanlink

#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "lanlink/logging/logger.h"

namespace lanlink {
namespace logging {

/**
 * Process-wide table of named loggers.
 *
 * Components log through loggers named after themselves ("client",
 * "server", "network.udp"). Levels come from the global level unless a glob
 * rule matches the name; the most recently added matching rule wins. All
 * loggers share one default sink, replaced as a whole by setDefaultSink().
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);
  std::shared_ptr<Logger> getDefaultLogger();

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  // `glob` supports '*' and '?'; every other character is literal
  void setPattern(const std::string& glob, LogLevel level);
  void clearPatterns();

  void setDefaultSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getDefaultSink() const;

  bool shouldLog(const std::string& logger_name, LogLevel level);
  LogLevel getEffectiveLevel(const std::string& logger_name);

  std::vector<std::string> getLoggerNames() const;

  // Back to Info, stderr and no rules. Existing loggers stay registered.
  void reset();

 private:
  struct LevelRule {
    std::string glob;
    std::regex matcher;
    LogLevel level;
  };

  LoggerRegistry();

  LogLevel levelForLocked(const std::string& name) const;
  void reapplyLevelsLocked();

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::vector<LevelRule> rules_;  // newest first
  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<LogSink> default_sink_;
  std::shared_ptr<Logger> default_logger_;
};

}  // namespace logging
}  // namespace lanlink

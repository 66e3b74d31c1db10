#include "lanlink/logging/logger_registry.h"

namespace lanlink {
namespace logging {

namespace {

constexpr const char* kDefaultLoggerName = "default";

std::regex compileGlob(const std::string& glob) {
  static const std::string kSpecial = ".+()[]{}^$|\\";

  std::string expr;
  expr.reserve(glob.size() * 2);
  for (char c : glob) {
    if (c == '*') {
      expr += ".*";
    } else if (c == '?') {
      expr += '.';
    } else {
      if (kSpecial.find(c) != std::string::npos) {
        expr += '\\';
      }
      expr += c;
    }
  }
  return std::regex(expr);
}

}  // namespace

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry registry;
  return registry;
}

LoggerRegistry::LoggerRegistry()
    : default_sink_(SinkFactory::createStderrSink()),
      default_logger_(std::make_shared<Logger>(kDefaultLoggerName)) {
  default_logger_->setSink(default_sink_);
  loggers_[kDefaultLoggerName] = default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name, levelForLocked(name));
  logger->setSink(default_sink_);
  loggers_.emplace(name, logger);
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  reapplyLevelsLocked();
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setPattern(const std::string& glob, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  rules_.insert(rules_.begin(), LevelRule{glob, compileGlob(glob), level});
  reapplyLevelsLocked();
}

void LoggerRegistry::clearPatterns() {
  std::lock_guard<std::mutex> lock(mutex_);
  rules_.clear();
  reapplyLevelsLocked();
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
}

std::shared_ptr<LogSink> LoggerRegistry::getDefaultSink() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_sink_;
}

bool LoggerRegistry::shouldLog(const std::string& logger_name,
                               LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(logger_name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  LogLevel threshold = levelForLocked(logger_name);
  return threshold != LogLevel::Off && level >= threshold;
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& logger_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return levelForLocked(logger_name);
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }
  return names;
}

void LoggerRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  rules_.clear();
  global_level_ = LogLevel::Info;
  default_sink_ = SinkFactory::createStderrSink();
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
  reapplyLevelsLocked();
}

LogLevel LoggerRegistry::levelForLocked(const std::string& name) const {
  for (const auto& rule : rules_) {
    if (std::regex_match(name, rule.matcher)) {
      return rule.level;
    }
  }
  return global_level_;
}

void LoggerRegistry::reapplyLevelsLocked() {
  for (auto& entry : loggers_) {
    entry.second->setLevel(levelForLocked(entry.first));
  }
}

}  // namespace logging
}  // namespace lanlink

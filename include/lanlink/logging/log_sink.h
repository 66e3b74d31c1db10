#pragma once

#include <cstddef>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include "lanlink/logging/log_formatter.h"
#include "lanlink/logging/log_message.h"

namespace lanlink {
namespace logging {

/**
 * Destination for formatted log records. Sinks are shared between loggers
 * and must tolerate concurrent log() calls.
 */
class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;
  virtual SinkType type() const = 0;

  virtual bool supportsRotation() const { return false; }

  void setFormatter(std::unique_ptr<Formatter> formatter) {
    if (formatter) {
      formatter_ = std::move(formatter);
    }
  }

 protected:
  std::unique_ptr<Formatter> formatter_{new TextFormatter()};
};

class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::Stdio; }

 private:
  const Target target_;
  std::mutex mutex_;
};

/**
 * Appends to `path`. When a write would push the file past `max_bytes` the
 * file becomes path.1, older copies shift up, and at most `max_files`
 * rotated copies are kept.
 */
class RotatingFileSink : public LogSink {
 public:
  struct Options {
    std::string path;
    size_t max_bytes = 10 * 1024 * 1024;
    size_t max_files = 5;
  };

  explicit RotatingFileSink(Options options);
  ~RotatingFileSink() override;

  void log(const LogMessage& msg) override;
  void flush() override;
  SinkType type() const override { return SinkType::File; }
  bool supportsRotation() const override { return true; }

  bool isOpen() const { return out_.is_open(); }

 private:
  void open();
  void rotate();

  const Options options_;
  std::ofstream out_;
  size_t written_{0};
  std::mutex mutex_;
};

class SinkFactory {
 public:
  static std::unique_ptr<LogSink> createStderrSink() {
    return std::unique_ptr<LogSink>(new StdioSink(StdioSink::Stderr));
  }

  static std::unique_ptr<LogSink> createFileSink(const std::string& path) {
    RotatingFileSink::Options options;
    options.path = path;
    return std::unique_ptr<LogSink>(new RotatingFileSink(options));
  }
};

}  // namespace logging
}  // namespace lanlink

#include "lanlink/logging/log_sink.h"

#include <cstdio>
#include <iostream>

namespace lanlink {
namespace logging {

void StdioSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);
  std::lock_guard<std::mutex> lock(mutex_);
  (target_ == Stdout ? std::cout : std::cerr) << line << '\n';
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  (target_ == Stdout ? std::cout : std::cerr).flush();
}

RotatingFileSink::RotatingFileSink(Options options)
    : options_(std::move(options)) {
  open();
}

RotatingFileSink::~RotatingFileSink() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (out_.is_open()) {
    out_.flush();
    out_.close();
  }
}

void RotatingFileSink::log(const LogMessage& msg) {
  std::string line = formatter_->format(msg);
  line += '\n';

  std::lock_guard<std::mutex> lock(mutex_);
  if (!out_.is_open()) {
    open();
    if (!out_.is_open()) {
      return;
    }
  }

  if (options_.max_bytes > 0 && written_ > 0 &&
      written_ + line.size() > options_.max_bytes) {
    rotate();
  }

  out_ << line;
  written_ += line.size();
}

void RotatingFileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (out_.is_open()) {
    out_.flush();
  }
}

void RotatingFileSink::open() {
  out_.open(options_.path, std::ios::out | std::ios::app);
  if (!out_.is_open()) {
    std::cerr << "lanlink: cannot open log file " << options_.path << '\n';
    return;
  }
  out_.seekp(0, std::ios::end);
  written_ = static_cast<size_t>(out_.tellp());
}

void RotatingFileSink::rotate() {
  out_.close();

  auto numbered = [this](size_t n) {
    return options_.path + "." + std::to_string(n);
  };

  std::remove(numbered(options_.max_files).c_str());
  for (size_t n = options_.max_files; n > 1; --n) {
    std::rename(numbered(n - 1).c_str(), numbered(n).c_str());
  }
  if (options_.max_files > 0) {
    std::rename(options_.path.c_str(), numbered(1).c_str());
  } else {
    std::remove(options_.path.c_str());
  }

  written_ = 0;
  open();
}

}  // namespace logging
}  // namespace lanlink

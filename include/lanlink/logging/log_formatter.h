#pragma once

#include <string>

#include "lanlink/logging/log_message.h"

namespace lanlink {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// "2026-01-01 12:00:00.000 [INFO] [server] [peer:a:p] text"; debug records
// also carry "(file:line)"
class TextFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per record, no trailing newline
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace lanlink

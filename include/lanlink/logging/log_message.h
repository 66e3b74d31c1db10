#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>

#include "lanlink/logging/log_level.h"

namespace lanlink {
namespace logging {

/**
 * One log record as handed to a sink.
 *
 * `peer` is the "address:port" of the remote endpoint the record is about,
 * empty when there is none. `fields` holds extra structured values that the
 * JSON formatter emits under "metadata".
 */
struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string logger_name;
  std::string message;

  std::chrono::system_clock::time_point timestamp{
      std::chrono::system_clock::now()};
  std::thread::id thread_id{std::this_thread::get_id()};

  const char* file{nullptr};
  int line{0};

  std::string peer;
  std::map<std::string, std::string> fields;
};

}  // namespace logging
}  // namespace lanlink

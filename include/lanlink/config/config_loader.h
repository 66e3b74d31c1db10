#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "lanlink/config/config_types.h"

namespace lanlink {
namespace config {

/**
 * @brief Raised when a configuration file cannot be read or parsed
 */
class ConfigLoadError : public std::runtime_error {
 public:
  explicit ConfigLoadError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * Parse configuration text into a JSON document.
 *
 * @param content File contents
 * @param yaml Parse as YAML (otherwise strict JSON)
 * @throws ConfigLoadError on syntax errors
 */
nlohmann::json parseConfigDocument(const std::string& content, bool yaml);

/**
 * Load and validate a configuration file. ".yaml" and ".yml" files are read
 * with yaml-cpp, anything else as JSON.
 *
 * @throws ConfigLoadError when the file is unreadable or malformed
 * @throws ConfigValidationError when a value is invalid
 */
LanlinkConfig loadConfigFile(const std::string& path);

/**
 * Install the logging settings on the process-wide logger registry.
 */
void applyLoggingConfig(const LoggingConfig& config);

}  // namespace config
}  // namespace lanlink

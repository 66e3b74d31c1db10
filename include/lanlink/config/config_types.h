#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace lanlink {
namespace config {

// Port shared by the server listener and the client broadcast target
constexpr uint16_t kDefaultDiscoveryPort = 8090;
constexpr const char* kDefaultBroadcastAddress = "255.255.255.255";

/**
 * @brief Raised when a configuration value is out of range or mistyped
 */
class ConfigValidationError : public std::runtime_error {
 public:
  ConfigValidationError(const std::string& field, const std::string& reason)
      : std::runtime_error(formatError(field, reason)),
        field_(field),
        reason_(reason) {}

  const std::string& field() const { return field_; }
  const std::string& reason() const { return reason_; }

 private:
  static std::string formatError(const std::string& field,
                                 const std::string& reason) {
    return "Configuration validation failed for field '" + field +
           "': " + reason;
  }

  std::string field_;
  std::string reason_;
};

/**
 * @brief Discovery client settings
 *
 * JSON/YAML keys: local_port, broadcast_port, broadcast_address,
 * discover_interval_ms, keepalive_interval_ms, ack_timeout_ms, payload.
 */
struct ClientConfig {
  uint16_t local_port = 0;  // 0 = ephemeral
  uint16_t broadcast_port = kDefaultDiscoveryPort;
  std::string broadcast_address = kDefaultBroadcastAddress;
  std::chrono::milliseconds discover_interval{1000};
  std::chrono::milliseconds keepalive_interval{1000};
  std::chrono::milliseconds ack_timeout{4000};
  nlohmann::json payload = nlohmann::json::object();

  /**
   * @throws ConfigValidationError
   */
  void validate() const;

  static ClientConfig fromJson(const nlohmann::json& j);
  nlohmann::json toJson() const;
};

/**
 * @brief Discovery server settings
 *
 * JSON/YAML keys: listen_address, listen_port, monitor_interval_ms,
 * disconnect_timeout_ms.
 */
struct ServerConfig {
  std::string listen_address = "0.0.0.0";
  uint16_t listen_port = kDefaultDiscoveryPort;
  std::chrono::milliseconds monitor_interval{1000};
  std::chrono::milliseconds disconnect_timeout{4000};

  void validate() const;

  static ServerConfig fromJson(const nlohmann::json& j);
  nlohmann::json toJson() const;
};

/**
 * @brief Logging settings
 *
 * "patterns" maps logger-name globs to levels, e.g. {"client.*": "debug"}.
 */
struct LoggingConfig {
  std::string level = "info";
  std::string file;             // empty = stderr
  std::string format = "text";  // "text" or "json"
  std::vector<std::pair<std::string, std::string>> patterns;

  void validate() const;

  static LoggingConfig fromJson(const nlohmann::json& j);
  nlohmann::json toJson() const;
};

/**
 * @brief Root of a configuration file
 */
struct LanlinkConfig {
  ClientConfig client;
  ServerConfig server;
  LoggingConfig logging;

  void validate() const {
    client.validate();
    server.validate();
    logging.validate();
  }

  static LanlinkConfig fromJson(const nlohmann::json& j);
  nlohmann::json toJson() const;
};

}  // namespace config
}  // namespace lanlink

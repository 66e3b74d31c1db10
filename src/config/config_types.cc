#include "lanlink/config/config_types.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <limits>

#include "lanlink/logging/log_level.h"
#include "lanlink/network/address.h"

namespace lanlink {
namespace config {

namespace {

using nlohmann::json;

void requireObject(const json& j, const std::string& section) {
  if (!j.is_object()) {
    throw ConfigValidationError(section, "expected an object");
  }
}

void rejectUnknownKeys(const json& j,
                       const std::string& section,
                       std::initializer_list<const char*> known) {
  for (auto it = j.begin(); it != j.end(); ++it) {
    bool found = std::any_of(known.begin(), known.end(), [&](const char* k) {
      return it.key() == k;
    });
    if (!found) {
      throw ConfigValidationError(section + "." + it.key(), "unknown field");
    }
  }
}

uint64_t getUnsigned(const json& value,
                     const std::string& field,
                     uint64_t max_value) {
  if (!value.is_number_integer()) {
    throw ConfigValidationError(field, "expected an integer");
  }
  if (value.is_number_unsigned()) {
    uint64_t v = value.get<uint64_t>();
    if (v > max_value) {
      throw ConfigValidationError(field, "value out of range");
    }
    return v;
  }
  int64_t v = value.get<int64_t>();
  if (v < 0 || static_cast<uint64_t>(v) > max_value) {
    throw ConfigValidationError(field, "value out of range");
  }
  return static_cast<uint64_t>(v);
}

uint16_t getPort(const json& value, const std::string& field) {
  return static_cast<uint16_t>(getUnsigned(value, field, 65535));
}

std::chrono::milliseconds getMillis(const json& value,
                                    const std::string& field) {
  return std::chrono::milliseconds(static_cast<int64_t>(getUnsigned(
      value, field,
      static_cast<uint64_t>(std::numeric_limits<int32_t>::max()))));
}

std::string getString(const json& value, const std::string& field) {
  if (!value.is_string()) {
    throw ConfigValidationError(field, "expected a string");
  }
  return value.get<std::string>();
}

void requirePositive(std::chrono::milliseconds value,
                     const std::string& field) {
  if (value.count() <= 0) {
    throw ConfigValidationError(field, "must be greater than zero");
  }
}

bool isKnownLevel(const std::string& level) {
  return logging::parseLogLevel(level).has_value();
}

}  // namespace

// ===== ClientConfig =====

void ClientConfig::validate() const {
  if (broadcast_port == 0) {
    throw ConfigValidationError("client.broadcast_port",
                                "must be a non-zero port");
  }
  if (!network::Address::parseInternetAddressNoPort(broadcast_address)) {
    throw ConfigValidationError("client.broadcast_address",
                                "'" + broadcast_address +
                                    "' is not an IP address");
  }
  requirePositive(discover_interval, "client.discover_interval_ms");
  requirePositive(keepalive_interval, "client.keepalive_interval_ms");
  requirePositive(ack_timeout, "client.ack_timeout_ms");
  if (payload.is_discarded()) {
    throw ConfigValidationError("client.payload", "invalid JSON payload");
  }
}

ClientConfig ClientConfig::fromJson(const json& j) {
  ClientConfig config;
  requireObject(j, "client");
  rejectUnknownKeys(j, "client",
                    {"local_port", "broadcast_port", "broadcast_address",
                     "discover_interval_ms", "keepalive_interval_ms",
                     "ack_timeout_ms", "payload"});

  if (j.contains("local_port")) {
    config.local_port = getPort(j["local_port"], "client.local_port");
  }
  if (j.contains("broadcast_port")) {
    config.broadcast_port =
        getPort(j["broadcast_port"], "client.broadcast_port");
  }
  if (j.contains("broadcast_address")) {
    config.broadcast_address =
        getString(j["broadcast_address"], "client.broadcast_address");
  }
  if (j.contains("discover_interval_ms")) {
    config.discover_interval =
        getMillis(j["discover_interval_ms"], "client.discover_interval_ms");
  }
  if (j.contains("keepalive_interval_ms")) {
    config.keepalive_interval =
        getMillis(j["keepalive_interval_ms"], "client.keepalive_interval_ms");
  }
  if (j.contains("ack_timeout_ms")) {
    config.ack_timeout =
        getMillis(j["ack_timeout_ms"], "client.ack_timeout_ms");
  }
  if (j.contains("payload")) {
    config.payload = j["payload"];
  }

  config.validate();
  return config;
}

json ClientConfig::toJson() const {
  json j;
  j["local_port"] = local_port;
  j["broadcast_port"] = broadcast_port;
  j["broadcast_address"] = broadcast_address;
  j["discover_interval_ms"] = discover_interval.count();
  j["keepalive_interval_ms"] = keepalive_interval.count();
  j["ack_timeout_ms"] = ack_timeout.count();
  j["payload"] = payload;
  return j;
}

// ===== ServerConfig =====

void ServerConfig::validate() const {
  if (!network::Address::parseInternetAddressNoPort(listen_address)) {
    throw ConfigValidationError("server.listen_address",
                                "'" + listen_address +
                                    "' is not an IP address");
  }
  requirePositive(monitor_interval, "server.monitor_interval_ms");
  requirePositive(disconnect_timeout, "server.disconnect_timeout_ms");
}

ServerConfig ServerConfig::fromJson(const json& j) {
  ServerConfig config;
  requireObject(j, "server");
  rejectUnknownKeys(j, "server",
                    {"listen_address", "listen_port", "monitor_interval_ms",
                     "disconnect_timeout_ms"});

  if (j.contains("listen_address")) {
    config.listen_address =
        getString(j["listen_address"], "server.listen_address");
  }
  if (j.contains("listen_port")) {
    config.listen_port = getPort(j["listen_port"], "server.listen_port");
  }
  if (j.contains("monitor_interval_ms")) {
    config.monitor_interval =
        getMillis(j["monitor_interval_ms"], "server.monitor_interval_ms");
  }
  if (j.contains("disconnect_timeout_ms")) {
    config.disconnect_timeout =
        getMillis(j["disconnect_timeout_ms"], "server.disconnect_timeout_ms");
  }

  config.validate();
  return config;
}

json ServerConfig::toJson() const {
  json j;
  j["listen_address"] = listen_address;
  j["listen_port"] = listen_port;
  j["monitor_interval_ms"] = monitor_interval.count();
  j["disconnect_timeout_ms"] = disconnect_timeout.count();
  return j;
}

// ===== LoggingConfig =====

void LoggingConfig::validate() const {
  if (!isKnownLevel(level)) {
    throw ConfigValidationError("logging.level",
                                "unknown log level '" + level + "'");
  }
  if (format != "text" && format != "json") {
    throw ConfigValidationError("logging.format",
                                "must be \"text\" or \"json\"");
  }
  for (const auto& pattern : patterns) {
    if (pattern.first.empty()) {
      throw ConfigValidationError("logging.patterns", "empty logger pattern");
    }
    if (!isKnownLevel(pattern.second)) {
      throw ConfigValidationError("logging.patterns." + pattern.first,
                                  "unknown log level '" + pattern.second +
                                      "'");
    }
  }
}

LoggingConfig LoggingConfig::fromJson(const json& j) {
  LoggingConfig config;
  requireObject(j, "logging");
  rejectUnknownKeys(j, "logging", {"level", "file", "format", "patterns"});

  if (j.contains("level")) {
    config.level = getString(j["level"], "logging.level");
  }
  if (j.contains("file")) {
    config.file = getString(j["file"], "logging.file");
  }
  if (j.contains("format")) {
    config.format = getString(j["format"], "logging.format");
  }
  if (j.contains("patterns")) {
    const auto& patterns = j["patterns"];
    requireObject(patterns, "logging.patterns");
    for (auto it = patterns.begin(); it != patterns.end(); ++it) {
      config.patterns.emplace_back(
          it.key(), getString(it.value(), "logging.patterns." + it.key()));
    }
  }

  config.validate();
  return config;
}

json LoggingConfig::toJson() const {
  json j;
  j["level"] = level;
  j["file"] = file;
  j["format"] = format;
  json p = json::object();
  for (const auto& pattern : patterns) {
    p[pattern.first] = pattern.second;
  }
  j["patterns"] = p;
  return j;
}

// ===== LanlinkConfig =====

LanlinkConfig LanlinkConfig::fromJson(const json& j) {
  LanlinkConfig config;
  requireObject(j, "<root>");
  rejectUnknownKeys(j, "<root>", {"client", "server", "logging"});

  if (j.contains("client")) {
    config.client = ClientConfig::fromJson(j["client"]);
  }
  if (j.contains("server")) {
    config.server = ServerConfig::fromJson(j["server"]);
  }
  if (j.contains("logging")) {
    config.logging = LoggingConfig::fromJson(j["logging"]);
  }
  return config;
}

json LanlinkConfig::toJson() const {
  json j;
  j["client"] = client.toJson();
  j["server"] = server.toJson();
  j["logging"] = logging.toJson();
  return j;
}

}  // namespace config
}  // namespace lanlink

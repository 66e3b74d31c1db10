#ifndef LANLINK_PROTOCOL_PAYLOAD_H
#define LANLINK_PROTOCOL_PAYLOAD_H

#include <string>

#include <nlohmann/json.hpp>

namespace lanlink {
namespace protocol {

/**
 * Parse the payload carried by CONNECT_REQ / KEEPALIVE_REQ.
 * Empty or malformed input yields an empty JSON object.
 */
inline nlohmann::json parsePayload(const std::string& raw) {
  if (raw.empty()) {
    return nlohmann::json::object();
  }
  auto parsed = nlohmann::json::parse(raw, nullptr, false);
  if (parsed.is_discarded()) {
    return nlohmann::json::object();
  }
  return parsed;
}

/**
 * Serialize a payload for the wire. Null serializes to nothing.
 */
inline std::string serializePayload(const nlohmann::json& payload) {
  if (payload.is_null()) {
    return std::string();
  }
  return payload.dump();
}

}  // namespace protocol
}  // namespace lanlink

#endif  // LANLINK_PROTOCOL_PAYLOAD_H

#ifndef LANLINK_PROTOCOL_WIRE_CODEC_H
#define LANLINK_PROTOCOL_WIRE_CODEC_H

#include <cstdint>
#include <string>
#include <utility>

#include "lanlink/core/compat.h"
#include "lanlink/core/result.h"

namespace lanlink {
namespace protocol {

/**
 * Frame types of the discovery protocol. The wire token is the upper-case
 * name, e.g. "DISCOVER_REQ".
 */
enum class MessageType {
  DiscoverReq,
  DiscoverAck,
  ConnectReq,
  ConnectAck,
  KeepaliveReq,
  KeepaliveAck,
  Error
};

const char* messageTypeToString(MessageType type);

/**
 * Map a wire token to its type.
 * @return The type, or nullopt for tokens outside the protocol
 */
optional<MessageType> messageTypeFromString(const std::string& token);

/**
 * One decoded frame. The payload is the raw remainder of the frame after the
 * sequence field and may itself contain spaces.
 */
struct Message {
  MessageType type{MessageType::DiscoverReq};
  uint64_t sequence{0};
  std::string payload;

  Message() = default;
  Message(MessageType t, uint64_t seq, std::string p = std::string())
      : type(t), sequence(seq), payload(std::move(p)) {}
};

/**
 * Encode "<TYPE> <sequence>" or "<TYPE> <sequence> <payload>" when the payload
 * is not empty.
 */
std::string encode(MessageType type,
                   uint64_t sequence,
                   const std::string& payload = std::string());

inline std::string encode(const Message& message) {
  return encode(message.type, message.sequence, message.payload);
}

/**
 * Decode a frame.
 *
 * Fails with ErrorCode::MalformedMessage when the leading token is not a
 * known type, or the sequence field is missing or not a non-negative decimal
 * integer.
 */
Result<Message> decode(const std::string& frame);

/**
 * True when the leading token of the frame names a protocol message type,
 * whether or not the rest of the frame is well formed. Frames for which this
 * is false are application traffic and are passed through untouched.
 */
bool isProtocolFrame(const std::string& frame);

}  // namespace protocol
}  // namespace lanlink

#endif  // LANLINK_PROTOCOL_WIRE_CODEC_H

#include "lanlink/protocol/wire_codec.h"

#include <limits>

namespace lanlink {
namespace protocol {

namespace {

std::string leadingToken(const std::string& frame) {
  size_t space = frame.find(' ');
  return space == std::string::npos ? frame : frame.substr(0, space);
}

bool parseSequence(const std::string& field, uint64_t& out) {
  if (field.empty()) {
    return false;
  }

  uint64_t value = 0;
  for (char c : field) {
    if (c < '0' || c > '9') {
      return false;
    }
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      return false;  // overflow
    }
    value = value * 10 + digit;
  }

  out = value;
  return true;
}

}  // namespace

const char* messageTypeToString(MessageType type) {
  switch (type) {
    case MessageType::DiscoverReq:
      return "DISCOVER_REQ";
    case MessageType::DiscoverAck:
      return "DISCOVER_ACK";
    case MessageType::ConnectReq:
      return "CONNECT_REQ";
    case MessageType::ConnectAck:
      return "CONNECT_ACK";
    case MessageType::KeepaliveReq:
      return "KEEPALIVE_REQ";
    case MessageType::KeepaliveAck:
      return "KEEPALIVE_ACK";
    case MessageType::Error:
      return "ERROR";
  }
  return "UNKNOWN";
}

optional<MessageType> messageTypeFromString(const std::string& token) {
  if (token == "DISCOVER_REQ") return MessageType::DiscoverReq;
  if (token == "DISCOVER_ACK") return MessageType::DiscoverAck;
  if (token == "CONNECT_REQ") return MessageType::ConnectReq;
  if (token == "CONNECT_ACK") return MessageType::ConnectAck;
  if (token == "KEEPALIVE_REQ") return MessageType::KeepaliveReq;
  if (token == "KEEPALIVE_ACK") return MessageType::KeepaliveAck;
  if (token == "ERROR") return MessageType::Error;
  return nullopt;
}

std::string encode(MessageType type,
                   uint64_t sequence,
                   const std::string& payload) {
  std::string frame = messageTypeToString(type);
  frame += ' ';
  frame += std::to_string(sequence);
  if (!payload.empty()) {
    frame += ' ';
    frame += payload;
  }
  return frame;
}

Result<Message> decode(const std::string& frame) {
  size_t first_space = frame.find(' ');
  std::string token = first_space == std::string::npos
                          ? frame
                          : frame.substr(0, first_space);

  auto type = messageTypeFromString(token);
  if (!type) {
    return makeError<Message>(ErrorCode::MalformedMessage,
                              "unknown message type '" + token + "'");
  }

  if (first_space == std::string::npos) {
    return makeError<Message>(ErrorCode::MalformedMessage,
                              "missing sequence in " + token);
  }

  size_t seq_start = first_space + 1;
  size_t second_space = frame.find(' ', seq_start);
  std::string seq_field =
      second_space == std::string::npos
          ? frame.substr(seq_start)
          : frame.substr(seq_start, second_space - seq_start);

  uint64_t sequence = 0;
  if (!parseSequence(seq_field, sequence)) {
    return makeError<Message>(ErrorCode::MalformedMessage,
                              "invalid sequence '" + seq_field + "' in " +
                                  token);
  }

  Message message(*type, sequence);
  if (second_space != std::string::npos) {
    message.payload = frame.substr(second_space + 1);
  }
  return makeSuccess(std::move(message));
}

bool isProtocolFrame(const std::string& frame) {
  return messageTypeFromString(leadingToken(frame)).has_value();
}

}  // namespace protocol
}  // namespace lanlink

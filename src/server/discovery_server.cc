#define LANLINK_LOG_COMPONENT "server"

#include "lanlink/server/discovery_server.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include "lanlink/logging/log_macros.h"
#include "lanlink/protocol/payload.h"

namespace lanlink {
namespace server {

using protocol::Message;
using protocol::MessageType;

DiscoveryServer::DiscoveryServer(event::Dispatcher& dispatcher,
                                 const config::ServerConfig& config)
    : DiscoveryServer(dispatcher, config, network::defaultUdpSocketFactory()) {
}

DiscoveryServer::DiscoveryServer(event::Dispatcher& dispatcher,
                                 const config::ServerConfig& config,
                                 network::UdpSocketFactory socket_factory)
    : dispatcher_(dispatcher),
      config_(config),
      socket_factory_(std::move(socket_factory)) {
  config_.validate();

  listen_address_ = network::Address::parseInternetAddressNoPort(
      config_.listen_address, config_.listen_port);

  sweep_timer_ = dispatcher_.createTimer([this]() { onSweepTimer(); });
}

DiscoveryServer::~DiscoveryServer() {
  callbacks_.clear();
  stop();
}

IoVoidResult DiscoveryServer::start() {
  if (started_) {
    LANLINK_LOG(Debug, "start() ignored, server already running");
    return IoVoidResult::success();
  }

  // start() may run inside the previous socket's receive loop
  if (socket_) {
    dispatcher_.deferredDelete(std::move(socket_));
  }

  IoVoidResult err = IoVoidResult::success();
  socket_ = socket_factory_(listen_address_->version(), err);
  if (!socket_) {
    LANLINK_LOG(Error, "Failed to create UDP socket: {}", err.error_message());
    return err.ok() ? IoVoidResult::error(EBADF, "socket factory failed")
                    : err;
  }

  auto result = socket_->bind(listen_address_);
  if (!result.ok()) {
    LANLINK_LOG(Error, "Failed to bind {}: {}", listen_address_->asString(),
                result.error_message());
    socket_->close();
    socket_.reset();
    return result;
  }

  socket_->startReceiving(dispatcher_, *this);
  started_ = true;

  sweep_timer_->disableTimer();
  sweep_timer_->enableTimer(config_.monitor_interval);

  LANLINK_LOG(Info, "Server listening on {}",
              socket_->localAddress() ? socket_->localAddress()->asString()
                                      : listen_address_->asString());
  return IoVoidResult::success();
}

void DiscoveryServer::stop() {
  if (!started_) {
    return;
  }

  started_ = false;
  sweep_timer_->disableTimer();

  std::vector<std::string> keys;
  keys.reserve(clients_.size());
  for (const auto& entry : clients_) {
    keys.push_back(entry.first);
  }
  for (const auto& key : keys) {
    evictClient(key, "server stopping");
  }

  if (socket_) {
    socket_->close();
  }

  LANLINK_LOG(Info, "Server stopped");
}

VoidResult DiscoveryServer::send(const std::string& raw,
                                 uint16_t port,
                                 const std::string& address) {
  if (!started_ || !socket_ || !socket_->isOpen()) {
    return makeVoidError(Error(ErrorCode::NotStarted, "server not started"));
  }

  auto peer = network::Address::parseInternetAddressNoPort(address, port);
  if (!peer) {
    return makeVoidError(Error(ErrorCode::InvalidAddress,
                               "'" + address + "' is not an IP address"));
  }

  auto result = socket_->sendTo(raw, *peer);
  if (!result.ok()) {
    LANLINK_LOG(Error, "send to {} failed: {}", peer->asString(),
                result.error_message());
    return makeVoidError(Error(ErrorCode::SendFailed, result.error_message()));
  }
  return makeVoidSuccess();
}

void DiscoveryServer::addCallbacks(DiscoveryServerCallbacks& callbacks) {
  callbacks_.push_back(&callbacks);
}

void DiscoveryServer::removeCallbacks(DiscoveryServerCallbacks& callbacks) {
  callbacks_.remove(&callbacks);
}

network::Address::InstanceConstSharedPtr DiscoveryServer::localAddress()
    const {
  return socket_ ? socket_->localAddress() : nullptr;
}

// ===== Inbound datagrams =====

void DiscoveryServer::onDatagram(
    const std::string& data,
    const network::Address::InstanceConstSharedPtr& peer) {
  auto decoded = protocol::decode(data);
  if (const Error* error = getError(decoded)) {
    if (protocol::isProtocolFrame(data)) {
      LANLINK_LOG(Debug, "Dropping malformed frame from {}: {}",
                  peer->asString(), error->message);
    } else {
      emitMessage(peer, data);
    }
    return;
  }

  const Message& message = get<Message>(decoded);
  switch (message.type) {
    case MessageType::DiscoverReq:
      handleDiscoverReq(message, peer);
      break;
    case MessageType::ConnectReq:
      handleConnectReq(message, peer);
      break;
    case MessageType::KeepaliveReq:
      handleKeepaliveReq(message, peer);
      break;
    case MessageType::Error:
      handleError(message, peer);
      break;
    default:
      // Replies are never addressed to the server; hand them to the host
      emitMessage(peer, data);
      break;
  }
}

void DiscoveryServer::onReceiveError(int error_code) {
  LANLINK_LOG(Warning, "Receive error: {}", std::strerror(error_code));
}

void DiscoveryServer::handleDiscoverReq(
    const Message& message,
    const network::Address::InstanceConstSharedPtr& peer) {
  reply(MessageType::DiscoverAck, message.sequence, *peer);
}

void DiscoveryServer::handleConnectReq(
    const Message& message,
    const network::Address::InstanceConstSharedPtr& peer) {
  std::string key = peer->asString();

  if (isRegistered(key)) {
    // Unclean reconnect: drop the old record and make the client start over
    evictClient(key, "duplicate connect request");
    reply(MessageType::Error, message.sequence, *peer,
          protocol::messageTypeToString(MessageType::ConnectReq));
    return;
  }

  registerClient(peer, protocol::parsePayload(message.payload));
  reply(MessageType::ConnectAck, message.sequence, *peer);
}

void DiscoveryServer::handleKeepaliveReq(
    const Message& message,
    const network::Address::InstanceConstSharedPtr& peer) {
  auto it = clients_.find(peer->asString());
  if (it == clients_.end()) {
    LANLINK_LOG_PEER(Debug, peer->asString(),
                     "Keepalive from unregistered client");
    reply(MessageType::Error, message.sequence, *peer,
          protocol::messageTypeToString(MessageType::KeepaliveReq));
    return;
  }

  it->second.last_seen = std::max(it->second.last_seen, now());
  reply(MessageType::KeepaliveAck, message.sequence, *peer);
}

void DiscoveryServer::handleError(
    const Message& message,
    const network::Address::InstanceConstSharedPtr& peer) {
  std::string key = peer->asString();
  if (isRegistered(key)) {
    evictClient(key, message.payload.empty() ? "client error"
                                             : message.payload.c_str());
  }
  reply(MessageType::Error, message.sequence, *peer,
        protocol::messageTypeToString(MessageType::Error));
}

void DiscoveryServer::reply(MessageType type,
                            uint64_t sequence,
                            const network::Address::Instance& peer,
                            const std::string& payload) {
  if (!socket_ || !socket_->isOpen()) {
    return;
  }

  std::string frame = protocol::encode(type, sequence, payload);
  auto result = socket_->sendTo(frame, peer);
  if (!result.ok()) {
    LANLINK_LOG(Error, "Failed to send '{}' to {}: {}", frame,
                peer.asString(), result.error_message());
    return;
  }
  LANLINK_LOG(Debug, "-> {} {}", peer.asString(), frame);
}

// ===== Registry =====

void DiscoveryServer::registerClient(
    const network::Address::InstanceConstSharedPtr& peer,
    nlohmann::json payload) {
  ClientRecord record;
  record.endpoint = peer;
  record.key = peer->asString();
  record.last_seen = now();
  record.payload = std::move(payload);

  auto inserted = clients_.emplace(record.key, record);
  LANLINK_LOG_PEER(Info, record.key, "Client connected ({} registered)",
                   clients_.size());

  emitConnection(inserted.first->second);
}

void DiscoveryServer::evictClient(const std::string& key, const char* reason) {
  auto it = clients_.find(key);
  if (it == clients_.end()) {
    return;
  }

  ClientRecord record = std::move(it->second);
  clients_.erase(it);

  LANLINK_LOG_PEER(Info, key, "Client removed: {} ({} registered)", reason,
                   clients_.size());

  emitClose(record);
}

void DiscoveryServer::onSweepTimer() {
  if (!started_) {
    return;
  }
  sweep();
  if (started_) {
    sweep_timer_->enableTimer(config_.monitor_interval);
  }
}

void DiscoveryServer::sweep() {
  auto current = now();

  std::vector<std::string> expired;
  for (const auto& entry : clients_) {
    if (current - entry.second.last_seen > config_.disconnect_timeout) {
      expired.push_back(entry.first);
    }
  }

  for (const auto& key : expired) {
    evictClient(key, "keepalive timeout");
  }
}

// ===== Observers =====

void DiscoveryServer::emitConnection(const ClientRecord& record) {
  // The record may be evicted by an observer; hand out a stable copy
  ClientRecord copy = record;
  auto snapshot = callbacks_;
  for (auto* cb : snapshot) {
    if (std::find(callbacks_.begin(), callbacks_.end(), cb) !=
        callbacks_.end()) {
      cb->onConnection(copy, clients_);
    }
  }
}

void DiscoveryServer::emitClose(const ClientRecord& record) {
  auto snapshot = callbacks_;
  for (auto* cb : snapshot) {
    if (std::find(callbacks_.begin(), callbacks_.end(), cb) !=
        callbacks_.end()) {
      cb->onClose(record, clients_);
    }
  }
}

void DiscoveryServer::emitMessage(
    const network::Address::InstanceConstSharedPtr& from,
    const std::string& raw) {
  auto snapshot = callbacks_;
  for (auto* cb : snapshot) {
    if (std::find(callbacks_.begin(), callbacks_.end(), cb) !=
        callbacks_.end()) {
      cb->onMessage(from, raw);
    }
  }
}

}  // namespace server
}  // namespace lanlink

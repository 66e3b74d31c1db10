#define LANLINK_LOG_COMPONENT "client"

#include "lanlink/client/discovery_client.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "lanlink/logging/log_macros.h"
#include "lanlink/protocol/payload.h"

namespace lanlink {
namespace client {

using protocol::Message;
using protocol::MessageType;

const char* stateToString(State state) {
  switch (state) {
    case State::Disconnected:
      return "Disconnected";
    case State::Discovering:
      return "Discovering";
    case State::Connecting:
      return "Connecting";
    case State::Connected:
      return "Connected";
  }
  return "Unknown";
}

DiscoveryClient::DiscoveryClient(event::Dispatcher& dispatcher,
                                 const config::ClientConfig& config)
    : DiscoveryClient(dispatcher, config, network::defaultUdpSocketFactory()) {
}

DiscoveryClient::DiscoveryClient(event::Dispatcher& dispatcher,
                                 const config::ClientConfig& config,
                                 network::UdpSocketFactory socket_factory)
    : dispatcher_(dispatcher),
      config_(config),
      socket_factory_(std::move(socket_factory)) {
  config_.validate();

  broadcast_address_ = network::Address::parseInternetAddressNoPort(
      config_.broadcast_address, config_.broadcast_port);
  payload_ = protocol::serializePayload(config_.payload);

  discover_timer_ = dispatcher_.createTimer([this]() { onDiscoverTimer(); });
  keepalive_timer_ = dispatcher_.createTimer([this]() { onKeepaliveTimer(); });
  ack_watchdog_ = dispatcher_.createTimer([this]() { onAckTimeout(); });
}

DiscoveryClient::~DiscoveryClient() {
  // Observers may already be gone; tear down silently
  callbacks_.clear();
  stop();
}

IoVoidResult DiscoveryClient::start() {
  if (started_) {
    LANLINK_LOG(Debug, "start() ignored, client already running");
    return IoVoidResult::success();
  }

  auto version = broadcast_address_->version();

  // start() may run inside the previous socket's receive loop
  if (socket_) {
    dispatcher_.deferredDelete(std::move(socket_));
  }

  IoVoidResult err = IoVoidResult::success();
  socket_ = socket_factory_(version, err);
  if (!socket_) {
    LANLINK_LOG(Error, "Failed to create UDP socket: {}", err.error_message());
    return err.ok() ? IoVoidResult::error(EBADF, "socket factory failed")
                    : err;
  }

  auto bind_address = network::Address::anyAddress(version, config_.local_port);
  auto result = socket_->bind(bind_address);
  if (!result.ok()) {
    LANLINK_LOG(Error, "Failed to bind {}: {}", bind_address->asString(),
                result.error_message());
    socket_->close();
    socket_.reset();
    return result;
  }

  result = socket_->setBroadcast(true);
  if (!result.ok()) {
    LANLINK_LOG(Error, "Failed to enable SO_BROADCAST: {}",
                result.error_message());
    socket_->close();
    socket_.reset();
    return result;
  }

  socket_->startReceiving(dispatcher_, *this);
  started_ = true;

  LANLINK_LOG(Info, "Client listening on {}, discovering on {}",
              socket_->localAddress() ? socket_->localAddress()->asString()
                                      : bind_address->asString(),
              broadcast_address_->asString());

  beginDiscovery();
  return IoVoidResult::success();
}

void DiscoveryClient::stop() {
  if (!started_) {
    return;
  }

  bool was_connected = (state_ == State::Connected);
  if (was_connected && server_) {
    // Let the server drop the record now instead of at its next sweep
    uint64_t seq = stampRequest();
    sendFrame(protocol::encode(MessageType::Error, seq, "CLOSE"), *server_);
  }

  cancelAllTimers();
  outstanding_sequence_ = nullopt;
  started_ = false;
  transitionTo(State::Disconnected);
  server_.reset();

  if (socket_) {
    socket_->close();
  }

  LANLINK_LOG(Info, "Client stopped");

  if (was_connected) {
    emitClose();
  }
}

VoidResult DiscoveryClient::send(const std::string& raw) {
  if (!started_ || !socket_ || !socket_->isOpen()) {
    return makeVoidError(Error(ErrorCode::NotStarted, "client not started"));
  }
  if (!server_) {
    return makeVoidError(
        Error(ErrorCode::NotConnected, "no server discovered yet"));
  }

  auto result = socket_->sendTo(raw, *server_);
  if (!result.ok()) {
    LANLINK_LOG(Error, "send to {} failed: {}", server_->asString(),
                result.error_message());
    return makeVoidError(Error(ErrorCode::SendFailed, result.error_message()));
  }
  return makeVoidSuccess();
}

void DiscoveryClient::addCallbacks(DiscoveryClientCallbacks& callbacks) {
  callbacks_.push_back(&callbacks);
}

void DiscoveryClient::removeCallbacks(DiscoveryClientCallbacks& callbacks) {
  callbacks_.remove(&callbacks);
}

network::Address::InstanceConstSharedPtr DiscoveryClient::localAddress()
    const {
  return socket_ ? socket_->localAddress() : nullptr;
}

// ===== Inbound datagrams =====

void DiscoveryClient::onDatagram(
    const std::string& data,
    const network::Address::InstanceConstSharedPtr& peer) {
  if (!protocol::isProtocolFrame(data)) {
    emitMessage(peer, data);
    return;
  }

  auto decoded = protocol::decode(data);
  if (const Error* error = getError(decoded)) {
    LANLINK_LOG(Debug, "Dropping malformed frame from {}: {}",
                peer->asString(), error->message);
    return;
  }

  const Message& message = get<Message>(decoded);
  switch (message.type) {
    case MessageType::DiscoverAck:
      handleDiscoverAck(message, peer);
      break;
    case MessageType::ConnectAck:
      handleConnectAck(message);
      break;
    case MessageType::KeepaliveAck:
      handleKeepaliveAck(message);
      break;
    case MessageType::Error:
      handleError(message);
      break;
    default:
      LANLINK_LOG(Debug, "Ignoring {} from {}",
                  protocol::messageTypeToString(message.type),
                  peer->asString());
      break;
  }
}

void DiscoveryClient::onReceiveError(int error_code) {
  LANLINK_LOG(Warning, "Receive error: {}", std::strerror(error_code));
}

bool DiscoveryClient::isOutstanding(uint64_t sequence) const {
  return outstanding_sequence_.has_value() &&
         *outstanding_sequence_ == sequence;
}

void DiscoveryClient::handleDiscoverAck(
    const Message& message,
    const network::Address::InstanceConstSharedPtr& peer) {
  if (state_ != State::Discovering || !isOutstanding(message.sequence)) {
    LANLINK_LOG(Debug, "Stale DISCOVER_ACK {} from {} in state {}",
                message.sequence, peer->asString(), stateToString(state_));
    return;
  }

  outstanding_sequence_ = nullopt;
  discover_timer_->disableTimer();

  server_ = peer;
  LANLINK_LOG(Info, "Discovered server at {}", server_->asString());

  // Server is known; stop broadcasting until the next reset
  setBroadcast(false);

  sendConnect();
}

void DiscoveryClient::handleConnectAck(const Message& message) {
  if (state_ != State::Connecting || !isOutstanding(message.sequence)) {
    LANLINK_LOG(Debug, "Stale CONNECT_ACK {} in state {}", message.sequence,
                stateToString(state_));
    return;
  }

  outstanding_sequence_ = nullopt;
  ack_watchdog_->disableTimer();
  transitionTo(State::Connected);

  emitConnection();

  // An observer may have stopped or reset us
  if (started_ && state_ == State::Connected) {
    sendKeepalive();
  }
}

void DiscoveryClient::handleKeepaliveAck(const Message& message) {
  if (state_ != State::Connected || !isOutstanding(message.sequence)) {
    LANLINK_LOG(Debug, "Stale KEEPALIVE_ACK {} in state {}", message.sequence,
                stateToString(state_));
    return;
  }

  outstanding_sequence_ = nullopt;
  ack_watchdog_->disableTimer();
  keepalive_timer_->disableTimer();
  keepalive_timer_->enableTimer(config_.keepalive_interval);
}

void DiscoveryClient::handleError(const Message& message) {
  if (!isOutstanding(message.sequence)) {
    LANLINK_LOG(Debug, "Stale ERROR {} ({})", message.sequence,
                message.payload);
    return;
  }

  resetSession("server rejected " + message.payload);
}

// ===== Requests =====

uint64_t DiscoveryClient::stampRequest() {
  uint64_t seq = next_sequence_++;
  last_sent_sequence_ = seq;
  outstanding_sequence_ = seq;
  return seq;
}

void DiscoveryClient::sendFrame(const std::string& frame,
                                const network::Address::Instance& peer) {
  if (!socket_ || !socket_->isOpen()) {
    return;
  }

  auto result = socket_->sendTo(frame, peer);
  if (!result.ok()) {
    LANLINK_LOG(Error, "Failed to send '{}' to {}: {}", frame,
                peer.asString(), result.error_message());
    return;
  }
  LANLINK_LOG(Debug, "-> {} {}", peer.asString(), frame);
}

void DiscoveryClient::sendDiscover() {
  uint64_t seq = stampRequest();
  sendFrame(protocol::encode(MessageType::DiscoverReq, seq),
            *broadcast_address_);
}

void DiscoveryClient::sendConnect() {
  transitionTo(State::Connecting);

  uint64_t seq = stampRequest();
  sendFrame(protocol::encode(MessageType::ConnectReq, seq, payload_), *server_);

  ack_watchdog_->disableTimer();
  ack_watchdog_->enableTimer(config_.ack_timeout);
}

void DiscoveryClient::sendKeepalive() {
  uint64_t seq = stampRequest();
  sendFrame(protocol::encode(MessageType::KeepaliveReq, seq, payload_),
            *server_);

  ack_watchdog_->disableTimer();
  ack_watchdog_->enableTimer(config_.ack_timeout);
}

// ===== Timers =====

void DiscoveryClient::onDiscoverTimer() {
  if (state_ != State::Discovering) {
    return;
  }
  sendDiscover();
  discover_timer_->enableTimer(config_.discover_interval);
}

void DiscoveryClient::onKeepaliveTimer() {
  if (state_ != State::Connected) {
    return;
  }
  sendKeepalive();
}

void DiscoveryClient::onAckTimeout() {
  LANLINK_LOG(Warning, "No reply to request {} within {}ms",
              last_sent_sequence_ ? *last_sent_sequence_ : 0,
              config_.ack_timeout.count());
  resetSession("ack timeout");
}

// ===== Transitions =====

void DiscoveryClient::beginDiscovery() {
  setBroadcast(true);
  transitionTo(State::Discovering);

  sendDiscover();

  discover_timer_->disableTimer();
  discover_timer_->enableTimer(config_.discover_interval);
}

void DiscoveryClient::resetSession(const std::string& reason) {
  bool was_connected = (state_ == State::Connected);

  LANLINK_LOG(Info, "Resetting session in state {}: {}",
              stateToString(state_), reason);

  cancelAllTimers();
  outstanding_sequence_ = nullopt;
  // Burn one sequence so replies to the abandoned request can never match
  ++next_sequence_;
  server_.reset();
  transitionTo(State::Disconnected);

  if (was_connected) {
    emitClose();
  }

  if (started_ && state_ == State::Disconnected) {
    beginDiscovery();
  }
}

void DiscoveryClient::cancelAllTimers() {
  discover_timer_->disableTimer();
  keepalive_timer_->disableTimer();
  ack_watchdog_->disableTimer();
}

void DiscoveryClient::transitionTo(State new_state) {
  State old_state = state_;
  if (old_state == new_state) {
    return;
  }

  onExitState(old_state);
  state_ = new_state;

  LANLINK_LOG(Debug, "State {} -> {}", stateToString(old_state),
              stateToString(new_state));
}

void DiscoveryClient::onExitState(State state) {
  switch (state) {
    case State::Discovering:
      discover_timer_->disableTimer();
      break;
    case State::Connecting:
      ack_watchdog_->disableTimer();
      break;
    case State::Connected:
      keepalive_timer_->disableTimer();
      ack_watchdog_->disableTimer();
      break;
    case State::Disconnected:
      break;
  }
}

void DiscoveryClient::setBroadcast(bool enabled) {
  if (!socket_ || !socket_->isOpen() ||
      socket_->broadcastEnabled() == enabled) {
    return;
  }
  auto result = socket_->setBroadcast(enabled);
  if (!result.ok()) {
    LANLINK_LOG(Warning, "Failed to {} SO_BROADCAST: {}",
                enabled ? "enable" : "disable", result.error_message());
  }
}

// ===== Observers =====

void DiscoveryClient::emitConnection() {
  LANLINK_LOG(Info, "Connected to {}", server_->asString());

  auto server = server_;
  auto snapshot = callbacks_;
  for (auto* cb : snapshot) {
    if (std::find(callbacks_.begin(), callbacks_.end(), cb) !=
        callbacks_.end()) {
      cb->onConnection(server);
    }
  }
}

void DiscoveryClient::emitClose() {
  LANLINK_LOG(Info, "Connection closed");

  auto snapshot = callbacks_;
  for (auto* cb : snapshot) {
    if (std::find(callbacks_.begin(), callbacks_.end(), cb) !=
        callbacks_.end()) {
      cb->onClose();
    }
  }
}

void DiscoveryClient::emitMessage(
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

}  // namespace client
}  // namespace lanlink

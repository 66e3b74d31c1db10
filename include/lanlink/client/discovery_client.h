/**
 * Discovery client
 *
 * Locates a discovery server on the local network by broadcast, registers
 * with it, and keeps the registration alive with periodic keepalives.
 *
 * State flow:
 *   Disconnected -> Discovering -> Connecting -> Connected
 *
 * Every request carries a fresh sequence number and only a reply echoing the
 * outstanding sequence is accepted. A missed reply (ack watchdog) or a
 * matching ERROR frame resets the session and restarts discovery.
 */

#ifndef LANLINK_CLIENT_DISCOVERY_CLIENT_H
#define LANLINK_CLIENT_DISCOVERY_CLIENT_H

#include <cstdint>
#include <list>
#include <string>

#include "lanlink/config/config_types.h"
#include "lanlink/core/compat.h"
#include "lanlink/core/result.h"
#include "lanlink/event/event_loop.h"
#include "lanlink/io_result.h"
#include "lanlink/network/address.h"
#include "lanlink/network/udp_socket.h"
#include "lanlink/protocol/wire_codec.h"

namespace lanlink {
namespace client {

enum class State { Disconnected, Discovering, Connecting, Connected };

const char* stateToString(State state);

/**
 * Observer for client lifecycle events. All methods run on the dispatcher
 * thread and may call back into the client, including stop().
 */
class DiscoveryClientCallbacks {
 public:
  virtual ~DiscoveryClientCallbacks() = default;

  /**
   * The server acknowledged the connect request.
   */
  virtual void onConnection(
      const network::Address::InstanceConstSharedPtr& server) {
    (void)server;
  }

  /**
   * An established connection was lost or stopped.
   */
  virtual void onClose() {}

  /**
   * A datagram that is not protocol traffic.
   */
  virtual void onMessage(const network::Address::InstanceConstSharedPtr& from,
                         const std::string& raw) {
    (void)from;
    (void)raw;
  }
};

class DiscoveryClient : public network::DatagramCallbacks {
 public:
  /**
   * @throws config::ConfigValidationError if the configuration is invalid
   */
  DiscoveryClient(event::Dispatcher& dispatcher,
                  const config::ClientConfig& config);
  DiscoveryClient(event::Dispatcher& dispatcher,
                  const config::ClientConfig& config,
                  network::UdpSocketFactory socket_factory);
  ~DiscoveryClient() override;

  DiscoveryClient(const DiscoveryClient&) = delete;
  DiscoveryClient& operator=(const DiscoveryClient&) = delete;

  /**
   * Open and bind the socket, then start broadcasting discovery requests.
   * Calling start() on a running client does nothing.
   *
   * @return Socket setup failure, if any
   */
  IoVoidResult start();

  /**
   * Cancel every timer and close the socket. A connected client first tells
   * the server it is leaving and emits onClose(). Safe to call repeatedly.
   */
  void stop();

  /**
   * Unicast a raw datagram to the current server.
   * @return NotStarted / NotConnected / SendFailed on failure
   */
  VoidResult send(const std::string& raw);

  void addCallbacks(DiscoveryClientCallbacks& callbacks);
  void removeCallbacks(DiscoveryClientCallbacks& callbacks);

  State state() const { return state_; }
  bool isStarted() const { return started_; }

  /**
   * Endpoint of the discovered server, or nullptr while discovering.
   */
  network::Address::InstanceConstSharedPtr serverAddress() const {
    return server_;
  }

  /**
   * Sequence stamped on the most recent request, nullopt before the first.
   */
  optional<uint64_t> lastSentSequence() const { return last_sent_sequence_; }

  /**
   * Sequence a reply must echo to be accepted, nullopt when none is pending.
   */
  optional<uint64_t> outstandingSequence() const {
    return outstanding_sequence_;
  }

  const config::ClientConfig& config() const { return config_; }

  network::Address::InstanceConstSharedPtr localAddress() const;

  // network::DatagramCallbacks
  void onDatagram(
      const std::string& data,
      const network::Address::InstanceConstSharedPtr& peer) override;
  void onReceiveError(int error_code) override;

 private:
  void transitionTo(State new_state);
  void onExitState(State state);

  // Request senders. Each stamps a new sequence.
  void sendDiscover();
  void sendConnect();
  void sendKeepalive();
  uint64_t stampRequest();
  void sendFrame(const std::string& frame,
                 const network::Address::Instance& peer);

  // Reply handlers
  void handleDiscoverAck(const protocol::Message& message,
                         const network::Address::InstanceConstSharedPtr& peer);
  void handleConnectAck(const protocol::Message& message);
  void handleKeepaliveAck(const protocol::Message& message);
  void handleError(const protocol::Message& message);
  bool isOutstanding(uint64_t sequence) const;

  // Timer callbacks
  void onDiscoverTimer();
  void onKeepaliveTimer();
  void onAckTimeout();

  void beginDiscovery();
  void resetSession(const std::string& reason);
  void cancelAllTimers();
  void setBroadcast(bool enabled);

  void emitConnection();
  void emitClose();
  void emitMessage(const network::Address::InstanceConstSharedPtr& from,
                   const std::string& raw);

  event::Dispatcher& dispatcher_;
  config::ClientConfig config_;
  network::UdpSocketFactory socket_factory_;
  network::UdpSocketPtr socket_;

  network::Address::InstanceConstSharedPtr broadcast_address_;
  std::string payload_;  // serialized once from config_.payload

  State state_{State::Disconnected};
  bool started_{false};
  network::Address::InstanceConstSharedPtr server_;

  uint64_t next_sequence_{0};
  optional<uint64_t> last_sent_sequence_;
  optional<uint64_t> outstanding_sequence_;

  // One timer per kind; each is disabled before being re-armed
  event::TimerPtr discover_timer_;
  event::TimerPtr keepalive_timer_;
  event::TimerPtr ack_watchdog_;

  std::list<DiscoveryClientCallbacks*> callbacks_;
};

}  // namespace client
}  // namespace lanlink

#endif  // LANLINK_CLIENT_DISCOVERY_CLIENT_H

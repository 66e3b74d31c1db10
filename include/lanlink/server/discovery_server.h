/**
 * Discovery server
 *
 * Answers discovery broadcasts, registers clients that connect, and evicts
 * clients whose keepalives stop arriving. The registry is keyed by the
 * client endpoint string ("address:port") and holds at most one record per
 * endpoint.
 */

#ifndef LANLINK_SERVER_DISCOVERY_SERVER_H
#define LANLINK_SERVER_DISCOVERY_SERVER_H

#include <chrono>
#include <cstdint>
#include <list>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "lanlink/config/config_types.h"
#include "lanlink/core/result.h"
#include "lanlink/event/event_loop.h"
#include "lanlink/io_result.h"
#include "lanlink/network/address.h"
#include "lanlink/network/udp_socket.h"
#include "lanlink/protocol/wire_codec.h"

namespace lanlink {
namespace server {

/**
 * A registered client.
 */
struct ClientRecord {
  network::Address::InstanceConstSharedPtr endpoint;
  std::string key;  // endpoint->asString()
  std::chrono::steady_clock::time_point last_seen;
  nlohmann::json payload;
};

// Ordered by key so snapshots iterate deterministically
using ClientRegistry = std::map<std::string, ClientRecord>;

/**
 * Observer for server events. The registry passed along is the state right
 * after the change: it contains the record on connection and no longer
 * contains it on close.
 */
class DiscoveryServerCallbacks {
 public:
  virtual ~DiscoveryServerCallbacks() = default;

  virtual void onConnection(const ClientRecord& record,
                            const ClientRegistry& clients) {
    (void)record;
    (void)clients;
  }

  virtual void onClose(const ClientRecord& record,
                       const ClientRegistry& clients) {
    (void)record;
    (void)clients;
  }

  virtual void onMessage(const network::Address::InstanceConstSharedPtr& from,
                         const std::string& raw) {
    (void)from;
    (void)raw;
  }
};

class DiscoveryServer : public network::DatagramCallbacks {
 public:
  /**
   * @throws config::ConfigValidationError if the configuration is invalid
   */
  DiscoveryServer(event::Dispatcher& dispatcher,
                  const config::ServerConfig& config);
  DiscoveryServer(event::Dispatcher& dispatcher,
                  const config::ServerConfig& config,
                  network::UdpSocketFactory socket_factory);
  ~DiscoveryServer() override;

  DiscoveryServer(const DiscoveryServer&) = delete;
  DiscoveryServer& operator=(const DiscoveryServer&) = delete;

  /**
   * Bind the listen socket and start the liveness sweep.
   */
  IoVoidResult start();

  /**
   * Stop the sweep, evict every registered client (one onClose each) and
   * close the socket. Safe to call repeatedly.
   */
  void stop();

  /**
   * Unicast a raw datagram to any peer.
   * @return NotStarted / InvalidAddress / SendFailed on failure
   */
  VoidResult send(const std::string& raw,
                  uint16_t port,
                  const std::string& address);

  void addCallbacks(DiscoveryServerCallbacks& callbacks);
  void removeCallbacks(DiscoveryServerCallbacks& callbacks);

  const ClientRegistry& clients() const { return clients_; }
  size_t clientCount() const { return clients_.size(); }
  bool isRegistered(const std::string& key) const {
    return clients_.count(key) != 0;
  }

  bool isStarted() const { return started_; }
  const config::ServerConfig& config() const { return config_; }

  /**
   * Bound address; resolves an ephemeral listen port after start().
   */
  network::Address::InstanceConstSharedPtr localAddress() const;

  // network::DatagramCallbacks
  void onDatagram(
      const std::string& data,
      const network::Address::InstanceConstSharedPtr& peer) override;
  void onReceiveError(int error_code) override;

 private:
  void handleDiscoverReq(const protocol::Message& message,
                         const network::Address::InstanceConstSharedPtr& peer);
  void handleConnectReq(const protocol::Message& message,
                        const network::Address::InstanceConstSharedPtr& peer);
  void handleKeepaliveReq(const protocol::Message& message,
                          const network::Address::InstanceConstSharedPtr& peer);
  void handleError(const protocol::Message& message,
                   const network::Address::InstanceConstSharedPtr& peer);

  void reply(protocol::MessageType type,
             uint64_t sequence,
             const network::Address::Instance& peer,
             const std::string& payload = std::string());

  void registerClient(const network::Address::InstanceConstSharedPtr& peer,
                      nlohmann::json payload);
  void evictClient(const std::string& key, const char* reason);

  void onSweepTimer();
  void sweep();

  void emitConnection(const ClientRecord& record);
  void emitClose(const ClientRecord& record);
  void emitMessage(const network::Address::InstanceConstSharedPtr& from,
                   const std::string& raw);

  std::chrono::steady_clock::time_point now() const {
    return dispatcher_.approximateMonotonicTime();
  }

  event::Dispatcher& dispatcher_;
  config::ServerConfig config_;
  network::UdpSocketFactory socket_factory_;
  network::UdpSocketPtr socket_;
  network::Address::InstanceConstSharedPtr listen_address_;

  bool started_{false};
  ClientRegistry clients_;
  event::TimerPtr sweep_timer_;

  std::list<DiscoveryServerCallbacks*> callbacks_;
};

}  // namespace server
}  // namespace lanlink

#endif  // LANLINK_SERVER_DISCOVERY_SERVER_H

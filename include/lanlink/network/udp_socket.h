#ifndef LANLINK_NETWORK_UDP_SOCKET_H
#define LANLINK_NETWORK_UDP_SOCKET_H

#include <functional>
#include <memory>
#include <string>

#include "lanlink/event/event_loop.h"
#include "lanlink/io_result.h"
#include "lanlink/network/address.h"

namespace lanlink {
namespace network {

/**
 * Receives datagrams read from a UdpSocket. Invoked on the dispatcher thread,
 * once per datagram.
 */
class DatagramCallbacks {
 public:
  virtual ~DatagramCallbacks() = default;

  virtual void onDatagram(const std::string& data,
                          const Address::InstanceConstSharedPtr& peer) = 0;

  /**
   * Called when a receive fails with something other than EAGAIN.
   */
  virtual void onReceiveError(int error_code) { (void)error_code; }
};

/**
 * Non-blocking UDP endpoint bound to one dispatcher.
 *
 * An owner replacing a socket that may be delivering a datagram hands it to
 * Dispatcher::deferredDelete() instead of destroying it.
 */
class UdpSocket : public event::DeferredDeletable {
 public:

  /**
   * Bind the socket. Port 0 picks an ephemeral port.
   */
  virtual IoVoidResult bind(const Address::InstanceConstSharedPtr& address) = 0;

  /**
   * Toggle SO_BROADCAST.
   */
  virtual IoVoidResult setBroadcast(bool enabled) = 0;

  virtual bool broadcastEnabled() const = 0;

  /**
   * Send one datagram.
   * @return Number of bytes sent or the send error
   */
  virtual IoCallResult sendTo(const std::string& data,
                              const Address::Instance& peer) = 0;

  /**
   * Register for read readiness on the dispatcher. Every pending datagram is
   * delivered to the callbacks before returning to the loop.
   */
  virtual void startReceiving(event::Dispatcher& dispatcher,
                              DatagramCallbacks& callbacks) = 0;

  /**
   * Stop receiving and close the descriptor. Safe to call twice.
   */
  virtual void close() = 0;

  virtual bool isOpen() const = 0;

  /**
   * Address the socket is bound to, or nullptr before bind.
   */
  virtual Address::InstanceConstSharedPtr localAddress() const = 0;
};

using UdpSocketPtr = std::unique_ptr<UdpSocket>;

/**
 * Creates sockets for the given IP version. Returns nullptr and fills in the
 * error when the descriptor cannot be created.
 */
using UdpSocketFactory =
    std::function<UdpSocketPtr(Address::IpVersion version, IoVoidResult& err)>;

/**
 * Factory producing real kernel sockets.
 */
UdpSocketFactory defaultUdpSocketFactory();

}  // namespace network
}  // namespace lanlink

#endif  // LANLINK_NETWORK_UDP_SOCKET_H

#ifndef LANLINK_NETWORK_UDP_SOCKET_IMPL_H
#define LANLINK_NETWORK_UDP_SOCKET_IMPL_H

#include "lanlink/network/udp_socket.h"

namespace lanlink {
namespace network {

/**
 * UdpSocket over a POSIX datagram descriptor.
 *
 * The descriptor is non-blocking and binds exclusively: a second socket on
 * the same address and port fails with EADDRINUSE. Readiness is
 * edge-triggered so every read event drains the receive queue.
 */
class UdpSocketImpl : public UdpSocket {
 public:
  /**
   * Open a descriptor for the given family.
   * @return The socket or nullptr with the error filled in
   */
  static UdpSocketPtr create(Address::IpVersion version, IoVoidResult& err);

  explicit UdpSocketImpl(int fd);
  ~UdpSocketImpl() override;

  UdpSocketImpl(const UdpSocketImpl&) = delete;
  UdpSocketImpl& operator=(const UdpSocketImpl&) = delete;

  IoVoidResult bind(const Address::InstanceConstSharedPtr& address) override;
  IoVoidResult setBroadcast(bool enabled) override;
  bool broadcastEnabled() const override { return broadcast_enabled_; }
  IoCallResult sendTo(const std::string& data,
                      const Address::Instance& peer) override;
  void startReceiving(event::Dispatcher& dispatcher,
                      DatagramCallbacks& callbacks) override;
  void close() override;
  bool isOpen() const override { return fd_ >= 0; }
  Address::InstanceConstSharedPtr localAddress() const override {
    return local_address_;
  }

  int fd() const { return fd_; }

 private:
  void onFileEvent(uint32_t events);

  // Largest UDP payload
  static constexpr size_t kMaxDatagramSize = 65507;

  int fd_;
  bool broadcast_enabled_{false};
  Address::InstanceConstSharedPtr local_address_;
  event::FileEventPtr file_event_;
  DatagramCallbacks* callbacks_{nullptr};
};

}  // namespace network
}  // namespace lanlink

#endif  // LANLINK_NETWORK_UDP_SOCKET_IMPL_H

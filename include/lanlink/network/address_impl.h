#ifndef LANLINK_NETWORK_ADDRESS_IMPL_H
#define LANLINK_NETWORK_ADDRESS_IMPL_H

#include <netinet/in.h>

#include "lanlink/network/address.h"

namespace lanlink {
namespace network {
namespace Address {

/**
 * Endpoint backed by a sockaddr_storage holding either a sockaddr_in or a
 * sockaddr_in6. The family is fixed at construction.
 */
class InetInstance : public Instance {
 public:
  InetInstance(const in_addr& address, uint16_t port);
  InetInstance(const in6_addr& address, uint16_t port);
  explicit InetInstance(const sockaddr_in& address);
  explicit InetInstance(const sockaddr_in6& address);

  IpVersion version() const override { return version_; }
  uint16_t port() const override;
  std::string host() const override;
  std::string asString() const override;

  bool isAnyAddress() const override;
  bool isLoopbackAddress() const override;
  bool isBroadcastAddress() const override;

  const sockaddr* sockAddr() const override {
    return reinterpret_cast<const sockaddr*>(&storage_);
  }
  socklen_t sockAddrLen() const override { return length_; }

  bool operator==(const Instance& rhs) const override;

 private:
  const sockaddr_in& v4() const {
    return *reinterpret_cast<const sockaddr_in*>(&storage_);
  }
  const sockaddr_in6& v6() const {
    return *reinterpret_cast<const sockaddr_in6*>(&storage_);
  }

  sockaddr_storage storage_;
  socklen_t length_;
  IpVersion version_;
};

}  // namespace Address
}  // namespace network
}  // namespace lanlink

#endif  // LANLINK_NETWORK_ADDRESS_IMPL_H

#ifndef LANLINK_NETWORK_ADDRESS_H
#define LANLINK_NETWORK_ADDRESS_H

#include <cstdint>
#include <memory>
#include <string>

#include <netinet/in.h>
#include <sys/socket.h>

namespace lanlink {
namespace network {
namespace Address {

enum class IpVersion { v4, v6 };

class Instance;
using InstanceConstSharedPtr = std::shared_ptr<const Instance>;

/**
 * An IP endpoint (address plus UDP port).
 *
 * Endpoints are immutable and shared between the socket layer, the
 * protocol engines and callbacks. asString() gives "a.b.c.d:port" or
 * "[v6]:port"; the server keys its client table by that string.
 */
class Instance {
 public:
  virtual ~Instance() = default;

  virtual IpVersion version() const = 0;
  virtual uint16_t port() const = 0;

  // Literal address without the port
  virtual std::string host() const = 0;
  virtual std::string asString() const = 0;

  virtual bool isAnyAddress() const = 0;
  virtual bool isLoopbackAddress() const = 0;
  // 255.255.255.255 only; never true for IPv6
  virtual bool isBroadcastAddress() const = 0;

  virtual const sockaddr* sockAddr() const = 0;
  virtual socklen_t sockAddrLen() const = 0;

  virtual bool operator==(const Instance& rhs) const = 0;
  bool operator!=(const Instance& rhs) const { return !(*this == rhs); }
};

/**
 * Build an endpoint from a numeric literal ("10.0.0.255", "ff02::1").
 * Host names are not resolved. Returns nullptr if `literal` is not an
 * address.
 */
InstanceConstSharedPtr parseInternetAddressNoPort(const std::string& literal,
                                                  uint16_t port = 0);

// "a.b.c.d:port" or "[v6]:port"; nullptr on any malformed part
InstanceConstSharedPtr parseInternetAddress(const std::string& endpoint);

/**
 * Wrap a kernel supplied sockaddr (recvfrom, getsockname).
 * With `v6only` false an IPv4-mapped IPv6 peer comes back as IPv4.
 * Returns nullptr for short buffers and non-IP families.
 */
InstanceConstSharedPtr addressFromSockAddr(const sockaddr_storage& addr,
                                           socklen_t len,
                                           bool v6only = true);

InstanceConstSharedPtr anyAddress(IpVersion version, uint16_t port = 0);
InstanceConstSharedPtr loopbackAddress(IpVersion version, uint16_t port = 0);

}  // namespace Address
}  // namespace network
}  // namespace lanlink

#endif  // LANLINK_NETWORK_ADDRESS_H

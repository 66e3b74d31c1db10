#include "lanlink/network/address_impl.h"

#include <cstring>

#include <arpa/inet.h>
#include <sys/socket.h>

namespace lanlink {
namespace network {
namespace Address {

namespace {

// Digits only, at most 65535
bool parsePort(const std::string& text, uint16_t& port) {
  if (text.empty() || text.size() > 5) {
    return false;
  }
  uint32_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  if (value > 0xFFFF) {
    return false;
  }
  port = static_cast<uint16_t>(value);
  return true;
}

InstanceConstSharedPtr makeV4(const std::string& text, uint16_t port) {
  in_addr raw;
  if (::inet_pton(AF_INET, text.c_str(), &raw) != 1) {
    return nullptr;
  }
  return std::make_shared<InetInstance>(raw, port);
}

InstanceConstSharedPtr makeV6(const std::string& text, uint16_t port) {
  in6_addr raw;
  if (::inet_pton(AF_INET6, text.c_str(), &raw) != 1) {
    return nullptr;
  }
  return std::make_shared<InetInstance>(raw, port);
}

}  // namespace

InetInstance::InetInstance(const in_addr& address, uint16_t port)
    : length_(sizeof(sockaddr_in)), version_(IpVersion::v4) {
  std::memset(&storage_, 0, sizeof(storage_));
  auto* sin = reinterpret_cast<sockaddr_in*>(&storage_);
  sin->sin_family = AF_INET;
  sin->sin_port = htons(port);
  sin->sin_addr = address;
}

InetInstance::InetInstance(const in6_addr& address, uint16_t port)
    : length_(sizeof(sockaddr_in6)), version_(IpVersion::v6) {
  std::memset(&storage_, 0, sizeof(storage_));
  auto* sin6 = reinterpret_cast<sockaddr_in6*>(&storage_);
  sin6->sin6_family = AF_INET6;
  sin6->sin6_port = htons(port);
  sin6->sin6_addr = address;
}

InetInstance::InetInstance(const sockaddr_in& address)
    : length_(sizeof(sockaddr_in)), version_(IpVersion::v4) {
  std::memset(&storage_, 0, sizeof(storage_));
  std::memcpy(&storage_, &address, sizeof(address));
}

InetInstance::InetInstance(const sockaddr_in6& address)
    : length_(sizeof(sockaddr_in6)), version_(IpVersion::v6) {
  std::memset(&storage_, 0, sizeof(storage_));
  std::memcpy(&storage_, &address, sizeof(address));
}

uint16_t InetInstance::port() const {
  return ntohs(version_ == IpVersion::v4 ? v4().sin_port : v6().sin6_port);
}

std::string InetInstance::host() const {
  char text[INET6_ADDRSTRLEN] = {};
  const char* written =
      version_ == IpVersion::v4
          ? ::inet_ntop(AF_INET, &v4().sin_addr, text, sizeof(text))
          : ::inet_ntop(AF_INET6, &v6().sin6_addr, text, sizeof(text));
  return written ? std::string(text) : std::string();
}

std::string InetInstance::asString() const {
  std::string port_text = std::to_string(port());
  if (version_ == IpVersion::v6) {
    return "[" + host() + "]:" + port_text;
  }
  return host() + ":" + port_text;
}

bool InetInstance::isAnyAddress() const {
  if (version_ == IpVersion::v4) {
    return v4().sin_addr.s_addr == htonl(INADDR_ANY);
  }
  return IN6_IS_ADDR_UNSPECIFIED(&v6().sin6_addr);
}

bool InetInstance::isLoopbackAddress() const {
  if (version_ == IpVersion::v4) {
    // 127.0.0.0/8
    return (ntohl(v4().sin_addr.s_addr) >> 24) == 127;
  }
  return IN6_IS_ADDR_LOOPBACK(&v6().sin6_addr);
}

bool InetInstance::isBroadcastAddress() const {
  return version_ == IpVersion::v4 &&
         v4().sin_addr.s_addr == htonl(INADDR_BROADCAST);
}

bool InetInstance::operator==(const Instance& rhs) const {
  if (rhs.version() != version_ || rhs.port() != port()) {
    return false;
  }
  const sockaddr* other = rhs.sockAddr();
  if (version_ == IpVersion::v4) {
    const auto* sin = reinterpret_cast<const sockaddr_in*>(other);
    return sin->sin_addr.s_addr == v4().sin_addr.s_addr;
  }
  const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(other);
  return std::memcmp(&sin6->sin6_addr, &v6().sin6_addr, sizeof(in6_addr)) == 0;
}

InstanceConstSharedPtr parseInternetAddressNoPort(const std::string& literal,
                                                  uint16_t port) {
  if (auto v4 = makeV4(literal, port)) {
    return v4;
  }
  return makeV6(literal, port);
}

InstanceConstSharedPtr parseInternetAddress(const std::string& endpoint) {
  uint16_t port = 0;

  if (!endpoint.empty() && endpoint.front() == '[') {
    size_t close = endpoint.find(']');
    if (close == std::string::npos || close + 1 >= endpoint.size() ||
        endpoint[close + 1] != ':' ||
        !parsePort(endpoint.substr(close + 2), port)) {
      return nullptr;
    }
    return makeV6(endpoint.substr(1, close - 1), port);
  }

  // A bare IPv6 literal has several colons; require brackets for those
  size_t colon = endpoint.find(':');
  if (colon == std::string::npos || endpoint.find(':', colon + 1) !=
                                        std::string::npos ||
      !parsePort(endpoint.substr(colon + 1), port)) {
    return nullptr;
  }
  return makeV4(endpoint.substr(0, colon), port);
}

InstanceConstSharedPtr addressFromSockAddr(const sockaddr_storage& addr,
                                           socklen_t len,
                                           bool v6only) {
  if (addr.ss_family == AF_INET &&
      len >= static_cast<socklen_t>(sizeof(sockaddr_in))) {
    return std::make_shared<InetInstance>(
        *reinterpret_cast<const sockaddr_in*>(&addr));
  }

  if (addr.ss_family == AF_INET6 &&
      len >= static_cast<socklen_t>(sizeof(sockaddr_in6))) {
    const auto& sin6 = *reinterpret_cast<const sockaddr_in6*>(&addr);
    if (!v6only && IN6_IS_ADDR_V4MAPPED(&sin6.sin6_addr)) {
      in_addr embedded;
      std::memcpy(&embedded, &sin6.sin6_addr.s6_addr[12], sizeof(embedded));
      return std::make_shared<InetInstance>(embedded, ntohs(sin6.sin6_port));
    }
    return std::make_shared<InetInstance>(sin6);
  }

  return nullptr;
}

InstanceConstSharedPtr anyAddress(IpVersion version, uint16_t port) {
  if (version == IpVersion::v6) {
    return std::make_shared<InetInstance>(in6addr_any, port);
  }
  in_addr any;
  any.s_addr = htonl(INADDR_ANY);
  return std::make_shared<InetInstance>(any, port);
}

InstanceConstSharedPtr loopbackAddress(IpVersion version, uint16_t port) {
  if (version == IpVersion::v6) {
    return std::make_shared<InetInstance>(in6addr_loopback, port);
  }
  in_addr loopback;
  loopback.s_addr = htonl(INADDR_LOOPBACK);
  return std::make_shared<InetInstance>(loopback, port);
}

}  // namespace Address
}  // namespace network
}  // namespace lanlink

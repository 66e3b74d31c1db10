#include <cstring>

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>

#include "lanlink/network/address.h"
#include "lanlink/network/address_impl.h"

namespace lanlink {
namespace network {
namespace Address {
namespace {

TEST(AddressTest, ParseIpv4WithoutPort) {
  auto addr = parseInternetAddressNoPort("192.168.1.10", 8090);
  ASSERT_NE(addr, nullptr);
  EXPECT_EQ(addr->version(), IpVersion::v4);
  EXPECT_EQ(addr->port(), 8090u);
  EXPECT_EQ(addr->host(), "192.168.1.10");
  EXPECT_EQ(addr->asString(), "192.168.1.10:8090");
}

TEST(AddressTest, ParseIpv6WithoutPort) {
  auto addr = parseInternetAddressNoPort("::1", 9000);
  ASSERT_NE(addr, nullptr);
  EXPECT_EQ(addr->version(), IpVersion::v6);
  EXPECT_TRUE(addr->isLoopbackAddress());
  EXPECT_EQ(addr->asString(), "[::1]:9000");
}

TEST(AddressTest, RejectsHostNames) {
  EXPECT_EQ(parseInternetAddressNoPort("localhost"), nullptr);
  EXPECT_EQ(parseInternetAddressNoPort(""), nullptr);
  EXPECT_EQ(parseInternetAddressNoPort("256.1.1.1"), nullptr);
}

TEST(AddressTest, ParseWithPort) {
  auto v4 = parseInternetAddress("10.0.0.5:1234");
  ASSERT_NE(v4, nullptr);
  EXPECT_EQ(v4->asString(), "10.0.0.5:1234");

  auto v6 = parseInternetAddress("[fe80::1]:5353");
  ASSERT_NE(v6, nullptr);
  EXPECT_EQ(v6->version(), IpVersion::v6);
  EXPECT_EQ(v6->port(), 5353u);
}

TEST(AddressTest, ParseWithPortRejectsBadInput) {
  EXPECT_EQ(parseInternetAddress("10.0.0.5"), nullptr);
  EXPECT_EQ(parseInternetAddress("10.0.0.5:"), nullptr);
  EXPECT_EQ(parseInternetAddress("10.0.0.5:65536"), nullptr);
  EXPECT_EQ(parseInternetAddress("10.0.0.5:-1"), nullptr);
  EXPECT_EQ(parseInternetAddress("10.0.0.5:80x"), nullptr);
  EXPECT_EQ(parseInternetAddress("fe80::1:80"), nullptr);
  EXPECT_EQ(parseInternetAddress("[fe80::1]80"), nullptr);
  EXPECT_EQ(parseInternetAddress("[nope]:80"), nullptr);
}

TEST(AddressTest, SpecialAddresses) {
  auto broadcast = parseInternetAddressNoPort("255.255.255.255", 8090);
  EXPECT_TRUE(broadcast->isBroadcastAddress());
  EXPECT_FALSE(broadcast->isAnyAddress());

  auto any = anyAddress(IpVersion::v4, 0);
  EXPECT_TRUE(any->isAnyAddress());
  EXPECT_EQ(any->asString(), "0.0.0.0:0");

  auto any6 = anyAddress(IpVersion::v6, 7);
  EXPECT_TRUE(any6->isAnyAddress());
  EXPECT_EQ(any6->asString(), "[::]:7");

  auto loopback = loopbackAddress(IpVersion::v4, 80);
  EXPECT_TRUE(loopback->isLoopbackAddress());
  EXPECT_EQ(loopback->asString(), "127.0.0.1:80");
}

/**
 * Test: Equality compares both address and port
 */
TEST(AddressTest, Equality) {
  auto a = parseInternetAddressNoPort("192.168.1.10", 8090);
  auto b = parseInternetAddress("192.168.1.10:8090");
  auto c = parseInternetAddressNoPort("192.168.1.10", 8091);
  auto d = parseInternetAddressNoPort("::ffff:192.168.1.10", 8090);

  EXPECT_TRUE(*a == *b);
  EXPECT_FALSE(*a == *c);
  EXPECT_FALSE(*a == *d);
}

TEST(AddressTest, FromSockAddr) {
  sockaddr_storage storage;
  std::memset(&storage, 0, sizeof(storage));
  auto* sin = reinterpret_cast<sockaddr_in*>(&storage);
  sin->sin_family = AF_INET;
  sin->sin_port = htons(4242);
  ASSERT_EQ(inet_pton(AF_INET, "172.16.0.3", &sin->sin_addr), 1);

  auto addr = addressFromSockAddr(storage, sizeof(sockaddr_in));
  ASSERT_NE(addr, nullptr);
  EXPECT_EQ(addr->asString(), "172.16.0.3:4242");

  EXPECT_EQ(addressFromSockAddr(storage, 2), nullptr);
}

TEST(AddressTest, MappedIpv4Unwrapped) {
  sockaddr_storage storage;
  std::memset(&storage, 0, sizeof(storage));
  auto* sin6 = reinterpret_cast<sockaddr_in6*>(&storage);
  sin6->sin6_family = AF_INET6;
  sin6->sin6_port = htons(53);
  ASSERT_EQ(inet_pton(AF_INET6, "::ffff:10.1.2.3", &sin6->sin6_addr), 1);

  auto kept = addressFromSockAddr(storage, sizeof(sockaddr_in6));
  ASSERT_NE(kept, nullptr);
  EXPECT_EQ(kept->version(), IpVersion::v6);

  auto unwrapped = addressFromSockAddr(storage, sizeof(sockaddr_in6), false);
  ASSERT_NE(unwrapped, nullptr);
  EXPECT_EQ(unwrapped->asString(), "10.1.2.3:53");
}

TEST(AddressTest, SockAddrRoundTripsThroughInstance) {
  in_addr raw;
  ASSERT_EQ(inet_pton(AF_INET, "192.168.0.255", &raw), 1);
  InetInstance instance(raw, 8090);

  EXPECT_EQ(instance.sockAddrLen(), sizeof(sockaddr_in));
  const auto* sin = reinterpret_cast<const sockaddr_in*>(instance.sockAddr());
  EXPECT_EQ(sin->sin_family, AF_INET);
  EXPECT_EQ(ntohs(sin->sin_port), 8090);
}

TEST(AddressTest, Ipv6EqualityAndFlags) {
  auto a = parseInternetAddress("[fe80::1]:8090");
  auto b = parseInternetAddressNoPort("fe80::1", 8090);
  auto c = parseInternetAddressNoPort("fe80::2", 8090);
  ASSERT_NE(a, nullptr);

  EXPECT_TRUE(*a == *b);
  EXPECT_TRUE(*a != *c);
  EXPECT_FALSE(a->isBroadcastAddress());
  EXPECT_FALSE(a->isLoopbackAddress());
  EXPECT_EQ(a->sockAddrLen(), sizeof(sockaddr_in6));
  EXPECT_EQ(a->host(), "fe80::1");
}

}  // namespace
}  // namespace Address
}  // namespace network
}  // namespace lanlink

#define LANLINK_LOG_COMPONENT "network.udp"

#include "lanlink/network/udp_socket_impl.h"

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <netinet/in.h>
#include <sys/socket.h>

#include "lanlink/logging/log_macros.h"

namespace lanlink {
namespace network {

UdpSocketPtr UdpSocketImpl::create(Address::IpVersion version,
                                   IoVoidResult& err) {
  int family = (version == Address::IpVersion::v4) ? AF_INET : AF_INET6;
  int fd = ::socket(family, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    err = IoVoidResult::from_errno(errno);
    return nullptr;
  }

  err = IoVoidResult::success();
  return std::make_unique<UdpSocketImpl>(fd);
}

UdpSocketImpl::UdpSocketImpl(int fd) : fd_(fd) {}

UdpSocketImpl::~UdpSocketImpl() {
  close();
  file_event_.reset();
}

IoVoidResult UdpSocketImpl::bind(
    const Address::InstanceConstSharedPtr& address) {
  if (fd_ < 0) {
    return IoVoidResult::error(EBADF, "socket is closed");
  }

  if (::bind(fd_, address->sockAddr(), address->sockAddrLen()) < 0) {
    return IoVoidResult::from_errno(errno);
  }

  // Read back the bound address so port 0 resolves to the real port
  sockaddr_storage storage;
  socklen_t len = sizeof(storage);
  std::memset(&storage, 0, sizeof(storage));
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&storage), &len) == 0) {
    local_address_ = Address::addressFromSockAddr(storage, len);
  } else {
    local_address_ = address;
  }

  LANLINK_LOG(Debug, "fd={} bound to {}", fd_,
              local_address_ ? local_address_->asString() : "<unknown>");
  return IoVoidResult::success();
}

IoVoidResult UdpSocketImpl::setBroadcast(bool enabled) {
  if (fd_ < 0) {
    return IoVoidResult::error(EBADF, "socket is closed");
  }

  int value = enabled ? 1 : 0;
  if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &value, sizeof(value)) < 0) {
    return IoVoidResult::from_errno(errno);
  }
  broadcast_enabled_ = enabled;
  return IoVoidResult::success();
}

IoCallResult UdpSocketImpl::sendTo(const std::string& data,
                                   const Address::Instance& peer) {
  if (fd_ < 0) {
    return IoCallResult::error(EBADF, "socket is closed");
  }

  ssize_t result;
  do {
    result = ::sendto(fd_, data.data(), data.size(), MSG_NOSIGNAL,
                      peer.sockAddr(), peer.sockAddrLen());
  } while (result < 0 && errno == EINTR);

  if (result < 0) {
    return IoCallResult::from_errno(errno);
  }
  return IoCallResult::success(static_cast<size_t>(result));
}

void UdpSocketImpl::startReceiving(event::Dispatcher& dispatcher,
                                   DatagramCallbacks& callbacks) {
  callbacks_ = &callbacks;
  file_event_ = dispatcher.createFileEvent(
      fd_, [this](uint32_t events) { onFileEvent(events); },
      event::FileTriggerType::Edge,
      static_cast<uint32_t>(event::FileReadyType::Read));
}

void UdpSocketImpl::onFileEvent(uint32_t events) {
  if (!(event::FileReadyType::Read & events)) {
    return;
  }

  std::vector<char> buffer(kMaxDatagramSize);

  // Edge-triggered: drain until the kernel queue is empty. The callbacks may
  // close this socket, so re-check the descriptor each iteration.
  while (fd_ >= 0) {
    sockaddr_storage peer_storage;
    socklen_t peer_len = sizeof(peer_storage);
    std::memset(&peer_storage, 0, sizeof(peer_storage));

    ssize_t n = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                           reinterpret_cast<sockaddr*>(&peer_storage),
                           &peer_len);
    if (n < 0) {
      int err = errno;
      if (err == EINTR) {
        continue;
      }
      if (err == EAGAIN || err == EWOULDBLOCK) {
        break;
      }
      LANLINK_LOG(Warning, "recvfrom failed on fd={}: {}", fd_,
                  std::strerror(err));
      if (callbacks_) {
        callbacks_->onReceiveError(err);
      }
      break;
    }

    auto peer = Address::addressFromSockAddr(peer_storage, peer_len, false);
    if (!peer) {
      LANLINK_LOG(Debug, "dropping datagram from unsupported address family");
      continue;
    }

    if (callbacks_) {
      callbacks_->onDatagram(std::string(buffer.data(), static_cast<size_t>(n)),
                             peer);
    }
  }
}

void UdpSocketImpl::close() {
  // close() may run inside our own read callback; only disarm the event here
  // and let the destructor free it.
  if (file_event_) {
    file_event_->setEnabled(0);
  }
  callbacks_ = nullptr;
  if (fd_ >= 0) {
    LANLINK_LOG(Debug, "closing fd={}", fd_);
    ::close(fd_);
    fd_ = -1;
  }
}

UdpSocketFactory defaultUdpSocketFactory() {
  return [](Address::IpVersion version, IoVoidResult& err) {
    return UdpSocketImpl::create(version, err);
  };
}

}  // namespace network
}  // namespace lanlink

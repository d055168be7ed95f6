#include "connection/udp_socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <string>
#include <utility>

namespace connection {

static bool set_nonblocking_fd(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

UdpSocket::UdpSocket() {
  fd_ = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (::pipe2(wake_, O_NONBLOCK | O_CLOEXEC) != 0) {
    wake_[0] = -1;
    wake_[1] = -1;
  }
}

UdpSocket::~UdpSocket() noexcept {
  close();
  for (int& w : wake_) {
    if (w >= 0) ::close(w);
    w = -1;
  }
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept {
  fd_ = std::exchange(other.fd_, -1);
  wake_[0] = std::exchange(other.wake_[0], -1);
  wake_[1] = std::exchange(other.wake_[1], -1);
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
  if (this == &other) return *this;
  close();
  for (int& w : wake_) {
    if (w >= 0) ::close(w);
  }
  fd_ = std::exchange(other.fd_, -1);
  wake_[0] = std::exchange(other.wake_[0], -1);
  wake_[1] = std::exchange(other.wake_[1], -1);
  return *this;
}

void UdpSocket::close() noexcept {
  if (fd_ >= 0) ::close(fd_);
  fd_ = -1;
}

void UdpSocket::shutdown() noexcept {
  if (wake_[1] < 0) return;
  const uint8_t b = 1;
  // Pipe full means a wakeup is already pending.
  (void)!::write(wake_[1], &b, 1);
}

bool UdpSocket::bind_rx(std::string_view local_addr, uint16_t local_port) {
  if (fd_ < 0) return false;

  int on = 1;
  if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) != 0) return false;
  if (setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) != 0) return false;

  ::sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(local_port);
  if (local_addr.empty() || local_addr == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    const std::string ip_str(local_addr);
    if (inet_pton(AF_INET, ip_str.c_str(), &addr.sin_addr) != 1) return false;
  }

  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) return false;
  return set_nonblocking_fd(fd_);
}

bool UdpSocket::send_to(const void* data, size_t len, Ipv4 ip, uint16_t port, int& out_errno) const {
  out_errno = 0;
  if (fd_ < 0) {
    out_errno = EBADF;
    return false;
  }

  ::sockaddr_in dst{};
  dst.sin_family = AF_INET;
  dst.sin_port = htons(port);
  dst.sin_addr.s_addr = htonl(ip);

  for (;;) {
    const ssize_t n = ::sendto(fd_, data, len, MSG_DONTWAIT,
                               reinterpret_cast<const sockaddr*>(&dst), sizeof(dst));
    if (n == static_cast<ssize_t>(len)) return true;
    if (n < 0 && errno == EINTR) continue;
    out_errno = (n < 0) ? errno : EMSGSIZE;
    return false;
  }
}

RecvStatus UdpSocket::recv_from(void* data, size_t len, size_t& out_nbytes,
                                Ipv4& out_ip, uint16_t& out_port,
                                std::chrono::milliseconds timeout) const {
  out_nbytes = 0;
  if (fd_ < 0) return RecvStatus::Closed;

  ::pollfd fds[2]{};
  fds[0].fd = fd_;
  fds[0].events = POLLIN;
  fds[1].fd = wake_[0];
  fds[1].events = POLLIN;
  const nfds_t nfds = (wake_[0] >= 0) ? 2 : 1;

  const int rc = ::poll(fds, nfds, static_cast<int>(timeout.count()));
  if (rc < 0) return (errno == EINTR) ? RecvStatus::Timeout : RecvStatus::Error;
  if (rc == 0) return RecvStatus::Timeout;
  if (nfds == 2 && (fds[1].revents & POLLIN)) return RecvStatus::Closed;
  if (fds[0].revents & (POLLERR | POLLNVAL)) return RecvStatus::Error;

  ::sockaddr_in src{};
  socklen_t src_len = sizeof(src);
  const ssize_t n = ::recvfrom(fd_, data, len, MSG_TRUNC,
                               reinterpret_cast<sockaddr*>(&src), &src_len);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RecvStatus::Timeout;
    return RecvStatus::Error;
  }

  // With MSG_TRUNC, n is the real datagram length even if it did not fit.
  out_nbytes = static_cast<size_t>(n);
  out_ip = ntohl(src.sin_addr.s_addr);
  out_port = ntohs(src.sin_port);
  return RecvStatus::Datagram;
}

uint16_t UdpSocket::local_port() const noexcept {
  if (fd_ < 0) return 0;
  ::sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
  return ntohs(addr.sin_port);
}

} // namespace connection

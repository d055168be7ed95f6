#include "connection/transport.hpp"

#include "utils/logger.hpp"

#include <algorithm>
#include <cstring>

namespace connection {

const char* to_string(TransportStatus s) noexcept {
  switch (s) {
    case TransportStatus::Ok:             return "ok";
    case TransportStatus::NotOpen:        return "socket not open";
    case TransportStatus::InvalidAddress: return "invalid address";
    case TransportStatus::SendFailed:     return "send failed";
  }
  return "unknown";
}

UdpTransport::~UdpTransport() noexcept {
  close();
}

bool UdpTransport::listen(std::string_view bind_ip, uint16_t port) {
  if (closed_.load(std::memory_order_acquire)) {
    logger::error() << "[NET] Transport was closed; create a new one to listen again.";
    return false;
  }
  if (bound_.load(std::memory_order_acquire)) return true;

  if (!rx_.bind_rx(bind_ip, port)) {
    logger::error() << "[NET] Failed to bind broadcast listener on " << bind_ip << ":" << port
                    << " (" << std::strerror(errno) << ")";
    return false;
  }
  bound_.store(true, std::memory_order_release);
  logger::info() << "[NET] Listening for broadcasts on " << bind_ip << ":" << rx_.local_port();
  return true;
}

TransportStatus UdpTransport::send(std::span<const uint8_t> bytes, Ipv4 dst, uint16_t port) {
  if (!tx_.is_open() || closed_.load(std::memory_order_acquire)) return TransportStatus::NotOpen;
  if (dst == 0 || port == 0) return TransportStatus::InvalidAddress;

  int err = 0;
  if (!tx_.send_to(bytes.data(), bytes.size(), dst, port, err)) {
    logger::warn() << "[NET] sendto " << ipv4_to_string(dst) << ":" << port
                   << " failed: " << std::strerror(err);
    return TransportStatus::SendFailed;
  }
  logger::debug() << "[NET] Sent " << bytes.size() << " bytes to " << ipv4_to_string(dst) << ":" << port;
  return TransportStatus::Ok;
}

RecvStatus UdpTransport::receive(Datagram& out, std::chrono::milliseconds timeout) {
  if (closed_.load(std::memory_order_acquire)) return RecvStatus::Closed;
  if (!bound_.load(std::memory_order_acquire)) return RecvStatus::Error;

  uint8_t buf[kRecvBufferBytes];
  size_t n = 0;
  Ipv4 ip = 0;
  uint16_t port = 0;
  const RecvStatus st = rx_.recv_from(buf, sizeof(buf), n, ip, port, timeout);
  if (st != RecvStatus::Datagram) return st;

  out.source = ip;
  out.source_port = port;
  out.wire_size = n;
  out.bytes.assign(buf, buf + std::min(n, sizeof(buf)));
  return RecvStatus::Datagram;
}

void UdpTransport::close() noexcept {
  if (closed_.exchange(true, std::memory_order_acq_rel)) return;
  rx_.shutdown();
}

void UdpTransport::release() noexcept {
  close();
  if (!rx_.is_open()) return;
  rx_.close();
  logger::info() << "[NET] Broadcast listener closed.";
}

} // namespace connection

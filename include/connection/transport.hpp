#pragma once
#include "connection/ipv4.hpp"
#include "connection/udp_socket.hpp"
#include "connection/wire_codec.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace connection {

enum class TransportStatus : uint8_t {
  Ok = 0,
  NotOpen = 1,
  InvalidAddress = 2,
  SendFailed = 3,
};

struct Datagram {
  Ipv4 source{0};
  uint16_t source_port{0};
  size_t wire_size{0};        // may exceed bytes.size() if the datagram was truncated
  std::vector<uint8_t> bytes;
};

const char* to_string(TransportStatus s) noexcept;

/**
 * @brief Datagram transport used by the coordinator.
 *
 * Sending is fire-and-forget: Ok only means the datagram left the host.
 * receive() is the pull side of an endless datagram stream; it returns Closed
 * for good once close() has been called.
 *
 * The interface lets tests inject a fake transport without touching the
 * coordinator.
 */
class ITransport {
public:
  virtual ~ITransport() noexcept = default;

  [[nodiscard]] virtual bool listen(std::string_view bind_ip, uint16_t port) = 0;
  [[nodiscard]] virtual TransportStatus send(std::span<const uint8_t> bytes, Ipv4 dst, uint16_t port) = 0;
  [[nodiscard]] virtual RecvStatus receive(Datagram& out, std::chrono::milliseconds timeout) = 0;
  virtual void close() noexcept = 0;
  // Frees the listening port. Only valid once no thread is inside receive().
  virtual void release() noexcept = 0;
};

/**
 * @brief POSIX UDP implementation: one unicast send socket, one receive socket
 * bound to the broadcast port.
 */
class UdpTransport final : public ITransport {
public:
  static constexpr size_t kRecvBufferBytes = 1024;

  UdpTransport() = default;
  ~UdpTransport() noexcept override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  bool listen(std::string_view bind_ip, uint16_t port = wire::kBroadcastPort) override;
  TransportStatus send(std::span<const uint8_t> bytes, Ipv4 dst, uint16_t port = wire::kCommandPort) override;
  RecvStatus receive(Datagram& out, std::chrono::milliseconds timeout) override;
  void close() noexcept override;
  void release() noexcept override;

  [[nodiscard]] uint16_t listen_port() const noexcept { return rx_.local_port(); }

private:
  UdpSocket tx_;
  UdpSocket rx_;
  std::atomic<bool> bound_{false};
  std::atomic<bool> closed_{false};
};

using TransportPtr = std::unique_ptr<ITransport>;

} // namespace connection

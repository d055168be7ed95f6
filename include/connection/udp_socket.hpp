#pragma once
#include "connection/ipv4.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <netinet/in.h>

namespace connection
{

  enum class RecvStatus : uint8_t
  {
    Datagram = 0,
    Timeout = 1,
    Closed = 2,
    Error = 3,
  };

  class UdpSocket
  {
  public:
    UdpSocket();
    ~UdpSocket() noexcept;

    UdpSocket(const UdpSocket &) = delete;
    UdpSocket &operator=(const UdpSocket &) = delete;
    UdpSocket(UdpSocket &&) noexcept;
    UdpSocket &operator=(UdpSocket &&) noexcept;

    // Bind for receiving. SO_REUSEADDR and SO_BROADCAST are always set so that
    // datagrams addressed to 255.255.255.255 are delivered.
    [[nodiscard]] bool bind_rx(std::string_view local_addr, uint16_t local_port);

    // Send one datagram. On failure `out_errno` holds the errno of sendto().
    [[nodiscard]] bool send_to(const void *data, size_t len, Ipv4 ip, uint16_t port, int &out_errno) const;

    // Wait up to `timeout` for one datagram.
    [[nodiscard]] RecvStatus recv_from(void *data, size_t len, size_t &out_nbytes,
                                       Ipv4 &out_ip, uint16_t &out_port,
                                       std::chrono::milliseconds timeout) const;

    // Port actually bound (useful after binding port 0).
    [[nodiscard]] uint16_t local_port() const noexcept;

    // Wakes a thread blocked in recv_from(), which then reports Closed.
    void shutdown() noexcept;
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

  private:
    int fd_ = -1;
    int wake_[2]{-1, -1}; // self-pipe used by shutdown()
  };

} // namespace connection

#pragma once
#include "connection/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tests {

struct SentDatagram {
  std::vector<uint8_t> bytes;
  connection::Ipv4 dst{0};
  uint16_t port{0};
};

/**
 * @brief Thread-safe fake transport for unit tests.
 *
 * - receive() pops from an RX queue, waiting up to the timeout.
 * - send() appends to a TX log, or fails for addresses marked with fail_sends_to().
 * - release() records that the listening port was given back.
 */
class FakeTransport final : public connection::ITransport {
public:
  bool listen(std::string_view bind_ip, uint16_t port) override {
    std::unique_lock<std::mutex> lk(m_);
    if (refuse_listen_) return false;
    bind_ip_ = std::string(bind_ip);
    listen_port_ = port;
    listening_ = true;
    return true;
  }

  connection::TransportStatus send(std::span<const uint8_t> bytes, connection::Ipv4 dst, uint16_t port) override {
    std::unique_lock<std::mutex> lk(m_);
    if (closed_) return connection::TransportStatus::NotOpen;
    if (failing_.count(dst)) return connection::TransportStatus::SendFailed;
    tx_.push_back(SentDatagram{std::vector<uint8_t>(bytes.begin(), bytes.end()), dst, port});
    cv_.notify_all();
    return connection::TransportStatus::Ok;
  }

  connection::RecvStatus receive(connection::Datagram& out, std::chrono::milliseconds timeout) override {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait_for(lk, timeout, [&] { return closed_ || !rx_.empty(); });
    if (closed_) return connection::RecvStatus::Closed;
    if (rx_.empty()) return connection::RecvStatus::Timeout;
    out = std::move(rx_.front());
    rx_.pop_front();
    return connection::RecvStatus::Datagram;
  }

  void close() noexcept override {
    std::unique_lock<std::mutex> lk(m_);
    closed_ = true;
    cv_.notify_all();
  }

  void release() noexcept override {
    std::unique_lock<std::mutex> lk(m_);
    closed_ = true;
    released_ = true;
    cv_.notify_all();
  }

  // ---- test controls ----
  void push_rx(connection::Ipv4 source, const std::vector<uint8_t>& bytes) {
    std::unique_lock<std::mutex> lk(m_);
    connection::Datagram d;
    d.source = source;
    d.source_port = 20910;
    d.wire_size = bytes.size();
    d.bytes = bytes;
    rx_.push_back(std::move(d));
    cv_.notify_all();
  }

  void fail_sends_to(connection::Ipv4 dst) {
    std::unique_lock<std::mutex> lk(m_);
    failing_.insert(dst);
  }

  void refuse_listen() {
    std::unique_lock<std::mutex> lk(m_);
    refuse_listen_ = true;
  }

  std::vector<SentDatagram> sent() const {
    std::unique_lock<std::mutex> lk(m_);
    return tx_;
  }

  std::vector<SentDatagram> sent_to(connection::Ipv4 dst) const {
    std::unique_lock<std::mutex> lk(m_);
    std::vector<SentDatagram> out;
    for (const auto& s : tx_) {
      if (s.dst == dst) out.push_back(s);
    }
    return out;
  }

  void clear_sent() {
    std::unique_lock<std::mutex> lk(m_);
    tx_.clear();
  }

  bool released() const {
    std::unique_lock<std::mutex> lk(m_);
    return released_;
  }

  std::string bind_ip() const {
    std::unique_lock<std::mutex> lk(m_);
    return bind_ip_;
  }

  bool listening() const {
    std::unique_lock<std::mutex> lk(m_);
    return listening_;
  }

  uint16_t listen_port() const {
    std::unique_lock<std::mutex> lk(m_);
    return listen_port_;
  }

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  bool listening_{false};
  bool refuse_listen_{false};
  bool closed_{false};
  bool released_{false};
  std::string bind_ip_;
  uint16_t listen_port_{0};
  std::deque<connection::Datagram> rx_;
  std::vector<SentDatagram> tx_;
  std::set<connection::Ipv4> failing_;
};

} // namespace tests

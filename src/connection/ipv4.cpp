#include "connection/ipv4.hpp"

#include <arpa/inet.h>

namespace connection {

std::optional<Ipv4> parse_ipv4(std::string_view text) {
  const std::string s(text);
  ::in_addr a{};
  if (inet_pton(AF_INET, s.c_str(), &a) != 1) return std::nullopt;
  return ntohl(a.s_addr);
}

std::string ipv4_to_string(Ipv4 addr) {
  ::in_addr a{};
  a.s_addr = htonl(addr);
  char buf[INET_ADDRSTRLEN]{};
  if (inet_ntop(AF_INET, &a, buf, sizeof(buf)) == nullptr) return "?";
  return buf;
}

bool is_unicast_host(Ipv4 addr) noexcept {
  const uint8_t first = static_cast<uint8_t>(addr >> 24);
  if (first == 0) return false;       // "this network"
  if (first == 127) return false;     // loopback
  if (first >= 224) return false;     // multicast, reserved and 255.255.255.255
  return true;
}

} // namespace connection

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace connection {

// IPv4 address in host byte order.
using Ipv4 = uint32_t;

[[nodiscard]] std::optional<Ipv4> parse_ipv4(std::string_view text);
[[nodiscard]] std::string ipv4_to_string(Ipv4 addr);

/**
 * @brief True if `addr` can be the address of a unit on the LAN.
 *
 * Rejects 0.0.0.0/8, loopback, multicast, the reserved 240/4 block and the
 * limited broadcast address.
 */
[[nodiscard]] bool is_unicast_host(Ipv4 addr) noexcept;

} // namespace connection

#pragma once
#include "connection/wire_codec.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace bgh {

struct RuntimeConfig {
  // Networking
  std::string bind_ip{"0.0.0.0"};
  uint16_t listen_port{connection::wire::kBroadcastPort};
  uint16_t command_port{connection::wire::kCommandPort};

  // Polling / freshness
  std::chrono::milliseconds poll_interval{std::chrono::seconds(10)};
  std::chrono::milliseconds staleness{std::chrono::seconds(30)};        // 3x poll_interval
  std::chrono::milliseconds staleness_check{std::chrono::seconds(1)};   // upper bound on Fresh->Stale detection delay
  std::chrono::milliseconds command_followup{500};
  uint32_t command_retries{2};                     // extra control frames sent while a command is pending
  std::chrono::milliseconds receive_timeout{250};
  std::chrono::milliseconds silence_warning{std::chrono::seconds(30)};  // nothing received at all for this long => warn once

  // Inbound filtering
  size_t max_datagram_bytes{100};
  double broadcast_rate_hz{10.0};                  // per unit
  double broadcast_burst{10.0};
  bool validate_header{true};                      // fixed bytes 0, 7..12, 14 of the status frame
  bool validate_ranges{true};
  int32_t ambient_min_centi{0};
  int32_t ambient_max_centi{5000};
  int32_t setpoint_min_centi{1600};
  int32_t setpoint_max_centi{3000};
  bool pin_hardware_id{true};

  // Logging
  std::string log_dir{"./logs"};
  bool file_log{false};
  int log_level{20}; // logger::Level
};

// Accepted range for every interval above; the coordinator clamps to it.
inline constexpr std::chrono::milliseconds kMinInterval{10};
inline constexpr std::chrono::milliseconds kMaxInterval{std::chrono::hours(24)};

using RuntimeConfigPtr = std::shared_ptr<const RuntimeConfig>;

} // namespace bgh

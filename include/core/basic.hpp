#pragma once

#include <array>
#include <chrono>
#include <cstdint>

namespace core
{

  // Operating mode, values are the wire codes.
  enum class Mode : uint8_t
  {
    Off = 0,
    Cool = 1,
    Heat = 2,
    Dry = 3,
    FanOnly = 4,
    Auto = 254,
    Unknown = 255, // any code not listed above
  };

  // Fan speed, values are the wire codes.
  enum class FanSpeed : uint8_t
  {
    Low = 1,
    Medium = 2,
    High = 3,
    Unknown = 255,
  };

  using Clock = std::chrono::steady_clock;

  // 6-byte unit identifier carried at offsets 1..6 of the status broadcast
  using HardwareId = std::array<uint8_t, 6>;

  // Fields carried by one status broadcast
  struct StatusReport
  {
    Mode mode{Mode::Unknown};
    FanSpeed fan{FanSpeed::Unknown};
    uint8_t mode_raw{0};
    uint8_t fan_raw{0};
    int32_t ambient_centi{0};  // x0.01 degC
    int32_t setpoint_centi{0}; // x0.01 degC
    HardwareId hardware_id{};
  };

  // Cached state of one unit
  struct DeviceState
  {
    StatusReport report{};
    Clock::time_point last_updated{};
    bool has_data{false};
    uint64_t updates{0};
  };

  // What consumers read: cached state plus the derived availability
  struct DeviceSnapshot
  {
    DeviceState state{};
    bool available{false};
  };

  [[nodiscard]] constexpr double centi_to_celsius(int32_t centi) noexcept
  {
    return static_cast<double>(centi) / 100.0;
  }

  [[nodiscard]] inline bool is_available(const DeviceState &s,
                                         Clock::time_point now,
                                         Clock::duration staleness) noexcept
  {
    return s.has_data && (now - s.last_updated) < staleness;
  }

} // namespace core

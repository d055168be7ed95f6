#pragma once
#include "core/basic.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace connection::wire {

/**
 * @brief Codec for the BGH Smart Control UDP protocol.
 *
 * IMPORTANT:
 * - Multi-byte fields are LITTLE-ENDIAN.
 * - Command and status-request frames are fixed templates. Only the mode and fan
 *   bytes of the command frame are ever written; every other byte is an opaque
 *   constant copied from the template.
 * - Temperatures stay in centidegrees (x0.01 degC) all the way to the presentation layer.
 */

// ---- Ports ----
inline constexpr uint16_t kCommandPort   = 20910; // unicast, host -> unit
inline constexpr uint16_t kBroadcastPort = 20911; // broadcast, unit -> subnet

// ---- Fixed frame sizes (bytes) ----
inline constexpr size_t kCommandFrameSize       = 22;
inline constexpr size_t kStatusRequestFrameSize = 17;
inline constexpr size_t kStatusFrameSize        = 29;

// Other datagrams the units publish on the broadcast port
inline constexpr size_t kAckFrameSize               = 22;
inline constexpr size_t kDiscoveryFrameSize         = 108;
inline constexpr size_t kControlResponseFrameSize   = 46;
inline constexpr size_t kControlResponseFrameSizeV2 = 47;

// ---- Field offsets ----
inline constexpr size_t kCmdModeOffset = 17;
inline constexpr size_t kCmdFanOffset  = 18;

inline constexpr size_t kStatusHwIdOffset     = 1;
inline constexpr size_t kStatusMarkerOffset   = 7;  // 6 x 0xff
inline constexpr size_t kStatusMarkerSize     = 6;
inline constexpr size_t kStatusFlagOffset     = 14; // 0x00 or 0x01
inline constexpr size_t kStatusModeOffset     = 18;
inline constexpr size_t kStatusFanOffset      = 19;
inline constexpr size_t kStatusAmbientOffset  = 21;
inline constexpr size_t kStatusSetpointOffset = 23;

using CommandFrame       = std::array<uint8_t, kCommandFrameSize>;
using StatusRequestFrame = std::array<uint8_t, kStatusRequestFrameSize>;

inline constexpr CommandFrame kCommandTemplate{
  0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
  0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
  0xf6, 0x00, 0x01, 0x61,
  0x04, // mode
  0x02, // fan
  0x00, 0x00, 0x80};

inline constexpr StatusRequestFrame kStatusRequest{
  0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
  0xac, 0xcf, 0x23, 0xaa, 0x31, 0x90, 0x59,
  0x00, 0x01, 0xe4};

enum class EncodeError : uint8_t {
  None = 0,
  InvalidMode = 1,
  InvalidFan = 2,
};

enum class DecodeError : uint8_t {
  None = 0,
  TooShort = 1,
  TooLong = 2,
};

enum class FrameKind : uint8_t {
  Status = 0,
  Ack = 1,
  Discovery = 2,
  ControlResponse = 3,
  Other = 4, // unrecognised length, goes through decode and gets rejected there
};

// ---- Endian helpers ----
inline void write_u16_le(uint8_t* out, uint16_t v) noexcept {
  out[0] = static_cast<uint8_t>(v & 0xFF);
  out[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

inline uint16_t read_u16_le(const uint8_t* in) noexcept {
  return static_cast<uint16_t>(static_cast<uint16_t>(in[0]) |
                               (static_cast<uint16_t>(in[1]) << 8));
}

// ---- Code tables ----
[[nodiscard]] bool is_valid_mode(core::Mode m) noexcept;
[[nodiscard]] bool is_valid_fan(core::FanSpeed f) noexcept;
[[nodiscard]] core::Mode mode_from_code(uint8_t code) noexcept;
[[nodiscard]] core::FanSpeed fan_from_code(uint8_t code) noexcept;

// ---- Encoders ----
[[nodiscard]] EncodeError encode_command(core::Mode mode, core::FanSpeed fan, CommandFrame& out) noexcept;
[[nodiscard]] StatusRequestFrame encode_status_request() noexcept;

// ---- Decoders ----
// On error `out` is left untouched.
[[nodiscard]] DecodeError decode_broadcast(std::span<const uint8_t> in, core::StatusReport& out) noexcept;

// Fixed header bytes of a status broadcast: byte 0 is 0x00, bytes 7..12 are
// 0xff and byte 14 is 0x00 or 0x01. False for any other length.
[[nodiscard]] bool has_status_header(std::span<const uint8_t> in) noexcept;

[[nodiscard]] FrameKind classify_datagram(size_t size) noexcept;

// ---- Presentation ----
const char* to_string(core::Mode m) noexcept;
const char* to_string(core::FanSpeed f) noexcept;
const char* to_string(EncodeError e) noexcept;
const char* to_string(DecodeError e) noexcept;
const char* to_string(FrameKind k) noexcept;

std::optional<core::Mode> parse_mode(std::string_view s) noexcept;
std::optional<core::FanSpeed> parse_fan_speed(std::string_view s) noexcept;

} // namespace connection::wire

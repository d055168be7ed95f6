#include "connection/wire_codec.hpp"

#include <algorithm>

namespace connection::wire {

bool is_valid_mode(core::Mode m) noexcept {
  switch (m) {
    case core::Mode::Off:
    case core::Mode::Cool:
    case core::Mode::Heat:
    case core::Mode::Dry:
    case core::Mode::FanOnly:
    case core::Mode::Auto:
      return true;
    case core::Mode::Unknown:
      return false;
  }
  return false;
}

bool is_valid_fan(core::FanSpeed f) noexcept {
  switch (f) {
    case core::FanSpeed::Low:
    case core::FanSpeed::Medium:
    case core::FanSpeed::High:
      return true;
    case core::FanSpeed::Unknown:
      return false;
  }
  return false;
}

core::Mode mode_from_code(uint8_t code) noexcept {
  const auto m = static_cast<core::Mode>(code);
  return is_valid_mode(m) ? m : core::Mode::Unknown;
}

core::FanSpeed fan_from_code(uint8_t code) noexcept {
  const auto f = static_cast<core::FanSpeed>(code);
  return is_valid_fan(f) ? f : core::FanSpeed::Unknown;
}

EncodeError encode_command(core::Mode mode, core::FanSpeed fan, CommandFrame& out) noexcept {
  if (!is_valid_mode(mode)) return EncodeError::InvalidMode;
  if (!is_valid_fan(fan)) return EncodeError::InvalidFan;

  out = kCommandTemplate;
  out[kCmdModeOffset] = static_cast<uint8_t>(mode);
  out[kCmdFanOffset]  = static_cast<uint8_t>(fan);
  return EncodeError::None;
}

StatusRequestFrame encode_status_request() noexcept {
  return kStatusRequest;
}

DecodeError decode_broadcast(std::span<const uint8_t> in, core::StatusReport& out) noexcept {
  if (in.size() < kStatusFrameSize) return DecodeError::TooShort;
  if (in.size() > kStatusFrameSize) return DecodeError::TooLong;

  core::StatusReport r{};
  std::copy_n(in.data() + kStatusHwIdOffset, r.hardware_id.size(), r.hardware_id.begin());
  r.mode_raw = in[kStatusModeOffset];
  r.fan_raw  = in[kStatusFanOffset];
  r.mode = mode_from_code(r.mode_raw);
  r.fan  = fan_from_code(r.fan_raw);
  r.ambient_centi  = read_u16_le(in.data() + kStatusAmbientOffset);
  r.setpoint_centi = read_u16_le(in.data() + kStatusSetpointOffset);

  out = r;
  return DecodeError::None;
}

bool has_status_header(std::span<const uint8_t> in) noexcept {
  if (in.size() != kStatusFrameSize) return false;
  if (in[0] != 0x00) return false;
  const auto marker = in.subspan(kStatusMarkerOffset, kStatusMarkerSize);
  if (!std::all_of(marker.begin(), marker.end(), [](uint8_t b) { return b == 0xff; })) return false;
  return in[kStatusFlagOffset] == 0x00 || in[kStatusFlagOffset] == 0x01;
}

FrameKind classify_datagram(size_t size) noexcept {
  switch (size) {
    case kStatusFrameSize:            return FrameKind::Status;
    case kAckFrameSize:               return FrameKind::Ack;
    case kDiscoveryFrameSize:         return FrameKind::Discovery;
    case kControlResponseFrameSize:
    case kControlResponseFrameSizeV2: return FrameKind::ControlResponse;
    default:                          return FrameKind::Other;
  }
}

const char* to_string(core::Mode m) noexcept {
  switch (m) {
    case core::Mode::Off:     return "off";
    case core::Mode::Cool:    return "cool";
    case core::Mode::Heat:    return "heat";
    case core::Mode::Dry:     return "dry";
    case core::Mode::FanOnly: return "fan_only";
    case core::Mode::Auto:    return "auto";
    case core::Mode::Unknown: return "unknown";
  }
  return "unknown";
}

const char* to_string(core::FanSpeed f) noexcept {
  switch (f) {
    case core::FanSpeed::Low:     return "low";
    case core::FanSpeed::Medium:  return "medium";
    case core::FanSpeed::High:    return "high";
    case core::FanSpeed::Unknown: return "unknown";
  }
  return "unknown";
}

const char* to_string(EncodeError e) noexcept {
  switch (e) {
    case EncodeError::None:        return "none";
    case EncodeError::InvalidMode: return "invalid mode";
    case EncodeError::InvalidFan:  return "invalid fan speed";
  }
  return "unknown";
}

const char* to_string(DecodeError e) noexcept {
  switch (e) {
    case DecodeError::None:     return "none";
    case DecodeError::TooShort: return "too short";
    case DecodeError::TooLong:  return "too long";
  }
  return "unknown";
}

const char* to_string(FrameKind k) noexcept {
  switch (k) {
    case FrameKind::Status:          return "status";
    case FrameKind::Ack:             return "ack";
    case FrameKind::Discovery:       return "discovery";
    case FrameKind::ControlResponse: return "control response";
    case FrameKind::Other:           return "other";
  }
  return "other";
}

std::optional<core::Mode> parse_mode(std::string_view s) noexcept {
  if (s == "off") return core::Mode::Off;
  if (s == "cool") return core::Mode::Cool;
  if (s == "heat") return core::Mode::Heat;
  if (s == "dry") return core::Mode::Dry;
  if (s == "fan_only" || s == "fan") return core::Mode::FanOnly;
  if (s == "auto") return core::Mode::Auto;
  return std::nullopt;
}

std::optional<core::FanSpeed> parse_fan_speed(std::string_view s) noexcept {
  if (s == "low") return core::FanSpeed::Low;
  if (s == "medium" || s == "mid") return core::FanSpeed::Medium;
  if (s == "high") return core::FanSpeed::High;
  return std::nullopt;
}

} // namespace connection::wire

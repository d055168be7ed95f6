#pragma once
#include "connection/ipv4.hpp"
#include "core/basic.hpp"
#include "utils/rate_limiter.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bgh {

enum class RegisterResult : uint8_t {
  Created = 0,
  Unchanged = 1,
  Replaced = 2,      // same id, new address: old state discarded
  InvalidId = 3,
  InvalidAddress = 4,
  AddressInUse = 5,  // address already registered under another id
};

enum class ApplyResult : uint8_t {
  Applied = 0,
  Removed = 1,
  HardwareMismatch = 2,
};

const char* to_string(RegisterResult r) noexcept;
const char* to_string(ApplyResult r) noexcept;

[[nodiscard]] constexpr bool is_registered(RegisterResult r) noexcept {
  return r == RegisterResult::Created || r == RegisterResult::Unchanged || r == RegisterResult::Replaced;
}

// A command that has been sent but not yet seen in a broadcast.
struct PendingCommand {
  core::Mode mode{core::Mode::Off};
  core::FanSpeed fan{core::FanSpeed::Low};
  uint32_t resends_left{0};
};

// What the poll loop should send to a unit on this tick.
enum class PollAction : uint8_t {
  StatusRequest = 0,
  Command = 1,
};

/**
 * @brief One registered unit: its registration, cached state and per-unit
 * bookkeeping used by the poll and listen loops.
 *
 * Every member is guarded by the entry's own mutex. Readers always get a full
 * copy, never a partially updated state. Once mark_removed() has run, the
 * entry refuses further updates, so handles still held by in-flight loop
 * iterations cannot resurrect a removed unit.
 */
class DeviceEntry {
public:
  DeviceEntry(std::string id, connection::Ipv4 ip, double rate_hz, double burst, bool pin_hardware_id);

  DeviceEntry(const DeviceEntry&) = delete;
  DeviceEntry& operator=(const DeviceEntry&) = delete;

  [[nodiscard]] const std::string& id() const noexcept { return id_; }
  [[nodiscard]] connection::Ipv4 ip() const noexcept { return ip_; }

  [[nodiscard]] core::DeviceState state() const;
  [[nodiscard]] core::DeviceSnapshot snapshot(core::Clock::time_point now, core::Clock::duration staleness) const;
  [[nodiscard]] bool removed() const;

  // ---- listen loop ----
  [[nodiscard]] bool admit(core::Clock::time_point now);
  [[nodiscard]] ApplyResult apply(const core::StatusReport& report, core::Clock::time_point now, bool& out_changed);

  // ---- poll loop ----
  // Returns true exactly once per Fresh -> Stale transition.
  [[nodiscard]] bool check_stale(core::Clock::time_point now, core::Clock::duration staleness);
  [[nodiscard]] core::Clock::time_point next_poll() const;
  [[nodiscard]] bool poll_due(core::Clock::time_point now) const;
  // Picks the frame to send on this tick and schedules the next regular poll.
  [[nodiscard]] PollAction next_action(core::Clock::time_point now, core::Clock::duration interval,
                                       PendingCommand& out_cmd, bool& out_gave_up);

  // ---- commands ----
  void set_pending(const PendingCommand& cmd, core::Clock::time_point followup_at);
  [[nodiscard]] std::optional<PendingCommand> pending() const;

  void mark_removed();

private:
  const std::string id_;
  const connection::Ipv4 ip_;
  const bool pin_hardware_id_;

  mutable std::mutex mtx_;
  core::DeviceState state_{};
  bool removed_{false};
  bool was_available_{false};
  std::optional<core::HardwareId> pinned_id_;
  utils::TokenBucket bucket_;

  core::Clock::time_point next_poll_{};
  bool followup_{false};
  std::optional<PendingCommand> pending_;
};

using DeviceEntryPtr = std::shared_ptr<DeviceEntry>;

/**
 * @brief IP address -> unit mapping.
 *
 * The address is the only correlation key available: the broadcast payload
 * does not name the unit that sent it. All operations are serialised by one
 * mutex; lookups are O(1).
 */
class DeviceRegistry {
public:
  DeviceRegistry(double rate_hz, double burst, bool pin_hardware_id);

  [[nodiscard]] RegisterResult register_device(std::string_view device_id, std::string_view ip);
  bool unregister_device(std::string_view device_id);

  [[nodiscard]] DeviceEntryPtr resolve(connection::Ipv4 source) const;
  [[nodiscard]] DeviceEntryPtr find(std::string_view device_id) const;
  [[nodiscard]] std::vector<DeviceEntryPtr> devices() const;
  [[nodiscard]] size_t size() const;

  void clear();

private:
  double rate_hz_{10.0};
  double burst_{10.0};
  bool pin_hardware_id_{true};

  mutable std::mutex mtx_;
  std::unordered_map<connection::Ipv4, DeviceEntryPtr> by_ip_;
  std::unordered_map<std::string, connection::Ipv4> ip_by_id_;
};

} // namespace bgh

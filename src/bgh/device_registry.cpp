#include "bgh/device_registry.hpp"

#include "utils/logger.hpp"

#include <utility>

namespace bgh {

const char* to_string(RegisterResult r) noexcept {
  switch (r) {
    case RegisterResult::Created:        return "created";
    case RegisterResult::Unchanged:      return "unchanged";
    case RegisterResult::Replaced:       return "replaced";
    case RegisterResult::InvalidId:      return "invalid device id";
    case RegisterResult::InvalidAddress: return "invalid address";
    case RegisterResult::AddressInUse:   return "address already registered";
  }
  return "unknown";
}

const char* to_string(ApplyResult r) noexcept {
  switch (r) {
    case ApplyResult::Applied:          return "applied";
    case ApplyResult::Removed:          return "device removed";
    case ApplyResult::HardwareMismatch: return "hardware id mismatch";
  }
  return "unknown";
}

static bool same_reading(const core::StatusReport& a, const core::StatusReport& b) noexcept {
  return a.mode_raw == b.mode_raw && a.fan_raw == b.fan_raw &&
         a.ambient_centi == b.ambient_centi && a.setpoint_centi == b.setpoint_centi;
}

static bool reflects(const core::StatusReport& r, const PendingCommand& cmd) noexcept {
  if (r.mode != cmd.mode) return false;
  return cmd.mode == core::Mode::Off || r.fan == cmd.fan;
}

// ---- DeviceEntry ----
DeviceEntry::DeviceEntry(std::string id, connection::Ipv4 ip, double rate_hz, double burst, bool pin_hardware_id)
  : id_(std::move(id)), ip_(ip), pin_hardware_id_(pin_hardware_id), bucket_(rate_hz, burst) {}

core::DeviceState DeviceEntry::state() const {
  std::scoped_lock lk(mtx_);
  return state_;
}

core::DeviceSnapshot DeviceEntry::snapshot(core::Clock::time_point now, core::Clock::duration staleness) const {
  std::scoped_lock lk(mtx_);
  core::DeviceSnapshot s{};
  s.state = state_;
  s.available = !removed_ && core::is_available(state_, now, staleness);
  return s;
}

bool DeviceEntry::removed() const {
  std::scoped_lock lk(mtx_);
  return removed_;
}

bool DeviceEntry::admit(core::Clock::time_point now) {
  std::scoped_lock lk(mtx_);
  return bucket_.try_consume(now);
}

ApplyResult DeviceEntry::apply(const core::StatusReport& report, core::Clock::time_point now, bool& out_changed) {
  out_changed = false;
  std::scoped_lock lk(mtx_);
  if (removed_) return ApplyResult::Removed;

  if (pin_hardware_id_) {
    if (pinned_id_ && *pinned_id_ != report.hardware_id) return ApplyResult::HardwareMismatch;
    if (!pinned_id_) pinned_id_ = report.hardware_id;
  }

  out_changed = !state_.has_data || !was_available_ || !same_reading(state_.report, report);

  state_.report = report;
  state_.last_updated = now;
  state_.has_data = true;
  ++state_.updates;
  was_available_ = true;

  if (pending_ && reflects(report, *pending_)) {
    pending_.reset();
  }
  return ApplyResult::Applied;
}

bool DeviceEntry::check_stale(core::Clock::time_point now, core::Clock::duration staleness) {
  std::scoped_lock lk(mtx_);
  if (removed_ || !was_available_) return false;
  if (core::is_available(state_, now, staleness)) return false;
  was_available_ = false;
  return true;
}

core::Clock::time_point DeviceEntry::next_poll() const {
  std::scoped_lock lk(mtx_);
  return next_poll_;
}

bool DeviceEntry::poll_due(core::Clock::time_point now) const {
  std::scoped_lock lk(mtx_);
  return !removed_ && now >= next_poll_;
}

PollAction DeviceEntry::next_action(core::Clock::time_point now, core::Clock::duration interval,
                                    PendingCommand& out_cmd, bool& out_gave_up) {
  out_gave_up = false;
  std::scoped_lock lk(mtx_);
  next_poll_ = now + interval;

  if (followup_) {
    followup_ = false;
    return PollAction::StatusRequest;
  }
  if (pending_) {
    if (pending_->resends_left > 0) {
      --pending_->resends_left;
      out_cmd = *pending_;
      return PollAction::Command;
    }
    pending_.reset();
    out_gave_up = true;
  }
  return PollAction::StatusRequest;
}

void DeviceEntry::set_pending(const PendingCommand& cmd, core::Clock::time_point followup_at) {
  std::scoped_lock lk(mtx_);
  if (removed_) return;
  pending_ = cmd;
  followup_ = true;
  next_poll_ = followup_at;
}

std::optional<PendingCommand> DeviceEntry::pending() const {
  std::scoped_lock lk(mtx_);
  return pending_;
}

void DeviceEntry::mark_removed() {
  std::scoped_lock lk(mtx_);
  removed_ = true;
  pending_.reset();
}

// ---- DeviceRegistry ----
DeviceRegistry::DeviceRegistry(double rate_hz, double burst, bool pin_hardware_id)
  : rate_hz_(rate_hz), burst_(burst), pin_hardware_id_(pin_hardware_id) {}

RegisterResult DeviceRegistry::register_device(std::string_view device_id, std::string_view ip) {
  if (device_id.empty()) return RegisterResult::InvalidId;

  const auto addr = connection::parse_ipv4(ip);
  if (!addr || !connection::is_unicast_host(*addr)) {
    logger::warn() << "[REG] Rejected '" << device_id << "': " << ip << " is not a usable unit address";
    return RegisterResult::InvalidAddress;
  }

  std::scoped_lock lk(mtx_);
  const std::string id(device_id);

  auto owner = by_ip_.find(*addr);
  if (owner != by_ip_.end() && owner->second->id() != id) {
    logger::warn() << "[REG] Rejected '" << id << "': " << ip << " already belongs to '"
                   << owner->second->id() << "'";
    return RegisterResult::AddressInUse;
  }

  RegisterResult result = RegisterResult::Created;
  auto by_id = ip_by_id_.find(id);
  if (by_id != ip_by_id_.end()) {
    if (by_id->second == *addr) return RegisterResult::Unchanged;

    auto old = by_ip_.find(by_id->second);
    if (old != by_ip_.end()) {
      old->second->mark_removed();
      by_ip_.erase(old);
    }
    result = RegisterResult::Replaced;
  }

  by_ip_[*addr] = std::make_shared<DeviceEntry>(id, *addr, rate_hz_, burst_, pin_hardware_id_);
  ip_by_id_[id] = *addr;
  logger::info() << "[REG] " << id << " @ " << connection::ipv4_to_string(*addr) << " " << to_string(result);
  return result;
}

bool DeviceRegistry::unregister_device(std::string_view device_id) {
  std::scoped_lock lk(mtx_);
  auto by_id = ip_by_id_.find(std::string(device_id));
  if (by_id == ip_by_id_.end()) return false;

  auto it = by_ip_.find(by_id->second);
  if (it != by_ip_.end()) {
    it->second->mark_removed();
    by_ip_.erase(it);
  }
  ip_by_id_.erase(by_id);
  logger::info() << "[REG] " << device_id << " removed";
  return true;
}

DeviceEntryPtr DeviceRegistry::resolve(connection::Ipv4 source) const {
  std::scoped_lock lk(mtx_);
  auto it = by_ip_.find(source);
  return (it == by_ip_.end()) ? nullptr : it->second;
}

DeviceEntryPtr DeviceRegistry::find(std::string_view device_id) const {
  std::scoped_lock lk(mtx_);
  auto by_id = ip_by_id_.find(std::string(device_id));
  if (by_id == ip_by_id_.end()) return nullptr;
  auto it = by_ip_.find(by_id->second);
  return (it == by_ip_.end()) ? nullptr : it->second;
}

std::vector<DeviceEntryPtr> DeviceRegistry::devices() const {
  std::scoped_lock lk(mtx_);
  std::vector<DeviceEntryPtr> out;
  out.reserve(by_ip_.size());
  for (const auto& [ip, entry] : by_ip_) out.push_back(entry);
  return out;
}

size_t DeviceRegistry::size() const {
  std::scoped_lock lk(mtx_);
  return by_ip_.size();
}

void DeviceRegistry::clear() {
  std::scoped_lock lk(mtx_);
  for (auto& [ip, entry] : by_ip_) entry->mark_removed();
  by_ip_.clear();
  ip_by_id_.clear();
}

} // namespace bgh

#include "bgh/state_coordinator.hpp"

#include "connection/wire_codec.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace bgh {

namespace {
constexpr auto kReceiveErrorBackoff = std::chrono::milliseconds(100);

double seconds(core::Clock::duration d) {
  return std::chrono::duration<double>(d).count();
}

void clamp_interval(std::chrono::milliseconds& v, const char* name) {
  const auto clamped = std::clamp(v, kMinInterval, kMaxInterval);
  if (clamped == v) return;
  logger::warn() << "[COORD] " << name << " " << v.count() << "ms out of range, using " << clamped.count() << "ms";
  v = clamped;
}

RuntimeConfigPtr checked(RuntimeConfigPtr cfg) {
  auto out = cfg ? std::make_shared<RuntimeConfig>(*cfg) : std::make_shared<RuntimeConfig>();
  clamp_interval(out->poll_interval, "poll_interval");
  clamp_interval(out->staleness, "staleness");
  clamp_interval(out->staleness_check, "staleness_check");
  clamp_interval(out->command_followup, "command_followup");
  clamp_interval(out->receive_timeout, "receive_timeout");
  clamp_interval(out->silence_warning, "silence_warning");
  return out;
}

std::string hex_id(const core::HardwareId& id) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t b : id) oss << std::setw(2) << static_cast<int>(b);
  return oss.str();
}
} // namespace

const char* to_string(CommandResult r) noexcept {
  switch (r) {
    case CommandResult::Accepted:             return "accepted";
    case CommandResult::UnknownDevice:        return "unknown device";
    case CommandResult::InvalidArgument:      return "invalid argument";
    case CommandResult::StateUnknown:         return "state unknown";
    case CommandResult::UnsupportedOperation: return "not supported by the unit";
    case CommandResult::TransportError:       return "transport error";
  }
  return "unknown";
}

StateCoordinator::StateCoordinator(RuntimeConfigPtr cfg, connection::TransportPtr transport)
  : cfg_(checked(std::move(cfg))),
    transport_(std::move(transport)),
    registry_(cfg_->broadcast_rate_hz, cfg_->broadcast_burst, cfg_->pin_hardware_id) {}

StateCoordinator::~StateCoordinator() {
  stop();
}

bool StateCoordinator::start() {
  if (running()) return true;
  if (stop_.stop_requested()) {
    logger::error() << "[COORD] Coordinator was stopped; it cannot be restarted.";
    return false;
  }
  if (!transport_) {
    logger::error() << "[COORD] No transport.";
    return false;
  }

  // The only fatal error: without the listener nothing can be observed.
  if (!transport_->listen(cfg_->bind_ip, cfg_->listen_port)) return false;

  running_.store(true, std::memory_order_release);
  listen_thread_ = std::thread(&StateCoordinator::listen_loop, this);
  poll_thread_ = std::thread(&StateCoordinator::poll_loop, this);
  logger::info() << "[COORD] Started: poll every " << seconds(cfg_->poll_interval)
                 << "s, stale after " << seconds(cfg_->staleness) << "s.";
  return true;
}

void StateCoordinator::stop() {
  stop_.request_stop();
  if (transport_) transport_->close();
  {
    std::scoped_lock lk(poll_mtx_);
    poll_kick_ = true;
  }
  poll_cv_.notify_all();

  if (listen_thread_.joinable()) listen_thread_.join();
  if (poll_thread_.joinable()) poll_thread_.join();
  // No thread is receiving any more; give the broadcast port back.
  if (transport_) transport_->release();

  if (running_.exchange(false, std::memory_order_acq_rel)) {
    logger::info() << "[COORD] Stopped.";
  }
}

// ---- registration ----
RegisterResult StateCoordinator::register_device(std::string_view device_id, std::string_view ip) {
  const RegisterResult r = registry_.register_device(device_id, ip);
  if (r == RegisterResult::Created || r == RegisterResult::Replaced) kick_poll();
  return r;
}

bool StateCoordinator::unregister_device(std::string_view device_id) {
  return registry_.unregister_device(device_id);
}

std::optional<core::DeviceSnapshot> StateCoordinator::get_state(std::string_view device_id) const {
  const auto entry = registry_.find(device_id);
  if (!entry) return std::nullopt;
  return entry->snapshot(core::Clock::now(), cfg_->staleness);
}

// ---- commands ----
CommandResult StateCoordinator::issue_command(std::string_view device_id,
                                              std::optional<core::Mode> mode,
                                              std::optional<core::FanSpeed> fan) {
  const auto entry = registry_.find(device_id);
  if (!entry) return CommandResult::UnknownDevice;
  if (!transport_) return CommandResult::TransportError;

  const core::DeviceState cached = entry->state();
  if (!mode) {
    if (!cached.has_data || cached.report.mode == core::Mode::Unknown) {
      logger::warn() << "[CMD] " << device_id << ": current mode not known yet, command not sent";
      return CommandResult::StateUnknown;
    }
    mode = cached.report.mode;
  }
  if (!fan) {
    const bool known = cached.has_data && cached.report.fan != core::FanSpeed::Unknown;
    fan = known ? cached.report.fan : core::FanSpeed::Low;
  }

  connection::wire::CommandFrame frame{};
  const auto err = connection::wire::encode_command(*mode, *fan, frame);
  if (err != connection::wire::EncodeError::None) {
    logger::warn() << "[CMD] " << device_id << ": " << connection::wire::to_string(err)
                   << " (mode=" << static_cast<int>(*mode) << ", fan=" << static_cast<int>(*fan) << ")";
    return CommandResult::InvalidArgument;
  }

  const auto st = transport_->send(frame, entry->ip(), cfg_->command_port);
  if (st != connection::TransportStatus::Ok) {
    counters_.send_failures.fetch_add(1, std::memory_order_relaxed);
    logger::warn() << "[CMD] " << device_id << ": " << connection::to_string(st);
    return CommandResult::TransportError;
  }

  logger::info() << "[CMD] " << device_id << " <- mode=" << connection::wire::to_string(*mode)
                 << " fan=" << connection::wire::to_string(*fan);

  PendingCommand pending{};
  pending.mode = *mode;
  pending.fan = *fan;
  pending.resends_left = cfg_->command_retries;
  entry->set_pending(pending, core::Clock::now() + cfg_->command_followup);
  kick_poll();
  return CommandResult::Accepted;
}

CommandResult StateCoordinator::set_mode(std::string_view device_id, core::Mode mode) {
  return issue_command(device_id, mode, std::nullopt);
}

CommandResult StateCoordinator::set_fan_speed(std::string_view device_id, core::FanSpeed fan) {
  return issue_command(device_id, std::nullopt, fan);
}

CommandResult StateCoordinator::turn_on(std::string_view device_id) {
  return issue_command(device_id, core::Mode::Cool, std::nullopt);
}

CommandResult StateCoordinator::turn_off(std::string_view device_id) {
  return issue_command(device_id, core::Mode::Off, std::nullopt);
}

CommandResult StateCoordinator::set_temperature(std::string_view device_id, int32_t setpoint_centi) {
  logger::warn() << "[CMD] " << device_id << ": setpoint " << core::centi_to_celsius(setpoint_centi)
                 << "C rejected, the unit protocol has no setpoint command";
  return CommandResult::UnsupportedOperation;
}

CommandResult StateCoordinator::request_status(std::string_view device_id) {
  const auto entry = registry_.find(device_id);
  if (!entry) return CommandResult::UnknownDevice;
  if (!transport_) return CommandResult::TransportError;

  const auto frame = connection::wire::encode_status_request();
  const auto st = transport_->send(frame, entry->ip(), cfg_->command_port);
  if (st != connection::TransportStatus::Ok) {
    counters_.send_failures.fetch_add(1, std::memory_order_relaxed);
    return CommandResult::TransportError;
  }
  return CommandResult::Accepted;
}

// ---- subscriptions ----
SubscriptionId StateCoordinator::subscribe(std::string_view device_id, StateCallback cb) {
  std::scoped_lock lk(subs_mtx_);
  const SubscriptionId id = next_sub_++;
  subs_.emplace(id, Subscription{std::string(device_id), std::move(cb)});
  return id;
}

bool StateCoordinator::unsubscribe(SubscriptionId id) {
  std::scoped_lock lk(subs_mtx_);
  return subs_.erase(id) > 0;
}

void StateCoordinator::notify(const DeviceEntry& entry, core::Clock::time_point now) {
  std::vector<StateCallback> targets;
  {
    std::scoped_lock lk(subs_mtx_);
    for (const auto& [id, sub] : subs_) {
      if (sub.device_id == entry.id() && sub.cb) targets.push_back(sub.cb);
    }
  }
  if (targets.empty()) return;

  const core::DeviceSnapshot snap = entry.snapshot(now, cfg_->staleness);
  for (const auto& cb : targets) cb(entry.id(), snap);
}

CoordinatorStats StateCoordinator::stats() const noexcept {
  CoordinatorStats s{};
  s.datagrams      = counters_.datagrams.load(std::memory_order_relaxed);
  s.unknown_source = counters_.unknown_source.load(std::memory_order_relaxed);
  s.ignored        = counters_.ignored.load(std::memory_order_relaxed);
  s.oversized      = counters_.oversized.load(std::memory_order_relaxed);
  s.rate_limited   = counters_.rate_limited.load(std::memory_order_relaxed);
  s.decode_errors  = counters_.decode_errors.load(std::memory_order_relaxed);
  s.rejected       = counters_.rejected.load(std::memory_order_relaxed);
  s.applied        = counters_.applied.load(std::memory_order_relaxed);
  s.polls_sent     = counters_.polls_sent.load(std::memory_order_relaxed);
  s.send_failures  = counters_.send_failures.load(std::memory_order_relaxed);
  s.receive_errors = counters_.receive_errors.load(std::memory_order_relaxed);
  return s;
}

// ---- listen loop ----
void StateCoordinator::listen_loop() {
  logger::info() << "[LISTEN] Started.";

  auto last_rx = core::Clock::now();
  bool silent = false;

  while (!stop_.stop_requested()) {
    connection::Datagram d;
    const auto st = transport_->receive(d, cfg_->receive_timeout);
    if (st == connection::RecvStatus::Closed) break;

    if (st == connection::RecvStatus::Error) {
      const auto n = counters_.receive_errors.fetch_add(1, std::memory_order_relaxed) + 1;
      if (n == 1 || n % 100 == 0) {
        logger::warn() << "[LISTEN] Receive error (" << n << " so far); retrying.";
      }
      std::this_thread::sleep_for(kReceiveErrorBackoff);
      continue;
    }

    const auto now = core::Clock::now();
    if (st == connection::RecvStatus::Timeout) {
      if (!silent && now - last_rx >= cfg_->silence_warning) {
        silent = true;
        logger::warn() << "[LISTEN] No datagrams for " << seconds(now - last_rx)
                       << "s; relying on polling.";
      }
      continue;
    }

    last_rx = now;
    if (silent) {
      silent = false;
      logger::info() << "[LISTEN] Datagrams arriving again.";
    }
    handle_datagram(d, now);
  }

  logger::info() << "[LISTEN] Stopped.";
}

bool StateCoordinator::plausible(const core::StatusReport& r) const noexcept {
  return r.ambient_centi >= cfg_->ambient_min_centi && r.ambient_centi <= cfg_->ambient_max_centi &&
         r.setpoint_centi >= cfg_->setpoint_min_centi && r.setpoint_centi <= cfg_->setpoint_max_centi;
}

void StateCoordinator::handle_datagram(const connection::Datagram& d, core::Clock::time_point now) {
  namespace wire = connection::wire;
  counters_.datagrams.fetch_add(1, std::memory_order_relaxed);

  // Other units and unrelated devices broadcast on the same subnet.
  const auto entry = registry_.resolve(d.source);
  if (!entry) {
    counters_.unknown_source.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  const auto kind = wire::classify_datagram(d.wire_size);
  if (kind == wire::FrameKind::Ack || kind == wire::FrameKind::Discovery ||
      kind == wire::FrameKind::ControlResponse) {
    counters_.ignored.fetch_add(1, std::memory_order_relaxed);
    logger::debug() << "[LISTEN] " << entry->id() << ": ignoring " << wire::to_string(kind)
                    << " frame (" << d.wire_size << " bytes)";
    return;
  }

  if (d.wire_size > cfg_->max_datagram_bytes) {
    counters_.oversized.fetch_add(1, std::memory_order_relaxed);
    logger::warn() << "[LISTEN] " << entry->id() << ": oversized datagram (" << d.wire_size << " bytes) dropped";
    return;
  }

  if (!entry->admit(now)) {
    counters_.rate_limited.fetch_add(1, std::memory_order_relaxed);
    logger::warn() << "[LISTEN] " << entry->id() << ": broadcast rate limit exceeded";
    return;
  }

  core::StatusReport report{};
  const auto err = wire::decode_broadcast(d.bytes, report);
  if (err != wire::DecodeError::None) {
    counters_.decode_errors.fetch_add(1, std::memory_order_relaxed);
    logger::warn() << "[LISTEN] " << entry->id() << ": bad status frame, " << wire::to_string(err)
                   << " (" << d.wire_size << " bytes)";
    return;
  }

  if (cfg_->validate_header && !wire::has_status_header(d.bytes)) {
    counters_.rejected.fetch_add(1, std::memory_order_relaxed);
    logger::warn() << "[LISTEN] " << entry->id() << ": 29-byte frame with an unexpected header, dropped";
    return;
  }

  if (cfg_->validate_ranges && !plausible(report)) {
    counters_.rejected.fetch_add(1, std::memory_order_relaxed);
    logger::warn() << "[LISTEN] " << entry->id() << ": implausible reading ambient="
                   << core::centi_to_celsius(report.ambient_centi) << "C setpoint="
                   << core::centi_to_celsius(report.setpoint_centi) << "C, frame dropped";
    return;
  }

  bool changed = false;
  const auto res = entry->apply(report, now, changed);
  if (res == ApplyResult::HardwareMismatch) {
    counters_.rejected.fetch_add(1, std::memory_order_relaxed);
    logger::warn() << "[LISTEN] " << entry->id() << ": hardware id " << hex_id(report.hardware_id)
                   << " does not match the pinned one (possible spoofing), frame dropped";
    return;
  }
  if (res == ApplyResult::Removed) return;

  counters_.applied.fetch_add(1, std::memory_order_relaxed);
  logger::debug() << "[LISTEN] " << entry->id() << ": mode=" << wire::to_string(report.mode)
                  << " fan=" << wire::to_string(report.fan)
                  << " ambient=" << core::centi_to_celsius(report.ambient_centi)
                  << "C setpoint=" << core::centi_to_celsius(report.setpoint_centi) << "C";
  if (changed) notify(*entry, now);
}

// ---- poll loop ----
void StateCoordinator::kick_poll() {
  {
    std::scoped_lock lk(poll_mtx_);
    poll_kick_ = true;
  }
  poll_cv_.notify_all();
}

void StateCoordinator::poll_device(DeviceEntry& entry, core::Clock::time_point now) {
  namespace wire = connection::wire;

  PendingCommand cmd{};
  bool gave_up = false;
  const PollAction action = entry.next_action(now, cfg_->poll_interval, cmd, gave_up);
  if (gave_up) {
    logger::warn() << "[POLL] " << entry.id() << ": command not confirmed by the unit, giving up";
  }

  connection::TransportStatus st = connection::TransportStatus::Ok;
  if (action == PollAction::Command) {
    wire::CommandFrame frame{};
    if (wire::encode_command(cmd.mode, cmd.fan, frame) != wire::EncodeError::None) return;
    logger::debug() << "[POLL] " << entry.id() << ": re-sending pending command";
    st = transport_->send(frame, entry.ip(), cfg_->command_port);
  } else {
    const auto frame = wire::encode_status_request();
    st = transport_->send(frame, entry.ip(), cfg_->command_port);
  }

  counters_.polls_sent.fetch_add(1, std::memory_order_relaxed);
  if (st != connection::TransportStatus::Ok) {
    counters_.send_failures.fetch_add(1, std::memory_order_relaxed);
    logger::warn() << "[POLL] " << entry.id() << ": " << connection::to_string(st);
  }
}

void StateCoordinator::check_staleness(core::Clock::time_point now) {
  for (const auto& entry : registry_.devices()) {
    if (!entry->check_stale(now, cfg_->staleness)) continue;
    logger::warn() << "[POLL] " << entry->id() << " unavailable: no broadcast for "
                   << seconds(now - entry->state().last_updated) << "s";
    notify(*entry, now);
  }
}

void StateCoordinator::poll_loop() {
  logger::info() << "[POLL] Started.";

  std::unique_lock lk(poll_mtx_);
  while (!stop_.stop_requested()) {
    poll_kick_ = false;
    lk.unlock();

    const auto now = core::Clock::now();
    check_staleness(now);

    auto wake = now + cfg_->staleness_check;
    for (const auto& entry : registry_.devices()) {
      if (stop_.stop_requested()) break;
      if (entry->poll_due(now)) poll_device(*entry, now);
      wake = std::min(wake, entry->next_poll());
    }

    lk.lock();
    poll_cv_.wait_until(lk, wake, [&] { return poll_kick_ || stop_.stop_requested(); });
  }

  logger::info() << "[POLL] Stopped.";
}

} // namespace bgh

#undef NDEBUG
#include "bgh/state_coordinator.hpp"
#include "connection/wire_codec.hpp"
#include "fake_transport.hpp"
#include "utils/logger.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
namespace wire = connection::wire;

namespace {

const char* kIpA = "192.168.1.50";
const char* kIpB = "192.168.1.51";
const char* kIpC = "192.168.1.77";

connection::Ipv4 ip(const char* s) {
  return *connection::parse_ipv4(s);
}

std::shared_ptr<bgh::RuntimeConfig> fast_config() {
  auto cfg = std::make_shared<bgh::RuntimeConfig>();
  cfg->poll_interval = 200ms;
  cfg->staleness = 600ms;
  cfg->staleness_check = 20ms;
  cfg->command_followup = 50ms;
  cfg->receive_timeout = 20ms;
  cfg->silence_warning = 5s;
  return cfg;
}

std::vector<uint8_t> status_frame(core::Mode mode, core::FanSpeed fan, uint16_t ambient, uint16_t setpoint) {
  std::vector<uint8_t> f(wire::kStatusFrameSize, 0x00);
  const uint8_t hw[6]{0xac, 0xcf, 0x23, 0x00, 0x00, 0x01};
  std::copy(hw, hw + 6, f.begin() + wire::kStatusHwIdOffset);
  std::fill_n(f.begin() + wire::kStatusMarkerOffset, wire::kStatusMarkerSize, 0xff);
  f[wire::kStatusModeOffset] = static_cast<uint8_t>(mode);
  f[wire::kStatusFanOffset] = static_cast<uint8_t>(fan);
  wire::write_u16_le(&f[wire::kStatusAmbientOffset], ambient);
  wire::write_u16_le(&f[wire::kStatusSetpointOffset], setpoint);
  return f;
}

bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 3s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

size_t count_size(const std::vector<tests::SentDatagram>& v, size_t size) {
  size_t n = 0;
  for (const auto& s : v) {
    if (s.bytes.size() == size) ++n;
  }
  return n;
}

struct Recorder {
  std::mutex m;
  std::vector<core::DeviceSnapshot> seen;

  bgh::StateCallback callback() {
    return [this](const std::string&, const core::DeviceSnapshot& s) {
      std::scoped_lock lk(m);
      seen.push_back(s);
    };
  }
  size_t size() {
    std::scoped_lock lk(m);
    return seen.size();
  }
  core::DeviceSnapshot last() {
    std::scoped_lock lk(m);
    return seen.back();
  }
};

struct Harness {
  tests::FakeTransport* fake{nullptr};
  std::unique_ptr<bgh::StateCoordinator> coord;

  explicit Harness(std::shared_ptr<bgh::RuntimeConfig> cfg = fast_config()) {
    auto t = std::make_unique<tests::FakeTransport>();
    fake = t.get();
    coord = std::make_unique<bgh::StateCoordinator>(std::move(cfg), std::move(t));
  }
};

} // namespace

static void test_start_binds_broadcast_port() {
  Harness h;
  assert(h.coord->start());
  assert(h.coord->running());
  assert(h.fake->listening());
  assert(h.fake->listen_port() == 20911);
  assert(h.fake->bind_ip() == "0.0.0.0");
  h.coord->stop();
  assert(!h.coord->running());
  assert(h.fake->released());
  // Not restartable.
  assert(!h.coord->start());
}

static void test_start_fails_when_listen_fails() {
  Harness h;
  h.fake->refuse_listen();
  assert(!h.coord->start());
  assert(!h.coord->running());
}

static void test_registration_triggers_poll() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());

  assert(wait_for([&] { return !h.fake->sent_to(ip(kIpA)).empty(); }));
  const auto first = h.fake->sent_to(ip(kIpA)).front();
  assert(first.port == 20910);
  assert(first.bytes.size() == wire::kStatusRequestFrameSize);

  // Registered after start: polled without waiting for the next cycle.
  assert(h.coord->register_device("bedroom", kIpB) == bgh::RegisterResult::Created);
  assert(wait_for([&] { return !h.fake->sent_to(ip(kIpB)).empty(); }, 150ms));

  // Regular polling continues.
  assert(wait_for([&] { return h.fake->sent_to(ip(kIpA)).size() >= 3; }));
  h.coord->stop();
}

static void test_broadcast_applied_and_notified() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  Recorder rec;
  (void)h.coord->subscribe("living", rec.callback());
  assert(h.coord->start());

  assert(!h.coord->get_state("living")->available);
  assert(!h.coord->get_state("nobody"));

  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::Medium, 0x0909, 0x0710));
  assert(wait_for([&] { return rec.size() == 1; }));

  const auto s = *h.coord->get_state("living");
  assert(s.available);
  assert(s.state.report.mode == core::Mode::Cool);
  assert(s.state.report.fan == core::FanSpeed::Medium);
  assert(s.state.report.ambient_centi == 2313);
  assert(s.state.report.setpoint_centi == 1808);
  assert(rec.last().available);

  // Same reading again: no new notification.
  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::Medium, 0x0909, 0x0710));
  assert(wait_for([&] { return h.coord->stats().applied == 2; }));
  assert(rec.size() == 1);
  h.coord->stop();
}

static void test_unknown_source_ignored() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->register_device("bedroom", kIpB) == bgh::RegisterResult::Created);
  assert(h.coord->start());

  h.fake->push_rx(ip(kIpC), status_frame(core::Mode::Heat, core::FanSpeed::High, 2000, 2200));
  assert(wait_for([&] { return h.coord->stats().unknown_source == 1; }));
  assert(h.coord->stats().applied == 0);
  assert(!h.coord->get_state("living")->state.has_data);
  assert(!h.coord->get_state("bedroom")->state.has_data);
  h.coord->stop();
}

static void test_filters() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());

  h.fake->push_rx(ip(kIpA), std::vector<uint8_t>(22, 0x00));   // ack
  h.fake->push_rx(ip(kIpA), std::vector<uint8_t>(108, 0x00));  // discovery
  h.fake->push_rx(ip(kIpA), std::vector<uint8_t>(28, 0x00));   // malformed
  h.fake->push_rx(ip(kIpA), std::vector<uint8_t>(400, 0x00));  // oversized
  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::Low, 9000, 2400));  // implausible

  assert(wait_for([&] {
    const auto st = h.coord->stats();
    return st.ignored + st.decode_errors + st.oversized + st.rejected == 5;
  }));
  const auto st = h.coord->stats();
  assert(st.datagrams == 5);
  assert(st.ignored == 2);
  assert(st.decode_errors == 1);
  assert(st.oversized == 1);
  assert(st.rejected == 1);
  assert(st.applied == 0);
  assert(!h.coord->get_state("living")->state.has_data);
  h.coord->stop();
}

static void test_bad_header_rejected() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());

  auto wrong_marker = status_frame(core::Mode::Cool, core::FanSpeed::Low, 2300, 2400);
  wrong_marker[9] = 0x00;
  auto wrong_lead = status_frame(core::Mode::Cool, core::FanSpeed::Low, 2300, 2400);
  wrong_lead[0] = 0x42;
  auto wrong_flag = status_frame(core::Mode::Cool, core::FanSpeed::Low, 2300, 2400);
  wrong_flag[wire::kStatusFlagOffset] = 0x05;
  h.fake->push_rx(ip(kIpA), wrong_marker);
  h.fake->push_rx(ip(kIpA), wrong_lead);
  h.fake->push_rx(ip(kIpA), wrong_flag);

  assert(wait_for([&] { return h.coord->stats().rejected == 3; }));
  assert(h.coord->stats().applied == 0);
  assert(!h.coord->get_state("living")->state.has_data);

  // A conforming frame from the same unit still goes through.
  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::Low, 2300, 2400));
  assert(wait_for([&] { return h.coord->stats().applied == 1; }));
  h.coord->stop();
}

static void test_header_check_can_be_disabled() {
  auto cfg = fast_config();
  cfg->validate_header = false;
  Harness h(cfg);
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());

  auto f = status_frame(core::Mode::Heat, core::FanSpeed::High, 2300, 2400);
  f[9] = 0x00;
  h.fake->push_rx(ip(kIpA), f);
  assert(wait_for([&] { return h.coord->stats().applied == 1; }));
  assert(h.coord->get_state("living")->state.report.mode == core::Mode::Heat);
  h.coord->stop();
}

static void test_intervals_clamped() {
  auto cfg = fast_config();
  cfg->poll_interval = 0ms;
  cfg->staleness_check = 0ms;
  cfg->receive_timeout = std::chrono::hours(24 * 365);
  Harness h(cfg);
  assert(h.coord->config().poll_interval == bgh::kMinInterval);
  assert(h.coord->config().staleness_check == bgh::kMinInterval);
  assert(h.coord->config().receive_timeout == bgh::kMaxInterval);
  assert(h.coord->config().staleness == 600ms);

  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());
  std::this_thread::sleep_for(200ms);
  const auto n = h.fake->sent_to(ip(kIpA)).size();
  h.coord->stop();
  // One request per 10 ms at most, with slack for scheduling.
  assert(n >= 2);
  assert(n <= 40);
}

static void test_range_check_can_be_disabled() {
  auto cfg = fast_config();
  cfg->validate_ranges = false;
  Harness h(cfg);
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());

  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::Low, 9000, 2400));
  assert(wait_for([&] { return h.coord->stats().applied == 1; }));
  assert(h.coord->get_state("living")->state.report.ambient_centi == 9000);
  h.coord->stop();
}

static void test_spoofed_hardware_id_rejected() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());

  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::Low, 2300, 2400));
  auto spoof = status_frame(core::Mode::Heat, core::FanSpeed::High, 2300, 2400);
  spoof[wire::kStatusHwIdOffset + 5] = 0x42;
  h.fake->push_rx(ip(kIpA), spoof);

  assert(wait_for([&] { return h.coord->stats().datagrams == 2; }));
  assert(wait_for([&] { return h.coord->stats().rejected == 1; }));
  assert(h.coord->get_state("living")->state.report.mode == core::Mode::Cool);
  h.coord->stop();
}

static void test_rate_limit() {
  auto cfg = fast_config();
  cfg->broadcast_rate_hz = 1.0;
  cfg->broadcast_burst = 2.0;
  Harness h(cfg);
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());

  for (int i = 0; i < 5; ++i) {
    h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::Low, 2300, 2400));
  }
  assert(wait_for([&] {
    const auto st = h.coord->stats();
    return st.applied + st.rate_limited == 5;
  }));
  const auto st = h.coord->stats();
  assert(st.applied >= 2);
  assert(st.rate_limited >= 2);
  h.coord->stop();
}

static void test_goes_stale_without_broadcasts() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  Recorder rec;
  (void)h.coord->subscribe("living", rec.callback());
  assert(h.coord->start());

  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::Low, 2300, 2400));
  assert(wait_for([&] { return h.coord->get_state("living")->available; }));

  // No answer to the polls: unavailable once the staleness window has passed.
  assert(wait_for([&] { return !h.coord->get_state("living")->available; }));
  assert(wait_for([&] { return rec.size() == 2; }));
  assert(!rec.last().available);
  // The last known values are kept.
  assert(h.coord->get_state("living")->state.report.mode == core::Mode::Cool);

  // Back as soon as a broadcast arrives.
  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::Low, 2300, 2400));
  assert(wait_for([&] { return rec.size() == 3; }));
  assert(rec.last().available);
  h.coord->stop();
}

static void test_set_temperature_unsupported() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());
  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::Low, 2300, 2400));
  assert(wait_for([&] { return h.coord->get_state("living")->available; }));

  const auto before = h.coord->get_state("living")->state;
  const auto sent_before = count_size(h.fake->sent_to(ip(kIpA)), wire::kCommandFrameSize);
  assert(h.coord->set_temperature("living", 2100) == bgh::CommandResult::UnsupportedOperation);
  assert(h.coord->set_temperature("nobody", 2100) == bgh::CommandResult::UnsupportedOperation);

  const auto after = h.coord->get_state("living")->state;
  assert(after.report.setpoint_centi == before.report.setpoint_centi);
  assert(after.updates == before.updates);
  assert(count_size(h.fake->sent_to(ip(kIpA)), wire::kCommandFrameSize) == sent_before);
  h.coord->stop();
}

static void test_command_does_not_touch_cache() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());
  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::High, 2300, 2400));
  assert(wait_for([&] { return h.coord->get_state("living")->available; }));
  h.fake->clear_sent();

  assert(h.coord->set_mode("living", core::Mode::Heat) == bgh::CommandResult::Accepted);
  assert(h.coord->get_state("living")->state.report.mode == core::Mode::Cool);

  tests::SentDatagram cmd;
  for (const auto& s : h.fake->sent_to(ip(kIpA))) {
    if (s.bytes.size() == wire::kCommandFrameSize) {
      cmd = s;
      break;
    }
  }
  assert(cmd.port == 20910);
  assert(cmd.bytes.size() == wire::kCommandFrameSize);
  assert(cmd.bytes[17] == 2);
  assert(cmd.bytes[18] == 3);  // fan kept from the cache

  // The unit confirms; only now does the cache change.
  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Heat, core::FanSpeed::High, 2300, 2400));
  assert(wait_for([&] { return h.coord->get_state("living")->state.report.mode == core::Mode::Heat; }));

  // Confirmed: no resend.
  std::this_thread::sleep_for(500ms);
  assert(count_size(h.fake->sent_to(ip(kIpA)), wire::kCommandFrameSize) == 1);
  h.coord->stop();
}

static void test_command_validation() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());

  assert(h.coord->set_mode("nobody", core::Mode::Cool) == bgh::CommandResult::UnknownDevice);
  assert(h.coord->request_status("nobody") == bgh::CommandResult::UnknownDevice);
  // Mode unknown until the first broadcast.
  assert(h.coord->set_fan_speed("living", core::FanSpeed::High) == bgh::CommandResult::StateUnknown);
  assert(h.coord->issue_command("living", core::Mode::Unknown, core::FanSpeed::Low)
         == bgh::CommandResult::InvalidArgument);
  assert(h.coord->issue_command("living", core::Mode::Cool, static_cast<core::FanSpeed>(9))
         == bgh::CommandResult::InvalidArgument);
  assert(count_size(h.fake->sent_to(ip(kIpA)), wire::kCommandFrameSize) == 0);

  // Full command works without any cached state.
  assert(h.coord->turn_off("living") == bgh::CommandResult::Accepted);
  const auto sent = h.fake->sent_to(ip(kIpA));
  bool found = false;
  for (const auto& s : sent) {
    if (s.bytes.size() == wire::kCommandFrameSize && s.bytes[17] == 0 && s.bytes[18] == 1) found = true;
  }
  assert(found);
  assert(h.coord->request_status("living") == bgh::CommandResult::Accepted);
  h.coord->stop();
}

static void test_follow_up_and_resends() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());
  assert(wait_for([&] { return !h.fake->sent_to(ip(kIpA)).empty(); }));
  h.fake->clear_sent();

  assert(h.coord->issue_command("living", core::Mode::Cool, core::FanSpeed::Medium) == bgh::CommandResult::Accepted);

  // Status request shortly after the command.
  assert(wait_for([&] {
    bool after_cmd = false;
    for (const auto& s : h.fake->sent_to(ip(kIpA))) {
      if (s.bytes.size() == wire::kCommandFrameSize) after_cmd = true;
      else if (after_cmd) return true;
    }
    return false;
  }, 150ms));

  // Unconfirmed: re-sent command_retries times, then dropped.
  assert(wait_for([&] { return count_size(h.fake->sent_to(ip(kIpA)), wire::kCommandFrameSize) == 3; }));
  std::this_thread::sleep_for(600ms);
  const auto sent = h.fake->sent_to(ip(kIpA));
  assert(count_size(sent, wire::kCommandFrameSize) == 3);
  assert(sent.back().bytes.size() == wire::kStatusRequestFrameSize);
  h.coord->stop();
}

static void test_send_failure_isolated() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->register_device("bedroom", kIpB) == bgh::RegisterResult::Created);
  h.fake->fail_sends_to(ip(kIpB));
  assert(h.coord->start());

  assert(h.coord->turn_on("bedroom") == bgh::CommandResult::TransportError);
  assert(h.coord->request_status("bedroom") == bgh::CommandResult::TransportError);
  assert(h.coord->turn_on("living") == bgh::CommandResult::Accepted);

  assert(wait_for([&] { return count_size(h.fake->sent_to(ip(kIpA)), wire::kStatusRequestFrameSize) >= 3; }));
  assert(h.fake->sent_to(ip(kIpB)).empty());
  assert(h.coord->stats().send_failures >= 3);
  assert(h.coord->running());
  h.coord->stop();
}

static void test_unregister_stops_updates() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  Recorder rec;
  (void)h.coord->subscribe("living", rec.callback());
  assert(h.coord->start());

  assert(h.coord->unregister_device("living"));
  assert(!h.coord->unregister_device("living"));
  assert(!h.coord->get_state("living"));
  assert(h.coord->set_mode("living", core::Mode::Cool) == bgh::CommandResult::UnknownDevice);

  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Cool, core::FanSpeed::Low, 2300, 2400));
  assert(wait_for([&] { return h.coord->stats().unknown_source == 1; }));
  assert(rec.size() == 0);
  h.coord->stop();
}

static void test_unsubscribe() {
  Harness h;
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  Recorder keep, drop;
  (void)h.coord->subscribe("living", keep.callback());
  const auto id = h.coord->subscribe("living", drop.callback());
  assert(h.coord->unsubscribe(id));
  assert(!h.coord->unsubscribe(id));
  assert(h.coord->start());

  h.fake->push_rx(ip(kIpA), status_frame(core::Mode::Dry, core::FanSpeed::Low, 2300, 2400));
  assert(wait_for([&] { return keep.size() == 1; }));
  assert(drop.size() == 0);
  h.coord->stop();
}

static void test_stop_is_prompt() {
  auto cfg = std::make_shared<bgh::RuntimeConfig>();  // 10 s poll interval
  Harness h(cfg);
  assert(h.coord->register_device("living", kIpA) == bgh::RegisterResult::Created);
  assert(h.coord->start());
  assert(wait_for([&] { return !h.fake->sent_to(ip(kIpA)).empty(); }));

  const auto t0 = std::chrono::steady_clock::now();
  h.coord->stop();
  assert(std::chrono::steady_clock::now() - t0 < 1s);
  assert(!h.coord->running());

  // Idempotent; destructor after an explicit stop is fine too.
  h.coord->stop();
}

int main() {
  logger::Options opts;
  opts.console_level = logger::Level::Error;
  logger::configure(opts);

  test_start_binds_broadcast_port();
  test_start_fails_when_listen_fails();
  test_registration_triggers_poll();
  test_broadcast_applied_and_notified();
  test_unknown_source_ignored();
  test_filters();
  test_bad_header_rejected();
  test_header_check_can_be_disabled();
  test_intervals_clamped();
  test_range_check_can_be_disabled();
  test_spoofed_hardware_id_rejected();
  test_rate_limit();
  test_goes_stale_without_broadcasts();
  test_set_temperature_unsupported();
  test_command_does_not_touch_cache();
  test_command_validation();
  test_follow_up_and_resends();
  test_send_failure_isolated();
  test_unregister_stops_updates();
  test_unsubscribe();
  test_stop_is_prompt();

  logger::close_logger();
  return 0;
}

#include "bgh/runtime_config.hpp"
#include "bgh/state_coordinator.hpp"
#include "bgh/stop_flag.hpp"
#include "connection/transport.hpp"
#include "connection/wire_codec.hpp"

#include "utils/logger.hpp"
#include "utils/signal_handler.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace {

struct DeviceArg {
  std::string id;
  std::string ip;
};

struct SetArg {
  std::string id;
  core::Mode mode{core::Mode::Off};
  std::optional<core::FanSpeed> fan;
};

// "ID=VALUE"
bool split_assignment(std::string_view s, std::string& key, std::string& value) {
  const auto eq = s.find('=');
  if (eq == std::string_view::npos || eq == 0 || eq + 1 == s.size()) return false;
  key = std::string(s.substr(0, eq));
  value = std::string(s.substr(eq + 1));
  return true;
}

// "ID=MODE[/FAN]"
bool parse_set(std::string_view s, SetArg& out) {
  std::string id, rest;
  if (!split_assignment(s, id, rest)) return false;

  const auto slash = rest.find('/');
  const auto mode = connection::wire::parse_mode(std::string_view(rest).substr(0, slash));
  if (!mode) return false;
  out.id = id;
  out.mode = *mode;
  if (slash != std::string::npos) {
    const auto fan = connection::wire::parse_fan_speed(std::string_view(rest).substr(slash + 1));
    if (!fan) return false;
    out.fan = *fan;
  }
  return true;
}

// Seconds, fractional allowed, within the interval range the coordinator accepts.
std::chrono::milliseconds parse_seconds(const std::string& s) {
  const double v = std::stod(s);
  const double min_s = std::chrono::duration<double>(bgh::kMinInterval).count();
  const double max_s = std::chrono::duration<double>(bgh::kMaxInterval).count();
  if (!(v >= min_s && v <= max_s)) {
    throw std::out_of_range("must be between " + std::to_string(min_s) + " and " + std::to_string(max_s) + " s");
  }
  return std::chrono::milliseconds(std::llround(v * 1000.0));
}

double parse_rate(const std::string& s) {
  const double v = std::stod(s);
  if (!(v > 0.0 && v <= 10000.0)) throw std::out_of_range("must be in (0, 10000]");
  return v;
}

uint16_t parse_port(const std::string& s) {
  const int v = std::stoi(s);
  if (v <= 0 || v > 65535) throw std::out_of_range("port");
  return static_cast<uint16_t>(v);
}

void print_help(const char* argv0) {
  std::printf(
    "Usage: %s --device ID=IP [--device ID=IP ...] [options]\n"
    "  --device ID=IP           unit to monitor (repeatable)\n"
    "  --bind_ip 0.0.0.0\n"
    "  --listen_port 20911      broadcast port\n"
    "  --command_port 20910     unit command port\n"
    "  --poll 10                poll interval (s)\n"
    "  --stale 30               staleness window (s)\n"
    "  --rate 10                max broadcasts/s processed per unit\n"
    "  --no_range_check         accept any temperature reading\n"
    "  --no_header_check        accept status frames with unexpected header bytes\n"
    "  --no_pin                 do not pin the unit hardware id\n"
    "  --set ID=MODE[/FAN]      send once at start (off|cool|heat|dry|fan_only|auto, low|medium|high)\n"
    "  --log_level debug|info|warn|error\n"
    "  --file_log 1|0\n"
    "  --log_dir ./logs\n",
    argv0
  );
}

void print_snapshot(const std::string& id, const core::DeviceSnapshot& s) {
  const auto& r = s.state.report;
  if (!s.available) {
    std::printf("%-12s unavailable\n", id.c_str());
    return;
  }
  std::printf("%-12s mode=%-8s fan=%-7s ambient=%6.2fC setpoint=%6.2fC\n",
              id.c_str(),
              connection::wire::to_string(r.mode),
              connection::wire::to_string(r.fan),
              core::centi_to_celsius(r.ambient_centi),
              core::centi_to_celsius(r.setpoint_centi));
  std::fflush(stdout);
}

} // namespace

int main(int argc, char** argv) {
  auto cfg = std::make_shared<bgh::RuntimeConfig>();
  std::vector<DeviceArg> devices;
  std::vector<SetArg> commands;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto need = [&](std::string_view name) -> std::string {
      if (i + 1 >= argc) {
        logger::error() << "Missing value for " << name;
        std::exit(2);
      }
      return argv[++i];
    };

    try {
      if (a == "--device") {
        DeviceArg d;
        if (!split_assignment(need(a), d.id, d.ip)) {
          logger::error() << "Invalid --device, expected ID=IP";
          return 2;
        }
        devices.push_back(std::move(d));
      }
      else if (a == "--bind_ip") cfg->bind_ip = need(a);
      else if (a == "--listen_port") cfg->listen_port = parse_port(need(a));
      else if (a == "--command_port") cfg->command_port = parse_port(need(a));
      else if (a == "--poll") cfg->poll_interval = parse_seconds(need(a));
      else if (a == "--stale") cfg->staleness = parse_seconds(need(a));
      else if (a == "--rate") {
        cfg->broadcast_rate_hz = parse_rate(need(a));
        cfg->broadcast_burst = cfg->broadcast_rate_hz;
      }
      else if (a == "--no_range_check") cfg->validate_ranges = false;
      else if (a == "--no_header_check") cfg->validate_header = false;
      else if (a == "--no_pin") cfg->pin_hardware_id = false;
      else if (a == "--set") {
        SetArg s;
        if (!parse_set(need(a), s)) {
          logger::error() << "Invalid --set, expected ID=MODE[/FAN]";
          return 2;
        }
        commands.push_back(std::move(s));
      }
      else if (a == "--log_level") {
        logger::Level lvl{};
        if (!logger::parse_level(need(a), lvl)) {
          logger::error() << "Invalid --log_level";
          return 2;
        }
        cfg->log_level = static_cast<int>(lvl);
      }
      else if (a == "--file_log") cfg->file_log = (std::stoi(need(a)) != 0);
      else if (a == "--log_dir") cfg->log_dir = need(a);
      else if (a == "--help") { print_help(argv[0]); return 0; }
      else {
        logger::error() << "Unknown arg: " << a;
        print_help(argv[0]);
        return 2;
      }
    } catch (const std::exception& e) {
      logger::error() << "Invalid value for " << a << ": " << e.what();
      return 2;
    }
  }

  if (devices.empty()) {
    print_help(argv[0]);
    return 2;
  }
  if (cfg->staleness <= cfg->poll_interval) {
    logger::warn() << "[MAIN] Staleness window is not longer than the poll interval; units will flap.";
  }

  logger::Options lopts;
  lopts.console_level = static_cast<logger::Level>(cfg->log_level);
  lopts.file_enabled = cfg->file_log;
  lopts.dir = cfg->log_dir;
  logger::configure(lopts);

  bgh::StateCoordinator coord(cfg, std::make_unique<connection::UdpTransport>());

  for (const auto& d : devices) {
    const auto r = coord.register_device(d.id, d.ip);
    if (!bgh::is_registered(r)) {
      logger::error() << "[MAIN] Cannot register " << d.id << "=" << d.ip << ": " << bgh::to_string(r);
      return 2;
    }
    (void)coord.subscribe(d.id, print_snapshot);
  }

  bgh::StopFlag stop;
  utils::SignalHandler sig(stop);

  if (!coord.start()) {
    logger::error() << "[MAIN] Cannot listen on " << cfg->bind_ip << ":" << cfg->listen_port;
    logger::close_logger();
    return 1;
  }

  for (const auto& c : commands) {
    const auto r = coord.issue_command(c.id, c.mode, c.fan);
    if (r != bgh::CommandResult::Accepted) {
      logger::error() << "[MAIN] Command for " << c.id << " failed: " << bgh::to_string(r);
    }
  }

  logger::info() << "[MAIN] Monitoring " << devices.size() << " unit(s). Ctrl+C to stop.";
  while (!stop.stop_requested()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  coord.stop();

  const auto st = coord.stats();
  logger::info() << "[MAIN] datagrams=" << st.datagrams << " applied=" << st.applied
                 << " unknown_source=" << st.unknown_source << " decode_errors=" << st.decode_errors
                 << " rejected=" << st.rejected << " send_failures=" << st.send_failures;
  logger::info() << "[MAIN] Shutdown complete.";
  logger::close_logger();
  return 0;
}

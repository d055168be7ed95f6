#pragma once
#include "bgh/device_registry.hpp"
#include "bgh/runtime_config.hpp"
#include "bgh/stop_flag.hpp"
#include "connection/transport.hpp"
#include "core/basic.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace bgh {

enum class CommandResult : uint8_t {
  Accepted = 0,             // sent; the cache changes only when the unit broadcasts
  UnknownDevice = 1,
  InvalidArgument = 2,      // mode/fan outside the code tables, nothing sent
  StateUnknown = 3,         // a field to keep is not known yet (no broadcast so far)
  UnsupportedOperation = 4,
  TransportError = 5,
};

const char* to_string(CommandResult r) noexcept;

struct CoordinatorStats {
  uint64_t datagrams{0};
  uint64_t unknown_source{0};
  uint64_t ignored{0};        // ACK / discovery / control response frames
  uint64_t oversized{0};
  uint64_t rate_limited{0};
  uint64_t decode_errors{0};
  uint64_t rejected{0};       // implausible values or hardware id mismatch
  uint64_t applied{0};
  uint64_t polls_sent{0};
  uint64_t send_failures{0};
  uint64_t receive_errors{0};
};

using SubscriptionId = uint64_t;
using StateCallback = std::function<void(const std::string& device_id, const core::DeviceSnapshot& snapshot)>;

/**
 * @brief Keeps a fresh cached state for every registered unit.
 *
 * Two threads share the injected transport:
 *  - listen: drains inbound datagrams, resolves the sender, decodes and
 *    applies status broadcasts;
 *  - poll: sends a status request (or re-sends a pending command) to every
 *    unit on its own deadline and flags units whose state went stale.
 *
 * Readers (get_state) never block on I/O. Subscribers are called from either
 * thread and must return quickly.
 */
class StateCoordinator {
public:
  StateCoordinator(RuntimeConfigPtr cfg, connection::TransportPtr transport);
  ~StateCoordinator();

  StateCoordinator(const StateCoordinator&) = delete;
  StateCoordinator& operator=(const StateCoordinator&) = delete;

  // Binds the listener and starts both loops. False if the bind failed.
  [[nodiscard]] bool start();
  void stop();
  [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

  [[nodiscard]] RegisterResult register_device(std::string_view device_id, std::string_view ip);
  bool unregister_device(std::string_view device_id);

  [[nodiscard]] std::optional<core::DeviceSnapshot> get_state(std::string_view device_id) const;

  // Fields left empty are taken from the cached state.
  [[nodiscard]] CommandResult issue_command(std::string_view device_id,
                                            std::optional<core::Mode> mode,
                                            std::optional<core::FanSpeed> fan);
  [[nodiscard]] CommandResult set_mode(std::string_view device_id, core::Mode mode);
  [[nodiscard]] CommandResult set_fan_speed(std::string_view device_id, core::FanSpeed fan);
  [[nodiscard]] CommandResult turn_on(std::string_view device_id);
  [[nodiscard]] CommandResult turn_off(std::string_view device_id);
  // The protocol has no setpoint write; always UnsupportedOperation.
  [[nodiscard]] CommandResult set_temperature(std::string_view device_id, int32_t setpoint_centi);
  [[nodiscard]] CommandResult request_status(std::string_view device_id);

  SubscriptionId subscribe(std::string_view device_id, StateCallback cb);
  bool unsubscribe(SubscriptionId id);

  [[nodiscard]] CoordinatorStats stats() const noexcept;
  [[nodiscard]] const RuntimeConfig& config() const noexcept { return *cfg_; }

private:
  struct Subscription {
    std::string device_id;
    StateCallback cb;
  };

  struct Counters {
    std::atomic<uint64_t> datagrams{0};
    std::atomic<uint64_t> unknown_source{0};
    std::atomic<uint64_t> ignored{0};
    std::atomic<uint64_t> oversized{0};
    std::atomic<uint64_t> rate_limited{0};
    std::atomic<uint64_t> decode_errors{0};
    std::atomic<uint64_t> rejected{0};
    std::atomic<uint64_t> applied{0};
    std::atomic<uint64_t> polls_sent{0};
    std::atomic<uint64_t> send_failures{0};
    std::atomic<uint64_t> receive_errors{0};
  };

  void listen_loop();
  void poll_loop();
  void handle_datagram(const connection::Datagram& d, core::Clock::time_point now);
  void poll_device(DeviceEntry& entry, core::Clock::time_point now);
  void check_staleness(core::Clock::time_point now);
  [[nodiscard]] bool plausible(const core::StatusReport& r) const noexcept;
  void notify(const DeviceEntry& entry, core::Clock::time_point now);
  void kick_poll();

  RuntimeConfigPtr cfg_;
  connection::TransportPtr transport_;
  DeviceRegistry registry_;

  StopFlag stop_;
  std::atomic<bool> running_{false};
  std::thread listen_thread_;
  std::thread poll_thread_;

  std::mutex poll_mtx_;
  std::condition_variable poll_cv_;
  bool poll_kick_{false};

  mutable std::mutex subs_mtx_;
  std::map<SubscriptionId, Subscription> subs_;
  SubscriptionId next_sub_{1};

  Counters counters_;
};

} // namespace bgh

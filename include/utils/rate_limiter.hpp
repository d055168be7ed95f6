#pragma once
/**
 * @file rate_limiter.hpp
 * @brief Token bucket used to cap how many broadcasts per unit are processed.
 *
 * Portable: uses std::chrono::steady_clock only.
 *
 * Design note:
 *  - tokens refill continuously at `rate` per second up to `capacity`
 *  - try_consume() never blocks; a caller that is over budget simply drops work
 */
#include <algorithm>
#include <chrono>
#include <cstdint>

namespace utils {

/**
 * @brief Non-blocking token bucket with a drop counter.
 *
 * Usage:
 *   utils::TokenBucket tb(10.0, 10.0);
 *   if (!tb.try_consume()) { ... drop ... }
 */
class TokenBucket {
public:
  using clock = std::chrono::steady_clock;

  TokenBucket() = default;
  TokenBucket(double rate_per_s, double capacity) { configure(rate_per_s, capacity); }

  void configure(double rate_per_s, double capacity) noexcept {
    rate_ = (rate_per_s > 0.0) ? rate_per_s : 1.0;
    capacity_ = (capacity >= 1.0) ? capacity : 1.0;
    tokens_ = capacity_;
    initialized_ = false;
  }

  double rate() const noexcept { return rate_; }
  double capacity() const noexcept { return capacity_; }

  /// Requests rejected since construction.
  std::uint64_t dropped() const noexcept { return dropped_; }

  bool try_consume(double tokens = 1.0) { return try_consume(clock::now(), tokens); }

  /// Same as try_consume() with an explicit time, for deterministic tests.
  bool try_consume(clock::time_point now, double tokens = 1.0) noexcept {
    if (!initialized_) {
      last_ = now;
      initialized_ = true;
    }
    if (now > last_) {
      const double elapsed_s = std::chrono::duration<double>(now - last_).count();
      tokens_ = std::min(capacity_, tokens_ + elapsed_s * rate_);
      last_ = now;
    }

    if (tokens_ >= tokens) {
      tokens_ -= tokens;
      return true;
    }
    ++dropped_;
    return false;
  }

private:
  double rate_{10.0};
  double capacity_{10.0};
  double tokens_{10.0};
  clock::time_point last_{};
  bool initialized_{false};
  std::uint64_t dropped_{0};
};

} // namespace utils

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace pxid::util {

// Wall-clock source with one second resolution
class Clock {
 public:
  virtual ~Clock() = default;

  // Seconds since the Unix epoch, truncated to 32 bits
  virtual std::uint32_t nowSeconds() const = 0;
};

// Reads std::chrono::system_clock
class SystemClock final : public Clock {
 public:
  std::uint32_t nowSeconds() const override;
};

// Returns a settable value for deterministic tests
class FixedClock final : public Clock {
 public:
  explicit FixedClock(std::uint32_t seconds) : seconds_(seconds) {}

  std::uint32_t nowSeconds() const override { return seconds_.load(); }

  void set(std::uint32_t seconds) { seconds_.store(seconds); }
  void advance(std::uint32_t seconds) { seconds_.fetch_add(seconds); }

 private:
  std::atomic<std::uint32_t> seconds_;
};

// Time utilities
class Time {
 public:
  // Format as an RFC3339 UTC string with second precision
  static std::string toRfc3339(std::chrono::system_clock::time_point time);
};

}  // namespace pxid::util

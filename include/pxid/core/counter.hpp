#pragma once

#include <atomic>
#include <cstdint>

namespace pxid::core {

// Largest value a counter can hold (3 bytes)
inline constexpr std::uint32_t kCounterMask = 0x00FFFFFF;

// Process-local sequence shared by every generation call of one Factory.
// Thread-safe. Values wrap silently modulo 2^24.
class Counter {
 public:
  // Seeded from a random 24-bit value
  Counter();

  // Seeded with an explicit start value (reduced modulo 2^24)
  explicit Counter(std::uint32_t seed) noexcept;

  // Not copyable or movable (contains atomic counter)
  Counter(const Counter&) = delete;
  Counter& operator=(const Counter&) = delete;
  Counter(Counter&&) = delete;
  Counter& operator=(Counter&&) = delete;

  // Atomically advance and return the pre-increment value modulo 2^24.
  // No two calls observe the same value until the counter wraps.
  std::uint32_t next() noexcept;

  // Value the next call to next() will return
  std::uint32_t peek() const noexcept;

  // Random 24-bit seed
  static std::uint32_t randomSeed();

 private:
  std::atomic<std::uint32_t> value_;
};

}  // namespace pxid::core

#include "pxid/core/counter.hpp"

#include <random>

namespace pxid::core {

Counter::Counter() : value_(randomSeed()) {}

Counter::Counter(std::uint32_t seed) noexcept : value_(seed & kCounterMask) {}

std::uint32_t Counter::next() noexcept {
  // The 32-bit atomic wraps at 2^32, a multiple of 2^24, so masking the
  // fetched value keeps the sequence contiguous across the overflow.
  return value_.fetch_add(1, std::memory_order_relaxed) & kCounterMask;
}

std::uint32_t Counter::peek() const noexcept {
  return value_.load(std::memory_order_relaxed) & kCounterMask;
}

std::uint32_t Counter::randomSeed() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  static thread_local std::uniform_int_distribution<std::uint32_t> dis(0, kCounterMask);
  return dis(gen);
}

}  // namespace pxid::core

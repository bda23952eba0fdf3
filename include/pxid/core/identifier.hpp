#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "pxid/common.hpp"
#include "pxid/core/codec.hpp"

namespace pxid::core {

inline constexpr std::size_t kMaxPrefixLength = 4;
inline constexpr std::size_t kBinaryLength = kMaxPrefixLength + kPayloadLength;
inline constexpr char kSeparator = '_';

using MachineId = std::array<std::uint8_t, 3>;
using ProcessId = std::array<std::uint8_t, 2>;
using CounterBytes = std::array<std::uint8_t, 3>;

// Packed binary form: prefix (NUL padded) followed by the payload
//
//   V V V V W W W W X X X Y Y Z Z Z
//   └─────┘ └─────┘ └───┘ └─┘ └───┘
//   prefix  time    machine pid counter
using Bytes = std::array<std::uint8_t, kBinaryLength>;

// Prefixed, roughly time-ordered unique identifier.
// Text form is "<prefix>_<token>", or just "<token>" when the prefix is empty,
// e.g. "acct_9m4e2mr0ui3e8a215n4g". Immutable once constructed.
class Factory;

class Identifier {
 public:
  // Assemble an identifier from its fields. The counter is reduced modulo 2^24.
  static Result<Identifier> create(std::string_view prefix, std::uint32_t timestamp,
                                   const MachineId& machine_id, const ProcessId& process_id,
                                   std::uint32_t counter);

  // Parse the text form. The prefix is everything before the last separator.
  static Result<Identifier> parse(std::string_view text);

  // Rebuild from the 16 byte binary form
  static Result<Identifier> fromBytes(const Bytes& bytes);

  // Check a prefix: at most 4 bytes of printable UTF-8 without the separator
  static Result<void> validatePrefix(std::string_view prefix);

  // Default constructor creates the nil identifier (no prefix, zero payload)
  Identifier() = default;

  // Get string representation
  std::string toString() const;

  // Get the 20 character token without the prefix
  std::string token() const;

  const std::string& prefix() const noexcept { return prefix_; }

  // Seconds since the Unix epoch
  std::uint32_t timestamp() const noexcept;

  // Timestamp as a time point
  std::chrono::system_clock::time_point time() const;

  MachineId machineId() const noexcept;
  std::uint16_t processId() const noexcept;
  ProcessId processIdBytes() const noexcept;
  std::uint32_t counter() const noexcept;
  CounterBytes counterBytes() const noexcept;

  const Payload& payload() const noexcept { return payload_; }

  // Get the 16 byte binary form
  Bytes bytes() const noexcept;

  bool isNil() const noexcept;

  // Comparison operators. Ordering follows the payload bytes (timestamp,
  // then machine id, process id and counter); the prefix breaks ties.
  bool operator==(const Identifier& other) const noexcept;
  bool operator!=(const Identifier& other) const noexcept;
  bool operator<(const Identifier& other) const noexcept;
  bool operator<=(const Identifier& other) const noexcept;
  bool operator>(const Identifier& other) const noexcept;
  bool operator>=(const Identifier& other) const noexcept;

  // Hash support for containers
  struct Hash {
    std::size_t operator()(const Identifier& id) const noexcept;
  };

 private:
  friend class Factory;

  Identifier(std::string prefix, const Payload& payload);

  // Pack the fields without validating the prefix
  static Identifier assemble(std::string prefix, std::uint32_t timestamp,
                             const MachineId& machine_id, const ProcessId& process_id,
                             std::uint32_t counter);

  std::string prefix_;
  Payload payload_{};
};

}  // namespace pxid::core

// Hash specialization for std::unordered_map
namespace std {
template <>
struct hash<pxid::core::Identifier> : pxid::core::Identifier::Hash {};
}  // namespace std

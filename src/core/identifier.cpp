#include "pxid/core/identifier.hpp"

#include <algorithm>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace pxid::core {

namespace {

// Payload field offsets
constexpr std::size_t kTimestampOffset = 0;
constexpr std::size_t kMachineIdOffset = 4;
constexpr std::size_t kProcessIdOffset = 7;
constexpr std::size_t kCounterOffset = 9;

int comparePayloads(const Payload& a, const Payload& b) noexcept {
  auto [ai, bi] = std::mismatch(a.begin(), a.end(), b.begin());
  if (ai == a.end()) {
    return 0;
  }
  return *ai < *bi ? -1 : 1;
}

}  // namespace

Result<Identifier> Identifier::create(std::string_view prefix, std::uint32_t timestamp,
                                      const MachineId& machine_id, const ProcessId& process_id,
                                      std::uint32_t counter) {
  if (auto valid = validatePrefix(prefix); !valid.has_value()) {
    return std::unexpected(valid.error());
  }

  return assemble(std::string(prefix), timestamp, machine_id, process_id, counter);
}

Result<Identifier> Identifier::parse(std::string_view text) {
  std::string_view prefix;
  std::string_view token = text;

  auto separator = text.rfind(kSeparator);
  if (separator != std::string_view::npos) {
    prefix = text.substr(0, separator);
    token = text.substr(separator + 1);

    if (prefix.empty()) {
      return makeErrorResult<Identifier>(ErrorCode::kInvalidPrefixEncoding,
                                         "Identifier '" + std::string(text) +
                                             "' has an empty prefix before the separator");
    }
  }

  if (auto valid = validatePrefix(prefix); !valid.has_value()) {
    return std::unexpected(valid.error());
  }

  auto payload = codec::decode(token);
  if (!payload.has_value()) {
    return std::unexpected(payload.error());
  }

  return Identifier(std::string(prefix), *payload);
}

Result<Identifier> Identifier::fromBytes(const Bytes& bytes) {
  auto prefix_end = std::find(bytes.begin(), bytes.begin() + kMaxPrefixLength, std::uint8_t{0});

  // Padding after the prefix must be all NUL
  if (std::any_of(prefix_end, bytes.begin() + kMaxPrefixLength,
                  [](std::uint8_t b) { return b != 0; })) {
    return makeErrorResult<Identifier>(ErrorCode::kInvalidPrefixEncoding,
                                       "Binary identifier has an embedded NUL in its prefix");
  }

  std::string prefix(bytes.begin(), prefix_end);
  if (auto valid = validatePrefix(prefix); !valid.has_value()) {
    return std::unexpected(valid.error());
  }

  Payload payload{};
  std::copy(bytes.begin() + kMaxPrefixLength, bytes.end(), payload.begin());

  return Identifier(std::move(prefix), payload);
}

Result<void> Identifier::validatePrefix(std::string_view prefix) {
  if (prefix.size() > kMaxPrefixLength) {
    return std::unexpected(makeError(
        ErrorCode::kPrefixTooLong,
        "Prefix '" + std::string(prefix) + "' is " + std::to_string(prefix.size()) +
            " bytes long, at most " + std::to_string(kMaxPrefixLength) + " are allowed"));
  }

  const auto* data = reinterpret_cast<const std::uint8_t*>(prefix.data());
  const auto length = static_cast<std::int32_t>(prefix.size());
  std::int32_t offset = 0;

  while (offset < length) {
    UChar32 c;
    U8_NEXT(data, offset, length, c);

    if (c < 0) {
      return std::unexpected(makeError(ErrorCode::kInvalidPrefixEncoding,
                                       "Prefix is not valid UTF-8"));
    }
    if (c == kSeparator) {
      return std::unexpected(makeError(ErrorCode::kInvalidPrefixEncoding,
                                       "Prefix '" + std::string(prefix) +
                                           "' contains the separator '_'"));
    }
    if (!u_isprint(c) || u_isspace(c)) {
      return std::unexpected(makeError(ErrorCode::kInvalidPrefixEncoding,
                                       "Prefix contains a non-printable character"));
    }
  }

  return {};
}

Identifier::Identifier(std::string prefix, const Payload& payload)
    : prefix_(std::move(prefix)), payload_(payload) {}

Identifier Identifier::assemble(std::string prefix, std::uint32_t timestamp,
                                const MachineId& machine_id, const ProcessId& process_id,
                                std::uint32_t counter) {
  Payload payload{};

  // Timestamp, big endian
  payload[kTimestampOffset + 0] = static_cast<std::uint8_t>(timestamp >> 24);
  payload[kTimestampOffset + 1] = static_cast<std::uint8_t>(timestamp >> 16);
  payload[kTimestampOffset + 2] = static_cast<std::uint8_t>(timestamp >> 8);
  payload[kTimestampOffset + 3] = static_cast<std::uint8_t>(timestamp);

  std::copy(machine_id.begin(), machine_id.end(), payload.begin() + kMachineIdOffset);
  std::copy(process_id.begin(), process_id.end(), payload.begin() + kProcessIdOffset);

  // Low 3 bytes of the counter, big endian
  payload[kCounterOffset + 0] = static_cast<std::uint8_t>(counter >> 16);
  payload[kCounterOffset + 1] = static_cast<std::uint8_t>(counter >> 8);
  payload[kCounterOffset + 2] = static_cast<std::uint8_t>(counter);

  return Identifier(std::move(prefix), payload);
}

std::string Identifier::toString() const {
  if (prefix_.empty()) {
    return token();
  }

  std::string result;
  result.reserve(prefix_.size() + 1 + kTokenLength);
  result += prefix_;
  result += kSeparator;
  result += token();
  return result;
}

std::string Identifier::token() const {
  return codec::encode(payload_);
}

std::uint32_t Identifier::timestamp() const noexcept {
  return (static_cast<std::uint32_t>(payload_[kTimestampOffset + 0]) << 24) |
         (static_cast<std::uint32_t>(payload_[kTimestampOffset + 1]) << 16) |
         (static_cast<std::uint32_t>(payload_[kTimestampOffset + 2]) << 8) |
         static_cast<std::uint32_t>(payload_[kTimestampOffset + 3]);
}

std::chrono::system_clock::time_point Identifier::time() const {
  return std::chrono::system_clock::time_point{std::chrono::seconds(timestamp())};
}

MachineId Identifier::machineId() const noexcept {
  return {payload_[kMachineIdOffset], payload_[kMachineIdOffset + 1],
          payload_[kMachineIdOffset + 2]};
}

std::uint16_t Identifier::processId() const noexcept {
  return static_cast<std::uint16_t>((payload_[kProcessIdOffset] << 8) |
                                    payload_[kProcessIdOffset + 1]);
}

ProcessId Identifier::processIdBytes() const noexcept {
  return {payload_[kProcessIdOffset], payload_[kProcessIdOffset + 1]};
}

std::uint32_t Identifier::counter() const noexcept {
  return (static_cast<std::uint32_t>(payload_[kCounterOffset]) << 16) |
         (static_cast<std::uint32_t>(payload_[kCounterOffset + 1]) << 8) |
         static_cast<std::uint32_t>(payload_[kCounterOffset + 2]);
}

CounterBytes Identifier::counterBytes() const noexcept {
  return {payload_[kCounterOffset], payload_[kCounterOffset + 1], payload_[kCounterOffset + 2]};
}

Bytes Identifier::bytes() const noexcept {
  Bytes result{};
  std::copy(prefix_.begin(), prefix_.end(), result.begin());
  std::copy(payload_.begin(), payload_.end(), result.begin() + kMaxPrefixLength);
  return result;
}

bool Identifier::isNil() const noexcept {
  return prefix_.empty() &&
         std::all_of(payload_.begin(), payload_.end(), [](std::uint8_t b) { return b == 0; });
}

bool Identifier::operator==(const Identifier& other) const noexcept {
  return payload_ == other.payload_ && prefix_ == other.prefix_;
}

bool Identifier::operator!=(const Identifier& other) const noexcept {
  return !(*this == other);
}

bool Identifier::operator<(const Identifier& other) const noexcept {
  int cmp = comparePayloads(payload_, other.payload_);
  if (cmp != 0) {
    return cmp < 0;
  }
  return prefix_ < other.prefix_;
}

bool Identifier::operator<=(const Identifier& other) const noexcept {
  return !(other < *this);
}

bool Identifier::operator>(const Identifier& other) const noexcept {
  return other < *this;
}

bool Identifier::operator>=(const Identifier& other) const noexcept {
  return !(*this < other);
}

std::size_t Identifier::Hash::operator()(const Identifier& id) const noexcept {
  std::size_t seed = std::hash<std::string>{}(id.prefix_);
  for (std::uint8_t b : id.payload_) {
    seed ^= std::hash<std::uint8_t>{}(b) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  }
  return seed;
}

}  // namespace pxid::core

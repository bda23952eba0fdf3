#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "pxid/common.hpp"

namespace pxid::core {

// Encoded portion of an identifier:
// timestamp (4) | machine id (3) | process id (2) | counter (3)
inline constexpr std::size_t kPayloadLength = 12;

// Length of the text token produced by encode()
inline constexpr std::size_t kTokenLength = 20;

// Lowercase base32hex alphabet (same symbols and order as rs/xid), so the
// token sorts in the same order as the payload bytes
inline constexpr std::string_view kAlphabet = "0123456789abcdefghijklmnopqrstuv";

using Payload = std::array<std::uint8_t, kPayloadLength>;

namespace codec {

// Encode 12 payload bytes as a 20 character token. The 96 bits are consumed
// five at a time from the most significant end; the last symbol carries the
// final bit followed by four zero bits.
std::string encode(const Payload& payload);

// Inverse of encode(). Fails with kInvalidLength when the token is not 20
// characters and with kInvalidCharacter for symbols outside kAlphabet or a
// last symbol whose padding bits are set.
Result<Payload> decode(std::string_view token);

// True if c belongs to kAlphabet
bool isAlphabetChar(char c) noexcept;

}  // namespace codec

}  // namespace pxid::core

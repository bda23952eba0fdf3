#include "pxid/core/codec.hpp"

namespace pxid::core::codec {

namespace {

constexpr std::size_t kBitsPerSymbol = 5;
constexpr std::uint32_t kSymbolMask = 0x1F;

constexpr std::array<std::int8_t, 256> makeDecodingTable() {
  std::array<std::int8_t, 256> table{};
  for (auto& entry : table) {
    entry = -1;
  }
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
  }
  return table;
}

constexpr std::array<std::int8_t, 256> kDecodingTable = makeDecodingTable();

int decodeChar(char c) {
  return kDecodingTable[static_cast<unsigned char>(c)];
}

}  // namespace

std::string encode(const Payload& payload) {
  std::string token;
  token.reserve(kTokenLength);

  std::uint32_t buffer = 0;
  std::size_t bits = 0;

  for (std::uint8_t byte : payload) {
    buffer = (buffer << 8) | byte;
    bits += 8;
    while (bits >= kBitsPerSymbol) {
      bits -= kBitsPerSymbol;
      token += kAlphabet[(buffer >> bits) & kSymbolMask];
    }
  }

  if (bits > 0) {
    token += kAlphabet[(buffer << (kBitsPerSymbol - bits)) & kSymbolMask];
  }

  return token;
}

Result<Payload> decode(std::string_view token) {
  if (token.size() != kTokenLength) {
    return makeErrorResult<Payload>(
        ErrorCode::kInvalidLength,
        "Token '" + std::string(token) + "' has length " + std::to_string(token.size()) +
            ", expected " + std::to_string(kTokenLength));
  }

  Payload payload{};
  std::size_t out = 0;
  std::uint32_t buffer = 0;
  std::size_t bits = 0;

  for (char c : token) {
    int value = decodeChar(c);
    if (value < 0) {
      return makeErrorResult<Payload>(
          ErrorCode::kInvalidCharacter,
          "Token '" + std::string(token) + "' contains invalid character '" + std::string(1, c) + "'");
    }

    buffer = (buffer << kBitsPerSymbol) | static_cast<std::uint32_t>(value);
    bits += kBitsPerSymbol;
    if (bits >= 8) {
      bits -= 8;
      payload[out++] = static_cast<std::uint8_t>((buffer >> bits) & 0xFF);
    }
  }

  // 100 bits in, 96 out: the remaining padding bits must be zero
  if ((buffer & ((1u << bits) - 1u)) != 0) {
    return makeErrorResult<Payload>(
        ErrorCode::kInvalidCharacter,
        "Token '" + std::string(token) + "' has a non-canonical last character '" +
            std::string(1, token.back()) + "'");
  }

  return payload;
}

bool isAlphabetChar(char c) noexcept {
  return decodeChar(c) >= 0;
}

}  // namespace pxid::core::codec

#include <gtest/gtest.h>

#include <random>
#include <set>

#include "pxid/core/codec.hpp"
#include "test_helpers.hpp"

using namespace pxid::core;
using namespace pxid::test;
using pxid::ErrorCode;

class CodecTest : public ::testing::Test {};

TEST_F(CodecTest, EncodesReferenceVector) {
  auto payload = payloadFromHex(kReferencePayloadHex);
  EXPECT_EQ(codec::encode(payload), kReferenceToken);
}

TEST_F(CodecTest, DecodesReferenceVector) {
  auto result = codec::decode(kReferenceToken);

  ASSERT_OK(result);
  EXPECT_EQ(*result, payloadFromHex(kReferencePayloadHex));
}

TEST_F(CodecTest, ExtremePayloads) {
  Payload zeros{};
  EXPECT_EQ(codec::encode(zeros), "00000000000000000000");

  Payload ones{};
  ones.fill(0xFF);
  EXPECT_EQ(codec::encode(ones), "vvvvvvvvvvvvvvvvvvvg");

  auto decoded = codec::decode("vvvvvvvvvvvvvvvvvvvg");
  ASSERT_OK(decoded);
  EXPECT_EQ(*decoded, ones);
}

TEST_F(CodecTest, TokenIsAlwaysTwentyAlphabetCharacters) {
  std::mt19937 gen(42);
  std::uniform_int_distribution<int> dis(0, 255);

  for (int i = 0; i < 200; ++i) {
    Payload payload{};
    for (auto& byte : payload) {
      byte = static_cast<std::uint8_t>(dis(gen));
    }

    auto token = codec::encode(payload);
    ASSERT_EQ(token.size(), kTokenLength);
    for (char c : token) {
      EXPECT_TRUE(codec::isAlphabetChar(c)) << "unexpected '" << c << "' in " << token;
    }

    auto decoded = codec::decode(token);
    ASSERT_OK(decoded);
    EXPECT_EQ(*decoded, payload);
  }
}

TEST_F(CodecTest, EncodingPreservesByteOrder) {
  // Tokens must sort exactly like their payloads
  std::mt19937 gen(7);
  std::uniform_int_distribution<int> dis(0, 255);

  std::set<Payload> payloads;
  while (payloads.size() < 100) {
    Payload payload{};
    for (auto& byte : payload) {
      byte = static_cast<std::uint8_t>(dis(gen));
    }
    payloads.insert(payload);
  }

  std::string previous;
  for (const auto& payload : payloads) {
    auto token = codec::encode(payload);
    EXPECT_LT(previous, token);
    previous = token;
  }
}

TEST_F(CodecTest, RejectsWrongLength) {
  EXPECT_ERROR(codec::decode(""), ErrorCode::kInvalidLength);
  EXPECT_ERROR(codec::decode("9m4e2mr0ui3e8a215n4"), ErrorCode::kInvalidLength);    // 19
  EXPECT_ERROR(codec::decode("9m4e2mr0ui3e8a215n4g0"), ErrorCode::kInvalidLength);  // 21
}

TEST_F(CodecTest, RejectsCharactersOutsideAlphabet) {
  EXPECT_ERROR(codec::decode("9m4e2mr0ui3e8a215nOg"), ErrorCode::kInvalidCharacter);  // uppercase O
  EXPECT_ERROR(codec::decode("9m4e2mr0ui3e8a215nxg"), ErrorCode::kInvalidCharacter);  // x
  EXPECT_ERROR(codec::decode("9M4E2MR0UI3E8A215N4G"), ErrorCode::kInvalidCharacter);
  EXPECT_ERROR(codec::decode("9m4e2mr0ui3e8a215n-g"), ErrorCode::kInvalidCharacter);
}

TEST_F(CodecTest, RejectsNonCanonicalLastCharacter) {
  // Only '0' and 'g' leave the four padding bits clear
  EXPECT_ERROR(codec::decode("9m4e2mr0ui3e8a215n4h"), ErrorCode::kInvalidCharacter);
  EXPECT_ERROR(codec::decode("00000000000000000001"), ErrorCode::kInvalidCharacter);
  EXPECT_OK(codec::decode("0000000000000000000g"));
}

TEST_F(CodecTest, AlphabetMembership) {
  for (char c : kAlphabet) {
    EXPECT_TRUE(codec::isAlphabetChar(c));
  }
  EXPECT_FALSE(codec::isAlphabetChar('w'));
  EXPECT_FALSE(codec::isAlphabetChar('z'));
  EXPECT_FALSE(codec::isAlphabetChar('A'));
  EXPECT_FALSE(codec::isAlphabetChar('_'));
  EXPECT_FALSE(codec::isAlphabetChar('\0'));
}

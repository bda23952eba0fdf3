#include "test_helpers.hpp"

#include <random>
#include <stdexcept>

namespace pxid::test {

void TempDirTest::SetUp() {
  temp_dir_ = std::filesystem::temp_directory_path() / "pxid_test";
  temp_dir_ /= randomString(8);
  std::filesystem::create_directories(temp_dir_);
}

void TempDirTest::TearDown() {
  if (std::filesystem::exists(temp_dir_)) {
    std::filesystem::remove_all(temp_dir_);
  }
}

core::Payload payloadFromHex(std::string_view hex) {
  if (hex.size() != core::kPayloadLength * 2) {
    throw std::invalid_argument("payload hex must be 24 digits");
  }

  core::Payload payload{};
  for (size_t i = 0; i < payload.size(); ++i) {
    payload[i] = static_cast<std::uint8_t>(std::stoul(std::string(hex.substr(i * 2, 2)), nullptr, 16));
  }
  return payload;
}

core::Identity testIdentity() {
  return core::Identity{{0xaa, 0xbb, 0xcc}, {0x12, 0x34}};
}

std::string randomString(size_t length) {
  static const char charset[] = "abcdefghijklmnopqrstuvwxyz0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result += charset[dis(gen)];
  }
  return result;
}

}  // namespace pxid::test

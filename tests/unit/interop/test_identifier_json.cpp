#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "pxid/interop/identifier_json.hpp"
#include "test_helpers.hpp"

using namespace pxid::core;
using namespace pxid::interop;
using namespace pxid::test;
using pxid::ErrorCode;

class IdentifierJsonTest : public ::testing::Test {
 protected:
  Identifier reference() {
    return Identifier::parse("acct_9m4e2mr0ui3e8a215n4g").value();
  }
};

TEST_F(IdentifierJsonTest, SerializesAsTextForm) {
  nlohmann::json j = reference();

  ASSERT_TRUE(j.is_string());
  EXPECT_EQ(j.get<std::string>(), "acct_9m4e2mr0ui3e8a215n4g");
  EXPECT_EQ(j.dump(), "\"acct_9m4e2mr0ui3e8a215n4g\"");
}

TEST_F(IdentifierJsonTest, DeserializesTextForm) {
  auto j = nlohmann::json::parse("\"acct_9m4e2mr0ui3e8a215n4g\"");

  auto id = j.get<Identifier>();
  EXPECT_EQ(id, reference());
}

TEST_F(IdentifierJsonTest, WorksInsideContainers) {
  std::map<std::string, Identifier> records{{"owner", reference()}};
  nlohmann::json j = records;

  EXPECT_EQ(j["owner"], "acct_9m4e2mr0ui3e8a215n4g");

  auto restored = j.get<std::map<std::string, Identifier>>();
  EXPECT_EQ(restored.at("owner"), reference());
}

TEST_F(IdentifierJsonTest, MalformedTextThrowsInvalidArgument) {
  nlohmann::json j = "acct_9m4e2mr0ui3e8a215nOg";
  EXPECT_THROW(j.get<Identifier>(), std::invalid_argument);

  nlohmann::json number = 42;
  EXPECT_THROW(number.get<Identifier>(), std::invalid_argument);
}

TEST_F(IdentifierJsonTest, TryFromJsonReportsErrors) {
  EXPECT_OK(tryIdentifierFromJson(nlohmann::json("acct_9m4e2mr0ui3e8a215n4g")));
  EXPECT_ERROR(tryIdentifierFromJson(nlohmann::json("short")), ErrorCode::kInvalidLength);
  EXPECT_ERROR(tryIdentifierFromJson(nlohmann::json::array()), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(tryIdentifierFromJson(nlohmann::json()), ErrorCode::kInvalidArgument);
}

TEST_F(IdentifierJsonTest, DescriptiveObject) {
  auto j = identifierToJson(reference());

  EXPECT_EQ(j["id"], "acct_9m4e2mr0ui3e8a215n4g");
  EXPECT_EQ(j["prefix"], "acct");
  EXPECT_EQ(j["timestamp"], 1300816219u);
  EXPECT_EQ(j["time"], "2011-03-22T17:50:19Z");
  EXPECT_EQ(j["machine_id"], "60f486");
  EXPECT_EQ(j["process_id"], 58408);
  EXPECT_EQ(j["counter"], 4271561u);
}

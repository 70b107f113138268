#include "sandbox/payload.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;

// NOLINTNEXTLINE
TEST(Payload, ParseFlatObject) {
  sandbox::ResultPayload payload;
  std::string error_msg;
  ASSERT_TRUE(sandbox::ParsePayload(
      R"({"answer": 42, "name": "speed", "ok": true, "xs": [1.5, 2]})",
      &payload, &error_msg))
      << error_msg;
  EXPECT_EQ(payload.size(), 4u);
  EXPECT_EQ(payload["answer"], "42");
  EXPECT_EQ(payload["name"], "\"speed\"");
  EXPECT_EQ(payload["ok"], "true");
  EXPECT_EQ(payload["xs"], "[1.5,2]");
}

// NOLINTNEXTLINE
TEST(Payload, ParseEmptyObject) {
  sandbox::ResultPayload payload;
  std::string error_msg;
  ASSERT_TRUE(sandbox::ParsePayload("{}", &payload, &error_msg));
  EXPECT_THAT(payload, IsEmpty());
}

// NOLINTNEXTLINE
TEST(Payload, RejectsNonObject) {
  sandbox::ResultPayload payload;
  std::string error_msg;
  EXPECT_FALSE(sandbox::ParsePayload("[1, 2, 3]", &payload, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("not a JSON object"));
}

// NOLINTNEXTLINE
TEST(Payload, RejectsInvalidJson) {
  sandbox::ResultPayload payload;
  std::string error_msg;
  EXPECT_FALSE(sandbox::ParsePayload("{\"a\": NaN}", &payload, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("Invalid JSON"));
  EXPECT_FALSE(sandbox::ParsePayload("", &payload, &error_msg));
}

// NOLINTNEXTLINE
TEST(Payload, ToJson) {
  sandbox::ResultPayload payload{{"answer", "42"}, {"label", "\"a\\\"b\""}};
  std::string json = sandbox::PayloadToJson(payload);
  sandbox::ResultPayload decoded;
  std::string error_msg;
  ASSERT_TRUE(sandbox::ParsePayload(json, &decoded, &error_msg)) << error_msg;
  EXPECT_EQ(decoded, payload);
}

}  // namespace

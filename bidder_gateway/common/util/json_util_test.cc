/*
 * Copyright 2024 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "bidder_gateway/common/util/json_util.h"

#include <string>

#include "gtest/gtest.h"

namespace privacy_sandbox::bidder_gateway {
namespace {

TEST(ParseJsonString, WorksForValidJsonString) {
  absl::StatusOr<rapidjson::Document> output =
      ParseJsonString(R"({"id": "req-1", "imp": [{"id": "1"}]})");
  ASSERT_TRUE(output.ok()) << output.status();
  EXPECT_TRUE(output.value().IsObject());
}

TEST(ParseJsonString, AcceptsNullDocument) {
  absl::StatusOr<rapidjson::Document> output = ParseJsonString("null");
  ASSERT_TRUE(output.ok()) << output.status();
  EXPECT_TRUE(output->IsNull());
}

TEST(ParseJsonString, ReturnsInvalidArgumentForInvalidJsonString) {
  absl::StatusOr<rapidjson::Document> output = ParseJsonString("{\"id\": ");
  ASSERT_FALSE(output.ok());
  EXPECT_EQ(output.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ParseJsonString, ReturnsInvalidArgumentForEmptyString) {
  absl::StatusOr<rapidjson::Document> output = ParseJsonString("");
  ASSERT_FALSE(output.ok());
  EXPECT_EQ(output.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(SerializeJsonDoc, WritesCompactJson) {
  rapidjson::Document document;
  document.SetObject();
  document.AddMember("key", "value", document.GetAllocator());
  document.AddMember("price", 1.5, document.GetAllocator());

  absl::StatusOr<std::string> output = SerializeJsonDoc(document);
  ASSERT_TRUE(output.ok()) << output.status();
  EXPECT_EQ(*output, R"({"key":"value","price":1.5})");
}

TEST(FindMember, ReturnsNullForNonObjectsAndMissingKeys) {
  absl::StatusOr<rapidjson::Document> document =
      ParseJsonString(R"({"a": 1, "list": [1]})");
  ASSERT_TRUE(document.ok());

  EXPECT_NE(FindMember(*document, "a"), nullptr);
  EXPECT_EQ(FindMember(*document, "b"), nullptr);
  EXPECT_EQ(FindMember((*document)["list"], "a"), nullptr);
}

TEST(FindMemberIgnoreCase, MatchesKeysCaseInsensitively) {
  absl::StatusOr<rapidjson::Document> document =
      ParseJsonString(R"({"Prebid": {"type": "video"}})");
  ASSERT_TRUE(document.ok());

  const rapidjson::Value* prebid = FindMemberIgnoreCase(*document, "prebid");
  ASSERT_NE(prebid, nullptr);
  EXPECT_TRUE(prebid->IsObject());
  EXPECT_EQ(FindMember(*document, "prebid"), nullptr);
}

TEST(GetStringMember, ReturnsOnlyStrings) {
  absl::StatusOr<rapidjson::Document> document =
      ParseJsonString(R"({"s": "text", "n": 3, "z": null})");
  ASSERT_TRUE(document.ok());

  ASSERT_TRUE(GetStringMember(*document, "s").has_value());
  EXPECT_EQ(*GetStringMember(*document, "s"), "text");
  EXPECT_FALSE(GetStringMember(*document, "n").has_value());
  EXPECT_FALSE(GetStringMember(*document, "z").has_value());
  EXPECT_FALSE(GetStringMember(*document, "missing").has_value());
}

TEST(HasNonNullMember, TreatsNullAsAbsent) {
  absl::StatusOr<rapidjson::Document> document =
      ParseJsonString(R"({"banner": {}, "video": null})");
  ASSERT_TRUE(document.ok());

  EXPECT_TRUE(HasNonNullMember(*document, "banner"));
  EXPECT_FALSE(HasNonNullMember(*document, "video"));
  EXPECT_FALSE(HasNonNullMember(*document, "audio"));
}

}  // namespace
}  // namespace privacy_sandbox::bidder_gateway

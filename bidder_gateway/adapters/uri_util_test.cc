// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "bidder_gateway/adapters/uri_util.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace privacy_sandbox::bidder_gateway {
namespace {

using ::testing::HasSubstr;

TEST(ValidateEndpointTest, AcceptsAbsoluteHttpUris) {
  EXPECT_TRUE(ValidateEndpoint("http://exchange.test/bid").ok());
  EXPECT_TRUE(ValidateEndpoint("https://exchange.test:8443/openrtb2?x=1").ok());
  EXPECT_TRUE(ValidateEndpoint("HTTPS://exchange.test/").ok());
}

TEST(ValidateEndpointTest, AcceptsUrisWithMacros) {
  EXPECT_TRUE(
      ValidateEndpoint("https://exchange.test/{{AccountID}}/bid?x={{Host}}")
          .ok());
}

TEST(ValidateEndpointTest, RejectsEmptyEndpoint) {
  EXPECT_TRUE(absl::IsInvalidArgument(ValidateEndpoint("")));
}

TEST(ValidateEndpointTest, RejectsRelativeOrMalformedUris) {
  absl::Status status = ValidateEndpoint("invalid_url");
  ASSERT_TRUE(absl::IsInvalidArgument(status));
  EXPECT_THAT(status.message(), HasSubstr("invalid_url"));

  EXPECT_TRUE(absl::IsInvalidArgument(ValidateEndpoint("/openrtb2/auction")));
  EXPECT_TRUE(absl::IsInvalidArgument(ValidateEndpoint("http://")));
}

TEST(ValidateEndpointTest, RejectsNonHttpSchemes) {
  EXPECT_TRUE(absl::IsInvalidArgument(ValidateEndpoint("ftp://exchange.test/")));
  EXPECT_TRUE(
      absl::IsInvalidArgument(ValidateEndpoint("file:///etc/bidders")));
}

TEST(UrlEscapeTest, KeepsUnreservedCharacters) {
  EXPECT_EQ(UrlEscape("Supply-123_a.b~c"), "Supply-123_a.b~c");
}

TEST(UrlEscapeTest, PercentEncodesEverythingElse) {
  EXPECT_EQ(UrlEscape("a b/c?d=e&f"), "a%20b%2Fc%3Fd%3De%26f");
  EXPECT_EQ(UrlEscape("\xC3\xA9"), "%C3%A9");
  EXPECT_EQ(UrlEscape(""), "");
}

}  // namespace
}  // namespace privacy_sandbox::bidder_gateway

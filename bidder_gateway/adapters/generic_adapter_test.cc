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


#include "bidder_gateway/adapters/generic_adapter.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace privacy_sandbox::bidder_gateway {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::SizeIs;

constexpr char kEndpoint[] = "https://randomurl.com";

std::shared_ptr<const BidRequest> MakeRequest(absl::string_view json) {
  absl::StatusOr<std::shared_ptr<const BidRequest>> request =
      BidRequest::Create(json);
  EXPECT_TRUE(request.ok()) << request.status();
  return request.ok() ? *std::move(request) : nullptr;
}

class GenericAdapterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    absl::StatusOr<std::unique_ptr<BidderAdapter>> adapter =
        GenericAdapter::Create({.name = "generic", .endpoint = kEndpoint});
    ASSERT_TRUE(adapter.ok()) << adapter.status();
    adapter_ = *std::move(adapter);
  }

  AdapterResult<AdapterBid> ParseOk(std::shared_ptr<const BidRequest> request,
                                    std::string body) const {
    CallSuccess call = {
        .request = {.uri = kEndpoint, .payload = std::move(request)},
        .response = {.status_code = kHttpStatusOk, .body = std::move(body)}};
    return adapter_->ParseResponse(call);
  }

  std::unique_ptr<BidderAdapter> adapter_;
};

TEST_F(GenericAdapterTest, CreationFailsOnInvalidEndpoint) {
  EXPECT_TRUE(absl::IsInvalidArgument(
      GenericAdapter::Create({.name = "generic", .endpoint = "invalid_url"})
          .status()));
}

TEST_F(GenericAdapterTest, ReportsConfiguredName) {
  EXPECT_EQ(adapter_->name(), "generic");
}

TEST_F(GenericAdapterTest, BuildsSinglePostToEndpoint) {
  std::shared_ptr<const BidRequest> request =
      MakeRequest(R"({"id": "a", "imp": [{"id": "1"}, {"id": "2"}]})");

  AdapterResult<OutboundRequest> result = adapter_->BuildRequests(request);

  EXPECT_THAT(result.errors, IsEmpty());
  ASSERT_THAT(result.values, SizeIs(1));
  const OutboundRequest& call = result.values[0];
  EXPECT_EQ(call.method, HttpMethod::kPost);
  EXPECT_EQ(call.uri, kEndpoint);
  EXPECT_EQ(call.body, request->json());
  EXPECT_EQ(call.payload, request);
  EXPECT_THAT(call.headers,
              ElementsAre(Pair(kContentTypeHeader, kJsonContentType),
                          Pair(kAcceptHeader, kJsonAccept)));
}

TEST_F(GenericAdapterTest, BuildIsRepeatable) {
  std::shared_ptr<const BidRequest> request =
      MakeRequest(R"({"id": "a", "imp": [{"id": "1", "banner": {}}]})");

  AdapterResult<OutboundRequest> first = adapter_->BuildRequests(request);
  AdapterResult<OutboundRequest> second = adapter_->BuildRequests(request);

  EXPECT_EQ(first.values, second.values);
  EXPECT_THAT(second.errors, IsEmpty());
}

TEST_F(GenericAdapterTest, RequestWithoutImpressionsBuildsNothing) {
  AdapterResult<OutboundRequest> result =
      adapter_->BuildRequests(MakeRequest(R"({"id": "a"})"));

  EXPECT_THAT(result.values, IsEmpty());
  EXPECT_THAT(result.errors, IsEmpty());
}

TEST_F(GenericAdapterTest, InfersTypeFromRequestedImpression) {
  struct Case {
    absl::string_view imp_json;
    MediaType expected;
  };
  for (const Case& test_case : {
           Case{R"({"id": "123", "banner": {}})", MediaType::kBanner},
           Case{R"({"id": "123", "video": {}})", MediaType::kVideo},
           Case{R"({"id": "123", "native": {}})", MediaType::kNative},
           Case{R"({"id": "123", "audio": {}})", MediaType::kAudio},
           Case{R"({"id": "123"})", MediaType::kBanner},
       }) {
    std::shared_ptr<const BidRequest> request =
        MakeRequest(absl::StrCat(R"({"imp": [)", test_case.imp_json, "]}"));
    AdapterResult<AdapterBid> result = ParseOk(
        request, R"({"seatbid": [{"bid": [{"impid": "123"}]}]})");

    EXPECT_THAT(result.errors, IsEmpty()) << test_case.imp_json;
    ASSERT_THAT(result.values, SizeIs(1)) << test_case.imp_json;
    EXPECT_EQ(result.values[0].media_type, test_case.expected)
        << test_case.imp_json;
    EXPECT_EQ(result.values[0].imp_id, "123");
  }
}

TEST_F(GenericAdapterTest, UnparsableResponseIsSingleError) {
  AdapterResult<AdapterBid> result = ParseOk(nullptr, "invalid");

  EXPECT_THAT(result.values, IsEmpty());
  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_EQ(result.errors[0].type(), AdapterErrorType::kBadServerResponse);
}

TEST_F(GenericAdapterTest, NullResponseOrSeatBidIsEmpty) {
  for (absl::string_view body : {"null", "{}"}) {
    AdapterResult<AdapterBid> result = ParseOk(nullptr, std::string(body));
    EXPECT_THAT(result.values, IsEmpty()) << body;
    EXPECT_THAT(result.errors, IsEmpty()) << body;
  }
}

}  // namespace
}  // namespace privacy_sandbox::bidder_gateway

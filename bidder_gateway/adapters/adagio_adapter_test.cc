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


#include "bidder_gateway/adapters/adagio_adapter.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/strings/match.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace privacy_sandbox::bidder_gateway {
namespace {

using ::testing::Each;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::SizeIs;
using ::testing::UnorderedElementsAre;

constexpr char kEndpoint[] = "http://localhost/prebid_server";

class AdagioAdapterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    absl::StatusOr<std::unique_ptr<BidderAdapter>> adapter =
        AdagioAdapter::Create({.name = "adagio", .endpoint = kEndpoint});
    ASSERT_TRUE(adapter.ok()) << adapter.status();
    adapter_ = *std::move(adapter);

    absl::StatusOr<std::shared_ptr<const BidRequest>> request =
        BidRequest::Create(R"({"imp": [{"id": "imp-1"}]})");
    ASSERT_TRUE(request.ok()) << request.status();
    request_ = *std::move(request);
  }

  AdapterResult<AdapterBid> ParseOk(std::string body) const {
    CallSuccess call = {
        .request = {.uri = kEndpoint, .payload = request_},
        .response = {.status_code = kHttpStatusOk, .body = std::move(body)}};
    return adapter_->ParseResponse(call);
  }

  std::unique_ptr<BidderAdapter> adapter_;
  std::shared_ptr<const BidRequest> request_;
};

TEST_F(AdagioAdapterTest, CreationFailsOnInvalidEndpoint) {
  EXPECT_TRUE(absl::IsInvalidArgument(
      AdagioAdapter::Create({.name = "adagio", .endpoint = "invalid_url"})
          .status()));
}

TEST_F(AdagioAdapterTest, ForwardsDeviceIp) {
  absl::StatusOr<std::shared_ptr<const BidRequest>> request =
      BidRequest::Create(R"JSON({
        "device": {"ua": "someUa", "dnt": 5, "ip": "someIp",
                   "language": "someLanguage"},
        "site": {"page": "somePage"},
        "imp": [{"id": "imp-1"}]
      })JSON");
  ASSERT_TRUE(request.ok()) << request.status();

  AdapterResult<OutboundRequest> result = adapter_->BuildRequests(*request);

  EXPECT_THAT(result.errors, IsEmpty());
  ASSERT_THAT(result.values, SizeIs(1));
  EXPECT_EQ(result.values[0].uri, kEndpoint);
  EXPECT_THAT(result.values[0].headers,
              UnorderedElementsAre(Pair(kContentTypeHeader, kJsonContentType),
                                   Pair(kAcceptHeader, kJsonAccept),
                                   Pair(kXForwardedForHeader, "someIp")));
}

TEST_F(AdagioAdapterTest, OmitsForwardedHeaderWithoutDeviceIp) {
  AdapterResult<OutboundRequest> result = adapter_->BuildRequests(request_);

  ASSERT_THAT(result.values, SizeIs(1));
  EXPECT_THAT(result.values[0].headers,
              UnorderedElementsAre(Pair(kContentTypeHeader, kJsonContentType),
                                   Pair(kAcceptHeader, kJsonAccept)));
}

TEST_F(AdagioAdapterTest, UnparsableResponseIsBadServerResponse) {
  AdapterResult<AdapterBid> result = ParseOk("invalid");

  EXPECT_THAT(result.values, IsEmpty());
  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_EQ(result.errors[0].type(), AdapterErrorType::kBadServerResponse);
  EXPECT_TRUE(absl::StartsWith(result.errors[0].message(), "Failed to decode"));
}

TEST_F(AdagioAdapterTest, NullResponseOrSeatBidIsEmpty) {
  for (absl::string_view body : {"null", "{}"}) {
    AdapterResult<AdapterBid> result = ParseOk(std::string(body));
    EXPECT_THAT(result.values, IsEmpty()) << body;
    EXPECT_THAT(result.errors, IsEmpty()) << body;
  }
}

TEST_F(AdagioAdapterTest, NullExtensionIsBadInput) {
  AdapterResult<AdapterBid> result =
      ParseOk(R"({"cur": "USD", "seatbid": [{"bid": [{"ext": null}]}]})");

  EXPECT_THAT(result.values, IsEmpty());
  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_EQ(result.errors[0].type(), AdapterErrorType::kBadInput);
}

TEST_F(AdagioAdapterTest, EmptyExtensionIsAccepted) {
  AdapterResult<AdapterBid> result =
      ParseOk(R"({"cur": "USD", "seatbid": [{"bid": [{"ext": {}}]}]})");

  EXPECT_THAT(result.errors, IsEmpty());
  EXPECT_THAT(result.values, SizeIs(1));
}

TEST_F(AdagioAdapterTest, KeepsValidBidsNextToInvalidOne) {
  AdapterResult<AdapterBid> result = ParseOk(R"JSON({
    "cur": "USD",
    "seatbid": [{"bid": [
      {"id": "123", "ext": {"Prebid": {"type": "video"}}},
      {"id": "123", "ext": {"Prebid": {"type": "video"}}},
      {"ext": null}
    ]}]
  })JSON");

  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_EQ(result.errors[0].type(), AdapterErrorType::kBadInput);
  ASSERT_THAT(result.values, SizeIs(2));
  EXPECT_THAT(result.values,
              Each(Field(&AdapterBid::media_type, MediaType::kVideo)));
  EXPECT_THAT(result.values, Each(Field(&AdapterBid::bid_id, "123")));
}

}  // namespace
}  // namespace privacy_sandbox::bidder_gateway

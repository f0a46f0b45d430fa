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


#include "bidder_gateway/adapters/bid_response_parser.h"

#include <memory>
#include <string>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace privacy_sandbox::bidder_gateway {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

constexpr char kRequest[] = R"JSON({
  "id": "auction-1",
  "imp": [{"id": "imp-1", "video": {}}, {"id": "imp-2", "banner": {}}]
})JSON";

class ParseBidResponseTest : public ::testing::Test {
 protected:
  void SetUp() override {
    absl::StatusOr<std::shared_ptr<const BidRequest>> request =
        BidRequest::Create(kRequest);
    ASSERT_TRUE(request.ok()) << request.status();
    request_ = *std::move(request);
  }

  CallSuccess MakeCall(int status_code, std::string body) const {
    return {.request = {.method = HttpMethod::kPost,
                        .uri = "https://exchange.test/bid",
                        .body = request_->json(),
                        .payload = request_},
            .response = {.status_code = status_code, .body = std::move(body)}};
  }

  AdapterResult<AdapterBid> Parse(int status_code, std::string body) const {
    return ParseBidResponse(MakeCall(status_code, std::move(body)), resolver_);
  }

  std::shared_ptr<const BidRequest> request_;
  MediaTypeResolver resolver_{ExtensionPolicy::kOptional,
                              {MediaType::kBanner, MediaType::kVideo}};
};

TEST_F(ParseBidResponseTest, NoContentYieldsEmptyResult) {
  AdapterResult<AdapterBid> result = Parse(kHttpStatusNoContent, "");

  EXPECT_THAT(result.values, IsEmpty());
  EXPECT_THAT(result.errors, IsEmpty());
}

TEST_F(ParseBidResponseTest, UnexpectedStatusIsBadServerResponse) {
  AdapterResult<AdapterBid> result = Parse(500, R"({"seatbid": []})");

  EXPECT_THAT(result.values, IsEmpty());
  EXPECT_THAT(result.errors,
              ElementsAre(AdapterError::BadServerResponse(
                  "Unexpected status code: 500. Run with request.debug = 1 "
                  "for more info")));
}

TEST_F(ParseBidResponseTest, UndecodableBodyIsBadServerResponse) {
  AdapterResult<AdapterBid> result = Parse(kHttpStatusOk, "invalid");

  EXPECT_THAT(result.values, IsEmpty());
  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_EQ(result.errors[0].type(), AdapterErrorType::kBadServerResponse);
  EXPECT_THAT(result.errors[0].message(), HasSubstr("Failed to decode"));
}

TEST_F(ParseBidResponseTest, EmptyBodyIsBadServerResponse) {
  AdapterResult<AdapterBid> result = Parse(kHttpStatusOk, "");

  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_EQ(result.errors[0].type(), AdapterErrorType::kBadServerResponse);
}

TEST_F(ParseBidResponseTest, NonObjectDocumentIsBadServerResponse) {
  AdapterResult<AdapterBid> result = Parse(kHttpStatusOk, "[1, 2]");

  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_EQ(result.errors[0].type(), AdapterErrorType::kBadServerResponse);
}

TEST_F(ParseBidResponseTest, NullDocumentOrSeatBidYieldsEmptyResult) {
  for (absl::string_view body :
       {"null", "{}", R"({"seatbid": null})", R"({"seatbid": []})",
        R"({"seatbid": [{"bid": null}, {}]})"}) {
    AdapterResult<AdapterBid> result = Parse(kHttpStatusOk, std::string(body));
    EXPECT_THAT(result.values, IsEmpty()) << body;
    EXPECT_THAT(result.errors, IsEmpty()) << body;
  }
}

TEST_F(ParseBidResponseTest, MalformedSeatBidIsBadServerResponse) {
  AdapterResult<AdapterBid> result =
      Parse(kHttpStatusOk, R"({"seatbid": {"bid": []}})");

  ASSERT_THAT(result.errors, SizeIs(1));
  EXPECT_EQ(result.errors[0].type(), AdapterErrorType::kBadServerResponse);
}

TEST_F(ParseBidResponseTest, ExtractsBidsWithInferredTypes) {
  AdapterResult<AdapterBid> result = Parse(kHttpStatusOk, R"JSON({
    "id": "response-1",
    "seatbid": [
      {"seat": "s1", "bid": [{"id": "bid-1", "impid": "imp-1", "price": 2.5}]},
      {"seat": "s2", "bid": [{"id": "bid-2", "impid": "imp-2", "price": 1}]}
    ]
  })JSON");

  EXPECT_THAT(result.errors, IsEmpty());
  ASSERT_THAT(result.values, SizeIs(2));
  EXPECT_EQ(result.values[0].imp_id, "imp-1");
  EXPECT_EQ(result.values[0].bid_id, "bid-1");
  EXPECT_DOUBLE_EQ(result.values[0].price, 2.5);
  EXPECT_EQ(result.values[0].media_type, MediaType::kVideo);
  EXPECT_EQ(result.values[0].currency, kDefaultCurrency);
  EXPECT_EQ(result.values[0].bid_json,
            R"({"id":"bid-1","impid":"imp-1","price":2.5})");
  EXPECT_EQ(result.values[1].imp_id, "imp-2");
  EXPECT_DOUBLE_EQ(result.values[1].price, 1.0);
  EXPECT_EQ(result.values[1].media_type, MediaType::kBanner);
}

TEST_F(ParseBidResponseTest, ResponseCurrencyAppliesToEveryBid) {
  AdapterResult<AdapterBid> result = Parse(kHttpStatusOk, R"JSON({
    "cur": "EUR",
    "seatbid": [{"bid": [{"impid": "imp-1"}, {"impid": "imp-2"}]}]
  })JSON");

  ASSERT_THAT(result.values, SizeIs(2));
  EXPECT_EQ(result.values[0].currency, "EUR");
  EXPECT_EQ(result.values[1].currency, "EUR");
}

TEST_F(ParseBidResponseTest, BadBidsDoNotStopOtherBids) {
  AdapterResult<AdapterBid> result = Parse(kHttpStatusOk, R"JSON({
    "seatbid": [{"bid": [
      {"id": "bad-type", "impid": "imp-1", "ext": {"prebid": {"type": "x"}}},
      "not-a-bid",
      {"id": "good", "impid": "imp-2"}
    ]}]
  })JSON");

  ASSERT_THAT(result.values, SizeIs(1));
  EXPECT_EQ(result.values[0].bid_id, "good");
  ASSERT_THAT(result.errors, SizeIs(2));
  EXPECT_EQ(result.errors[0].type(), AdapterErrorType::kBadInput);
  EXPECT_EQ(result.errors[1].type(), AdapterErrorType::kBadServerResponse);
}

TEST_F(ParseBidResponseTest, BidWithoutImpressionIdIsBanner) {
  AdapterResult<AdapterBid> result = Parse(
      kHttpStatusOk, R"({"seatbid": [{"bid": [{"id": "b", "price": 3}]}]})");

  EXPECT_THAT(result.errors, IsEmpty());
  ASSERT_THAT(result.values, SizeIs(1));
  EXPECT_EQ(result.values[0].imp_id, "");
  EXPECT_EQ(result.values[0].media_type, MediaType::kBanner);
}

}  // namespace
}  // namespace privacy_sandbox::bidder_gateway

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

#include <optional>
#include <string>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "bidder_gateway/common/util/json_util.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

inline constexpr char kSeatBidKey[] = "seatbid";
inline constexpr char kBidKey[] = "bid";
inline constexpr char kCurrencyKey[] = "cur";

// Appends the bids of one seatbid entry to `result`.
void ParseSeatBid(const rapidjson::Value& seat_bid, int seat_index,
                  absl::string_view currency, const BidRequest* payload,
                  const MediaTypeResolver& resolver,
                  AdapterResult<AdapterBid>& result) {
  if (!seat_bid.IsObject()) {
    result.errors.push_back(AdapterError::BadServerResponse(
        absl::StrCat("seatbid[", seat_index, "] is not an object")));
    return;
  }
  const rapidjson::Value* bids = FindMember(seat_bid, kBidKey);
  if (bids == nullptr || bids->IsNull()) {
    return;
  }
  if (!bids->IsArray()) {
    result.errors.push_back(AdapterError::BadServerResponse(
        absl::StrCat("seatbid[", seat_index, "].bid is not an array")));
    return;
  }
  for (rapidjson::SizeType i = 0; i < bids->Size(); ++i) {
    const rapidjson::Value& bid = (*bids)[i];
    if (!bid.IsObject()) {
      result.errors.push_back(AdapterError::BadServerResponse(absl::StrCat(
          "seatbid[", seat_index, "].bid[", i, "] is not an object")));
      continue;
    }
    absl::StatusOr<MediaType> media_type = resolver.Resolve(bid, payload);
    if (!media_type.ok()) {
      result.errors.push_back(
          AdapterError::BadInput(media_type.status().message()));
      continue;
    }
    absl::StatusOr<std::string> bid_json = SerializeJsonDoc(bid);
    if (!bid_json.ok()) {
      result.errors.push_back(
          AdapterError::BadServerResponse(bid_json.status().message()));
      continue;
    }
    AdapterBid adapter_bid;
    if (std::optional<absl::string_view> imp_id =
            GetStringMember(bid, "impid")) {
      adapter_bid.imp_id = std::string(*imp_id);
    }
    if (std::optional<absl::string_view> bid_id = GetStringMember(bid, "id")) {
      adapter_bid.bid_id = std::string(*bid_id);
    }
    if (const rapidjson::Value* price = FindMember(bid, "price");
        price != nullptr && price->IsNumber()) {
      adapter_bid.price = price->GetDouble();
    }
    adapter_bid.bid_json = *std::move(bid_json);
    adapter_bid.media_type = *media_type;
    adapter_bid.currency = std::string(currency);
    result.values.push_back(std::move(adapter_bid));
  }
}

}  // namespace

AdapterResult<AdapterBid> ParseBidResponse(const CallSuccess& call,
                                           const MediaTypeResolver& resolver) {
  const ExchangeResponse& response = call.response;
  if (response.status_code == kHttpStatusNoContent) {
    return AdapterResult<AdapterBid>::Empty();
  }
  if (response.status_code != kHttpStatusOk) {
    return AdapterResult<AdapterBid>::WithError(
        AdapterError::BadServerResponse(absl::StrCat(
            "Unexpected status code: ", response.status_code,
            ". Run with request.debug = 1 for more info")));
  }

  absl::StatusOr<rapidjson::Document> document =
      ParseJsonString(response.body);
  if (!document.ok()) {
    return AdapterResult<AdapterBid>::WithError(AdapterError::BadServerResponse(
        absl::StrCat("Failed to decode: ", document.status().message())));
  }
  if (document->IsNull()) {
    return AdapterResult<AdapterBid>::Empty();
  }
  if (!document->IsObject()) {
    return AdapterResult<AdapterBid>::WithError(AdapterError::BadServerResponse(
        "Failed to decode: bid response is not a JSON object"));
  }

  const rapidjson::Value* seat_bids = FindMember(*document, kSeatBidKey);
  if (seat_bids == nullptr || seat_bids->IsNull()) {
    return AdapterResult<AdapterBid>::Empty();
  }
  if (!seat_bids->IsArray()) {
    return AdapterResult<AdapterBid>::WithError(AdapterError::BadServerResponse(
        "Failed to decode: seatbid is not an array"));
  }

  absl::string_view currency = kDefaultCurrency;
  if (std::optional<absl::string_view> cur =
          GetStringMember(*document, kCurrencyKey);
      cur && !cur->empty()) {
    currency = *cur;
  }

  AdapterResult<AdapterBid> result;
  for (rapidjson::SizeType i = 0; i < seat_bids->Size(); ++i) {
    ParseSeatBid((*seat_bids)[i], static_cast<int>(i), currency,
                 call.request.payload.get(), resolver, result);
  }
  return result;
}

}  // namespace privacy_sandbox::bidder_gateway

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

#ifndef BIDDER_GATEWAY_ADAPTERS_ADAPTER_BID_H_
#define BIDDER_GATEWAY_ADAPTERS_ADAPTER_BID_H_

#include <string>

#include "bidder_gateway/openrtb/media_type.h"

namespace privacy_sandbox::bidder_gateway {

inline constexpr char kDefaultCurrency[] = "USD";

// A bid returned by an exchange, normalized for downstream ranking.
struct AdapterBid {
  // "impid" of the bid; matches an impression of the originating request.
  std::string imp_id;
  // "id" and "price" of the bid, copied out for logging and ranking.
  std::string bid_id;
  double price = 0.0;
  // The exchange's bid object, serialized as compact JSON and otherwise
  // left untouched.
  std::string bid_json;
  MediaType media_type = MediaType::kBanner;
  // "cur" of the seat bid response the bid came in.
  std::string currency = kDefaultCurrency;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_ADAPTERS_ADAPTER_BID_H_

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

#ifndef BIDDER_GATEWAY_ADAPTERS_BID_RESPONSE_PARSER_H_
#define BIDDER_GATEWAY_ADAPTERS_BID_RESPONSE_PARSER_H_

#include "bidder_gateway/adapters/adapter_bid.h"
#include "bidder_gateway/adapters/adapter_result.h"
#include "bidder_gateway/adapters/http_call.h"
#include "bidder_gateway/adapters/media_type_resolver.h"

namespace privacy_sandbox::bidder_gateway {

// Parses an OpenRTB bid response received from an exchange.
//
// 204 yields nothing. Any status other than 200 and 204, or a body that is
// not JSON, yields a single kBadServerResponse error. A JSON null body or a
// response without "seatbid" is a valid no-bid. Otherwise every
// seatbid[].bid[] entry is resolved with `resolver`; an entry that cannot
// be used produces one error and its siblings are still returned.
AdapterResult<AdapterBid> ParseBidResponse(const CallSuccess& call,
                                           const MediaTypeResolver& resolver);

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_ADAPTERS_BID_RESPONSE_PARSER_H_

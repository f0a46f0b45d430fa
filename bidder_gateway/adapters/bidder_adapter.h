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

#ifndef BIDDER_GATEWAY_ADAPTERS_BIDDER_ADAPTER_H_
#define BIDDER_GATEWAY_ADAPTERS_BIDDER_ADAPTER_H_

#include <memory>
#include <string>

#include "absl/strings/string_view.h"
#include "bidder_gateway/adapters/adapter_bid.h"
#include "bidder_gateway/adapters/adapter_result.h"
#include "bidder_gateway/adapters/http_call.h"
#include "bidder_gateway/openrtb/bid_request.h"

namespace privacy_sandbox::bidder_gateway {

// Configuration an adapter instance is created from.
struct AdapterConfig {
  // Registry key, e.g. "generic".
  std::string name;
  // Absolute http(s) URI. May contain {{Macro}} placeholders the adapter
  // fills in per call.
  std::string endpoint;
};

// Interface for one exchange integration. Implementations are created once
// per process through a static factory that validates the configuration and
// are immutable afterwards, so both operations may run concurrently from
// any thread.
class BidderAdapter {
 public:
  virtual ~BidderAdapter() = default;

  virtual absl::string_view name() const = 0;

  // Translates the canonical request into the calls to issue. Problems with
  // a single impression are reported as kBadInput errors and that impression
  // is skipped.
  virtual AdapterResult<OutboundRequest> BuildRequests(
      const std::shared_ptr<const BidRequest>& request) const = 0;

  // Translates one received response into bids. Failed calls never reach
  // this method.
  virtual AdapterResult<AdapterBid> ParseResponse(
      const CallSuccess& call) const = 0;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_ADAPTERS_BIDDER_ADAPTER_H_

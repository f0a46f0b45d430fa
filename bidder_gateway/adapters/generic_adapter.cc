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

#include <utility>
#include <vector>

#include "bidder_gateway/adapters/bid_response_parser.h"
#include "bidder_gateway/adapters/uri_util.h"
#include "bidder_gateway/common/util/status_macros.h"

namespace privacy_sandbox::bidder_gateway {

absl::StatusOr<std::unique_ptr<BidderAdapter>> GenericAdapter::Create(
    const AdapterConfig& config) {
  BG_RETURN_IF_ERROR(ValidateEndpoint(config.endpoint));
  return std::unique_ptr<BidderAdapter>(new GenericAdapter(
      config, MediaTypeResolver(ExtensionPolicy::kOptional,
                                {MediaType::kBanner, MediaType::kVideo,
                                 MediaType::kNative, MediaType::kAudio})));
}

GenericAdapter::GenericAdapter(const AdapterConfig& config,
                               MediaTypeResolver resolver)
    : name_(config.name),
      endpoint_(config.endpoint),
      resolver_(std::move(resolver)) {}

HttpHeaders GenericAdapter::MakeHeaders(const BidRequest& request) const {
  return {{kContentTypeHeader, kJsonContentType}, {kAcceptHeader, kJsonAccept}};
}

AdapterResult<OutboundRequest> GenericAdapter::BuildRequests(
    const std::shared_ptr<const BidRequest>& request) const {
  if (request == nullptr || request->imps().empty()) {
    return AdapterResult<OutboundRequest>::Empty();
  }
  std::vector<OutboundRequest> calls;
  calls.push_back({.method = HttpMethod::kPost,
                   .uri = endpoint_,
                   .headers = MakeHeaders(*request),
                   .body = request->json(),
                   .payload = request});
  return AdapterResult<OutboundRequest>::WithValues(std::move(calls));
}

AdapterResult<AdapterBid> GenericAdapter::ParseResponse(
    const CallSuccess& call) const {
  return ParseBidResponse(call, resolver_);
}

}  // namespace privacy_sandbox::bidder_gateway

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

#include "bidder_gateway/adapters/axonix_adapter.h"

#include <optional>
#include <utility>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "bidder_gateway/adapters/bid_response_parser.h"
#include "bidder_gateway/adapters/generic_adapter.h"
#include "bidder_gateway/adapters/uri_util.h"
#include "bidder_gateway/common/util/json_util.h"
#include "bidder_gateway/common/util/status_macros.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

// Reads imp.ext.bidder.supplyId.
absl::StatusOr<std::string> GetSupplyId(const Impression& imp) {
  const rapidjson::Value* ext = FindMember(*imp.json, "ext");
  const rapidjson::Value* bidder =
      ext != nullptr ? FindMember(*ext, "bidder") : nullptr;
  if (bidder == nullptr || !bidder->IsObject()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Missing bidder ext in impression ", imp.id));
  }
  std::optional<absl::string_view> supply_id =
      GetStringMember(*bidder, "supplyId");
  if (!supply_id || supply_id->empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Missing supplyId in impression ", imp.id));
  }
  return std::string(*supply_id);
}

}  // namespace

absl::StatusOr<std::unique_ptr<BidderAdapter>> AxonixAdapter::Create(
    const AdapterConfig& config) {
  BG_RETURN_IF_ERROR(ValidateEndpoint(config.endpoint));
  if (!absl::StrContains(config.endpoint, kAccountIdMacro)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Endpoint of ", config.name, " must contain ", kAccountIdMacro));
  }
  return std::unique_ptr<BidderAdapter>(new AxonixAdapter(config));
}

AxonixAdapter::AxonixAdapter(const AdapterConfig& config)
    : name_(config.name),
      endpoint_template_(config.endpoint),
      resolver_(ExtensionPolicy::kOptional,
                {MediaType::kBanner, MediaType::kVideo, MediaType::kNative,
                 MediaType::kAudio}) {}

AdapterResult<OutboundRequest> AxonixAdapter::BuildRequests(
    const std::shared_ptr<const BidRequest>& request) const {
  AdapterResult<OutboundRequest> result;
  if (request == nullptr) {
    return result;
  }
  const std::vector<Impression>& imps = request->imps();
  for (size_t i = 0; i < imps.size(); ++i) {
    absl::StatusOr<std::string> supply_id = GetSupplyId(imps[i]);
    if (!supply_id.ok()) {
      result.errors.push_back(
          AdapterError::BadInput(supply_id.status().message()));
      continue;
    }
    absl::StatusOr<std::shared_ptr<const BidRequest>> subset =
        request->WithSingleImp(i);
    if (!subset.ok()) {
      result.errors.push_back(
          AdapterError::BadInput(subset.status().message()));
      continue;
    }
    OutboundRequest call = {
        .method = HttpMethod::kPost,
        .uri = absl::StrReplaceAll(endpoint_template_,
                                   {{kAccountIdMacro, UrlEscape(*supply_id)}}),
        .headers = {{kContentTypeHeader, kJsonContentType},
                    {kAcceptHeader, kJsonAccept}},
        .body = (*subset)->json(),
        .payload = *std::move(subset)};
    result.values.push_back(std::move(call));
  }
  return result;
}

AdapterResult<AdapterBid> AxonixAdapter::ParseResponse(
    const CallSuccess& call) const {
  return ParseBidResponse(call, resolver_);
}

}  // namespace privacy_sandbox::bidder_gateway

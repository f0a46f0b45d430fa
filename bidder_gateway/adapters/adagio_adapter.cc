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

#include <optional>
#include <string>
#include <utility>

#include "bidder_gateway/adapters/uri_util.h"
#include "bidder_gateway/common/util/status_macros.h"

namespace privacy_sandbox::bidder_gateway {

absl::StatusOr<std::unique_ptr<BidderAdapter>> AdagioAdapter::Create(
    const AdapterConfig& config) {
  BG_RETURN_IF_ERROR(ValidateEndpoint(config.endpoint));
  return std::unique_ptr<BidderAdapter>(new AdagioAdapter(
      config, MediaTypeResolver(ExtensionPolicy::kRequired,
                                {MediaType::kBanner, MediaType::kVideo,
                                 MediaType::kNative, MediaType::kAudio})));
}

HttpHeaders AdagioAdapter::MakeHeaders(const BidRequest& request) const {
  HttpHeaders headers = GenericAdapter::MakeHeaders(request);
  if (std::optional<std::string> ip = request.DeviceIp()) {
    headers.emplace_back(kXForwardedForHeader, *std::move(ip));
  }
  return headers;
}

}  // namespace privacy_sandbox::bidder_gateway

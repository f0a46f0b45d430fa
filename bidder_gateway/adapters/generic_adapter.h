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

#ifndef BIDDER_GATEWAY_ADAPTERS_GENERIC_ADAPTER_H_
#define BIDDER_GATEWAY_ADAPTERS_GENERIC_ADAPTER_H_

#include <memory>
#include <string>

#include "absl/status/statusor.h"
#include "bidder_gateway/adapters/bidder_adapter.h"
#include "bidder_gateway/adapters/media_type_resolver.h"

namespace privacy_sandbox::bidder_gateway {

inline constexpr char kContentTypeHeader[] = "Content-Type";
inline constexpr char kAcceptHeader[] = "Accept";
inline constexpr char kJsonContentType[] = "application/json;charset=utf-8";
inline constexpr char kJsonAccept[] = "application/json";

// Forwards the whole request, unchanged, in a single POST to a static
// endpoint and reads back a standard OpenRTB response.
//
// Bids may carry ext.prebid.type. When they don't and the impression
// declares several formats, the first of banner, video, native, audio wins.
class GenericAdapter : public BidderAdapter {
 public:
  static absl::StatusOr<std::unique_ptr<BidderAdapter>> Create(
      const AdapterConfig& config);

  absl::string_view name() const override { return name_; }

  AdapterResult<OutboundRequest> BuildRequests(
      const std::shared_ptr<const BidRequest>& request) const override;

  AdapterResult<AdapterBid> ParseResponse(
      const CallSuccess& call) const override;

 protected:
  GenericAdapter(const AdapterConfig& config, MediaTypeResolver resolver);

  // Headers sent with every call.
  virtual HttpHeaders MakeHeaders(const BidRequest& request) const;

 private:
  const std::string name_;
  const std::string endpoint_;
  const MediaTypeResolver resolver_;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_ADAPTERS_GENERIC_ADAPTER_H_

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

#ifndef BIDDER_GATEWAY_ADAPTERS_ADAGIO_ADAPTER_H_
#define BIDDER_GATEWAY_ADAPTERS_ADAGIO_ADAPTER_H_

#include <memory>

#include "absl/status/statusor.h"
#include "bidder_gateway/adapters/generic_adapter.h"

namespace privacy_sandbox::bidder_gateway {

inline constexpr char kXForwardedForHeader[] = "X-Forwarded-For";

// Adagio speaks plain OpenRTB like GenericAdapter, and additionally:
//  - forwards the device IP in X-Forwarded-For,
//  - requires every response bid to carry "ext". A bid with a missing or
//    null "ext" is dropped with a kBadInput error; an empty object falls
//    back to inference (banner, video, native, audio for multi-format
//    impressions).
class AdagioAdapter final : public GenericAdapter {
 public:
  static absl::StatusOr<std::unique_ptr<BidderAdapter>> Create(
      const AdapterConfig& config);

 protected:
  using GenericAdapter::GenericAdapter;

  HttpHeaders MakeHeaders(const BidRequest& request) const override;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_ADAPTERS_ADAGIO_ADAPTER_H_

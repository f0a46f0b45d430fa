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

#ifndef BIDDER_GATEWAY_ADAPTERS_MEDIA_TYPE_RESOLVER_H_
#define BIDDER_GATEWAY_ADAPTERS_MEDIA_TYPE_RESOLVER_H_

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "bidder_gateway/openrtb/bid_request.h"
#include "bidder_gateway/openrtb/media_type.h"
#include "rapidjson/document.h"

namespace privacy_sandbox::bidder_gateway {

enum class ExtensionPolicy : std::uint8_t {
  // A bid without "ext" has no override and goes straight to inference.
  kOptional,
  // Every bid must carry a non-null "ext".
  kRequired,
};

// Maps a response bid to the media type of the ad it carries.
//
// bid.ext.prebid.type, when present, wins. Otherwise the type is inferred
// from the formats declared by the impression the bid's "impid" points at:
// the single declared format, banner when none is declared, or the first
// entry of `multi_format_precedence` the impression declares when several
// are. Returns InvalidArgument when the extension block is malformed (or
// missing under kRequired) or when several formats are declared and none is
// listed in the precedence.
class MediaTypeResolver {
 public:
  MediaTypeResolver(ExtensionPolicy extension_policy,
                    std::vector<MediaType> multi_format_precedence)
      : extension_policy_(extension_policy),
        multi_format_precedence_(std::move(multi_format_precedence)) {}

  // `payload` may be null, in which case inference yields banner.
  absl::StatusOr<MediaType> Resolve(const rapidjson::Value& bid,
                                    const BidRequest* payload) const;

 private:
  absl::StatusOr<MediaType> InferFromImpression(const Impression& imp) const;

  const ExtensionPolicy extension_policy_;
  const std::vector<MediaType> multi_format_precedence_;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_ADAPTERS_MEDIA_TYPE_RESOLVER_H_

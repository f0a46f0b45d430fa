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

#ifndef BIDDER_GATEWAY_OPENRTB_MEDIA_TYPE_H_
#define BIDDER_GATEWAY_OPENRTB_MEDIA_TYPE_H_

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>

#include "absl/strings/string_view.h"

namespace privacy_sandbox::bidder_gateway {

// Ad formats an impression can declare and a bid can resolve to.
enum class MediaType : std::uint8_t { kBanner, kVideo, kAudio, kNative };

// Order in which an impression's format objects are inspected.
inline constexpr std::array<MediaType, 4> kAllMediaTypes = {
    MediaType::kBanner, MediaType::kVideo, MediaType::kAudio,
    MediaType::kNative};

// Returns the OpenRTB object name of the format: "banner", "video", "audio"
// or "native".
absl::string_view MediaTypeToString(MediaType media_type);

// Inverse of MediaTypeToString. Matching is exact.
std::optional<MediaType> MediaTypeFromString(absl::string_view name);

std::ostream& operator<<(std::ostream& os, MediaType media_type);

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_OPENRTB_MEDIA_TYPE_H_

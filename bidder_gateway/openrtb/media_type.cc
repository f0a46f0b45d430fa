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

#include "bidder_gateway/openrtb/media_type.h"

namespace privacy_sandbox::bidder_gateway {

absl::string_view MediaTypeToString(MediaType media_type) {
  switch (media_type) {
    case MediaType::kBanner:
      return "banner";
    case MediaType::kVideo:
      return "video";
    case MediaType::kAudio:
      return "audio";
    case MediaType::kNative:
      return "native";
  }
  return "unknown";
}

std::optional<MediaType> MediaTypeFromString(absl::string_view name) {
  for (MediaType media_type : kAllMediaTypes) {
    if (MediaTypeToString(media_type) == name) {
      return media_type;
    }
  }
  return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, MediaType media_type) {
  return os << MediaTypeToString(media_type);
}

}  // namespace privacy_sandbox::bidder_gateway

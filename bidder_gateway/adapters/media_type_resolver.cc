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

#include "bidder_gateway/adapters/media_type_resolver.h"

#include <optional>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "bidder_gateway/common/util/json_util.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

inline constexpr char kExtKey[] = "ext";
inline constexpr char kPrebidKey[] = "prebid";
inline constexpr char kTypeKey[] = "type";
inline constexpr char kImpIdKey[] = "impid";

std::string BidLabel(const rapidjson::Value& bid) {
  std::optional<absl::string_view> id = GetStringMember(bid, "id");
  return id ? absl::StrCat("bid \"", *id, "\"") : "bid";
}

}  // namespace

absl::StatusOr<MediaType> MediaTypeResolver::Resolve(
    const rapidjson::Value& bid, const BidRequest* payload) const {
  const rapidjson::Value* ext = FindMember(bid, kExtKey);
  if (ext == nullptr || ext->IsNull()) {
    if (extension_policy_ == ExtensionPolicy::kRequired) {
      return absl::InvalidArgumentError(
          absl::StrCat("Missing ext in ", BidLabel(bid)));
    }
  } else {
    if (!ext->IsObject()) {
      return absl::InvalidArgumentError(
          absl::StrCat("ext of ", BidLabel(bid), " is not an object"));
    }
    const rapidjson::Value* prebid = FindMemberIgnoreCase(*ext, kPrebidKey);
    if (prebid != nullptr && !prebid->IsNull()) {
      if (!prebid->IsObject()) {
        return absl::InvalidArgumentError(
            absl::StrCat("ext.prebid of ", BidLabel(bid), " is not an object"));
      }
      const rapidjson::Value* type = FindMember(*prebid, kTypeKey);
      if (type != nullptr && !type->IsNull()) {
        if (!type->IsString()) {
          return absl::InvalidArgumentError(absl::StrCat(
              "ext.prebid.type of ", BidLabel(bid), " is not a string"));
        }
        absl::string_view type_name(type->GetString(),
                                    type->GetStringLength());
        std::optional<MediaType> media_type = MediaTypeFromString(type_name);
        if (!media_type) {
          return absl::InvalidArgumentError(
              absl::StrCat("Unknown media type \"", type_name, "\" in ",
                           BidLabel(bid)));
        }
        return *media_type;
      }
    }
  }

  if (payload == nullptr) {
    return MediaType::kBanner;
  }
  std::optional<absl::string_view> imp_id = GetStringMember(bid, kImpIdKey);
  const Impression* imp =
      imp_id ? payload->FindImp(*imp_id) : nullptr;
  if (imp == nullptr) {
    return MediaType::kBanner;
  }
  return InferFromImpression(*imp);
}

absl::StatusOr<MediaType> MediaTypeResolver::InferFromImpression(
    const Impression& imp) const {
  if (imp.formats.empty()) {
    return MediaType::kBanner;
  }
  if (imp.formats.size() == 1) {
    return imp.formats.front();
  }
  for (MediaType candidate : multi_format_precedence_) {
    if (imp.HasFormat(candidate)) {
      return candidate;
    }
  }
  return absl::InvalidArgumentError(absl::StrCat(
      "Ambiguous media type for impression \"", imp.id, "\" declaring [",
      absl::StrJoin(imp.formats, ", ",
                    [](std::string* out, MediaType media_type) {
                      absl::StrAppend(out, MediaTypeToString(media_type));
                    }),
      "]"));
}

}  // namespace privacy_sandbox::bidder_gateway

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

#include "bidder_gateway/openrtb/bid_request.h"

#include <algorithm>
#include <utility>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "bidder_gateway/common/util/json_util.h"
#include "bidder_gateway/common/util/status_macros.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

inline constexpr char kImpKey[] = "imp";

}  // namespace

bool Impression::HasFormat(MediaType media_type) const {
  return std::find(formats.begin(), formats.end(), media_type) !=
         formats.end();
}

BidRequest::BidRequest(rapidjson::Document document)
    : document_(std::move(document)) {}

absl::StatusOr<std::shared_ptr<const BidRequest>> BidRequest::Create(
    absl::string_view json) {
  BG_ASSIGN_OR_RETURN(rapidjson::Document document, ParseJsonString(json));
  return FromDocument(std::move(document));
}

absl::StatusOr<std::shared_ptr<const BidRequest>> BidRequest::FromDocument(
    rapidjson::Document document) {
  std::shared_ptr<BidRequest> request(new BidRequest(std::move(document)));
  BG_RETURN_IF_ERROR(request->Init());
  return std::shared_ptr<const BidRequest>(std::move(request));
}

absl::Status BidRequest::Init() {
  if (!document_.IsObject()) {
    return absl::InvalidArgumentError("Bid request is not a JSON object");
  }
  if (std::optional<absl::string_view> id = GetStringMember(document_, "id")) {
    id_ = std::string(*id);
  }

  const rapidjson::Value* imps = FindMember(document_, kImpKey);
  if (imps != nullptr && !imps->IsNull()) {
    if (!imps->IsArray()) {
      return absl::InvalidArgumentError("Bid request \"imp\" is not an array");
    }
    absl::flat_hash_set<std::string> seen_ids;
    imps_.reserve(imps->Size());
    for (rapidjson::SizeType i = 0; i < imps->Size(); ++i) {
      const rapidjson::Value& imp = (*imps)[i];
      if (!imp.IsObject()) {
        return absl::InvalidArgumentError(
            absl::StrCat("imp[", i, "] is not an object"));
      }
      std::optional<absl::string_view> imp_id = GetStringMember(imp, "id");
      if (!imp_id) {
        return absl::InvalidArgumentError(
            absl::StrCat("imp[", i, "] has no string \"id\""));
      }
      if (!seen_ids.emplace(*imp_id).second) {
        return absl::InvalidArgumentError(
            absl::StrCat("Duplicate impression id: ", *imp_id));
      }
      Impression impression;
      impression.id = std::string(*imp_id);
      impression.json = &imp;
      for (MediaType media_type : kAllMediaTypes) {
        if (HasNonNullMember(imp, MediaTypeToString(media_type))) {
          impression.formats.push_back(media_type);
        }
      }
      imps_.push_back(std::move(impression));
    }
  }

  BG_ASSIGN_OR_RETURN(json_, SerializeJsonDoc(document_));
  return absl::OkStatus();
}

const Impression* BidRequest::FindImp(absl::string_view imp_id) const {
  for (const Impression& imp : imps_) {
    if (imp.id == imp_id) {
      return &imp;
    }
  }
  return nullptr;
}

std::optional<std::string> BidRequest::DeviceIp() const {
  const rapidjson::Value* device = FindMember(document_, "device");
  if (device == nullptr) {
    return std::nullopt;
  }
  for (absl::string_view key : {"ip", "ipv6"}) {
    std::optional<absl::string_view> ip = GetStringMember(*device, key);
    if (ip && !ip->empty()) {
      return std::string(*ip);
    }
  }
  return std::nullopt;
}

absl::StatusOr<std::shared_ptr<const BidRequest>> BidRequest::WithSingleImp(
    std::size_t imp_index) const {
  if (imp_index >= imps_.size()) {
    return absl::OutOfRangeError(absl::StrCat(
        "Impression index ", imp_index, " out of ", imps_.size()));
  }
  rapidjson::Document subset;
  subset.CopyFrom(document_, subset.GetAllocator());
  rapidjson::Value single_imp(rapidjson::kArrayType);
  single_imp.PushBack(
      rapidjson::Value(*imps_[imp_index].json, subset.GetAllocator()),
      subset.GetAllocator());
  subset[kImpKey].Swap(single_imp);
  return FromDocument(std::move(subset));
}

}  // namespace privacy_sandbox::bidder_gateway

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

#include "bidder_gateway/common/util/json_util.h"

#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "rapidjson/error/en.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

namespace privacy_sandbox::bidder_gateway {

absl::StatusOr<rapidjson::Document> ParseJsonString(absl::string_view str) {
  rapidjson::Document document;
  document.Parse<rapidjson::kParseFullPrecisionFlag>(str.data(), str.size());
  if (document.HasParseError()) {
    return absl::InvalidArgumentError(absl::StrCat(
        kJsonParseError, " at offset ", document.GetErrorOffset(), ": ",
        rapidjson::GetParseError_En(document.GetParseError())));
  }
  return document;
}

absl::StatusOr<std::string> SerializeJsonDoc(const rapidjson::Value& value) {
  rapidjson::StringBuffer string_buffer;
  rapidjson::Writer<rapidjson::StringBuffer> writer(string_buffer);
  if (!value.Accept(writer)) {
    return absl::InternalError("Error serializing JSON value");
  }
  return std::string(string_buffer.GetString(), string_buffer.GetSize());
}

const rapidjson::Value* FindMember(const rapidjson::Value& object,
                                   absl::string_view key) {
  if (!object.IsObject()) {
    return nullptr;
  }
  rapidjson::Value::ConstMemberIterator it = object.FindMember(
      rapidjson::Value(rapidjson::StringRef(key.data(), key.size())));
  if (it == object.MemberEnd()) {
    return nullptr;
  }
  return &it->value;
}

const rapidjson::Value* FindMemberIgnoreCase(const rapidjson::Value& object,
                                             absl::string_view key) {
  if (!object.IsObject()) {
    return nullptr;
  }
  for (const auto& member : object.GetObject()) {
    absl::string_view name(member.name.GetString(),
                           member.name.GetStringLength());
    if (absl::EqualsIgnoreCase(name, key)) {
      return &member.value;
    }
  }
  return nullptr;
}

std::optional<absl::string_view> GetStringMember(const rapidjson::Value& object,
                                                 absl::string_view key) {
  const rapidjson::Value* value = FindMember(object, key);
  if (value == nullptr || !value->IsString()) {
    return std::nullopt;
  }
  return absl::string_view(value->GetString(), value->GetStringLength());
}

bool HasNonNullMember(const rapidjson::Value& object, absl::string_view key) {
  const rapidjson::Value* value = FindMember(object, key);
  return value != nullptr && !value->IsNull();
}

}  // namespace privacy_sandbox::bidder_gateway

/*
 * Copyright 2024 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef BIDDER_GATEWAY_COMMON_UTIL_JSON_UTIL_H_
#define BIDDER_GATEWAY_COMMON_UTIL_JSON_UTIL_H_

#include <optional>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "rapidjson/document.h"

namespace privacy_sandbox::bidder_gateway {

inline constexpr char kJsonParseError[] = "JSON parse error";

// Parses a JSON string into a rapidjson document. Returns an
// InvalidArgument error describing the offset and reason on failure.
absl::StatusOr<rapidjson::Document> ParseJsonString(absl::string_view str);

// Serializes a rapidjson value into a compact JSON string.
absl::StatusOr<std::string> SerializeJsonDoc(const rapidjson::Value& value);

// Returns the member named `key` of `object`, or nullptr if `object` is not
// a JSON object or has no such member.
const rapidjson::Value* FindMember(const rapidjson::Value& object,
                                   absl::string_view key);

// Same as FindMember, with ASCII case-insensitive key comparison. The first
// matching member wins.
const rapidjson::Value* FindMemberIgnoreCase(const rapidjson::Value& object,
                                             absl::string_view key);

// Returns the string member `key` of `object` if present and a string.
std::optional<absl::string_view> GetStringMember(const rapidjson::Value& object,
                                                 absl::string_view key);

// Returns true if `object` has a member `key` that is neither absent nor
// JSON null.
bool HasNonNullMember(const rapidjson::Value& object, absl::string_view key);

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_UTIL_JSON_UTIL_H_

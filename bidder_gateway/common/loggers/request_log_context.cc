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

#include "bidder_gateway/common/loggers/request_log_context.h"

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

std::string FormatContext(
    const absl::btree_map<std::string, std::string>& context_map) {
  std::vector<std::string> pairs;
  for (const auto& [key, value] : context_map) {
    if (!value.empty()) {
      pairs.push_back(absl::StrCat(key, ": ", value));
    }
  }
  if (pairs.empty()) {
    return "";
  }
  return absl::StrCat("(", absl::StrJoin(pairs, ", "), ") ");
}

}  // namespace

RequestLogContext::RequestLogContext(
    const absl::btree_map<std::string, std::string>& context_map)
    : context_str_(FormatContext(context_map)) {}

}  // namespace privacy_sandbox::bidder_gateway

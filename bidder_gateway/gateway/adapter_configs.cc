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

#include "bidder_gateway/gateway/adapter_configs.h"

#include <optional>
#include <utility>

#include "absl/algorithm/container.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

bool IsAdapterNameChar(char c) {
  return absl::ascii_isalnum(c) || c == '_' || c == '-';
}

bool IsSchemeChar(char c) {
  return absl::ascii_isalnum(c) || c == '+' || c == '-' || c == '.';
}

// Splits "name=scheme://..." into its name and endpoint. Returns nullopt for
// anything else, including a comma separated fragment of an endpoint's query
// string such as "b=2".
std::optional<std::pair<absl::string_view, absl::string_view>> SplitEntry(
    absl::string_view segment) {
  std::pair<absl::string_view, absl::string_view> name_and_endpoint =
      absl::StrSplit(segment, absl::MaxSplits('=', 1));
  absl::string_view name = absl::StripAsciiWhitespace(name_and_endpoint.first);
  absl::string_view endpoint =
      absl::StripAsciiWhitespace(name_and_endpoint.second);
  if (name.empty() || !absl::c_all_of(name, IsAdapterNameChar)) {
    return std::nullopt;
  }
  const size_t scheme_end = endpoint.find("://");
  if (scheme_end == absl::string_view::npos || scheme_end == 0 ||
      !absl::ascii_isalpha(endpoint[0]) ||
      !absl::c_all_of(endpoint.substr(0, scheme_end), IsSchemeChar)) {
    return std::nullopt;
  }
  return std::make_pair(name, endpoint);
}

}  // namespace

absl::StatusOr<std::vector<AdapterConfig>> BuildAdapterConfigs(
    absl::string_view adapter_endpoints) {
  std::vector<AdapterConfig> configs;
  for (absl::string_view segment :
       absl::StrSplit(adapter_endpoints, ',', absl::SkipWhitespace())) {
    segment = absl::StripAsciiWhitespace(segment);
    if (std::optional<std::pair<absl::string_view, absl::string_view>> entry =
            SplitEntry(segment)) {
      configs.push_back({.name = std::string(entry->first),
                         .endpoint = std::string(entry->second)});
      continue;
    }
    if (configs.empty()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Malformed adapter endpoint entry \"", segment,
          "\", expected name=scheme://endpoint"));
    }
    // A comma inside the previous endpoint, e.g. "?sizes=300x250,728x90".
    absl::StrAppend(&configs.back().endpoint, ",", segment);
  }
  return configs;
}

std::vector<std::string> ParseAdapterNames(absl::string_view names) {
  std::vector<std::string> result;
  for (absl::string_view name :
       absl::StrSplit(names, ',', absl::SkipWhitespace())) {
    result.emplace_back(absl::StripAsciiWhitespace(name));
  }
  return result;
}

}  // namespace privacy_sandbox::bidder_gateway

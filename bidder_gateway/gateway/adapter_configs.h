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

#ifndef BIDDER_GATEWAY_GATEWAY_ADAPTER_CONFIGS_H_
#define BIDDER_GATEWAY_GATEWAY_ADAPTER_CONFIGS_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "bidder_gateway/adapters/bidder_adapter.h"

namespace privacy_sandbox::bidder_gateway {

// Parses "name=endpoint[,name=endpoint...]". Whitespace around entries is
// ignored and empty entries are skipped. Only the first '=' separates, so
// endpoints may carry query strings.
//
// A new entry starts only at a segment of the form "name=scheme://...".
// Any other segment is taken as a comma inside the previous endpoint, so
// "a=https://x/?s=1,2" keeps its query intact. An endpoint query segment
// that itself looks like "name=scheme://..." cannot be told apart from a
// new entry and must be percent-encoded. A list whose first segment is not
// a full entry is an InvalidArgument error.
absl::StatusOr<std::vector<AdapterConfig>> BuildAdapterConfigs(
    absl::string_view adapter_endpoints);

// Splits a comma separated adapter name list, dropping empty entries.
std::vector<std::string> ParseAdapterNames(absl::string_view names);

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_GATEWAY_ADAPTER_CONFIGS_H_

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

#ifndef BIDDER_GATEWAY_ADAPTERS_URI_UTIL_H_
#define BIDDER_GATEWAY_ADAPTERS_URI_UTIL_H_

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace privacy_sandbox::bidder_gateway {

// Checks that `endpoint` is an absolute http or https URI with a host once
// every {{Macro}} placeholder has been substituted. Returns InvalidArgument
// otherwise.
absl::Status ValidateEndpoint(absl::string_view endpoint);

// Percent-encodes every byte outside the RFC 3986 unreserved set.
std::string UrlEscape(absl::string_view value);

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_ADAPTERS_URI_UTIL_H_

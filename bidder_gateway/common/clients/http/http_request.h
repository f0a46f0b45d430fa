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

#ifndef BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_HTTP_REQUEST_H_
#define BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_HTTP_REQUEST_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace privacy_sandbox::bidder_gateway {

enum class HttpMethod : std::uint8_t { kGet, kPost, kPut };

absl::string_view HttpMethodToString(HttpMethod method);

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HTTPRequest {
  HttpMethod method = HttpMethod::kGet;
  std::string url;
  // Optional
  HttpHeaders headers = {};
  // Optional. Sent for POST and PUT.
  std::string body = "";
};

struct HTTPResponse {
  // HTTP status of the final response. Any status, including 4xx and 5xx, is
  // reported here rather than as an error.
  int status_code = 0;

  // All response header lines of the final response, in wire order, with
  // names as sent by the server.
  HttpHeaders headers;

  std::string body;
};

using OnDoneFetchUrlWithMetadata =
    absl::AnyInvocable<void(absl::StatusOr<HTTPResponse>) &&>;

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_HTTP_REQUEST_H_

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

#include "bidder_gateway/adapters/http_call.h"

#include <utility>

#include "absl/strings/str_cat.h"

namespace privacy_sandbox::bidder_gateway {

HTTPRequest OutboundRequest::ToHttpRequest() const {
  return {.method = method, .url = uri, .headers = headers, .body = body};
}

bool operator==(const OutboundRequest& lhs, const OutboundRequest& rhs) {
  if (lhs.method != rhs.method || lhs.uri != rhs.uri ||
      lhs.headers != rhs.headers || lhs.body != rhs.body) {
    return false;
  }
  if (lhs.payload == nullptr || rhs.payload == nullptr) {
    return lhs.payload == rhs.payload;
  }
  return lhs.payload->json() == rhs.payload->json();
}

bool operator!=(const OutboundRequest& lhs, const OutboundRequest& rhs) {
  return !(lhs == rhs);
}

ExchangeResponse ExchangeResponse::FromHttpResponse(HTTPResponse response) {
  return {.status_code = response.status_code,
          .headers = std::move(response.headers),
          .body = std::move(response.body)};
}

CallOutcome MakeCallOutcome(OutboundRequest request,
                            absl::StatusOr<HTTPResponse> result) {
  if (result.ok()) {
    return CallSuccess{
        .request = std::move(request),
        .response = ExchangeResponse::FromHttpResponse(*std::move(result))};
  }
  AdapterError error =
      absl::IsDeadlineExceeded(result.status())
          ? AdapterError::Timeout(absl::StrCat("Timed out calling ",
                                               request.uri, ": ",
                                               result.status().message()))
          : AdapterError::Generic(absl::StrCat("Call to ", request.uri,
                                               " failed: ",
                                               result.status().ToString()));
  return CallFailure{.request = std::move(request), .error = std::move(error)};
}

}  // namespace privacy_sandbox::bidder_gateway

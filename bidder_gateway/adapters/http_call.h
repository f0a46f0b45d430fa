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

#ifndef BIDDER_GATEWAY_ADAPTERS_HTTP_CALL_H_
#define BIDDER_GATEWAY_ADAPTERS_HTTP_CALL_H_

#include <memory>
#include <string>
#include <variant>

#include "absl/status/statusor.h"
#include "bidder_gateway/adapters/adapter_error.h"
#include "bidder_gateway/common/clients/http/http_request.h"
#include "bidder_gateway/openrtb/bid_request.h"

namespace privacy_sandbox::bidder_gateway {

inline constexpr int kHttpStatusOk = 200;
inline constexpr int kHttpStatusNoContent = 204;

// One HTTP call an adapter wants issued to its exchange.
struct OutboundRequest {
  HttpMethod method = HttpMethod::kPost;
  std::string uri;
  HttpHeaders headers;
  std::string body;
  // The request (or per call subset) the body was built from. Used to match
  // response bids back to impressions.
  std::shared_ptr<const BidRequest> payload;

  // Converts to the transport's request type.
  HTTPRequest ToHttpRequest() const;
};

bool operator==(const OutboundRequest& lhs, const OutboundRequest& rhs);
bool operator!=(const OutboundRequest& lhs, const OutboundRequest& rhs);

struct ExchangeResponse {
  int status_code = 0;
  HttpHeaders headers;
  std::string body;

  static ExchangeResponse FromHttpResponse(HTTPResponse response);
};

struct CallSuccess {
  OutboundRequest request;
  ExchangeResponse response;
};

struct CallFailure {
  OutboundRequest request;
  AdapterError error;
};

// Exactly one of the two per dispatched call.
using CallOutcome = std::variant<CallSuccess, CallFailure>;

// Classifies a transport result. DeadlineExceeded becomes a kTimeout
// failure, any other error status a kGeneric one.
CallOutcome MakeCallOutcome(OutboundRequest request,
                            absl::StatusOr<HTTPResponse> result);

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_ADAPTERS_HTTP_CALL_H_

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

#ifndef BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_HTTP_FETCHER_ASYNC_H_
#define BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_HTTP_FETCHER_ASYNC_H_

#include "bidder_gateway/common/clients/http/http_request.h"

namespace privacy_sandbox::bidder_gateway {

// Issues HTTP calls asynchronously.
class HttpFetcherAsync {
 public:
  virtual ~HttpFetcherAsync() = default;

  HttpFetcherAsync() = default;

  // HttpFetcherAsync is neither copyable nor movable.
  HttpFetcherAsync(const HttpFetcherAsync&) = delete;
  HttpFetcherAsync& operator=(const HttpFetcherAsync&) = delete;

  // Performs `request` and reports the response with its status code and
  // headers.
  //
  // timeout_ms: The request timeout. Must be positive.
  // done_callback: Invoked exactly once, on a thread that is not guaranteed
  // to be the caller's. A transport timeout is reported as
  // DeadlineExceeded, other transport failures as other non-OK statuses.
  virtual void FetchUrlWithMetadata(
      const HTTPRequest& request, int timeout_ms,
      OnDoneFetchUrlWithMetadata done_callback) = 0;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_HTTP_FETCHER_ASYNC_H_

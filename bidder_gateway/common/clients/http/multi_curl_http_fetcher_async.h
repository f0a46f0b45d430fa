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

#ifndef BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_MULTI_CURL_HTTP_FETCHER_ASYNC_H_
#define BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_MULTI_CURL_HTTP_FETCHER_ASYNC_H_

#include <cstdint>
#include <memory>
#include <string>

#include "bidder_gateway/common/clients/http/curl_request_data.h"
#include "bidder_gateway/common/clients/http/http_fetcher_async.h"
#include "bidder_gateway/common/clients/http/multi_curl_request_manager.h"
#include "src/concurrent/executor.h"

namespace privacy_sandbox::bidder_gateway {

class MultiCurlHttpFetcherAsync final : public HttpFetcherAsync {
 public:
  // Constructs a new multi session for performing HTTP calls.
  // LIBCurl maintains persistent HTTP connections by default.
  // A TCP connection to all request servers is kept warm to reduce TCP
  // handshake latency for each request.
  // If no data is transferred over the TCP connection for keepalive_idle_sec,
  // OS sends a keep alive packet.
  // If the other endpoint does not reply, OS sends another keep alive
  // packet after keepalive_interval_sec.
  //
  // `executor` runs the completion callbacks and must outlive this object.
  explicit MultiCurlHttpFetcherAsync(
      server_common::Executor* executor,
      const MultiCurlHttpFetcherAsyncOptions& options =
          MultiCurlHttpFetcherAsyncOptions{});

  // Errors out any pending HTTP calls with a Cancelled status.
  ~MultiCurlHttpFetcherAsync() override = default;

  // Issues GET, POST or PUT with libcurl. POST and PUT send request.body.
  // Thread safe.
  void FetchUrlWithMetadata(const HTTPRequest& request, int timeout_ms,
                            OnDoneFetchUrlWithMetadata done_callback) override;

 private:
  // Creates and sets up a curl request with default options.
  std::unique_ptr<CurlRequestData> CreateCurlRequest(
      const HTTPRequest& request, int timeout_ms,
      OnDoneFetchUrlWithMetadata done_callback);

  // Wait time before sending keepalive packets.
  const int64_t keepalive_idle_sec_;

  // Interval time between keep-alive packets in case of no response.
  const int64_t keepalive_interval_sec_;

  const bool skip_tls_verification_;

  // Contents of the CA bundle. Empty means libcurl's default bundle.
  std::string ca_cert_blob_;

  MultiCurlRequestManager request_manager_;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_MULTI_CURL_HTTP_FETCHER_ASYNC_H_

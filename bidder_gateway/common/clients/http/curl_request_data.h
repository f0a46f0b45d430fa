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

#ifndef BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_CURL_REQUEST_DATA_H_
#define BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_CURL_REQUEST_DATA_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <curl/curl.h>
#include <event2/event.h>
#include <event2/event_struct.h>

#include "absl/time/time.h"
#include "bidder_gateway/common/clients/http/http_request.h"

namespace privacy_sandbox::bidder_gateway {

struct DataToUpload {
  std::string data;
  // First offset in the data that has not yet been uploaded.
  std::size_t offset = 0;
};

struct SocketInfo {
  // Socket file descriptor.
  curl_socket_t sock_fd;
  // Last activity recorded on the descriptor.
  int activity;
  // Event type monitored by libevent's event loop.
  struct event tracked_event;
};

inline constexpr char kDefaultCaCertPath[] =
    "/etc/ssl/certs/ca-certificates.crt";

struct MultiCurlHttpFetcherAsyncOptions {
  int64_t keepalive_interval_sec = 2;
  int64_t keepalive_idle_sec = 2;
  // PEM bundle loaded once at construction. Empty means libcurl's built in
  // default.
  std::string ca_cert = kDefaultCaCertPath;
  bool skip_tls_verification = false;
  long curlmopt_maxconnects = 0L;
  long curlmopt_max_total_connections = 0L;
  long curlmopt_max_host_connections = 0L;
};

// State of one in-flight transfer. Owns the easy handle and everything
// libcurl writes to or reads from while the transfer runs.
struct CurlRequestData {
  CurlRequestData(const HttpHeaders& headers,
                  OnDoneFetchUrlWithMetadata on_done);
  ~CurlRequestData();

  CurlRequestData(const CurlRequestData&) = delete;
  CurlRequestData& operator=(const CurlRequestData&) = delete;

  // The easy handle provided by libcurl, registered to the multi handle.
  CURL* req_handle;

  // The linked list of the request HTTP headers.
  struct curl_slist* headers_list_ptr = nullptr;

  // Invoked once with the response or the transfer error.
  OnDoneFetchUrlWithMetadata done_callback;

  // Body to upload for PUT requests.
  std::unique_ptr<DataToUpload> body;

  HTTPResponse response;

  absl::Time start_time;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_CURL_REQUEST_DATA_H_

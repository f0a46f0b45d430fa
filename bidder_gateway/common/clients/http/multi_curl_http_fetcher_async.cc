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

#include "bidder_gateway/common/clients/http/multi_curl_http_fetcher_async.h"

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

#include <curl/curl.h>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "bidder_gateway/common/loggers/request_log_context.h"
#include "bidder_gateway/common/util/file_util.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

std::string LoadCaCert(const MultiCurlHttpFetcherAsyncOptions& options) {
  if (options.skip_tls_verification || options.ca_cert.empty()) {
    return "";
  }
  absl::StatusOr<std::string> ca_cert_blob =
      GetFileContent(options.ca_cert, /*log_on_error=*/true);
  if (!ca_cert_blob.ok()) {
    PS_LOG(WARNING, SystemLogContext())
        << "Using libcurl's default CA bundle: " << ca_cert_blob.status();
    return "";
  }
  return *std::move(ca_cert_blob);
}

size_t WriteCallback(char* data, size_t size, size_t number_elements,
                     void* userdata) {
  auto* output = static_cast<std::string*>(userdata);
  output->append(data, size * number_elements);
  return size * number_elements;
}

// Collects "Name: value" header lines. A status line starts a new header
// block (after a 100-continue, for example), so earlier lines are dropped.
size_t HeaderCallback(char* data, size_t size, size_t number_elements,
                      void* userdata) {
  auto* response = static_cast<HTTPResponse*>(userdata);
  const size_t num_bytes = size * number_elements;
  absl::string_view line(data, num_bytes);
  if (absl::StartsWith(line, "HTTP/")) {
    response->headers.clear();
    return num_bytes;
  }
  const size_t colon = line.find(':');
  if (colon != absl::string_view::npos) {
    response->headers.emplace_back(
        std::string(absl::StripAsciiWhitespace(line.substr(0, colon))),
        std::string(absl::StripAsciiWhitespace(line.substr(colon + 1))));
  }
  return num_bytes;
}

size_t ReadCallback(char* data, size_t size, size_t num_items,
                    void* userdata) {
  auto* to_upload = static_cast<DataToUpload*>(userdata);
  if (to_upload->offset >= to_upload->data.size()) {
    // No more data to upload.
    return 0;
  }
  const size_t num_bytes_to_upload =
      std::min(to_upload->data.size() - to_upload->offset, num_items * size);
  std::memcpy(data, to_upload->data.data() + to_upload->offset,
              num_bytes_to_upload);
  to_upload->offset += num_bytes_to_upload;
  return num_bytes_to_upload;
}

}  // namespace

MultiCurlHttpFetcherAsync::MultiCurlHttpFetcherAsync(
    server_common::Executor* executor,
    const MultiCurlHttpFetcherAsyncOptions& options)
    : keepalive_idle_sec_(options.keepalive_idle_sec),
      keepalive_interval_sec_(options.keepalive_interval_sec),
      skip_tls_verification_(options.skip_tls_verification),
      ca_cert_blob_(LoadCaCert(options)),
      request_manager_(options.curlmopt_maxconnects,
                       options.curlmopt_max_total_connections,
                       options.curlmopt_max_host_connections, *executor) {}

std::unique_ptr<CurlRequestData> MultiCurlHttpFetcherAsync::CreateCurlRequest(
    const HTTPRequest& request, int timeout_ms,
    OnDoneFetchUrlWithMetadata done_callback) {
  auto curl_request_data =
      std::make_unique<CurlRequestData>(request.headers,
                                        std::move(done_callback));
  CURL* req_handle = curl_request_data->req_handle;
  curl_easy_setopt(req_handle, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(req_handle, CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(req_handle, CURLOPT_WRITEDATA,
                   &curl_request_data->response.body);
  curl_easy_setopt(req_handle, CURLOPT_HEADERFUNCTION, HeaderCallback);
  curl_easy_setopt(req_handle, CURLOPT_HEADERDATA,
                   &curl_request_data->response);
  // Worker threads must not receive signals from name resolution timeouts.
  curl_easy_setopt(req_handle, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(req_handle, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(timeout_ms));
  // Enable TCP keep-alive to keep connection warm.
  curl_easy_setopt(req_handle, CURLOPT_TCP_KEEPALIVE, 1L);
  curl_easy_setopt(req_handle, CURLOPT_TCP_KEEPIDLE,
                   static_cast<long>(keepalive_idle_sec_));
  curl_easy_setopt(req_handle, CURLOPT_TCP_KEEPINTVL,
                   static_cast<long>(keepalive_interval_sec_));
  // Set CURLOPT_ACCEPT_ENCODING to an empty string to pass all supported
  // encodings. See https://curl.se/libcurl/c/CURLOPT_ACCEPT_ENCODING.html.
  curl_easy_setopt(req_handle, CURLOPT_ACCEPT_ENCODING, "");

  if (skip_tls_verification_) {
    curl_easy_setopt(req_handle, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(req_handle, CURLOPT_SSL_VERIFYHOST, 0L);
    curl_easy_setopt(req_handle, CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(req_handle, CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
  } else if (!ca_cert_blob_.empty()) {
    struct curl_blob ca_blob;
    ca_blob.data = ca_cert_blob_.data();
    ca_blob.len = ca_cert_blob_.size();
    ca_blob.flags = CURL_BLOB_COPY;
    curl_easy_setopt(req_handle, CURLOPT_CAINFO_BLOB, &ca_blob);
  }

  switch (request.method) {
    case HttpMethod::kGet:
      curl_easy_setopt(req_handle, CURLOPT_HTTPGET, 1L);
      break;
    case HttpMethod::kPost:
      curl_easy_setopt(req_handle, CURLOPT_POST, 1L);
      curl_easy_setopt(req_handle, CURLOPT_POSTFIELDSIZE_LARGE,
                       static_cast<curl_off_t>(request.body.size()));
      curl_easy_setopt(req_handle, CURLOPT_COPYPOSTFIELDS,
                       request.body.c_str());
      break;
    case HttpMethod::kPut:
      curl_request_data->body =
          std::make_unique<DataToUpload>(DataToUpload{request.body});
      curl_easy_setopt(req_handle, CURLOPT_UPLOAD, 1L);
      curl_easy_setopt(req_handle, CURLOPT_INFILESIZE_LARGE,
                       static_cast<curl_off_t>(request.body.size()));
      curl_easy_setopt(req_handle, CURLOPT_READDATA,
                       curl_request_data->body.get());
      curl_easy_setopt(req_handle, CURLOPT_READFUNCTION, ReadCallback);
      break;
  }

  if (curl_request_data->headers_list_ptr != nullptr) {
    curl_easy_setopt(req_handle, CURLOPT_HTTPHEADER,
                     curl_request_data->headers_list_ptr);
  }
  return curl_request_data;
}

void MultiCurlHttpFetcherAsync::FetchUrlWithMetadata(
    const HTTPRequest& request, int timeout_ms,
    OnDoneFetchUrlWithMetadata done_callback) {
  if (timeout_ms <= 0) {
    // CURLOPT_TIMEOUT_MS of 0 would mean no timeout at all.
    std::move(done_callback)(absl::DeadlineExceededError(absl::StrCat(
        "No time left to fetch ", request.url, " (timeout_ms: ", timeout_ms,
        ")")));
    return;
  }
  PS_VLOG(kNoisyInfo, SystemLogContext())
      << HttpMethodToString(request.method) << " " << request.url
      << " (timeout_ms: " << timeout_ms << ")";
  request_manager_.StartProcessing(
      CreateCurlRequest(request, timeout_ms, std::move(done_callback)));
}

}  // namespace privacy_sandbox::bidder_gateway

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

#include "bidder_gateway/common/clients/http/curl_request_data.h"

#include <utility>

#include "absl/strings/str_cat.h"

namespace privacy_sandbox::bidder_gateway {

CurlRequestData::CurlRequestData(const HttpHeaders& headers,
                                 OnDoneFetchUrlWithMetadata on_done)
    : req_handle(curl_easy_init()),
      done_callback(std::move(on_done)),
      start_time(absl::Now()) {
  for (const auto& [name, value] : headers) {
    std::string header_line = absl::StrCat(name, ": ", value);
    headers_list_ptr =
        curl_slist_append(headers_list_ptr, header_line.c_str());
  }
}

CurlRequestData::~CurlRequestData() {
  curl_slist_free_all(headers_list_ptr);
  curl_easy_cleanup(req_handle);
}

}  // namespace privacy_sandbox::bidder_gateway

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

#include "bidder_gateway/adapters/uri_util.h"

#include <curl/curl.h>

#include <memory>

#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

inline constexpr absl::string_view kMacroOpen = "{{";
inline constexpr absl::string_view kMacroClose = "}}";
inline constexpr absl::string_view kMacroSample = "macro";

struct CurlUrlDeleter {
  void operator()(CURLU* url) const { curl_url_cleanup(url); }
};

struct CurlStringDeleter {
  void operator()(char* str) const { curl_free(str); }
};

// Replaces each {{...}} placeholder with a token that is valid in any URI
// component. An unterminated "{{" is left as is and fails parsing later.
std::string SubstituteMacros(absl::string_view endpoint) {
  std::string out;
  out.reserve(endpoint.size());
  while (!endpoint.empty()) {
    size_t open = endpoint.find(kMacroOpen);
    if (open == absl::string_view::npos) {
      break;
    }
    size_t close = endpoint.find(kMacroClose, open + kMacroOpen.size());
    if (close == absl::string_view::npos) {
      break;
    }
    absl::StrAppend(&out, endpoint.substr(0, open), kMacroSample);
    endpoint.remove_prefix(close + kMacroClose.size());
  }
  absl::StrAppend(&out, endpoint);
  return out;
}

absl::StatusOr<std::string> GetUrlPart(CURLU* url, CURLUPart part) {
  char* raw = nullptr;
  CURLUcode code = curl_url_get(url, part, &raw, 0);
  std::unique_ptr<char, CurlStringDeleter> value(raw);
  if (code != CURLUE_OK) {
    return absl::InvalidArgumentError(curl_url_strerror(code));
  }
  return std::string(value.get());
}

}  // namespace

absl::Status ValidateEndpoint(absl::string_view endpoint) {
  if (endpoint.empty()) {
    return absl::InvalidArgumentError("Endpoint is empty");
  }
  std::unique_ptr<CURLU, CurlUrlDeleter> url(curl_url());
  if (url == nullptr) {
    return absl::InternalError("Failed to allocate a libcurl URL handle");
  }
  const std::string substituted = SubstituteMacros(endpoint);
  if (CURLUcode code =
          curl_url_set(url.get(), CURLUPART_URL, substituted.c_str(), 0);
      code != CURLUE_OK) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Endpoint \"%s\" is not an absolute URI: %s", endpoint,
                        curl_url_strerror(code)));
  }
  absl::StatusOr<std::string> scheme = GetUrlPart(url.get(), CURLUPART_SCHEME);
  if (!scheme.ok() || (absl::AsciiStrToLower(*scheme) != "http" &&
                       absl::AsciiStrToLower(*scheme) != "https")) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Endpoint \"%s\" must use the http or https scheme", endpoint));
  }
  absl::StatusOr<std::string> host = GetUrlPart(url.get(), CURLUPART_HOST);
  if (!host.ok() || host->empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Endpoint \"%s\" has no host", endpoint));
  }
  return absl::OkStatus();
}

std::string UrlEscape(absl::string_view value) {
  // libcurl treats a zero length as "use strlen".
  if (value.empty()) {
    return "";
  }
  std::unique_ptr<char, CurlStringDeleter> encoded(
      curl_easy_escape(nullptr, value.data(), static_cast<int>(value.size())));
  if (encoded == nullptr) {
    return "";
  }
  return std::string(encoded.get());
}

}  // namespace privacy_sandbox::bidder_gateway

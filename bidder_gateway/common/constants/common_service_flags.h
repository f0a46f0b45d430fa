/*
 * Copyright 2024 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef BIDDER_GATEWAY_COMMON_CONSTANTS_COMMON_SERVICE_FLAGS_H_
#define BIDDER_GATEWAY_COMMON_CONSTANTS_COMMON_SERVICE_FLAGS_H_

#include <array>
#include <optional>
#include <string>

#include "absl/flags/declare.h"
#include "absl/flags/flag.h"
#include "absl/strings/string_view.h"

ABSL_DECLARE_FLAG(std::optional<bool>, https_fetch_skips_tls_verification);
ABSL_DECLARE_FLAG(std::optional<std::string>, ca_cert);
ABSL_DECLARE_FLAG(std::optional<int>, curlmopt_maxconnects);
ABSL_DECLARE_FLAG(std::optional<int>, curlmopt_max_total_connections);
ABSL_DECLARE_FLAG(std::optional<int>, curlmopt_max_host_connections);
ABSL_DECLARE_FLAG(std::optional<int>, bg_verbosity);
ABSL_DECLARE_FLAG(std::optional<int>, auction_timeout_ms);
ABSL_DECLARE_FLAG(std::optional<std::string>, adapter_endpoints);

namespace privacy_sandbox::bidder_gateway {

inline constexpr absl::string_view HTTPS_FETCH_SKIPS_TLS_VERIFICATION =
    "HTTPS_FETCH_SKIPS_TLS_VERIFICATION";
inline constexpr absl::string_view CA_CERT = "CA_CERT";
inline constexpr absl::string_view CURLMOPT_MAXCONNECTS =
    "CURLMOPT_MAXCONNECTS";
inline constexpr absl::string_view CURLMOPT_MAX_TOTAL_CONNECTIONS =
    "CURLMOPT_MAX_TOTAL_CONNECTIONS";
inline constexpr absl::string_view CURLMOPT_MAX_HOST_CONNECTIONS =
    "CURLMOPT_MAX_HOST_CONNECTIONS";
inline constexpr absl::string_view BG_VERBOSITY = "BG_VERBOSITY";
inline constexpr absl::string_view AUCTION_TIMEOUT_MS = "AUCTION_TIMEOUT_MS";
inline constexpr absl::string_view ADAPTER_ENDPOINTS = "ADAPTER_ENDPOINTS";

inline constexpr int kNumCommonFlags = 8;
inline constexpr std::array<absl::string_view, kNumCommonFlags>
    kCommonServiceFlags = {
        HTTPS_FETCH_SKIPS_TLS_VERIFICATION,
        CA_CERT,
        CURLMOPT_MAXCONNECTS,
        CURLMOPT_MAX_TOTAL_CONNECTIONS,
        CURLMOPT_MAX_HOST_CONNECTIONS,
        BG_VERBOSITY,
        AUCTION_TIMEOUT_MS,
        ADAPTER_ENDPOINTS,
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_CONSTANTS_COMMON_SERVICE_FLAGS_H_

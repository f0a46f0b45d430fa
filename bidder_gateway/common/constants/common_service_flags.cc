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

#include "bidder_gateway/common/constants/common_service_flags.h"

ABSL_FLAG(std::optional<bool>, https_fetch_skips_tls_verification,
          std::nullopt,
          "If true, outbound HTTPS calls to exchanges skip certificate and "
          "host verification. Only meant for testing.");
ABSL_FLAG(std::optional<std::string>, ca_cert, std::nullopt,
          "Path of the PEM CA bundle used to verify exchange endpoints.");
ABSL_FLAG(std::optional<int>, curlmopt_maxconnects, std::nullopt,
          "Maximum number of connections kept alive in libcurl's connection "
          "cache. 0 lets libcurl decide.");
ABSL_FLAG(std::optional<int>, curlmopt_max_total_connections, std::nullopt,
          "Maximum number of simultaneously open connections. 0 means no "
          "limit.");
ABSL_FLAG(std::optional<int>, curlmopt_max_host_connections, std::nullopt,
          "Maximum number of simultaneously open connections to a single "
          "host. 0 means no limit.");
ABSL_FLAG(std::optional<int>, bg_verbosity, std::nullopt,
          "Verbose log level. Messages logged at or below this level are "
          "emitted.");
ABSL_FLAG(std::optional<int>, auction_timeout_ms, std::nullopt,
          "Time budget shared by every exchange call of one auction.");
ABSL_FLAG(std::optional<std::string>, adapter_endpoints, std::nullopt,
          "Comma separated list of name=endpoint pairs, one per exchange "
          "adapter to enable. Endpoints may contain {{AccountID}} and "
          "commas in their query strings.");

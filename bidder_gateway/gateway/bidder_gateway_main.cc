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

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <grpc/event_engine/event_engine.h>

#include "absl/debugging/failure_signal_handler.h"
#include "absl/debugging/symbolize.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "bidder_gateway/adapters/adapter_registry.h"
#include "bidder_gateway/common/clients/config/server_config_client.h"
#include "bidder_gateway/common/clients/http/multi_curl_http_fetcher_async.h"
#include "bidder_gateway/common/loggers/request_log_context.h"
#include "bidder_gateway/common/util/file_util.h"
#include "bidder_gateway/common/util/status_macros.h"
#include "bidder_gateway/fanout/bidder_fanout.h"
#include "bidder_gateway/fanout/seat_result.h"
#include "bidder_gateway/gateway/adapter_configs.h"
#include "bidder_gateway/gateway/runtime_flags.h"
#include "bidder_gateway/openrtb/bid_request.h"
#include "src/concurrent/event_engine_executor.h"
#include "src/logger/request_context_logger.h"

ABSL_FLAG(std::optional<std::string>, request_file, std::nullopt,
          "Path of the OpenRTB bid request to auction, or - for stdin.");
ABSL_FLAG(std::optional<std::string>, bidders, std::nullopt,
          "Comma separated adapter names eligible for the auction. Defaults "
          "to every adapter in --adapter_endpoints.");

namespace privacy_sandbox::bidder_gateway {

inline constexpr int kDefaultAuctionTimeoutMs = 200;

ServerConfigClient GetConfigClient() {
  ServerConfigClient config_client(GetServiceFlags());
  config_client.SetFlag(FLAGS_request_file, REQUEST_FILE);
  config_client.SetFlag(FLAGS_bidders, BIDDERS);
  config_client.SetFlag(FLAGS_https_fetch_skips_tls_verification,
                        HTTPS_FETCH_SKIPS_TLS_VERIFICATION);
  config_client.SetFlag(FLAGS_ca_cert, CA_CERT);
  config_client.SetFlag(FLAGS_curlmopt_maxconnects, CURLMOPT_MAXCONNECTS);
  config_client.SetFlag(FLAGS_curlmopt_max_total_connections,
                        CURLMOPT_MAX_TOTAL_CONNECTIONS);
  config_client.SetFlag(FLAGS_curlmopt_max_host_connections,
                        CURLMOPT_MAX_HOST_CONNECTIONS);
  config_client.SetFlag(FLAGS_bg_verbosity, BG_VERBOSITY);
  config_client.SetFlag(FLAGS_auction_timeout_ms, AUCTION_TIMEOUT_MS);
  config_client.SetFlag(FLAGS_adapter_endpoints, ADAPTER_ENDPOINTS);

  config_client.SetDefault(kFalse, HTTPS_FETCH_SKIPS_TLS_VERIFICATION);
  config_client.SetDefault(kDefaultCaCertPath, CA_CERT);
  config_client.SetDefault("0", CURLMOPT_MAXCONNECTS);
  config_client.SetDefault("0", CURLMOPT_MAX_TOTAL_CONNECTIONS);
  config_client.SetDefault("0", CURLMOPT_MAX_HOST_CONNECTIONS);
  config_client.SetDefault("0", BG_VERBOSITY);
  config_client.SetDefault(absl::StrCat(kDefaultAuctionTimeoutMs),
                           AUCTION_TIMEOUT_MS);

  // Set verbosity
  server_common::log::SetGlobalPSVLogLevel(
      config_client.GetIntParameter(BG_VERBOSITY));
  PS_VLOG(kPlain, SystemLogContext())
      << "Config: " << config_client.DebugString();
  return config_client;
}

absl::Status RunAuction() {
  ServerConfigClient config_client = GetConfigClient();

  BG_ASSIGN_OR_RETURN(
      std::vector<AdapterConfig> adapter_configs,
      BuildAdapterConfigs(config_client.GetStringParameter(ADAPTER_ENDPOINTS)));
  if (adapter_configs.empty()) {
    return absl::InvalidArgumentError(
        "No adapters configured, set --adapter_endpoints");
  }
  BG_ASSIGN_OR_RETURN(std::unique_ptr<AdapterRegistry> registry,
                      AdapterRegistry::Create(adapter_configs));

  absl::string_view request_file =
      config_client.GetStringParameter(REQUEST_FILE);
  if (request_file.empty()) {
    return absl::InvalidArgumentError("--request_file is required");
  }
  BG_ASSIGN_OR_RETURN(std::string request_json,
                      GetFileContent(request_file, /*log_on_error=*/true));
  BG_ASSIGN_OR_RETURN(std::shared_ptr<const BidRequest> request,
                      BidRequest::Create(request_json));

  std::vector<std::string> bidders =
      config_client.HasParameter(BIDDERS) &&
              !config_client.GetStringParameter(BIDDERS).empty()
          ? ParseAdapterNames(config_client.GetStringParameter(BIDDERS))
          : registry->Names();

  const int auction_timeout_ms =
      config_client.GetIntParameter(AUCTION_TIMEOUT_MS);
  if (auction_timeout_ms <= 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("--auction_timeout_ms must be positive, got ",
                     auction_timeout_ms));
  }

  server_common::GrpcInit grpc_init;
  server_common::EventEngineExecutor executor(
      grpc_event_engine::experimental::CreateEventEngine());
  MultiCurlHttpFetcherAsync http_fetcher(
      &executor,
      {.ca_cert = std::string(config_client.GetStringParameter(CA_CERT)),
       .skip_tls_verification = config_client.GetBooleanParameter(
           HTTPS_FETCH_SKIPS_TLS_VERIFICATION),
       .curlmopt_maxconnects =
           config_client.GetInt64Parameter(CURLMOPT_MAXCONNECTS),
       .curlmopt_max_total_connections =
           config_client.GetInt64Parameter(CURLMOPT_MAX_TOTAL_CONNECTIONS),
       .curlmopt_max_host_connections =
           config_client.GetInt64Parameter(CURLMOPT_MAX_HOST_CONNECTIONS)});
  BidderFanout fanout(*registry, http_fetcher, executor);

  PS_LOG(INFO, SystemLogContext())
      << "Running auction " << request->id() << " across "
      << bidders.size() << " adapters";
  std::vector<SeatResult> seats = fanout.RunAndWait(
      request, bidders, absl::Milliseconds(auction_timeout_ms));
  BG_ASSIGN_OR_RETURN(std::string output, SeatResultsToJson(seats));
  std::cout << output << std::endl;
  return absl::OkStatus();
}

}  // namespace privacy_sandbox::bidder_gateway

int main(int argc, char** argv) {
  absl::InitializeSymbolizer(argv[0]);
  absl::FailureSignalHandlerOptions options;
  absl::InstallFailureSignalHandler(options);
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);

  if (absl::Status status = privacy_sandbox::bidder_gateway::RunAuction();
      !status.ok()) {
    ABSL_LOG(ERROR) << "Auction failed: " << status;
    return 1;
  }
  return 0;
}

/*
 * Copyright 2024 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef BIDDER_GATEWAY_COMMON_LOGGERS_REQUEST_LOG_CONTEXT_H_
#define BIDDER_GATEWAY_COMMON_LOGGERS_REQUEST_LOG_CONTEXT_H_

#include <string>

#include "absl/container/btree_map.h"
#include "absl/strings/string_view.h"
#include "src/logger/request_context_logger.h"

namespace privacy_sandbox::bidder_gateway {

inline server_common::log::SystemLogContext& SystemLogContext() {
  return server_common::log::SystemLogContext::Get();
}

// log verbosity

inline constexpr int kPlain = 1;      // auction request and seat results
inline constexpr int kNoisyWarn = 2;  // failed exchange calls and bad bids
inline constexpr int kSuccess = 3;
inline constexpr int kNoisyInfo = 5;
inline constexpr int kStats = 5;       // curl timings, bid and error counts
inline constexpr int kOriginated = 6;  // outbound exchange calls

// Key/value pairs identifying the auction (and adapter) a log line belongs
// to, e.g. "(auction_id: a-1) ". Empty values are left out.
class RequestLogContext {
 public:
  RequestLogContext() = default;
  explicit RequestLogContext(
      const absl::btree_map<std::string, std::string>& context_map);

  absl::string_view ContextStr() const { return context_str_; }

 private:
  std::string context_str_;
};

}  // namespace privacy_sandbox::bidder_gateway

// PS_LOG and PS_VLOG on the system context, prefixed with the request
// context of `log_context`.
#define BG_LOG(severity, log_context)                                   \
  PS_LOG(severity, ::privacy_sandbox::bidder_gateway::SystemLogContext()) \
      << (log_context).ContextStr()

#define BG_VLOG(verbose_level, log_context)                       \
  PS_VLOG(verbose_level,                                          \
          ::privacy_sandbox::bidder_gateway::SystemLogContext()) \
      << (log_context).ContextStr()

#endif  // BIDDER_GATEWAY_COMMON_LOGGERS_REQUEST_LOG_CONTEXT_H_

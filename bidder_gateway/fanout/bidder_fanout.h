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

#ifndef BIDDER_GATEWAY_FANOUT_BIDDER_FANOUT_H_
#define BIDDER_GATEWAY_FANOUT_BIDDER_FANOUT_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "absl/time/time.h"
#include "bidder_gateway/adapters/adapter_registry.h"
#include "bidder_gateway/common/clients/http/http_fetcher_async.h"
#include "bidder_gateway/fanout/seat_result.h"
#include "bidder_gateway/openrtb/bid_request.h"
#include "src/concurrent/executor.h"

namespace privacy_sandbox::bidder_gateway {

using OnAuctionDone = absl::AnyInvocable<void(std::vector<SeatResult>) &&>;

// Runs one auction across a set of adapters.
//
// Every adapter builds its calls, all calls are dispatched at once through
// the fetcher and each response is parsed by the adapter that built the
// call. A single deadline, `budget` from the start of Run, bounds the whole
// auction: calls still in flight when it fires are recorded as kTimeout
// errors and their responses, should they arrive later, are dropped.
//
// One adapter's failures never affect another adapter's seat. The fetcher
// and executor must outlive every auction started on this object.
class BidderFanout {
 public:
  BidderFanout(const AdapterRegistry& registry, HttpFetcherAsync& http_fetcher,
               server_common::Executor& executor)
      : registry_(registry),
        http_fetcher_(http_fetcher),
        executor_(executor) {}

  // Not copyable or movable.
  BidderFanout(const BidderFanout&) = delete;
  BidderFanout& operator=(const BidderFanout&) = delete;

  // Starts an auction and returns immediately. `on_done` receives one
  // SeatResult per distinct adapter name, in the order given, once every
  // call has resolved. It runs exactly once, possibly on the calling thread
  // and possibly on a fetcher or executor thread.
  void Run(std::shared_ptr<const BidRequest> request,
           const std::vector<std::string>& adapter_names,
           absl::Duration budget, OnAuctionDone on_done) const;

  // Blocking variant of Run.
  std::vector<SeatResult> RunAndWait(
      std::shared_ptr<const BidRequest> request,
      const std::vector<std::string>& adapter_names,
      absl::Duration budget) const;

 private:
  const AdapterRegistry& registry_;
  HttpFetcherAsync& http_fetcher_;
  server_common::Executor& executor_;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_FANOUT_BIDDER_FANOUT_H_

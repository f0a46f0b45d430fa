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

#ifndef BIDDER_GATEWAY_FANOUT_SEAT_RESULT_H_
#define BIDDER_GATEWAY_FANOUT_SEAT_RESULT_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "bidder_gateway/adapters/adapter_bid.h"
#include "bidder_gateway/adapters/adapter_error.h"

namespace privacy_sandbox::bidder_gateway {

// Everything one adapter produced during one auction.
struct SeatResult {
  std::string adapter_name;
  // Bids in call completion order, response order within a call.
  std::vector<AdapterBid> bids;
  // Build errors first, then per call errors in completion order.
  std::vector<AdapterError> errors;
};

// Renders seat results as a JSON array:
//   [{"seat": "...", "bids": [{"impid", "mediatype", "cur", "bid"}],
//     "errors": [{"type", "message"}]}]
// "bid" is the exchange's bid object, embedded verbatim.
absl::StatusOr<std::string> SeatResultsToJson(
    absl::Span<const SeatResult> seat_results);

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_FANOUT_SEAT_RESULT_H_

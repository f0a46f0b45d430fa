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

#ifndef BIDDER_GATEWAY_ADAPTERS_ADAPTER_ERROR_H_
#define BIDDER_GATEWAY_ADAPTERS_ADAPTER_ERROR_H_

#include <cstdint>
#include <ostream>
#include <string>

#include "absl/strings/string_view.h"

namespace privacy_sandbox::bidder_gateway {

enum class AdapterErrorType : std::uint8_t {
  // Request or bid data the adapter could not map.
  kBadInput,
  // Unparsable body or an unexpected HTTP status from the exchange.
  kBadServerResponse,
  // The auction deadline elapsed before the exchange answered.
  kTimeout,
  // The exchange explicitly declined the request.
  kRejected,
  // Transport failures and anything unclassified.
  kGeneric,
};

// Returns "bad_input", "bad_server_response", "timeout", "rejected" or
// "generic".
absl::string_view AdapterErrorTypeToString(AdapterErrorType type);

// A recoverable failure attached to one adapter's results. Carries only a
// classification and a message.
class AdapterError {
 public:
  AdapterError(AdapterErrorType type, std::string message);

  static AdapterError BadInput(absl::string_view message);
  static AdapterError BadServerResponse(absl::string_view message);
  static AdapterError Timeout(absl::string_view message);
  static AdapterError Rejected(absl::string_view message);
  static AdapterError Generic(absl::string_view message);

  AdapterErrorType type() const { return type_; }
  const std::string& message() const { return message_; }

  bool operator==(const AdapterError& other) const {
    return type_ == other.type_ && message_ == other.message_;
  }
  bool operator!=(const AdapterError& other) const { return !(*this == other); }

 private:
  AdapterErrorType type_;
  std::string message_;
};

std::ostream& operator<<(std::ostream& os, const AdapterError& error);

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_ADAPTERS_ADAPTER_ERROR_H_

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

#include "bidder_gateway/adapters/adapter_error.h"

#include <utility>

namespace privacy_sandbox::bidder_gateway {

absl::string_view AdapterErrorTypeToString(AdapterErrorType type) {
  switch (type) {
    case AdapterErrorType::kBadInput:
      return "bad_input";
    case AdapterErrorType::kBadServerResponse:
      return "bad_server_response";
    case AdapterErrorType::kTimeout:
      return "timeout";
    case AdapterErrorType::kRejected:
      return "rejected";
    case AdapterErrorType::kGeneric:
      return "generic";
  }
  return "generic";
}

AdapterError::AdapterError(AdapterErrorType type, std::string message)
    : type_(type), message_(std::move(message)) {}

AdapterError AdapterError::BadInput(absl::string_view message) {
  return AdapterError(AdapterErrorType::kBadInput, std::string(message));
}

AdapterError AdapterError::BadServerResponse(absl::string_view message) {
  return AdapterError(AdapterErrorType::kBadServerResponse,
                      std::string(message));
}

AdapterError AdapterError::Timeout(absl::string_view message) {
  return AdapterError(AdapterErrorType::kTimeout, std::string(message));
}

AdapterError AdapterError::Rejected(absl::string_view message) {
  return AdapterError(AdapterErrorType::kRejected, std::string(message));
}

AdapterError AdapterError::Generic(absl::string_view message) {
  return AdapterError(AdapterErrorType::kGeneric, std::string(message));
}

std::ostream& operator<<(std::ostream& os, const AdapterError& error) {
  return os << AdapterErrorTypeToString(error.type()) << ": "
            << error.message();
}

}  // namespace privacy_sandbox::bidder_gateway

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

#ifndef BIDDER_GATEWAY_ADAPTERS_ADAPTER_RESULT_H_
#define BIDDER_GATEWAY_ADAPTERS_ADAPTER_RESULT_H_

#include <utility>
#include <vector>

#include "bidder_gateway/adapters/adapter_error.h"

namespace privacy_sandbox::bidder_gateway {

// Output of every adapter operation: the values produced plus the
// recoverable errors met along the way. Both lists may be non-empty at once
// (partial success); an empty list is the "nothing" state.
template <typename T>
struct AdapterResult {
  std::vector<T> values;
  std::vector<AdapterError> errors;

  static AdapterResult Empty() { return AdapterResult(); }

  static AdapterResult WithValues(std::vector<T> values) {
    AdapterResult result;
    result.values = std::move(values);
    return result;
  }

  static AdapterResult WithError(AdapterError error) {
    AdapterResult result;
    result.errors.push_back(std::move(error));
    return result;
  }

  static AdapterResult Of(std::vector<T> values,
                          std::vector<AdapterError> errors) {
    AdapterResult result;
    result.values = std::move(values);
    result.errors = std::move(errors);
    return result;
  }
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_ADAPTERS_ADAPTER_RESULT_H_

//  Copyright 2024 Google LLC
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//       http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#ifndef BIDDER_GATEWAY_GATEWAY_RUNTIME_FLAGS_H_
#define BIDDER_GATEWAY_GATEWAY_RUNTIME_FLAGS_H_

#include <array>
#include <vector>

#include "absl/strings/string_view.h"
#include "bidder_gateway/common/constants/common_service_flags.h"

namespace privacy_sandbox::bidder_gateway {

// Define runtime flag names.
inline constexpr absl::string_view REQUEST_FILE = "REQUEST_FILE";
inline constexpr absl::string_view BIDDERS = "BIDDERS";

inline constexpr int kNumRuntimeFlags = 2;
inline constexpr std::array<absl::string_view, kNumRuntimeFlags> kFlags = {
    REQUEST_FILE,
    BIDDERS,
};

inline std::vector<absl::string_view> GetServiceFlags() {
  std::vector<absl::string_view> flags(kFlags.begin(),
                                       kFlags.begin() + kNumRuntimeFlags);

  for (absl::string_view flag : kCommonServiceFlags) {
    flags.push_back(flag);
  }

  return flags;
}

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_GATEWAY_RUNTIME_FLAGS_H_

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

#ifndef BIDDER_GATEWAY_ADAPTERS_ADAPTER_REGISTRY_H_
#define BIDDER_GATEWAY_ADAPTERS_ADAPTER_REGISTRY_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "bidder_gateway/adapters/bidder_adapter.h"

namespace privacy_sandbox::bidder_gateway {

using AdapterFactory =
    absl::StatusOr<std::unique_ptr<BidderAdapter>> (*)(const AdapterConfig&);

// Returns the factory registered for `name`, or nullptr.
AdapterFactory FindAdapterFactory(absl::string_view name);

// Immutable name -> adapter table built once at startup.
class AdapterRegistry {
 public:
  // Creates one adapter per config. Fails with InvalidArgument on an unknown
  // adapter name, a duplicate name or an invalid endpoint.
  static absl::StatusOr<std::unique_ptr<AdapterRegistry>> Create(
      absl::Span<const AdapterConfig> configs);

  // Takes ownership of already created adapters. Later duplicates are
  // rejected.
  static absl::StatusOr<std::unique_ptr<AdapterRegistry>> FromAdapters(
      std::vector<std::unique_ptr<BidderAdapter>> adapters);

  AdapterRegistry(const AdapterRegistry&) = delete;
  AdapterRegistry& operator=(const AdapterRegistry&) = delete;

  // Returns nullptr when no adapter is registered under `name`.
  const BidderAdapter* Find(absl::string_view name) const;

  // Registered names, sorted.
  std::vector<std::string> Names() const;

 private:
  AdapterRegistry() = default;

  absl::flat_hash_map<std::string, std::unique_ptr<BidderAdapter>> adapters_;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_ADAPTERS_ADAPTER_REGISTRY_H_

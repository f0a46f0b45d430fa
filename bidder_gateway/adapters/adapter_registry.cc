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

#include "bidder_gateway/adapters/adapter_registry.h"

#include <algorithm>
#include <utility>

#include "absl/base/no_destructor.h"
#include "absl/strings/str_cat.h"
#include "bidder_gateway/adapters/adagio_adapter.h"
#include "bidder_gateway/adapters/axonix_adapter.h"
#include "bidder_gateway/adapters/generic_adapter.h"
#include "bidder_gateway/common/loggers/request_log_context.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

const absl::flat_hash_map<std::string, AdapterFactory>& Factories() {
  static const absl::NoDestructor<
      absl::flat_hash_map<std::string, AdapterFactory>>
      kFactories({
          {"generic", &GenericAdapter::Create},
          {"adagio", &AdagioAdapter::Create},
          {"axonix", &AxonixAdapter::Create},
      });
  return *kFactories;
}

}  // namespace

AdapterFactory FindAdapterFactory(absl::string_view name) {
  auto it = Factories().find(name);
  return it == Factories().end() ? nullptr : it->second;
}

absl::StatusOr<std::unique_ptr<AdapterRegistry>> AdapterRegistry::Create(
    absl::Span<const AdapterConfig> configs) {
  std::vector<std::unique_ptr<BidderAdapter>> adapters;
  adapters.reserve(configs.size());
  for (const AdapterConfig& config : configs) {
    AdapterFactory factory = FindAdapterFactory(config.name);
    if (factory == nullptr) {
      return absl::InvalidArgumentError(
          absl::StrCat("Unknown adapter: ", config.name));
    }
    absl::StatusOr<std::unique_ptr<BidderAdapter>> adapter = factory(config);
    if (!adapter.ok()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Failed to create adapter ", config.name, ": ",
                       adapter.status().message()));
    }
    PS_VLOG(kPlain, SystemLogContext())
        << "Created adapter " << config.name << " for " << config.endpoint;
    adapters.push_back(*std::move(adapter));
  }
  return FromAdapters(std::move(adapters));
}

absl::StatusOr<std::unique_ptr<AdapterRegistry>> AdapterRegistry::FromAdapters(
    std::vector<std::unique_ptr<BidderAdapter>> adapters) {
  std::unique_ptr<AdapterRegistry> registry(new AdapterRegistry());
  for (std::unique_ptr<BidderAdapter>& adapter : adapters) {
    std::string name(adapter->name());
    if (registry->adapters_.contains(name)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate adapter: ", name));
    }
    registry->adapters_.emplace(std::move(name), std::move(adapter));
  }
  return registry;
}

const BidderAdapter* AdapterRegistry::Find(absl::string_view name) const {
  auto it = adapters_.find(name);
  return it == adapters_.end() ? nullptr : it->second.get();
}

std::vector<std::string> AdapterRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(adapters_.size());
  for (const auto& [name, unused] : adapters_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace privacy_sandbox::bidder_gateway

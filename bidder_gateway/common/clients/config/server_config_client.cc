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

#include "bidder_gateway/common/clients/config/server_config_client.h"

#include "absl/log/check.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "bidder_gateway/common/loggers/request_log_context.h"

namespace privacy_sandbox::bidder_gateway {

ServerConfigClient::ServerConfigClient(
    absl::Span<const absl::string_view> all_flags) {
  for (absl::string_view flag : all_flags) {
    config_entries_map_[std::string(flag)] = kEmptyValue;
  }
}

bool ServerConfigClient::HasParameter(absl::string_view name) const noexcept {
  return config_entries_map_.contains(name);
}

absl::string_view ServerConfigClient::GetStringParameter(
    absl::string_view name) const noexcept {
  DCHECK(HasParameter(name)) << "Flag " << name << " not found";
  auto it = config_entries_map_.find(name);
  if (it == config_entries_map_.end()) {
    return kEmptyValue;
  }
  return it->second;
}

bool ServerConfigClient::GetBooleanParameter(
    absl::string_view name) const noexcept {
  return absl::AsciiStrToLower(GetStringParameter(name)) == kTrue;
}

int ServerConfigClient::GetIntParameter(absl::string_view name) const noexcept {
  int value = 0;
  CHECK(absl::SimpleAtoi(GetStringParameter(name), &value))
      << "Config parameter " << name << " is not an int: '"
      << GetStringParameter(name) << "'";
  return value;
}

int64_t ServerConfigClient::GetInt64Parameter(
    absl::string_view name) const noexcept {
  int64_t value = 0;
  CHECK(absl::SimpleAtoi(GetStringParameter(name), &value))
      << "Config parameter " << name << " is not an int64: '"
      << GetStringParameter(name) << "'";
  return value;
}

void ServerConfigClient::SetDefault(absl::string_view value,
                                    absl::string_view config_name) {
  std::string& entry = config_entries_map_[std::string(config_name)];
  if (entry.empty()) {
    entry = std::string(value);
  }
}

void ServerConfigClient::SetOverride(absl::string_view value,
                                     absl::string_view config_name) {
  PS_LOG(INFO, SystemLogContext()) << absl::StrFormat(
      "Overriding flag (flag name: %s, overriden value: %s)", config_name,
      value);
  config_entries_map_[std::string(config_name)] = std::string(value);
}

std::string ServerConfigClient::DebugString() const {
  return absl::StrJoin(config_entries_map_, "\n",
                       absl::PairFormatter(": "));
}

}  // namespace privacy_sandbox::bidder_gateway

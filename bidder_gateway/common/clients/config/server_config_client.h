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

#ifndef BIDDER_GATEWAY_COMMON_CLIENTS_CONFIG_SERVER_CONFIG_CLIENT_H_
#define BIDDER_GATEWAY_COMMON_CLIENTS_CONFIG_SERVER_CONFIG_CLIENT_H_

#include <cstdint>
#include <optional>
#include <string>

#include "absl/container/btree_map.h"
#include "absl/flags/flag.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace privacy_sandbox::bidder_gateway {

inline constexpr char kEmptyValue[] = "";
inline constexpr char kTrue[] = "true";
inline constexpr char kFalse[] = "false";

// Holds the runtime configuration of the service as <parameter_name,
// parameter_value> string entries. Values are populated from command line
// flags; parameters whose flag was not given keep their default.
class ServerConfigClient {
 public:
  // Registers every parameter in `all_flags` with an empty value.
  explicit ServerConfigClient(absl::Span<const absl::string_view> all_flags);

  // Checks if a parameter is present in the config client.
  bool HasParameter(absl::string_view name) const noexcept;

  // Fetches the string value for the specified config parameter.
  absl::string_view GetStringParameter(absl::string_view name) const noexcept;

  // Fetches the boolean value for the specified config parameter. Anything
  // other than a case-insensitive "true" is false.
  bool GetBooleanParameter(absl::string_view name) const noexcept;

  // Fetches the int value for the specified config parameter. The value
  // must parse as an int.
  int GetIntParameter(absl::string_view name) const noexcept;

  int64_t GetInt64Parameter(absl::string_view name) const noexcept;

  // Sets `config_entries_map_` if flag is set.
  template <typename T>
  void SetFlag(const absl::Flag<std::optional<T>>& flag,
               absl::string_view config_name) {
    std::optional<T> flag_value = absl::GetFlag(flag);
    if (flag_value) {
      config_entries_map_[std::string(config_name)] = absl::StrCat(*flag_value);
    }
  }

  void SetFlag(const absl::Flag<std::optional<bool>>& flag,
               absl::string_view config_name) {
    std::optional<bool> flag_value = absl::GetFlag(flag);
    if (flag_value) {
      config_entries_map_[std::string(config_name)] =
          *flag_value ? kTrue : kFalse;
    }
  }

  // Sets `value` for a parameter that no flag populated.
  void SetDefault(absl::string_view value, absl::string_view config_name);

  // For overriding flag values, regardless of their value on the command
  // line.
  void SetOverride(absl::string_view value, absl::string_view config_name);

  std::string DebugString() const;

 private:
  absl::btree_map<std::string, std::string> config_entries_map_;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_CLIENTS_CONFIG_SERVER_CONFIG_CLIENT_H_

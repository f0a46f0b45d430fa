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

#include <cstdint>
#include <optional>
#include <string>

#include "gtest/gtest.h"

ABSL_FLAG(std::optional<std::string>, config_param_1, std::nullopt,
          "test flag 1");
ABSL_FLAG(std::optional<bool>, config_param_2, std::nullopt, "test flag 2");
ABSL_FLAG(std::optional<bool>, config_param_3, std::nullopt, "test flag 3");
ABSL_FLAG(std::optional<int32_t>, config_param_4, std::nullopt, "test flag 4");
ABSL_FLAG(std::optional<int64_t>, config_param_5, std::nullopt,
          "test flag 5");

namespace privacy_sandbox::bidder_gateway {
namespace {

constexpr absl::string_view kFlags[] = {"config_param_1", "config_param_2",
                                        "config_param_3", "config_param_4",
                                        "config_param_5"};

TEST(ServerConfigClientTest, CanReadFlagsPassedThroughConstructor) {
  absl::SetFlag(&FLAGS_config_param_1, "config_value_1");
  absl::SetFlag(&FLAGS_config_param_2, true);
  absl::SetFlag(&FLAGS_config_param_3, false);
  absl::SetFlag(&FLAGS_config_param_4, 100);
  absl::SetFlag(&FLAGS_config_param_5, int64_t{1} << 40);

  ServerConfigClient config_client(kFlags);
  config_client.SetFlag(FLAGS_config_param_1, "config_param_1");
  config_client.SetFlag(FLAGS_config_param_2, "config_param_2");
  config_client.SetFlag(FLAGS_config_param_3, "config_param_3");
  config_client.SetFlag(FLAGS_config_param_4, "config_param_4");
  config_client.SetFlag(FLAGS_config_param_5, "config_param_5");

  EXPECT_EQ(config_client.GetStringParameter("config_param_1"),
            "config_value_1");
  EXPECT_TRUE(config_client.GetBooleanParameter("config_param_2"));
  EXPECT_FALSE(config_client.GetBooleanParameter("config_param_3"));
  EXPECT_EQ(config_client.GetIntParameter("config_param_4"), 100);
  EXPECT_EQ(config_client.GetInt64Parameter("config_param_5"),
            int64_t{1} << 40);
}

TEST(ServerConfigClientTest, UnsetFlagsKeepEmptyValue) {
  absl::SetFlag(&FLAGS_config_param_1, std::nullopt);

  ServerConfigClient config_client(kFlags);
  config_client.SetFlag(FLAGS_config_param_1, "config_param_1");

  EXPECT_TRUE(config_client.HasParameter("config_param_1"));
  EXPECT_EQ(config_client.GetStringParameter("config_param_1"), "");
  EXPECT_FALSE(config_client.HasParameter("not_registered"));
}

TEST(ServerConfigClientTest, DefaultDoesNotReplaceFlagValue) {
  absl::SetFlag(&FLAGS_config_param_1, "from_flag");
  absl::SetFlag(&FLAGS_config_param_4, std::nullopt);

  ServerConfigClient config_client(kFlags);
  config_client.SetFlag(FLAGS_config_param_1, "config_param_1");
  config_client.SetFlag(FLAGS_config_param_4, "config_param_4");
  config_client.SetDefault("from_default", "config_param_1");
  config_client.SetDefault("200", "config_param_4");

  EXPECT_EQ(config_client.GetStringParameter("config_param_1"), "from_flag");
  EXPECT_EQ(config_client.GetIntParameter("config_param_4"), 200);
}

TEST(ServerConfigClientTest, OverrideReplacesFlagValue) {
  absl::SetFlag(&FLAGS_config_param_2, false);

  ServerConfigClient config_client(kFlags);
  config_client.SetFlag(FLAGS_config_param_2, "config_param_2");
  config_client.SetOverride(kTrue, "config_param_2");

  EXPECT_TRUE(config_client.GetBooleanParameter("config_param_2"));
}

TEST(ServerConfigClientTest, BooleanParsingIsCaseInsensitive) {
  ServerConfigClient config_client(kFlags);
  config_client.SetOverride("TRUE", "config_param_3");

  EXPECT_TRUE(config_client.GetBooleanParameter("config_param_3"));
}

}  // namespace
}  // namespace privacy_sandbox::bidder_gateway

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


#include "bidder_gateway/common/util/file_util.h"

#include <fstream>
#include <string>

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace privacy_sandbox::bidder_gateway {
namespace {

using ::testing::HasSubstr;

TEST(GetFileContentTest, ReadsWholeFile) {
  const std::string path =
      absl::StrCat(::testing::TempDir(), "/file_util_test_request.json");
  {
    std::ofstream ofs(path, std::ios::binary);
    ofs << "{\"id\":\"a\"}\n";
  }

  absl::StatusOr<std::string> content = GetFileContent(path);

  ASSERT_TRUE(content.ok()) << content.status();
  EXPECT_EQ(*content, "{\"id\":\"a\"}\n");
}

TEST(GetFileContentTest, MissingFileIsNotFound) {
  absl::StatusOr<std::string> content =
      GetFileContent(absl::StrCat(::testing::TempDir(), "/does/not/exist"));

  ASSERT_TRUE(absl::IsNotFound(content.status()));
  EXPECT_THAT(content.status().message(), HasSubstr(kPathFailed));
}

}  // namespace
}  // namespace privacy_sandbox::bidder_gateway

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
#include <iostream>
#include <sstream>
#include <utility>

#include "absl/log/absl_log.h"
#include "absl/strings/str_cat.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

absl::StatusOr<std::string> ReadStream(std::istream& is,
                                       absl::string_view path,
                                       bool log_on_error) {
  std::ostringstream contents;
  contents << is.rdbuf();
  if (is.bad()) {
    std::string err_str = absl::StrCat("Failed to read file: ", path);
    ABSL_LOG_IF(ERROR, log_on_error) << err_str;
    return absl::DataLossError(std::move(err_str));
  }
  return contents.str();
}

}  // namespace

absl::StatusOr<std::string> GetFileContent(absl::string_view path,
                                           bool log_on_error) {
  if (path == kStdinPath) {
    return ReadStream(std::cin, "<stdin>", log_on_error);
  }
  std::ifstream ifs{std::string(path), std::ios::binary};
  if (!ifs.is_open()) {
    std::string err_str = absl::StrCat(kPathFailed, path);
    ABSL_LOG_IF(ERROR, log_on_error) << err_str;
    return absl::NotFoundError(std::move(err_str));
  }
  return ReadStream(ifs, path, log_on_error);
}

}  // namespace privacy_sandbox::bidder_gateway

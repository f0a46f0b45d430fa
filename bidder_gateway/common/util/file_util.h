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


#ifndef BIDDER_GATEWAY_COMMON_UTIL_FILE_UTIL_H_
#define BIDDER_GATEWAY_COMMON_UTIL_FILE_UTIL_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace privacy_sandbox::bidder_gateway {

inline constexpr char kPathFailed[] = "Failed to load file from path: ";
// Path that reads the document from standard input.
inline constexpr char kStdinPath[] = "-";

// Reads the whole file at `path`, or standard input when `path` is
// `kStdinPath`. Returns NotFound when the file cannot be opened and
// DataLoss when reading stops before the end of the stream.
absl::StatusOr<std::string> GetFileContent(absl::string_view path,
                                           bool log_on_error = false);

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_UTIL_FILE_UTIL_H_

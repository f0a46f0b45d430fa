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

#ifndef BIDDER_GATEWAY_COMMON_UTIL_STATUS_MACROS_H_
#define BIDDER_GATEWAY_COMMON_UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// Evaluates `expr` (an absl::Status) and returns it from the enclosing
// function if it is not OK.
#define BG_RETURN_IF_ERROR(expr)                                           \
  do {                                                                     \
    ::absl::Status bg_status_macros_internal_status = (expr);              \
    if (ABSL_PREDICT_FALSE(!bg_status_macros_internal_status.ok())) {      \
      return bg_status_macros_internal_status;                             \
    }                                                                      \
  } while (false)

// Evaluates `rexpr` (an absl::StatusOr<T>). On error returns the status from
// the enclosing function, otherwise move-assigns the value to `lhs`, which
// may be a declaration:
//
//   BG_ASSIGN_OR_RETURN(rapidjson::Document doc, ParseJsonString(body));
#define BG_ASSIGN_OR_RETURN(lhs, rexpr)                                   \
  BG_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(                                \
      BG_STATUS_MACROS_IMPL_CONCAT_(bg_status_or_value, __LINE__), lhs, \
      rexpr)

#define BG_STATUS_MACROS_IMPL_ASSIGN_OR_RETURN_(statusor, lhs, rexpr) \
  auto statusor = (rexpr);                                            \
  if (ABSL_PREDICT_FALSE(!statusor.ok())) {                           \
    return std::move(statusor).status();                              \
  }                                                                   \
  lhs = std::move(statusor).value()

#define BG_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y) x##y
#define BG_STATUS_MACROS_IMPL_CONCAT_(x, y) \
  BG_STATUS_MACROS_IMPL_CONCAT_INNER_(x, y)

#endif  // BIDDER_GATEWAY_COMMON_UTIL_STATUS_MACROS_H_

/*
 * Copyright 2024 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef BIDDER_GATEWAY_COMMON_UTIL_ASYNC_TASK_TRACKER_H_
#define BIDDER_GATEWAY_COMMON_UTIL_ASYNC_TASK_TRACKER_H_

#include <cstdint>
#include <optional>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/synchronization/mutex.h"
#include "bidder_gateway/common/loggers/request_log_context.h"

namespace privacy_sandbox::bidder_gateway {

enum class TaskStatus : std::uint8_t {
  UNKNOWN,
  EMPTY_RESPONSE,  // Task completed without producing anything.
  TIMED_OUT,       // Task abandoned at the deadline.
  ERROR,
  SUCCESS,
};

// Tracks a fixed number of asynchronous tasks and runs `on_all_tasks_done`
// once every one of them has reported completion.
//
// TaskCompleted may be called from any thread. The optional per task closure
// runs while the tracker's lock is held, so closures observe completions in
// a single total order. The final callback runs without holding any lock and
// may destroy the tracker.
class AsyncTaskTracker {
 public:
  AsyncTaskTracker(int num_tasks_to_track,
                   const RequestLogContext& log_context,
                   absl::AnyInvocable<void() &&> on_all_tasks_done);

  AsyncTaskTracker(const AsyncTaskTracker&) = delete;
  AsyncTaskTracker& operator=(const AsyncTaskTracker&) = delete;

  void TaskCompleted(TaskStatus task_status) ABSL_LOCKS_EXCLUDED(mu_);

  // `on_single_task_done`, if provided, is called with the lock held.
  void TaskCompleted(
      TaskStatus task_status,
      std::optional<absl::AnyInvocable<void()>> on_single_task_done)
      ABSL_LOCKS_EXCLUDED(mu_);

 private:
  std::string ToString() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  const int num_tasks_to_track_;
  absl::Mutex mu_;
  int pending_tasks_count_ ABSL_GUARDED_BY(mu_);
  int successful_tasks_count_ ABSL_GUARDED_BY(mu_) = 0;
  int empty_tasks_count_ ABSL_GUARDED_BY(mu_) = 0;
  int timed_out_tasks_count_ ABSL_GUARDED_BY(mu_) = 0;
  int error_tasks_count_ ABSL_GUARDED_BY(mu_) = 0;
  absl::AnyInvocable<void() &&> on_all_tasks_done_;
  const RequestLogContext& log_context_;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_UTIL_ASYNC_TASK_TRACKER_H_

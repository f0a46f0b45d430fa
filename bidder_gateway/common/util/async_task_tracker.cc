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

#include "bidder_gateway/common/util/async_task_tracker.h"

#include <utility>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"

namespace privacy_sandbox::bidder_gateway {

AsyncTaskTracker::AsyncTaskTracker(
    int num_tasks_to_track, const RequestLogContext& log_context,
    absl::AnyInvocable<void() &&> on_all_tasks_done)
    : num_tasks_to_track_(num_tasks_to_track),
      pending_tasks_count_(num_tasks_to_track),
      on_all_tasks_done_(std::move(on_all_tasks_done)),
      log_context_(log_context) {}

void AsyncTaskTracker::TaskCompleted(TaskStatus task_status) {
  TaskCompleted(task_status, std::nullopt);
}

void AsyncTaskTracker::TaskCompleted(
    TaskStatus task_status,
    std::optional<absl::AnyInvocable<void()>> on_single_task_done) {
  bool is_last_task = false;
  {
    absl::MutexLock lock(&mu_);
    DCHECK_GT(pending_tasks_count_, 0)
        << "Unexpected call (indicates either a bug in the initialization or "
           "the usage)";

    if (on_single_task_done) {
      (*on_single_task_done)();
    }

    --pending_tasks_count_;
    switch (task_status) {
      case TaskStatus::SUCCESS:
        ++successful_tasks_count_;
        break;
      case TaskStatus::EMPTY_RESPONSE:
        ++empty_tasks_count_;
        break;
      case TaskStatus::TIMED_OUT:
        ++timed_out_tasks_count_;
        break;
      case TaskStatus::ERROR:
        ++error_tasks_count_;
        break;
      default:
        BG_LOG(ERROR, log_context_)
            << "Unexpected task status: " << static_cast<int>(task_status);
        break;
    }
    BG_VLOG(kNoisyInfo, log_context_)
        << "Updated pending tasks state: " << ToString();
    is_last_task = pending_tasks_count_ == 0;
  }

  // on_all_tasks_done_ may delete this tracker, so no member is touched after
  // it runs.
  if (is_last_task) {
    std::move(on_all_tasks_done_)();
  }
}

std::string AsyncTaskTracker::ToString() const {
  return absl::StrCat("total: ", num_tasks_to_track_,
                      ", pending: ", pending_tasks_count_,
                      ", successful: ", successful_tasks_count_,
                      ", empty: ", empty_tasks_count_,
                      ", timed out: ", timed_out_tasks_count_,
                      ", error: ", error_tasks_count_);
}

}  // namespace privacy_sandbox::bidder_gateway

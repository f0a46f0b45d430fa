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

#include "bidder_gateway/fanout/bidder_fanout.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <utility>
#include <variant>

#include "absl/base/thread_annotations.h"
#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "bidder_gateway/common/loggers/request_log_context.h"
#include "bidder_gateway/common/util/async_task_tracker.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

// A call built by an adapter and waiting to be dispatched.
struct PendingCall {
  size_t seat_index;
  const BidderAdapter* adapter;
  OutboundRequest request;
};

// What one resolved call contributed to its seat.
struct CompletedCall {
  size_t seat_index;
  std::vector<AdapterBid> bids;
  std::vector<AdapterError> errors;
};

// Transport timeout for a call dispatched with `remaining` left before the
// deadline. Never below 1 ms and never past what an int holds.
int CallTimeoutMs(absl::Duration remaining) {
  const int64_t remaining_ms = absl::ToInt64Milliseconds(remaining);
  return static_cast<int>(std::clamp<int64_t>(
      remaining_ms, 1, std::numeric_limits<int>::max()));
}

TaskStatus StatusOf(const AdapterResult<AdapterBid>& result) {
  if (!result.values.empty()) {
    return TaskStatus::SUCCESS;
  }
  return result.errors.empty() ? TaskStatus::EMPTY_RESPONSE
                               : TaskStatus::ERROR;
}

// State of one auction. Kept alive by the callbacks that reference it and
// released once the last of them has run.
//
// Each call slot is resolved exactly once, either by its response or by the
// deadline; whichever claims the slot first under `mu_` wins and the other
// is ignored. Resolved calls are appended to `completed_` under the
// tracker's lock, which fixes the completion order used for merging.
class AuctionState : public std::enable_shared_from_this<AuctionState> {
 public:
  AuctionState(std::vector<SeatResult> seats, std::vector<PendingCall> calls,
               HttpFetcherAsync& http_fetcher,
               server_common::Executor& executor, RequestLogContext log_context,
               OnAuctionDone on_done)
      : seats_(std::move(seats)),
        calls_(std::move(calls)),
        http_fetcher_(http_fetcher),
        executor_(executor),
        log_context_(std::move(log_context)),
        on_done_(std::move(on_done)),
        resolved_(calls_.size(), false),
        tracker_(static_cast<int>(calls_.size()), log_context_,
                 [this]() { Finish(); }) {}

  void Start(absl::Duration budget) {
    if (calls_.empty()) {
      Finish();
      return;
    }
    const absl::Time deadline = absl::Now() + budget;
    {
      absl::MutexLock lock(&mu_);
      deadline_task_ = executor_.RunAfter(
          budget, [self = shared_from_this()]() { self->OnDeadline(); });
    }
    BG_VLOG(kNoisyInfo, log_context_)
        << "Dispatching " << calls_.size() << " calls with a budget of "
        << budget;
    for (size_t i = 0; i < calls_.size(); ++i) {
      if (IsResolved(i)) {
        continue;
      }
      const int timeout_ms = CallTimeoutMs(deadline - absl::Now());
      BG_VLOG(kOriginated, log_context_)
          << "Calling " << calls_[i].adapter->name() << " at "
          << calls_[i].request.uri;
      http_fetcher_.FetchUrlWithMetadata(
          calls_[i].request.ToHttpRequest(), timeout_ms,
          [self = shared_from_this(),
           i](absl::StatusOr<HTTPResponse> result) mutable {
            self->OnResponse(i, std::move(result));
          });
    }
  }

 private:
  bool IsResolved(size_t call_index) ABSL_LOCKS_EXCLUDED(mu_) {
    absl::MutexLock lock(&mu_);
    return resolved_[call_index];
  }

  // Returns true if the caller now owns the slot.
  bool Claim(size_t call_index) ABSL_LOCKS_EXCLUDED(mu_) {
    absl::MutexLock lock(&mu_);
    if (resolved_[call_index]) {
      return false;
    }
    resolved_[call_index] = true;
    return true;
  }

  void OnResponse(size_t call_index, absl::StatusOr<HTTPResponse> result) {
    PendingCall& call = calls_[call_index];
    if (!Claim(call_index)) {
      BG_VLOG(kNoisyWarn, log_context_)
          << "Dropping late response from " << call.adapter->name()
          << ", status: " << result.status();
      return;
    }

    CallOutcome outcome =
        MakeCallOutcome(std::move(call.request), std::move(result));
    AdapterResult<AdapterBid> parsed;
    TaskStatus task_status;
    if (const auto* success = std::get_if<CallSuccess>(&outcome)) {
      BG_VLOG(kSuccess, log_context_)
          << call.adapter->name() << " answered with HTTP status "
          << success->response.status_code;
      parsed = call.adapter->ParseResponse(*success);
      task_status = StatusOf(parsed);
    } else {
      const AdapterError& error = std::get<CallFailure>(outcome).error;
      BG_VLOG(kNoisyWarn, log_context_)
          << "Call to " << call.adapter->name() << " failed: " << error;
      task_status = error.type() == AdapterErrorType::kTimeout
                        ? TaskStatus::TIMED_OUT
                        : TaskStatus::ERROR;
      parsed.errors.push_back(error);
    }
    Complete(call_index, task_status, std::move(parsed));
  }

  void OnDeadline() {
    std::vector<size_t> expired;
    {
      absl::MutexLock lock(&mu_);
      deadline_task_.reset();
      for (size_t i = 0; i < resolved_.size(); ++i) {
        if (!resolved_[i]) {
          resolved_[i] = true;
          expired.push_back(i);
        }
      }
    }
    if (!expired.empty()) {
      BG_VLOG(kNoisyWarn, log_context_)
          << "Auction deadline reached with " << expired.size()
          << " calls in flight";
    }
    for (size_t i : expired) {
      Complete(i, TaskStatus::TIMED_OUT,
               AdapterResult<AdapterBid>::WithError(AdapterError::Timeout(
                   absl::StrCat(calls_[i].adapter->name(),
                                " did not answer before the auction "
                                "deadline"))));
    }
  }

  void Complete(size_t call_index, TaskStatus task_status,
                AdapterResult<AdapterBid> result) {
    const size_t seat_index = calls_[call_index].seat_index;
    tracker_.TaskCompleted(task_status, [this, seat_index, &result]() {
      completed_.push_back({.seat_index = seat_index,
                            .bids = std::move(result.values),
                            .errors = std::move(result.errors)});
    });
  }

  void Finish() {
    std::optional<server_common::TaskId> deadline_task;
    {
      absl::MutexLock lock(&mu_);
      deadline_task.swap(deadline_task_);
    }
    // A deadline closure that can no longer be cancelled finds every slot
    // resolved and does nothing.
    if (deadline_task.has_value() && !executor_.Cancel(*deadline_task)) {
      BG_VLOG(kNoisyInfo, log_context_) << "Deadline task already running";
    }

    for (CompletedCall& call : completed_) {
      SeatResult& seat = seats_[call.seat_index];
      std::move(call.bids.begin(), call.bids.end(),
                std::back_inserter(seat.bids));
      std::move(call.errors.begin(), call.errors.end(),
                std::back_inserter(seat.errors));
    }
    if (server_common::log::PS_VLOG_IS_ON(kStats)) {
      for (const SeatResult& seat : seats_) {
        BG_VLOG(kStats, log_context_)
            << "Seat " << seat.adapter_name << ": " << seat.bids.size()
            << " bids, " << seat.errors.size() << " errors";
      }
    }
    std::move(on_done_)(std::move(seats_));
  }

  std::vector<SeatResult> seats_;
  std::vector<PendingCall> calls_;
  HttpFetcherAsync& http_fetcher_;
  server_common::Executor& executor_;
  const RequestLogContext log_context_;
  OnAuctionDone on_done_;

  absl::Mutex mu_;
  std::vector<bool> resolved_ ABSL_GUARDED_BY(mu_);
  std::optional<server_common::TaskId> deadline_task_ ABSL_GUARDED_BY(mu_);

  // Appended by the tracker's per task closure, read by Finish.
  std::vector<CompletedCall> completed_;
  AsyncTaskTracker tracker_;
};

}  // namespace

void BidderFanout::Run(std::shared_ptr<const BidRequest> request,
                       const std::vector<std::string>& adapter_names,
                       absl::Duration budget, OnAuctionDone on_done) const {
  RequestLogContext log_context(absl::btree_map<std::string, std::string>{
      {"auction_id", std::string(request->id())}});

  std::vector<SeatResult> seats;
  std::vector<PendingCall> calls;
  absl::flat_hash_set<std::string> seen_names;
  for (const std::string& name : adapter_names) {
    if (!seen_names.insert(name).second) {
      continue;
    }
    const size_t seat_index = seats.size();
    SeatResult& seat = seats.emplace_back();
    seat.adapter_name = name;

    const BidderAdapter* adapter = registry_.Find(name);
    if (adapter == nullptr) {
      BG_LOG(WARNING, log_context) << "No adapter registered as " << name;
      seat.errors.push_back(
          AdapterError::Generic(absl::StrCat("Unknown adapter: ", name)));
      continue;
    }
    AdapterResult<OutboundRequest> built = adapter->BuildRequests(request);
    BG_VLOG(kNoisyInfo, log_context)
        << name << " built " << built.values.size() << " calls and "
        << built.errors.size() << " errors";
    seat.errors = std::move(built.errors);
    for (OutboundRequest& outbound : built.values) {
      calls.push_back({.seat_index = seat_index,
                       .adapter = adapter,
                       .request = std::move(outbound)});
    }
  }

  auto state = std::make_shared<AuctionState>(
      std::move(seats), std::move(calls), http_fetcher_, executor_,
      std::move(log_context), std::move(on_done));
  state->Start(budget);
}

std::vector<SeatResult> BidderFanout::RunAndWait(
    std::shared_ptr<const BidRequest> request,
    const std::vector<std::string>& adapter_names,
    absl::Duration budget) const {
  struct Waiter {
    absl::Notification done;
    std::vector<SeatResult> seats;
  };
  auto waiter = std::make_shared<Waiter>();
  Run(std::move(request), adapter_names, budget,
      [waiter](std::vector<SeatResult> seats) {
        waiter->seats = std::move(seats);
        waiter->done.Notify();
      });
  waiter->done.WaitForNotification();
  return std::move(waiter->seats);
}

}  // namespace privacy_sandbox::bidder_gateway

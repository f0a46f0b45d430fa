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

#include "bidder_gateway/common/util/event_base.h"

#include <event2/thread.h>

#include "absl/log/check.h"

namespace privacy_sandbox::bidder_gateway {

EventBase::EventBase(int num_priorities) {
  // Must precede event_base_new so the base is created with locking enabled.
  CHECK_EQ(evthread_use_pthreads(), 0) << "libevent pthreads unavailable";
  event_base_ = event_base_new();
  CHECK(event_base_ != nullptr) << "Failed to create libevent event_base";
  event_base_priority_init(event_base_, num_priorities);
}

EventBase::~EventBase() {
  if (event_base_ != nullptr) {
    event_base_free(event_base_);
  }
}

struct event_base* EventBase::get() { return event_base_; }

}  // namespace privacy_sandbox::bidder_gateway

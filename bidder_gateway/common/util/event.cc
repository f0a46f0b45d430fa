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

#include "bidder_gateway/common/util/event.h"

#include "absl/log/check.h"

namespace privacy_sandbox::bidder_gateway {

Event::Event(struct event_base* base, evutil_socket_t fd, short event_type,
             Event::Callback event_callback, void* arg, int priority,
             const struct timeval* event_timeout, bool add_to_loop)
    : event_(event_new(base, fd, event_type, event_callback, arg)) {
  CHECK(event_ != nullptr) << "Failed to create libevent event";
  event_priority_set(event_, priority);
  if (add_to_loop) {
    event_add(event_, event_timeout);
  }
}

struct event* Event::get() { return event_; }

Event::~Event() {
  if (event_ != nullptr) {
    event_del(event_);
    event_free(event_);
  }
}

}  // namespace privacy_sandbox::bidder_gateway

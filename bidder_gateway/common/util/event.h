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

#ifndef BIDDER_GATEWAY_COMMON_UTIL_EVENT_H_
#define BIDDER_GATEWAY_COMMON_UTIL_EVENT_H_

#include <event2/event.h>
#include <event2/event_struct.h>

#include "bidder_gateway/common/util/event_base.h"

namespace privacy_sandbox::bidder_gateway {

// Owns a libevent event. The event is deleted from its base and freed on
// destruction.
class Event {
 public:
  // Arguments are documented here:
  // https://libevent.org/doc/event_8h.html#aed2307f3d9b38e07cc10c2607322d758
  using Callback = void (*)(/*fd or signal=*/evutil_socket_t, /*events=*/short,
                            /*pointer to user provided data=*/void*);

  // When `add_to_loop` is true the event is made pending right away with
  // `event_timeout` (nullptr means no timeout).
  Event(struct event_base* base, evutil_socket_t fd, short event_type,
        Callback event_callback, void* arg,
        int priority = kNumEventPriorities / 2,
        const struct timeval* event_timeout = nullptr,
        bool add_to_loop = true);
  ~Event();

  Event(const Event&) = delete;
  Event& operator=(const Event&) = delete;

  struct event* get();

 private:
  struct event* event_ = nullptr;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_UTIL_EVENT_H_

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

#ifndef BIDDER_GATEWAY_COMMON_UTIL_EVENT_BASE_H_
#define BIDDER_GATEWAY_COMMON_UTIL_EVENT_BASE_H_

#include <event2/event.h>

namespace privacy_sandbox::bidder_gateway {

inline constexpr int kNumEventPriorities = 3;

// Owns a libevent event_base configured for use from multiple threads.
class EventBase {
 public:
  explicit EventBase(int num_priorities = kNumEventPriorities);
  ~EventBase();

  EventBase(const EventBase&) = delete;
  EventBase& operator=(const EventBase&) = delete;

  // Gets the underlying event base data type.
  struct event_base* get();

 private:
  struct event_base* event_base_ = nullptr;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_UTIL_EVENT_BASE_H_

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

#ifndef BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_MULTI_CURL_REQUEST_MANAGER_H_
#define BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_MULTI_CURL_REQUEST_MANAGER_H_

#include <memory>
#include <thread>

#include <curl/curl.h>
#include <event2/event.h>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/synchronization/notification.h"
#include "bidder_gateway/common/clients/http/curl_request_data.h"
#include "bidder_gateway/common/util/event.h"
#include "bidder_gateway/common/util/event_base.h"
#include "src/concurrent/executor.h"

namespace privacy_sandbox::bidder_gateway {

// Drives a libcurl multi handle from a libevent loop running on a dedicated
// thread. All multi handle operations happen on that thread; completion
// callbacks are handed to the executor.
// More info: https://curl.se/libcurl/c/threadsafe.html
class MultiCurlRequestManager final {
 public:
  // Initializes the multi session and starts the event loop. Returns once
  // the loop is running.
  MultiCurlRequestManager(long curlmopt_maxconnects,
                          long curlmopt_max_total_connections,
                          long curlmopt_max_host_connections,
                          server_common::Executor& executor);

  // Stops the loop. Transfers still in flight complete with a Cancelled
  // error.
  ~MultiCurlRequestManager();

  MultiCurlRequestManager(const MultiCurlRequestManager&) = delete;
  MultiCurlRequestManager& operator=(const MultiCurlRequestManager&) = delete;

  // Hands the request to the event loop. The request's callback is invoked
  // exactly once.
  void StartProcessing(std::unique_ptr<CurlRequestData> request);

 private:
  void UpsertSocketInLibevent(curl_socket_t sock_fd, int activity,
                              SocketInfo* socket_info);
  void AddSocketToLibevent(curl_socket_t sock_fd, int activity);

  static void StartedEventLoop(evutil_socket_t fd, short event_type,
                               void* arg);
  static void ShutdownEventLoop(evutil_socket_t fd, short event_type,
                                void* arg);
  static void OnProcessingStarted(evutil_socket_t fd, short event_type,
                                  void* arg);

  // Fired when the timeout libcurl asked for expires.
  static void MultiTimerCallback(evutil_socket_t fd, short what, void* arg);

  // Invoked by libcurl to say which sockets should be watched.
  static int OnLibcurlSocketUpdate(CURL* easy_handle, curl_socket_t sock_fd,
                                   int activity, void* data,
                                   void* socket_info_pointer);

  // Invoked by libevent on read/write readiness of a watched socket.
  static void OnLibeventSocketActivity(evutil_socket_t fd, short kind,
                                       void* data);

  std::unique_ptr<CurlRequestData> Remove(CURL* curl_handle);

  // Reads finished transfers off the multi handle and schedules their
  // callbacks. Runs on the event loop thread only.
  void PerformCurlUpdate();

  // Completes `request` with `status` on the executor.
  void FailRequest(std::unique_ptr<CurlRequestData> request,
                   absl::Status status);

  // Easy handle to its request data, for every transfer added to the multi
  // handle and not yet finished.
  absl::flat_hash_map<CURL*, std::unique_ptr<CurlRequestData>>
      easy_curl_request_data_;
  int running_handles_ = 0;
  CURLM* request_manager_;
  EventBase event_base_;
  Event eventloop_started_event_;
  // Activated by the destructor to stop the loop from inside.
  Event shutdown_event_;
  // Timer controlled by libcurl through OnLibcurlTimerUpdate.
  Event multi_timer_event_;
  absl::Notification eventloop_started_;
  server_common::Executor& executor_;
  std::thread event_loop_thread_;
};

}  // namespace privacy_sandbox::bidder_gateway

#endif  // BIDDER_GATEWAY_COMMON_CLIENTS_HTTP_MULTI_CURL_REQUEST_MANAGER_H_

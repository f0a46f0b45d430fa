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

#include "bidder_gateway/common/clients/http/multi_curl_request_manager.h"

#include <memory>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/strings/str_cat.h"
#include "bidder_gateway/common/loggers/request_log_context.h"

namespace privacy_sandbox::bidder_gateway {

namespace {

const struct timeval kZeroSecond = {0, 0};
const struct timeval kOneMicrosecond = {0, 1};

void LogCurlStats(CURL* handle) {
  if (!server_common::log::PS_VLOG_IS_ON(kStats)) {
    return;
  }
  char* request_url = nullptr;
  double time_namelookup = -1;
  double time_connect = -1;
  double time_starttransfer = -1;
  double time_total = -1;
  curl_off_t download_size = -1;
  curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &request_url);
  curl_easy_getinfo(handle, CURLINFO_NAMELOOKUP_TIME, &time_namelookup);
  curl_easy_getinfo(handle, CURLINFO_CONNECT_TIME, &time_connect);
  curl_easy_getinfo(handle, CURLINFO_STARTTRANSFER_TIME, &time_starttransfer);
  curl_easy_getinfo(handle, CURLINFO_TOTAL_TIME, &time_total);
  curl_easy_getinfo(handle, CURLINFO_SIZE_DOWNLOAD_T, &download_size);
  PS_VLOG(kStats, SystemLogContext())
      << "Curl request " << (request_url != nullptr ? request_url : "")
      << " stats: namelookup: " << time_namelookup
      << "s, connect: " << time_connect
      << "s, starttransfer: " << time_starttransfer
      << "s, total: " << time_total << "s, downloaded: " << download_size
      << " bytes";
}

int OnLibcurlTimerUpdate(CURLM* multi, long timeout_ms, void* timer_event_arg) {
  DCHECK(timer_event_arg != nullptr) << "Timer event not found";
  auto* timer_event = reinterpret_cast<struct event*>(timer_event_arg);
  if (timeout_ms == -1) {
    evtimer_del(timer_event);
  } else {
    struct timeval timeout = {timeout_ms / 1000, (timeout_ms % 1000) * 1000};
    evtimer_add(timer_event, &timeout);
  }
  return 0;
}

// Maps the result of a finished transfer to a status. HTTP error codes are
// not errors at this layer.
absl::Status GetResultFromMsg(const CURLMsg* msg) {
  if (msg->msg != CURLMSG_DONE) {
    return absl::InternalError(
        absl::StrCat("Unexpected curl message: ", msg->msg));
  }
  const char* result_msg = curl_easy_strerror(msg->data.result);
  switch (msg->data.result) {
    case CURLE_OK:
      return absl::OkStatus();
    case CURLE_OPERATION_TIMEDOUT:
      return absl::DeadlineExceededError(result_msg);
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
      return absl::InvalidArgumentError(result_msg);
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
      return absl::UnavailableError(result_msg);
    default:
      return absl::InternalError(result_msg);
  }
}

void RemoveSocketFromLibevent(std::unique_ptr<SocketInfo> socket_info) {
  if (socket_info && event_initialized(&socket_info->tracked_event)) {
    event_del(&socket_info->tracked_event);
  }
}

}  // namespace

void MultiCurlRequestManager::OnLibeventSocketActivity(evutil_socket_t fd,
                                                       short kind,
                                                       void* data) {
  int action = ((kind & EV_READ) ? CURL_CSELECT_IN : 0) |
               ((kind & EV_WRITE) ? CURL_CSELECT_OUT : 0);
  auto* self = reinterpret_cast<MultiCurlRequestManager*>(data);
  curl_multi_socket_action(self->request_manager_, fd, action,
                           &self->running_handles_);
  self->PerformCurlUpdate();
}

void MultiCurlRequestManager::UpsertSocketInLibevent(curl_socket_t sock_fd,
                                                     int activity,
                                                     SocketInfo* socket_info) {
  short kind = ((activity & CURL_POLL_IN) ? EV_READ : 0) |
               ((activity & CURL_POLL_OUT) ? EV_WRITE : 0) | EV_PERSIST;
  socket_info->sock_fd = sock_fd;
  socket_info->activity = activity;
  if (event_initialized(&socket_info->tracked_event)) {
    event_del(&socket_info->tracked_event);
  }
  event_assign(&socket_info->tracked_event, event_base_.get(), sock_fd, kind,
               OnLibeventSocketActivity, this);
  event_add(&socket_info->tracked_event, /*timeout=*/nullptr);
}

void MultiCurlRequestManager::AddSocketToLibevent(curl_socket_t sock_fd,
                                                  int activity) {
  // Zeroed so event_initialized() is false before the first event_assign.
  auto socket_info = std::make_unique<SocketInfo>();
  UpsertSocketInLibevent(sock_fd, activity, socket_info.get());
  curl_multi_assign(request_manager_, sock_fd, socket_info.release());
}

int MultiCurlRequestManager::OnLibcurlSocketUpdate(CURL* easy_handle,
                                                   curl_socket_t sock_fd,
                                                   int activity, void* data,
                                                   void* socket_info_pointer) {
  auto* socket_info = reinterpret_cast<SocketInfo*>(socket_info_pointer);
  auto* self = reinterpret_cast<MultiCurlRequestManager*>(data);
  // See activity details here:
  // https://curl.se/libcurl/c/CURLMOPT_SOCKETFUNCTION.html
  if (activity == CURL_POLL_REMOVE) {
    RemoveSocketFromLibevent(std::unique_ptr<SocketInfo>(socket_info));
  } else if (socket_info == nullptr) {
    self->AddSocketToLibevent(sock_fd, activity);
  } else {
    self->UpsertSocketInLibevent(sock_fd, activity, socket_info);
  }
  return 0;
}

MultiCurlRequestManager::MultiCurlRequestManager(
    long curlmopt_maxconnects, long curlmopt_max_total_connections,
    long curlmopt_max_host_connections, server_common::Executor& executor)
    : request_manager_(nullptr),
      eventloop_started_event_(event_base_.get(), /*fd=*/-1,
                               /*event_type=*/EV_TIMEOUT,
                               /*event_callback=*/StartedEventLoop,
                               /*arg=*/this,
                               /*priority=*/kNumEventPriorities / 2,
                               &kOneMicrosecond),
      shutdown_event_(event_base_.get(), /*fd=*/-1, /*event_type=*/EV_TIMEOUT,
                      /*event_callback=*/ShutdownEventLoop, /*arg=*/this,
                      /*priority=*/0, /*event_timeout=*/nullptr,
                      /*add_to_loop=*/false),
      multi_timer_event_(event_base_.get(), /*fd=*/-1, /*event_type=*/0,
                         /*event_callback=*/MultiTimerCallback, /*arg=*/this,
                         /*priority=*/kNumEventPriorities / 2,
                         /*event_timeout=*/nullptr, /*add_to_loop=*/false),
      executor_(executor) {
  CHECK_EQ(curl_global_init(CURL_GLOBAL_ALL), CURLE_OK);
  request_manager_ = curl_multi_init();
  CHECK(request_manager_ != nullptr) << "Failed to create curl multi handle";
  curl_multi_setopt(request_manager_, CURLMOPT_SOCKETDATA, this);
  curl_multi_setopt(request_manager_, CURLMOPT_SOCKETFUNCTION,
                    OnLibcurlSocketUpdate);
  curl_multi_setopt(request_manager_, CURLMOPT_TIMERDATA,
                    multi_timer_event_.get());
  curl_multi_setopt(request_manager_, CURLMOPT_TIMERFUNCTION,
                    OnLibcurlTimerUpdate);
  if (curlmopt_maxconnects > 0) {
    // Limits number of connections left alive in cache.
    curl_multi_setopt(request_manager_, CURLMOPT_MAXCONNECTS,
                      curlmopt_maxconnects);
  }
  curl_multi_setopt(request_manager_, CURLMOPT_MAX_TOTAL_CONNECTIONS,
                    curlmopt_max_total_connections);
  curl_multi_setopt(request_manager_, CURLMOPT_MAX_HOST_CONNECTIONS,
                    curlmopt_max_host_connections);

  event_loop_thread_ = std::thread([this]() {
    event_base_loop(event_base_.get(), EVLOOP_NO_EXIT_ON_EMPTY);
  });
  eventloop_started_.WaitForNotification();
}

MultiCurlRequestManager::~MultiCurlRequestManager() {
  event_active(shutdown_event_.get(), EV_TIMEOUT, 0);
  event_loop_thread_.join();
}

// static
void MultiCurlRequestManager::StartedEventLoop(evutil_socket_t fd,
                                               short event_type, void* arg) {
  auto* self = reinterpret_cast<MultiCurlRequestManager*>(arg);
  PS_VLOG(kNoisyInfo, SystemLogContext()) << "Curl event loop started";
  self->eventloop_started_.Notify();
}

// static
void MultiCurlRequestManager::ShutdownEventLoop(evutil_socket_t fd,
                                                short event_type, void* arg) {
  auto* self = reinterpret_cast<MultiCurlRequestManager*>(arg);
  self->PerformCurlUpdate();
  std::vector<CURL*> pending_handles;
  pending_handles.reserve(self->easy_curl_request_data_.size());
  for (const auto& [handle, unused] : self->easy_curl_request_data_) {
    pending_handles.push_back(handle);
  }
  for (CURL* handle : pending_handles) {
    self->FailRequest(self->Remove(handle),
                      absl::CancelledError("Curl request manager shut down"));
  }
  curl_multi_cleanup(self->request_manager_);
  curl_global_cleanup();
  event_base_loopbreak(self->event_base_.get());
}

// Carries a request onto the event loop thread.
struct RequestEventState {
  MultiCurlRequestManager& curl_request_manager;
  std::unique_ptr<CurlRequestData> curl_request;
  std::unique_ptr<Event> event;
};

// static
void MultiCurlRequestManager::OnProcessingStarted(evutil_socket_t fd,
                                                  short event_type,
                                                  void* arg) {
  // Owns the event as well, which is freed when this returns.
  auto request_event_state = std::unique_ptr<RequestEventState>(
      reinterpret_cast<RequestEventState*>(arg));
  auto& self = request_event_state->curl_request_manager;
  CURL* req_handle = request_event_state->curl_request->req_handle;
  CURLMcode mc = curl_multi_add_handle(self.request_manager_, req_handle);
  if (mc != CURLM_OK) {
    self.FailRequest(
        std::move(request_event_state->curl_request),
        absl::InternalError(
            absl::StrCat("Failed to invoke request via curl with error: ",
                         curl_multi_strerror(mc))));
    return;
  }
  self.easy_curl_request_data_[req_handle] =
      std::move(request_event_state->curl_request);
}

void MultiCurlRequestManager::StartProcessing(
    std::unique_ptr<CurlRequestData> request) {
  // The multi handle is only touched from the event loop thread, so the
  // request hops onto the loop through a one shot event.
  auto event = std::make_unique<Event>(
      event_base_.get(), /*fd=*/-1, /*event_type=*/EV_TIMEOUT,
      /*event_callback=*/OnProcessingStarted, /*arg=*/nullptr,
      /*priority=*/kNumEventPriorities / 2, /*event_timeout=*/nullptr,
      /*add_to_loop=*/false);
  struct event* raw_event = event->get();
  auto request_event_state =
      std::make_unique<RequestEventState>(RequestEventState{
          *this,
          std::move(request),
          std::move(event),
      });
  event_assign(raw_event, event_base_.get(), /*fd=*/-1,
               /*events=*/EV_TIMEOUT, OnProcessingStarted,
               request_event_state.release());
  event_add(raw_event, &kZeroSecond);
}

void MultiCurlRequestManager::FailRequest(
    std::unique_ptr<CurlRequestData> request, absl::Status status) {
  if (request == nullptr) {
    return;
  }
  executor_.Run([request = std::move(request),
                 status = std::move(status)]() mutable {
    std::move(request->done_callback)(std::move(status));
  });
}

void MultiCurlRequestManager::PerformCurlUpdate() {
  int msgs_left = -1;
  while (CURLMsg* msg = curl_multi_info_read(request_manager_, &msgs_left)) {
    if (msg->msg != CURLMSG_DONE) {
      continue;
    }
    // Read everything needed from `msg` before removing the handle, which
    // invalidates it.
    CURL* req_handle = msg->easy_handle;
    absl::Status status = GetResultFromMsg(msg);
    std::unique_ptr<CurlRequestData> curl_request_data = Remove(req_handle);
    if (curl_request_data == nullptr) {
      continue;
    }
    LogCurlStats(req_handle);
    if (!status.ok()) {
      FailRequest(std::move(curl_request_data), std::move(status));
      continue;
    }
    long http_code = 0;
    curl_easy_getinfo(req_handle, CURLINFO_RESPONSE_CODE, &http_code);
    curl_request_data->response.status_code = static_cast<int>(http_code);
    executor_.Run(
        [curl_request_data = std::move(curl_request_data)]() mutable {
          std::move(curl_request_data->done_callback)(
              std::move(curl_request_data->response));
        });
  }
}

// static
void MultiCurlRequestManager::MultiTimerCallback(evutil_socket_t fd,
                                                 short what, void* arg) {
  auto* self = reinterpret_cast<MultiCurlRequestManager*>(arg);
  curl_multi_socket_action(self->request_manager_, CURL_SOCKET_TIMEOUT, 0,
                           &self->running_handles_);
  self->PerformCurlUpdate();
}

std::unique_ptr<CurlRequestData> MultiCurlRequestManager::Remove(
    CURL* curl_handle) {
  curl_multi_remove_handle(request_manager_, curl_handle);
  auto it = easy_curl_request_data_.find(curl_handle);
  if (it == easy_curl_request_data_.end()) {
    return nullptr;
  }
  std::unique_ptr<CurlRequestData> curl_request_data = std::move(it->second);
  easy_curl_request_data_.erase(it);
  return curl_request_data;
}

}  // namespace privacy_sandbox::bidder_gateway

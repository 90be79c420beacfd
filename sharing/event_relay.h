// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef PACKET_SHARING_EVENT_RELAY_H_
#define PACKET_SHARING_EVENT_RELAY_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "sharing/broadcast_channel.h"
#include "sharing/constants.h"
#include "sharing/internal/public/logging.h"
#include "sharing/task_supervisor.h"
#include "sharing/worker_queue.h"

namespace packet::sharing {

enum class RelayResult {
  kCancelled,
  kQueueStopped,
  kFeedClosed,
};

// Moves values from a broadcast feed into a worker queue until `handle` is
// cancelled, the queue stops or the feed is closed and drained. Lag on the
// feed is logged and skipped. Blocks the calling thread.
template <typename T>
RelayResult RelayUntilCancelled(
    const TaskHandle& handle,
    typename BroadcastChannel<T>::Receiver& receiver, WorkerQueue<T>& queue) {
  while (!handle.IsCancelled()) {
    absl::StatusOr<T> value = receiver.Receive(kRelayPollInterval);
    if (value.ok()) {
      if (!queue.Queue(*std::move(value))) {
        LOG(INFO) << handle.name() << ": Worker queue stopped.";
        return RelayResult::kQueueStopped;
      }
      continue;
    }
    switch (value.status().code()) {
      case absl::StatusCode::kDeadlineExceeded:
        break;
      case absl::StatusCode::kResourceExhausted:
        LOG(WARNING) << handle.name() << ": " << value.status();
        break;
      case absl::StatusCode::kOutOfRange:
        if (handle.IsCancelled()) {
          return RelayResult::kCancelled;
        }
        LOG(ERROR) << handle.name() << ": Feed closed.";
        return RelayResult::kFeedClosed;
      default:
        LOG(ERROR) << handle.name() << ": Unexpected feed error "
                   << value.status();
        return RelayResult::kFeedClosed;
    }
  }
  return RelayResult::kCancelled;
}

}  // namespace packet::sharing

#endif  // PACKET_SHARING_EVENT_RELAY_H_

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

#ifndef PACKET_SHARING_BROADCAST_CHANNEL_H_
#define PACKET_SHARING_BROADCAST_CHANNEL_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace packet::sharing {

// A bounded multi-producer, multi-consumer channel where every subscriber
// sees every value sent after it subscribed.
//
// The channel keeps the last `capacity` values. A subscriber that falls
// further behind loses the oldest values and is told so once through a
// ResourceExhausted status, then continues from the oldest value still held.
//
// Copies of a BroadcastChannel refer to the same channel.
template <typename T>
class BroadcastChannel {
 private:
  struct State;

 public:
  class Receiver {
   public:
    // Waits up to `timeout` for the next value.
    //  - ResourceExhausted: values were dropped, call again to continue.
    //  - DeadlineExceeded: nothing arrived in time.
    //  - OutOfRange: the channel is closed and fully drained.
    absl::StatusOr<T> Receive(absl::Duration timeout) {
      absl::Time deadline = absl::Now() + timeout;
      absl::MutexLock lock(&state_->mutex);
      while (next_seq_ >= state_->next_seq && !state_->closed) {
        if (state_->cond.WaitWithDeadline(&state_->mutex, deadline)) {
          break;
        }
      }
      uint64_t oldest = state_->next_seq - state_->values.size();
      if (next_seq_ < oldest) {
        uint64_t skipped = oldest - next_seq_;
        next_seq_ = oldest;
        return absl::ResourceExhaustedError(
            absl::StrCat("Receiver lagged by ", skipped, " values"));
      }
      if (next_seq_ < state_->next_seq) {
        T value = state_->values[next_seq_ - oldest];
        ++next_seq_;
        return value;
      }
      if (state_->closed) {
        return absl::OutOfRangeError("Channel closed");
      }
      return absl::DeadlineExceededError("No value received");
    }

   private:
    friend class BroadcastChannel;

    Receiver(std::shared_ptr<State> state,
             uint64_t next_seq)
        : state_(std::move(state)), next_seq_(next_seq) {}

    std::shared_ptr<State> state_;
    uint64_t next_seq_;
  };

  explicit BroadcastChannel(size_t capacity)
      : state_(std::make_shared<State>()) {
    state_->capacity = capacity == 0 ? 1 : capacity;
  }

  // Returns false if the channel is closed.
  bool Send(T value) {
    absl::MutexLock lock(&state_->mutex);
    if (state_->closed) {
      return false;
    }
    if (state_->values.size() == state_->capacity) {
      state_->values.pop_front();
    }
    state_->values.push_back(std::move(value));
    ++state_->next_seq;
    state_->cond.SignalAll();
    return true;
  }

  // Receivers only see values sent after they subscribed.
  Receiver Subscribe() {
    absl::MutexLock lock(&state_->mutex);
    return Receiver(state_, state_->next_seq);
  }

  // Receivers drain the held values and then get OutOfRange.
  void Close() {
    absl::MutexLock lock(&state_->mutex);
    state_->closed = true;
    state_->cond.SignalAll();
  }

  bool IsClosed() const {
    absl::MutexLock lock(&state_->mutex);
    return state_->closed;
  }

 private:
  struct State {
    mutable absl::Mutex mutex;
    absl::CondVar cond;
    size_t capacity = 1;
    bool closed ABSL_GUARDED_BY(mutex) = false;
    std::deque<T> values ABSL_GUARDED_BY(mutex);
    // Sequence number of the next value to be sent.
    uint64_t next_seq ABSL_GUARDED_BY(mutex) = 0;
  };

  std::shared_ptr<State> state_;
};

}  // namespace packet::sharing

#endif  // PACKET_SHARING_BROADCAST_CHANNEL_H_

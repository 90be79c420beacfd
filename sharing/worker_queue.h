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

#ifndef PACKET_SHARING_WORKER_QUEUE_H_
#define PACKET_SHARING_WORKER_QUEUE_H_

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/synchronization/mutex.h"
#include "internal/platform/task_runner.h"
#include "sharing/internal/public/logging.h"

namespace packet::sharing {

// Hands items from any thread to a callback running on `task_runner`, one
// item per task.
//
// The queue is bounded: Queue() blocks while `capacity` items are waiting or
// being handled, so a producer cannot get ahead of the consumer by more than
// `capacity` items. With a capacity of 1 every item is fully handled before
// the next one is accepted.
template <typename T>
class WorkerQueue {
 public:
  WorkerQueue(TaskRunner* task_runner, size_t capacity)
      : task_runner_(task_runner),
        capacity_(capacity == 0 ? 1 : capacity),
        state_(std::make_shared<State>()) {}

  ~WorkerQueue() { Stop(); }

  // Starts the queue. `callback` is called on the worker thread for every
  // item. Returns false if the queue is already started or stopped. Queue
  // cannot be restarted.
  bool Start(absl::AnyInvocable<void(T)> callback) {
    size_t queued = 0;
    {
      absl::MutexLock lock(&state_->mutex);
      if (state_->started) {
        LOG(ERROR) << "WorkerQueue is already started.";
        return false;
      }
      if (state_->stopped) {
        LOG(ERROR) << "WorkerQueue is already stopped, cannot restart.";
        return false;
      }
      state_->started = true;
      state_->callback = std::move(callback);
      queued = state_->items.size();
    }
    for (size_t i = 0; i < queued; ++i) {
      ScheduleCallback();
    }
    return true;
  }

  // Stops the queue. Pending items are dropped and blocked producers return.
  void Stop() {
    absl::MutexLock lock(&state_->mutex);
    if (state_->stopped) {
      return;
    }
    state_->stopped = true;
    state_->items.clear();
    state_->cond.SignalAll();
  }

  // Queues an item, blocking while the queue is full. Returns false if the
  // queue is stopped before the item is accepted.
  bool Queue(T item) {
    bool started;
    {
      absl::MutexLock lock(&state_->mutex);
      while (!state_->stopped && state_->pending >= capacity_) {
        state_->cond.Wait(&state_->mutex);
      }
      if (state_->stopped) {
        return false;
      }
      state_->items.push_back(std::move(item));
      ++state_->pending;
      started = state_->started;
    }
    if (started) {
      ScheduleCallback();
    }
    return true;
  }

  bool IsStopped() const {
    absl::MutexLock lock(&state_->mutex);
    return state_->stopped;
  }

 private:
  // Shared with posted tasks so that they stay valid after the queue is gone.
  struct State {
    mutable absl::Mutex mutex;
    absl::CondVar cond;
    bool started ABSL_GUARDED_BY(mutex) = false;
    bool stopped ABSL_GUARDED_BY(mutex) = false;
    std::deque<T> items ABSL_GUARDED_BY(mutex);
    // Items queued or being handled.
    size_t pending ABSL_GUARDED_BY(mutex) = 0;
    absl::AnyInvocable<void(T)> callback;
  };

  void ScheduleCallback() {
    VLOG(1) << "Scheduling callback";
    bool posted = task_runner_->PostTask([state = state_]() {
      std::optional<T> item;
      {
        absl::MutexLock lock(&state->mutex);
        if (state->stopped || state->items.empty()) {
          return;
        }
        item.emplace(std::move(state->items.front()));
        state->items.pop_front();
      }
      // Only one task runs the callback at a time on a sequenced runner.
      state->callback(std::move(*item));
      absl::MutexLock lock(&state->mutex);
      --state->pending;
      state->cond.SignalAll();
    });
    if (!posted) {
      LOG(WARNING) << "WorkerQueue task runner is shut down, stopping queue.";
      Stop();
    }
  }

  TaskRunner* const task_runner_;
  const size_t capacity_;
  std::shared_ptr<State> state_;
};

}  // namespace packet::sharing

#endif  // PACKET_SHARING_WORKER_QUEUE_H_

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

#include "internal/platform/task_runner_impl.h"

#include <cstdint>
#include <deque>
#include <map>
#include <thread>  // NOLINT
#include <utility>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace packet {

TaskRunnerImpl::TaskRunnerImpl(uint32_t runner_count) {
  if (runner_count == 0) {
    runner_count = 1;
  }
  threads_.reserve(runner_count);
  for (uint32_t i = 0; i < runner_count; ++i) {
    threads_.emplace_back([this]() { RunLoop(); });
  }
}

TaskRunnerImpl::~TaskRunnerImpl() { Shutdown(); }

void TaskRunnerImpl::Shutdown() {
  std::deque<absl::AnyInvocable<void()>> ready_tasks;
  std::multimap<absl::Time, absl::AnyInvocable<void()>> delayed_tasks;
  {
    absl::MutexLock lock(&mutex_);
    closed_ = true;
    ready_tasks.swap(ready_tasks_);
    delayed_tasks.swap(delayed_tasks_);
    cond_.SignalAll();
  }

  // Pending tasks are destroyed outside of the lock since their captures may
  // post back to this runner.
  ready_tasks.clear();
  delayed_tasks.clear();

  for (std::thread& thread : threads_) {
    if (!thread.joinable()) {
      continue;
    }
    if (thread.get_id() == std::this_thread::get_id()) {
      // Shutdown from one of our own tasks.
      thread.detach();
    } else {
      thread.join();
    }
  }
}

bool TaskRunnerImpl::PostTask(absl::AnyInvocable<void()> task) {
  absl::MutexLock lock(&mutex_);
  if (closed_) {
    return false;
  }
  if (task) {
    ready_tasks_.push_back(std::move(task));
    cond_.Signal();
  }
  return true;
}

bool TaskRunnerImpl::PostDelayedTask(absl::Duration delay,
                                     absl::AnyInvocable<void()> task) {
  absl::MutexLock lock(&mutex_);
  if (closed_) {
    return false;
  }
  if (!task) {
    return true;
  }
  delayed_tasks_.emplace(absl::Now() + delay, std::move(task));
  // Wake everyone, the new deadline may be earlier than the one being waited
  // on.
  cond_.SignalAll();
  return true;
}

void TaskRunnerImpl::RunLoop() {
  while (true) {
    absl::AnyInvocable<void()> task;
    {
      absl::MutexLock lock(&mutex_);
      while (true) {
        if (closed_) {
          return;
        }
        absl::Time now = absl::Now();
        while (!delayed_tasks_.empty() &&
               delayed_tasks_.begin()->first <= now) {
          auto node = delayed_tasks_.extract(delayed_tasks_.begin());
          ready_tasks_.push_back(std::move(node.mapped()));
        }
        if (!ready_tasks_.empty()) {
          task = std::move(ready_tasks_.front());
          ready_tasks_.pop_front();
          break;
        }
        if (delayed_tasks_.empty()) {
          cond_.Wait(&mutex_);
        } else {
          cond_.WaitWithDeadline(&mutex_, delayed_tasks_.begin()->first);
        }
      }
    }
    task();
  }
}

}  // namespace packet

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

#ifndef PACKET_INTERNAL_PLATFORM_TASK_RUNNER_IMPL_H_
#define PACKET_INTERNAL_PLATFORM_TASK_RUNNER_IMPL_H_

#include <cstdint>
#include <deque>
#include <map>
#include <thread>  // NOLINT
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "internal/platform/task_runner.h"

namespace packet {

// TaskRunner backed by a fixed pool of worker threads. A runner created with
// a count of 1 runs its tasks sequentially in posting order.
class TaskRunnerImpl : public TaskRunner {
 public:
  explicit TaskRunnerImpl(uint32_t runner_count);
  ~TaskRunnerImpl() override;

  bool PostTask(absl::AnyInvocable<void()> task) override
      ABSL_LOCKS_EXCLUDED(mutex_);
  bool PostDelayedTask(absl::Duration delay,
                       absl::AnyInvocable<void()> task) override
      ABSL_LOCKS_EXCLUDED(mutex_);
  void Shutdown() override ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  void RunLoop() ABSL_LOCKS_EXCLUDED(mutex_);

  absl::Mutex mutex_;
  absl::CondVar cond_;
  bool closed_ ABSL_GUARDED_BY(mutex_) = false;
  std::deque<absl::AnyInvocable<void()>> ready_tasks_ ABSL_GUARDED_BY(mutex_);
  std::multimap<absl::Time, absl::AnyInvocable<void()>> delayed_tasks_
      ABSL_GUARDED_BY(mutex_);
  std::vector<std::thread> threads_;
};

}  // namespace packet

#endif  // PACKET_INTERNAL_PLATFORM_TASK_RUNNER_IMPL_H_

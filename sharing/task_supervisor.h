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

#ifndef PACKET_SHARING_TASK_SUPERVISOR_H_
#define PACKET_SHARING_TASK_SUPERVISOR_H_

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/functional/any_invocable.h"
#include "absl/synchronization/mutex.h"
#include "internal/platform/cancellation_flag.h"
#include "internal/platform/cancellation_flag_listener.h"
#include "internal/platform/task_runner.h"

namespace packet {
namespace sharing {

// Which runner a supervised task lives on.
enum class Scheduler {
  kRuntime,
  kUi,
};

std::string SchedulerToString(Scheduler scheduler);

// Cancellable reference to a long-running loop.
class TaskHandle {
 public:
  // `on_cancel` runs once, on the thread calling Cancel().
  TaskHandle(std::string name, Scheduler scheduler,
             absl::AnyInvocable<void()> on_cancel = nullptr);
  TaskHandle(const TaskHandle&) = delete;
  TaskHandle& operator=(const TaskHandle&) = delete;

  const std::string& name() const { return name_; }
  Scheduler scheduler() const { return scheduler_; }

  // Asks the loop to stop. Does not wait for it. Safe to call repeatedly and
  // after the loop has finished.
  void Cancel();
  bool IsCancelled() const;

  void MarkDone();
  bool IsDone() const;

 private:
  const std::string name_;
  const Scheduler scheduler_;
  CancellationFlag cancellation_flag_;
  std::unique_ptr<CancellationFlagListener> on_cancel_listener_;
  std::atomic_bool done_ = false;
};

// Keeps the handles of every long-running loop in spawn order so that they
// can all be cancelled on stop, restart or shutdown.
//
// This class is thread-safe.
class TaskSupervisor {
 public:
  TaskSupervisor(TaskRunner* runtime_runner, TaskRunner* ui_runner);

  // Posts `loop` to the runner of `scheduler` and tracks its handle. `loop`
  // must return soon after the handle is cancelled.
  std::shared_ptr<TaskHandle> Spawn(
      Scheduler scheduler, std::string name,
      absl::AnyInvocable<void(const TaskHandle&)> loop)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Tracks a handle for work that runs outside of Spawn().
  void Track(std::shared_ptr<TaskHandle> handle) ABSL_LOCKS_EXCLUDED(mutex_);

  // Cancels every tracked handle, newest first, and forgets them. Returns the
  // number of handles cancelled.
  size_t StopAll() ABSL_LOCKS_EXCLUDED(mutex_);

  size_t size() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  TaskRunner& runtime_runner_;
  TaskRunner& ui_runner_;
  mutable absl::Mutex mutex_;
  std::vector<std::shared_ptr<TaskHandle>> handles_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_TASK_SUPERVISOR_H_

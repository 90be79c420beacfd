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

#include "sharing/task_supervisor.h"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "absl/synchronization/mutex.h"
#include "internal/platform/cancellation_flag_listener.h"
#include "internal/platform/task_runner.h"
#include "sharing/internal/public/logging.h"

namespace packet {
namespace sharing {

std::string SchedulerToString(Scheduler scheduler) {
  switch (scheduler) {
    case Scheduler::kRuntime:
      return "kRuntime";
    case Scheduler::kUi:
      return "kUi";
  }
  return "kUnknown";
}

TaskHandle::TaskHandle(std::string name, Scheduler scheduler,
                       absl::AnyInvocable<void()> on_cancel)
    : name_(std::move(name)), scheduler_(scheduler) {
  if (on_cancel) {
    on_cancel_listener_ = std::make_unique<CancellationFlagListener>(
        &cancellation_flag_, std::move(on_cancel));
  }
}

void TaskHandle::Cancel() {
  if (IsDone()) {
    VLOG(1) << "Task " << name_ << " already completed.";
  }
  cancellation_flag_.Cancel();
}

bool TaskHandle::IsCancelled() const { return cancellation_flag_.Cancelled(); }

void TaskHandle::MarkDone() { done_ = true; }

bool TaskHandle::IsDone() const { return done_; }

TaskSupervisor::TaskSupervisor(TaskRunner* runtime_runner,
                               TaskRunner* ui_runner)
    : runtime_runner_(*runtime_runner), ui_runner_(*ui_runner) {}

std::shared_ptr<TaskHandle> TaskSupervisor::Spawn(
    Scheduler scheduler, std::string name,
    absl::AnyInvocable<void(const TaskHandle&)> loop) {
  auto handle = std::make_shared<TaskHandle>(std::move(name), scheduler);
  TaskRunner& runner =
      scheduler == Scheduler::kRuntime ? runtime_runner_ : ui_runner_;
  VLOG(1) << "Scheduled to run task " << handle->name() << " on "
          << SchedulerToString(scheduler);
  if (!runner.PostTask([handle, loop = std::move(loop)]() mutable {
        if (!handle->IsCancelled()) {
          VLOG(1) << "Started to run task " << handle->name();
          loop(*handle);
        }
        handle->MarkDone();
        VLOG(1) << "Completed to run task " << handle->name();
      })) {
    LOG(WARNING) << __func__ << ": Runner is shut down, task "
                 << handle->name() << " not started.";
    handle->MarkDone();
  }
  Track(handle);
  return handle;
}

void TaskSupervisor::Track(std::shared_ptr<TaskHandle> handle) {
  absl::MutexLock lock(&mutex_);
  handles_.push_back(std::move(handle));
}

size_t TaskSupervisor::StopAll() {
  std::vector<std::shared_ptr<TaskHandle>> handles;
  {
    absl::MutexLock lock(&mutex_);
    handles.swap(handles_);
  }
  size_t count = handles.size();
  // Cancel outside of the lock, cancel hooks may spawn or track.
  while (!handles.empty()) {
    std::shared_ptr<TaskHandle> handle = std::move(handles.back());
    handles.pop_back();
    LOG(INFO) << __func__ << ": Cancelling task " << handle->name();
    handle->Cancel();
  }
  return count;
}

size_t TaskSupervisor::size() const {
  absl::MutexLock lock(&mutex_);
  return handles_.size();
}

}  // namespace sharing
}  // namespace packet

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

#include "sharing/thread_timer.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "absl/functional/any_invocable.h"
#include "absl/time/time.h"
#include "internal/platform/task_runner.h"
#include "sharing/internal/public/logging.h"

namespace packet::sharing {

ThreadTimer::ThreadTimer(TaskRunner& task_runner, std::string name,
                         absl::Duration delay, absl::AnyInvocable<void()> task)
    : name_(std::move(name)),
      run_cnt_(std::make_shared<std::atomic<int8_t>>(0)) {
  // Do not capture any member variables in the lambda, the object may be
  // deleted before the task is run.
  if (!task_runner.PostDelayedTask(
          delay, [run_cnt = run_cnt_, task = std::move(task),
                  name = name_]() mutable {
            if (run_cnt->fetch_add(1) == 0) {
              LOG(INFO) << "Timer " << name << " fired.";
              std::move(task)();
            } else {
              VLOG(1) << "Timer " << name << " expired but was cancelled.";
            }
          })) {
    LOG(WARNING) << "Timer " << name_ << " not started, runner is shut down.";
    run_cnt_->store(1);
  }
}

ThreadTimer::~ThreadTimer() { Cancel(); }

void ThreadTimer::Cancel() {
  if (run_cnt_->fetch_add(1) == 0) {
    LOG(INFO) << "Timer " << name_ << " cancelled.";
  }
}

bool ThreadTimer::IsRunning() const { return run_cnt_->load() == 0; }

}  // namespace packet::sharing

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

#ifndef PACKET_SHARING_THREAD_TIMER_H_
#define PACKET_SHARING_THREAD_TIMER_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "absl/functional/any_invocable.h"
#include "absl/time/time.h"
#include "internal/platform/task_runner.h"

namespace packet::sharing {

// A one shot timer that runs a task on the |task_runner| thread on expiration.
//
// The timer is started when the object is created and cancelled when it is
// destroyed. Whichever of expiration and |Cancel()| happens first wins; the
// task runs at most once. If |Cancel()| is called from a different thread
// than |task_runner|, an inflight task may continue until completion.
//
// This class is thread-safe.
class ThreadTimer {
 public:
  ThreadTimer(TaskRunner& task_runner, std::string name, absl::Duration delay,
              absl::AnyInvocable<void()> task);
  ~ThreadTimer();

  void Cancel();
  bool IsRunning() const;

 private:
  const std::string name_;
  // Incremented by both expiration and cancellation. The first one to
  // increment it from zero decides whether the task runs.
  std::shared_ptr<std::atomic<int8_t>> run_cnt_;
};

}  // namespace packet::sharing

#endif  // PACKET_SHARING_THREAD_TIMER_H_
